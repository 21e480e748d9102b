#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace Yomigana {
namespace utf8 {

// A decoded codepoint together with the byte range it occupies in the source
struct CodePoint {
  char32_t value{0};
  size_t offset{0};
  size_t length{0};
};

// Invalid or truncated sequences decode as U+FFFD covering a single byte, so
// splitting never fails and the byte ranges always tile the input.
std::vector<CodePoint> split(const std::string &text);

void append(std::string &out, char32_t cp);

std::string encode(char32_t cp);
std::string encode(const std::u32string &text);

} // namespace utf8
} // namespace Yomigana
