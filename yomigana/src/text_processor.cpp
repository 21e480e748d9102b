#include "text_processor.hpp"
#include "utf8.hpp"

#include <utility>

namespace Yomigana {
namespace text {

std::string TextProcessor::sanitizeUTF8(const std::string &input) {
  if (input.empty())
    return input;

  std::string result;
  result.reserve(input.size());

  for (const auto &cp : utf8::split(input)) {
    // 1バイトの置換文字は不正バイト (正規の U+FFFD は3バイト)
    if (cp.value == 0xFFFD && cp.length == 1)
      continue;
    if (cp.value < 0x20 && !isAllowedControl(cp.value))
      continue;
    if (cp.value == 0x7F)
      continue;
    result.append(input, cp.offset, cp.length);
  }

  return result;
}

std::vector<std::string> TextProcessor::splitLines(const std::string &text) {
  std::vector<std::string> lines;
  size_t start = 0;

  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos)
      end = text.size();

    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(std::move(line));

    start = end + 1;
  }

  return lines;
}

bool TextProcessor::isBlank(const std::string &line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

bool TextProcessor::isAllowedControl(char32_t c) {
  return c == 0x09 || c == 0x0A || c == 0x0D;
}

} // namespace text
} // namespace Yomigana
