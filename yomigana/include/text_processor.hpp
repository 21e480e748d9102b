#pragma once

#include <string>
#include <vector>

namespace Yomigana {
namespace text {

class TextProcessor {
public:
  // 不正なUTF-8シーケンスと制御文字 (TAB/LF/CRを除く) を取り除く
  static std::string sanitizeUTF8(const std::string &input);

  // 改行で分割し、行末の CR を取り除く
  static std::vector<std::string> splitLines(const std::string &text);

  static bool isBlank(const std::string &line);

private:
  static bool isAllowedControl(char32_t c);
};

} // namespace text
} // namespace Yomigana
