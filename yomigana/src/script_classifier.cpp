#include "script_classifier.hpp"
#include "utf8.hpp"

namespace Yomigana {
namespace script {

namespace {
constexpr char32_t kHiraganaToKatakanaOffset = 0x60;
} // namespace

bool isHiragana(char32_t c) { return c >= 0x3040 && c <= 0x309F; }

char32_t toKatakana(char32_t c) {
  if (c >= 0x3041 && c <= 0x3096)
    return c + kHiraganaToKatakanaOffset;
  return c;
}

bool isKanji(char32_t c) {
  return (c >= 0x4E00 && c <= 0x9FFF) ||  // CJK Unified Ideographs
         (c >= 0x3400 && c <= 0x4DBF) ||  // Extension A
         (c >= 0x20000 && c <= 0x2A6DF);  // Extension B
}

bool containsKanji(const std::string &utf8Text) {
  for (const auto &cp : utf8::split(utf8Text)) {
    if (isKanji(cp.value))
      return true;
  }
  return false;
}

} // namespace script
} // namespace Yomigana
