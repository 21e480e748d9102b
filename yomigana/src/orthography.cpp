#include "orthography.hpp"
#include "script_classifier.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <vector>

namespace Yomigana {
namespace furigana {

std::string reconstructOrthography(const std::string &surface,
                                   const std::string &phonetic) {
  std::vector<utf8::CodePoint> sur = utf8::split(surface);
  std::vector<utf8::CodePoint> pho = utf8::split(phonetic);

  // 右端からの残り文字数
  size_t s = sur.size();
  size_t p = pho.size();
  std::u32string tail;

  while (s > 0 && p > 0) {
    char32_t sc = sur[s - 1].value;
    char32_t pc = pho[p - 1].value;

    if (script::isKanji(sc))
      break;

    char32_t sk = script::toKatakana(sc);
    bool exactMatch = sk == pc;
    bool longVowelMatch = pc == kLongVowelMark && script::isHiragana(sc);
    if (!exactMatch && !longVowelMatch)
      break;

    tail.push_back(sk);
    --s;
    --p;
  }

  std::reverse(tail.begin(), tail.end());

  std::string head =
      p > 0 ? phonetic.substr(0, pho[p - 1].offset + pho[p - 1].length)
            : std::string();
  return head + utf8::encode(tail);
}

} // namespace furigana
} // namespace Yomigana
