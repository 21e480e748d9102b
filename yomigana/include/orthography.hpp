#pragma once

#include <string>

namespace Yomigana {
namespace furigana {

// 長音符
inline constexpr char32_t kLongVowelMark = 0x30FC;

// Rewrites the tail of a phonetic reading so it spells the surface's trailing
// kana (e.g. 行こう / イコー -> イコウ). Scans right to left and stops at the
// first kanji or the first mismatch; the head of the reading is kept as is.
std::string reconstructOrthography(const std::string &surface,
                                   const std::string &phonetic);

} // namespace furigana
} // namespace Yomigana
