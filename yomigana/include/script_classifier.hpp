#pragma once

#include <string>

namespace Yomigana {
namespace script {

// Hiragana block U+3040-U+309F
bool isHiragana(char32_t c);

// Shifts letter-forming hiragana (U+3041-U+3096) into the katakana block.
// Iteration marks and other symbols in the block are returned unchanged.
char32_t toKatakana(char32_t c);

// CJK Unified Ideographs, Extension A and Extension B only
bool isKanji(char32_t c);

bool containsKanji(const std::string &utf8Text);

} // namespace script
} // namespace Yomigana
