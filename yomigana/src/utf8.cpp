#include "utf8.hpp"

namespace Yomigana {
namespace utf8 {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

inline bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// 先頭バイトからシーケンス長を判定 (不正な先頭バイトは0)
inline size_t sequenceLength(unsigned char c) {
  if (c < 0x80)
    return 1;
  if (c >= 0xC2 && c <= 0xDF)
    return 2;
  if (c >= 0xE0 && c <= 0xEF)
    return 3;
  if (c >= 0xF0 && c <= 0xF4)
    return 4;
  return 0;
}

CodePoint decodeAt(const std::string &s, size_t i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  size_t len = sequenceLength(c);

  if (len == 0 || i + len > s.size())
    return CodePoint{kReplacement, i, 1};

  for (size_t j = 1; j < len; ++j) {
    if (!isContinuation(static_cast<unsigned char>(s[i + j])))
      return CodePoint{kReplacement, i, 1};
  }

  char32_t cp = 0;
  switch (len) {
  case 1:
    cp = c;
    break;
  case 2:
    cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3F);
    break;
  case 3:
    cp = ((c & 0x0F) << 12) |
         ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 6) |
         (static_cast<unsigned char>(s[i + 2]) & 0x3F);
    break;
  default:
    cp = ((c & 0x07) << 18) |
         ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 12) |
         ((static_cast<unsigned char>(s[i + 2]) & 0x3F) << 6) |
         (static_cast<unsigned char>(s[i + 3]) & 0x3F);
    break;
  }

  // 冗長表現・サロゲート・範囲外は不正として1バイト扱い
  if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
      (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
    return CodePoint{kReplacement, i, 1};

  return CodePoint{cp, i, len};
}

} // namespace

std::vector<CodePoint> split(const std::string &text) {
  std::vector<CodePoint> result;
  result.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    CodePoint cp = decodeAt(text, i);
    result.push_back(cp);
    i += cp.length;
  }
  return result;
}

void append(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp <= 0x10FFFF) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    append(out, kReplacement);
  }
}

std::string encode(char32_t cp) {
  std::string out;
  append(out, cp);
  return out;
}

std::string encode(const std::u32string &text) {
  std::string out;
  out.reserve(text.size() * 3);
  for (char32_t cp : text)
    append(out, cp);
  return out;
}

} // namespace utf8
} // namespace Yomigana
