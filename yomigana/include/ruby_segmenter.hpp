#pragma once

#include "feature_schema.hpp"

#include <string>
#include <vector>

namespace Yomigana {
namespace furigana {

// Concatenating every segment's text reproduces the token surface exactly.
// An empty ruby renders as plain text.
struct RubySegment {
  std::string text;
  std::string ruby;

  bool operator==(const RubySegment &other) const {
    return text == other.text && ruby == other.ruby;
  }
  bool operator!=(const RubySegment &other) const { return !(*this == other); }
};

// Surface kana act as anchors into the reading: the first occurrence of a
// kana's katakana form in the unread reading closes the preceding kanji run.
// A reading of "*" or one identical to the surface yields a single plain
// segment.
std::vector<RubySegment> buildRubySegments(const std::string &surface,
                                           const std::string &reading);

// 1トークン分のルビ: 漢字判定 → 読みの選択 → 表記復元 → 分割
std::vector<RubySegment> annotateToken(const std::string &surface,
                                       const TokenFeatures &features);

} // namespace furigana
} // namespace Yomigana
