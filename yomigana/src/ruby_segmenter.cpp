#include "ruby_segmenter.hpp"
#include "orthography.hpp"
#include "reading_selector.hpp"
#include "script_classifier.hpp"
#include "utf8.hpp"

#include <cstdlib>
#include <iostream>

namespace Yomigana {
namespace furigana {

namespace {

bool isDebugEnabled() {
  static const bool debug = std::getenv("YOMIGANA_DEBUG") != nullptr;
  return debug;
}

std::vector<RubySegment> plain(const std::string &surface) {
  return {RubySegment{surface, ""}};
}

// 読みの [from, to) 番目の文字に対応するバイト列。範囲外なら空 (ルビなし)
std::string slice(const std::string &text,
                  const std::vector<utf8::CodePoint> &chars, size_t from,
                  size_t to) {
  if (from >= to || to > chars.size()) {
    if (to > chars.size() && isDebugEnabled()) {
      std::cerr << "[DEBUG] Reading slice [" << from << ", " << to
                << ") exceeds reading length " << chars.size() << std::endl;
    }
    return std::string();
  }
  size_t begin = chars[from].offset;
  size_t end = chars[to - 1].offset + chars[to - 1].length;
  return text.substr(begin, end - begin);
}

} // namespace

std::vector<RubySegment> buildRubySegments(const std::string &surface,
                                           const std::string &reading) {
  if (reading == kNotApplicable || surface == reading)
    return plain(surface);

  std::vector<utf8::CodePoint> sur = utf8::split(surface);
  std::vector<utf8::CodePoint> read = utf8::split(reading);

  std::vector<RubySegment> segments;

  // 読みが未確定の漢字列 (surface のバイト範囲)
  size_t pendingBegin = 0;
  size_t pendingEnd = 0;
  size_t r = 0;

  for (const auto &cp : sur) {
    char32_t kata = script::toKatakana(cp.value);
    bool kanaMarker = kata != cp.value;

    if (kanaMarker && r < read.size()) {
      size_t anchor = r;
      while (anchor < read.size() && read[anchor].value != kata)
        ++anchor;

      if (anchor < read.size()) {
        if (pendingEnd > pendingBegin) {
          segments.push_back(RubySegment{
              surface.substr(pendingBegin, pendingEnd - pendingBegin),
              slice(reading, read, r, anchor)});
        }

        segments.push_back(
            RubySegment{surface.substr(cp.offset, cp.length), ""});
        r = anchor + 1;
        pendingBegin = pendingEnd = cp.offset + cp.length;
        continue;
      }
    }

    if (pendingEnd == pendingBegin)
      pendingBegin = cp.offset;
    pendingEnd = cp.offset + cp.length;
  }

  if (pendingEnd > pendingBegin) {
    segments.push_back(
        RubySegment{surface.substr(pendingBegin, pendingEnd - pendingBegin),
                    slice(reading, read, r, read.size())});
  }

  return segments;
}

std::vector<RubySegment> annotateToken(const std::string &surface,
                                       const TokenFeatures &features) {
  // かなのみの語にはルビを振らない
  if (!script::containsKanji(surface))
    return plain(surface);

  ReadingChoice choice = selectReading(features);
  if (!choice.reading)
    return plain(surface);

  std::string reading = choice.reconstruct
                            ? reconstructOrthography(surface, *choice.reading)
                            : *choice.reading;

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] annotate '" << surface << "' reading='" << reading
              << "'" << (choice.reconstruct ? " (reconstructed)" : "")
              << std::endl;
  }

  return buildRubySegments(surface, reading);
}

} // namespace furigana
} // namespace Yomigana
