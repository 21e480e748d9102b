#include "reading_selector.hpp"

namespace Yomigana {
namespace furigana {

namespace {

bool isPresent(const std::string &field) {
  return !field.empty() && field != kNotApplicable;
}

std::optional<std::string> presentOrNone(const std::string &field) {
  if (isPresent(field))
    return field;
  return std::nullopt;
}

struct ReadingVisitor {
  ReadingChoice operator()(const IpadicFeatures &f) const {
    return ReadingChoice{presentOrNone(f.reading), false};
  }

  ReadingChoice operator()(const UnidicFeatures &f) const {
    bool conjugated = f.conjugationType != kNotApplicable;
    const std::string &preferred =
        conjugated ? f.pronunciation : f.lemmaReading;

    ReadingChoice choice;
    choice.reconstruct = conjugated;
    choice.reading = isPresent(preferred)
                         ? std::optional<std::string>(preferred)
                         : presentOrNone(f.lemmaReading);
    return choice;
  }
};

} // namespace

ReadingChoice selectReading(const TokenFeatures &features) {
  return std::visit(ReadingVisitor{}, features);
}

} // namespace furigana
} // namespace Yomigana
