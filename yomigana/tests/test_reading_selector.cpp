#include "reading_selector.hpp"

#include <gtest/gtest.h>

using namespace Yomigana;
using furigana::ReadingChoice;
using furigana::selectReading;

namespace {

UnidicFeatures unidicWord(const std::string &conjugationType,
                          const std::string &lemmaReading,
                          const std::string &pronunciation) {
  UnidicFeatures f = std::get<UnidicFeatures>(
      pos::FeatureSchema::whitespace(DictionaryVariant::Unidic));
  f.pos1 = "動詞";
  f.conjugationType = conjugationType;
  f.lemmaReading = lemmaReading;
  f.pronunciation = pronunciation;
  return f;
}

} // namespace

TEST(ReadingSelectorTest, IpadicTakesReadingField) {
  IpadicFeatures f;
  f.reading = "トウキョウ";
  f.pronunciation = "トーキョー";

  ReadingChoice choice = selectReading(f);
  ASSERT_TRUE(choice.reading.has_value());
  EXPECT_EQ(*choice.reading, "トウキョウ");
  EXPECT_FALSE(choice.reconstruct);
}

TEST(ReadingSelectorTest, IpadicSentinelMeansNoReading) {
  IpadicFeatures f;
  f.reading = "*";
  EXPECT_FALSE(selectReading(f).reading.has_value());

  f.reading = "";
  EXPECT_FALSE(selectReading(f).reading.has_value());
}

TEST(ReadingSelectorTest, IpadicIgnoresConjugation) {
  IpadicFeatures f;
  f.conjugationType = "五段・カ行促音便";
  f.reading = "イコウ";
  ReadingChoice choice = selectReading(f);
  EXPECT_EQ(choice.reading, std::optional<std::string>("イコウ"));
  EXPECT_FALSE(choice.reconstruct);
}

TEST(ReadingSelectorTest, UnidicUninflectedPrefersLemmaReading) {
  ReadingChoice choice = selectReading(unidicWord("*", "ガッコウ", "ガッコー"));
  EXPECT_EQ(choice.reading, std::optional<std::string>("ガッコウ"));
  EXPECT_FALSE(choice.reconstruct);
}

TEST(ReadingSelectorTest, UnidicInflectedPrefersPronunciation) {
  ReadingChoice choice = selectReading(unidicWord("五段-カ行", "イク", "イコー"));
  EXPECT_EQ(choice.reading, std::optional<std::string>("イコー"));
  EXPECT_TRUE(choice.reconstruct);
}

TEST(ReadingSelectorTest, UnidicFallsBackToLemmaReading) {
  ReadingChoice choice = selectReading(unidicWord("五段-カ行", "イク", "*"));
  EXPECT_EQ(choice.reading, std::optional<std::string>("イク"));
  EXPECT_TRUE(choice.reconstruct);
}

TEST(ReadingSelectorTest, UnidicBothAbsent) {
  EXPECT_FALSE(selectReading(unidicWord("五段-カ行", "*", "*")).reading);
  EXPECT_FALSE(selectReading(unidicWord("*", "*", "*")).reading);
  // 非活用語は発音形があっても語彙素読みが無ければ読みなし
  EXPECT_FALSE(selectReading(unidicWord("*", "*", "ガッコー")).reading);
}
