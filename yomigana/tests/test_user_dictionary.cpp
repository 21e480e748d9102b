#include "user_dictionary.hpp"

#include <gtest/gtest.h>

using namespace Yomigana;

namespace {

// IPADIC の left-id.def / right-id.def の抜粋
const char *kIdDef = "0 BOS/EOS,*,*,*,*,*,*\n"
                     "1285 名詞,一般,*,*,*,*,*\n"
                     "1288 名詞,固有名詞,地域,一般,*,*,*\n"
                     "1293 名詞,サ変接続,*,*,*,*,*\n"
                     "1302 名詞,接尾,一般,*,*,*,*\n";

userdic::ContextIds testIds() {
  userdic::ContextIds ids;
  std::string error;
  EXPECT_TRUE(ids.left.parse(kIdDef, error)) << error;
  EXPECT_TRUE(ids.right.parse(kIdDef, error)) << error;
  return ids;
}

} // namespace

TEST(ContextIdTableTest, PicksGeneralEntryForPartOfSpeech) {
  userdic::ContextIdTable table;
  std::string error;
  ASSERT_TRUE(table.parse(kIdDef, error)) << error;

  EXPECT_EQ(table.idFor("名詞"), 1285);
  EXPECT_EQ(table.idFor("BOS/EOS"), 0);
  EXPECT_FALSE(table.idFor("動詞").has_value());

  EXPECT_TRUE(table.contains(0));
  EXPECT_TRUE(table.contains(1302));
  EXPECT_FALSE(table.contains(1303));
  EXPECT_FALSE(table.contains(-1));
}

TEST(ContextIdTableTest, FallsBackToLowestId) {
  userdic::ContextIdTable table;
  table.add(40, "動詞,自立,*,*,五段・ラ行,基本形,*");
  table.add(12, "動詞,非自立,*,*,五段・カ行促音便,連用タ接続,*");
  EXPECT_EQ(table.idFor("動詞"), 12);

  table.add(30, "動詞,自立,一般,*,*,*,*");
  EXPECT_EQ(table.idFor("動詞"), 30);
}

TEST(ContextIdTableTest, RejectsMalformedLines) {
  userdic::ContextIdTable table;
  std::string error;
  ASSERT_TRUE(table.parse("5 名詞,一般,*,*,*,*,*\n", error));

  EXPECT_FALSE(table.parse("5 名詞,一般\nx 名詞,一般\n", error));
  EXPECT_NE(error.find("line 2"), std::string::npos) << error;
  EXPECT_FALSE(table.parse("7\n", error));

  // 失敗した parse は表を変更しない
  EXPECT_EQ(table.idFor("名詞"), 5);
  EXPECT_FALSE(table.contains(6));
}

TEST(UserDictionaryTest, ExpandsSimpleIpadicEntry) {
  std::string out, error;
  ASSERT_TRUE(userdic::expandCsv("東京スカイツリー,名詞,トウキョウスカイツリー",
                                 DictionaryVariant::Ipadic, testIds(), out,
                                 error))
      << error;
  EXPECT_EQ(out, "東京スカイツリー,1285,1285,-10000,名詞,*,*,*,*,*,"
                 "東京スカイツリー,トウキョウスカイツリー,*\n");
}

TEST(UserDictionaryTest, ExpandsSimpleUnidicEntry) {
  std::string out, error;
  ASSERT_TRUE(userdic::expandCsv("推し活,名詞,オシカツ\n",
                                 DictionaryVariant::Unidic, testIds(), out,
                                 error))
      << error;
  EXPECT_EQ(out, "推し活,1285,1285,-10000,名詞,*,*,*,*,*,オシカツ,推し活,"
                 "推し活,オシカツ,推し活,オシカツ,*,*,*,*,*\n");
}

TEST(UserDictionaryTest, UnknownPartOfSpeechIsAnError) {
  std::string out = "untouched", error;
  EXPECT_FALSE(userdic::expandCsv("東京,名詞,トウキョウ\n走る,動詞,ハシル",
                                  DictionaryVariant::Ipadic, testIds(), out,
                                  error));
  EXPECT_NE(error.find("line 2"), std::string::npos) << error;
  EXPECT_NE(error.find("動詞"), std::string::npos) << error;
  EXPECT_EQ(out, "untouched");

  // 文脈ID表が読めていない場合も同様
  EXPECT_FALSE(userdic::expandCsv("東京,名詞,トウキョウ",
                                  DictionaryVariant::Ipadic,
                                  userdic::ContextIds(), out, error));
  EXPECT_NE(error.find("line 1"), std::string::npos) << error;
}

TEST(UserDictionaryTest, PassesFullEntriesThrough) {
  std::string row = "葛飾,1288,1288,5000,名詞,固有名詞,地域,一般,*,*,葛飾,"
                    "カツシカ,カツシカ";
  std::string out, error;
  ASSERT_TRUE(userdic::expandCsv(row + "\r\n", DictionaryVariant::Ipadic,
                                 testIds(), out, error))
      << error;
  EXPECT_EQ(out, row + "\n");
}

TEST(UserDictionaryTest, FillsEmptyContextIdsOfFullEntries) {
  std::string out, error;
  ASSERT_TRUE(userdic::expandCsv("葛飾,,1288,5000,名詞,固有名詞,地域,一般",
                                 DictionaryVariant::Ipadic, testIds(), out,
                                 error))
      << error;
  EXPECT_EQ(out, "葛飾,1285,1288,5000,名詞,固有名詞,地域,一般\n");
}

TEST(UserDictionaryTest, RejectsUndefinedContextIds) {
  std::string out, error;
  EXPECT_FALSE(userdic::expandCsv("葛飾,1288,9999,5000,名詞,固有名詞",
                                  DictionaryVariant::Ipadic, testIds(), out,
                                  error));
  EXPECT_NE(error.find("right context id 9999"), std::string::npos) << error;

  EXPECT_FALSE(userdic::expandCsv("葛飾,-1,1288,5000,名詞,固有名詞",
                                  DictionaryVariant::Ipadic, testIds(), out,
                                  error));
  EXPECT_NE(error.find("left context id -1"), std::string::npos) << error;
}

TEST(UserDictionaryTest, SkipsBlankLinesAndQuotesFields) {
  std::string out, error;
  ASSERT_TRUE(userdic::expandCsv("\n  \n\"A,B\",名詞,エービー\n\n",
                                 DictionaryVariant::Ipadic, testIds(), out,
                                 error))
      << error;
  EXPECT_EQ(out, "\"A,B\",1285,1285,-10000,名詞,*,*,*,*,*,\"A,B\",エービー,*\n");
}

TEST(UserDictionaryTest, RejectsMalformedRows) {
  userdic::ContextIds ids = testIds();
  std::string out = "untouched", error;

  EXPECT_FALSE(userdic::expandCsv("東京,名詞", DictionaryVariant::Ipadic, ids,
                                  out, error));
  EXPECT_NE(error.find("line 1"), std::string::npos) << error;

  EXPECT_FALSE(userdic::expandCsv("a,名詞,エー\nb,1,2,x,名詞",
                                  DictionaryVariant::Ipadic, ids, out, error));
  EXPECT_NE(error.find("line 2"), std::string::npos) << error;
  EXPECT_NE(error.find("cost"), std::string::npos) << error;

  EXPECT_FALSE(userdic::expandCsv("b,x,2,10,名詞", DictionaryVariant::Ipadic,
                                  ids, out, error));
  EXPECT_NE(error.find("context ids"), std::string::npos) << error;

  EXPECT_FALSE(userdic::expandCsv("b,1,2,99999,名詞", DictionaryVariant::Ipadic,
                                  ids, out, error));

  EXPECT_FALSE(userdic::expandCsv(",名詞,エー", DictionaryVariant::Ipadic, ids,
                                  out, error));
  EXPECT_NE(error.find("empty surface"), std::string::npos) << error;

  EXPECT_EQ(out, "untouched");
}

TEST(UserDictionaryTest, EmptyCsvIsAnError) {
  std::string out, error;
  EXPECT_FALSE(userdic::expandCsv("", DictionaryVariant::Ipadic, testIds(),
                                  out, error));
  EXPECT_FALSE(userdic::expandCsv("\n\n", DictionaryVariant::Unidic, testIds(),
                                  out, error));
  EXPECT_EQ(error, "no entries");
}
