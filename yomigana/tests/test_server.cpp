#include "protocol.hpp"
#include "scripted_tokenizer.hpp"
#include "server.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace Yomigana;
using Yomigana::testing::ScriptedTokenizer;

namespace {

std::string frame(const std::string &payload) {
  return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" +
         payload;
}

std::vector<std::string> readFrames(const std::string &stream) {
  std::vector<std::string> payloads;
  size_t pos = 0;
  const std::string header = "Content-Length: ";
  while ((pos = stream.find(header, pos)) != std::string::npos) {
    size_t end = stream.find("\r\n\r\n", pos);
    size_t length = std::stoul(stream.substr(pos + header.size()));
    payloads.push_back(stream.substr(end + 4, length));
    pos = end + 4 + length;
  }
  return payloads;
}

} // namespace

TEST(RequestServerTest, AnswersEachFramedRequest) {
  ScriptedTokenizer tokenizer(DictionaryVariant::Ipadic);
  tokenizer.add("東京", "名詞,固有名詞,地域,一般,*,*,東京,トウキョウ,トーキョー");
  Analyzer analyzer(tokenizer);

  std::istringstream in(frame(R"({"text": "東京"})") + frame("{bad"));
  std::ostringstream out;
  RequestServer server(in, out, analyzer);

  EXPECT_EQ(server.run(), 2u);

  std::vector<std::string> responses = readFrames(out.str());
  ASSERT_EQ(responses.size(), 2u);
  EXPECT_FALSE(protocol::isErrorResponse(responses[0])) << responses[0];
  EXPECT_NE(responses[0].find("トウキョウ"), std::string::npos);
  EXPECT_EQ(responses[1].rfind("Error: Invalid JSON: ", 0), 0u);
}

TEST(RequestServerTest, StopsAtEndOfInput) {
  ScriptedTokenizer tokenizer(DictionaryVariant::Ipadic);
  Analyzer analyzer(tokenizer);

  std::istringstream empty("");
  std::ostringstream out;
  EXPECT_EQ(RequestServer(empty, out, analyzer).run(), 0u);
  EXPECT_TRUE(out.str().empty());

  // 本文が足りないメッセージは処理しない
  std::istringstream truncated("Content-Length: 50\r\n\r\n{\"text\"");
  EXPECT_EQ(RequestServer(truncated, out, analyzer).run(), 0u);
}

TEST(RequestServerTest, RejectsBadContentLength) {
  ScriptedTokenizer tokenizer(DictionaryVariant::Ipadic);
  Analyzer analyzer(tokenizer);
  std::ostringstream out;

  std::istringstream negative("Content-Length: -1\r\n\r\n{}");
  EXPECT_EQ(RequestServer(negative, out, analyzer).run(), 0u);

  std::istringstream huge("Content-Length: 99999999999999999999\r\n\r\n{}");
  EXPECT_EQ(RequestServer(huge, out, analyzer).run(), 0u);

  std::istringstream oversized(
      "Content-Length: " +
      std::to_string(RequestServer::kMaxContentLength + 1) + "\r\n\r\n{}");
  EXPECT_EQ(RequestServer(oversized, out, analyzer).run(), 0u);

  std::istringstream garbage("Content-Length: 12abc\r\n\r\n{}");
  EXPECT_EQ(RequestServer(garbage, out, analyzer).run(), 0u);

  EXPECT_TRUE(out.str().empty());
}

TEST(RequestServerTest, AcceptsPaddedContentLength) {
  ScriptedTokenizer tokenizer(DictionaryVariant::Ipadic);
  Analyzer analyzer(tokenizer);

  std::string payload = R"({"text": ""})";
  std::istringstream in("Content-Length:  " + std::to_string(payload.size()) +
                        " \r\n\r\n" + payload);
  std::ostringstream out;
  EXPECT_EQ(RequestServer(in, out, analyzer).run(), 1u);
  EXPECT_FALSE(readFrames(out.str()).empty());
}
