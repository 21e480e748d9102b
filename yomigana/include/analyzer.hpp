#pragma once

#include "feature_schema.hpp"
#include "ruby_segmenter.hpp"
#include "tokenizer.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Yomigana {

struct AnalysisRequest {
  std::string text;
  std::optional<std::string> userDictCsv;
};

struct TokenAnnotation {
  std::string surface;
  TokenFeatures features;
  std::vector<furigana::RubySegment> rubySegments;
};

struct AnalysisResult {
  DictionaryVariant variant = DictionaryVariant::Ipadic;
  std::vector<TokenAnnotation> annotations;
};

enum class ErrorKind {
  MalformedRequest,
  TokenizationFailed,
  UserDictionaryFailed,
  EncodingFailed
};

struct AnalysisError {
  ErrorKind kind{ErrorKind::TokenizationFailed};
  std::string message;
};

using AnalysisOutcome = std::variant<AnalysisResult, AnalysisError>;

namespace analysis {

// 空白などトークンに含まれないバイト範囲の注釈
TokenAnnotation makeGap(const std::string &gapText, DictionaryVariant variant);

} // namespace analysis

// Turns a document into ruby annotations. Every byte of the input is covered
// by exactly one annotation, either a token or a synthesized gap.
class Analyzer {
public:
  explicit Analyzer(const Tokenizer &tokenizer);

  AnalysisOutcome analyze(const AnalysisRequest &request) const;

  DictionaryVariant variant() const { return tokenizer_.variant(); }

private:
  const Tokenizer &tokenizer_;
};

} // namespace Yomigana
