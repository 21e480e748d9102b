#include "analyzer.hpp"

#include <cstdlib>
#include <iostream>

namespace Yomigana {

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("YOMIGANA_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

namespace analysis {

TokenAnnotation makeGap(const std::string &gapText, DictionaryVariant variant) {
  TokenAnnotation gap;
  gap.surface = gapText;
  gap.features = pos::FeatureSchema::whitespace(variant);
  gap.rubySegments = {furigana::RubySegment{gapText, ""}};
  return gap;
}

} // namespace analysis

Analyzer::Analyzer(const Tokenizer &tokenizer) : tokenizer_(tokenizer) {}

AnalysisOutcome Analyzer::analyze(const AnalysisRequest &request) const {
  const std::string &text = request.text;
  const DictionaryVariant variant = tokenizer_.variant();

  TokenizeResult tokenized = tokenizer_.tokenize(text, request.userDictCsv);
  if (!tokenized.ok()) {
    const TokenizerError &err = *tokenized.error;
    ErrorKind kind = err.kind == TokenizerErrorKind::UserDictionary
                         ? ErrorKind::UserDictionaryFailed
                         : ErrorKind::TokenizationFailed;
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] tokenizer failed: " << err.message << std::endl;
    }
    return AnalysisError{kind, err.message};
  }

  AnalysisResult result;
  result.variant = variant;
  result.annotations.reserve(tokenized.tokens.size() * 2 + 1);

  size_t cursor = 0;
  for (const Token &token : tokenized.tokens) {
    if (token.startByte < cursor || token.endByte < token.startByte ||
        token.endByte > text.size()) {
      return AnalysisError{ErrorKind::TokenizationFailed,
                           "token '" + token.surface + "' at bytes [" +
                               std::to_string(token.startByte) + ", " +
                               std::to_string(token.endByte) +
                               ") is out of order"};
    }

    if (token.startByte > cursor) {
      result.annotations.push_back(analysis::makeGap(
          text.substr(cursor, token.startByte - cursor), variant));
    }

    TokenAnnotation annotation;
    annotation.surface =
        text.substr(token.startByte, token.endByte - token.startByte);
    annotation.features = pos::FeatureSchema::parse(variant, token.feature);
    annotation.rubySegments =
        furigana::annotateToken(annotation.surface, annotation.features);
    result.annotations.push_back(std::move(annotation));

    cursor = token.endByte;
  }

  if (cursor < text.size()) {
    result.annotations.push_back(
        analysis::makeGap(text.substr(cursor), variant));
  }

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] analyzed " << text.size() << " bytes into "
              << result.annotations.size() << " annotations" << std::endl;
  }

  return result;
}

} // namespace Yomigana
