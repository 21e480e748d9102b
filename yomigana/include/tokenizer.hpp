#pragma once

#include "feature_schema.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Yomigana {

struct Token {
  std::string surface; // 表層形 (UTF-8)
  size_t startByte{0}; // 入力テキスト中のバイト位置
  size_t endByte{0};
  std::string feature; // 辞書の素性 (CSV)
};

enum class TokenizerErrorKind { Tokenization, UserDictionary };

struct TokenizerError {
  TokenizerErrorKind kind{TokenizerErrorKind::Tokenization};
  std::string message;
};

struct TokenizeResult {
  std::vector<Token> tokens;
  std::optional<TokenizerError> error;

  bool ok() const { return !error.has_value(); }

  static TokenizeResult failure(TokenizerErrorKind kind, std::string message) {
    TokenizeResult result;
    result.error = TokenizerError{kind, std::move(message)};
    return result;
  }
};

// Morphological tokenizer boundary. Owned by the caller and shared read-only
// across requests; a user dictionary applies to a single call only.
class Tokenizer {
public:
  virtual ~Tokenizer() = default;

  virtual DictionaryVariant variant() const = 0;

  virtual TokenizeResult
  tokenize(const std::string &text,
           const std::optional<std::string> &userDictCsv) const = 0;
};

} // namespace Yomigana
