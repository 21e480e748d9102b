#pragma once

#include "config.hpp"
#include "tokenizer.hpp"

#include <memory>
#include <string>
#include <vector>

// Forward declarations
namespace MeCab {
class Model;
class Tagger;
} // namespace MeCab

namespace Yomigana {

namespace mecab {

struct SystemDictionaryInfo {
  std::string dicPath; // Dictionary directory
  std::string charset; // Character encoding
  bool isAvailable = false;
};

// Tokenizer backed by a MeCab model. The system model and tagger are created
// once in initialize() and shared by every tokenize() call; each call parses
// with its own lattice and its own charset converters, so concurrent calls
// share no mutable state.
class MeCabTokenizer : public Tokenizer {
public:
  explicit MeCabTokenizer(DictionaryVariant variant);
  ~MeCabTokenizer() override;

  MeCabTokenizer(const MeCabTokenizer &) = delete;
  MeCabTokenizer &operator=(const MeCabTokenizer &) = delete;

  bool initialize(const MeCabConfig &config);

  bool isInitialized() const { return model_ != nullptr; }
  const std::string &lastError() const { return last_error_; }

  DictionaryVariant variant() const override { return variant_; }

  TokenizeResult
  tokenize(const std::string &text,
           const std::optional<std::string> &userDictCsv) const override;

private:
  static std::unique_ptr<MeCab::Model>
  createModel(const std::vector<std::string> &args);

  std::vector<std::string> modelArgs() const;

  static SystemDictionaryInfo inspectModel(const MeCab::Model &model);

  TokenizeResult parseWith(const MeCab::Model &model,
                           const MeCab::Tagger &tagger,
                           const std::string &text) const;

  bool compileUserDictionary(const std::string &csv,
                             const std::string &outputPath,
                             const std::string &workDir,
                             std::string &error) const;

  DictionaryVariant variant_;
  MeCabConfig config_;
  std::unique_ptr<MeCab::Model> model_;
  std::unique_ptr<MeCab::Tagger> tagger_;
  std::string system_charset_;
  std::string dic_dir_;
  std::string last_error_;
};

} // namespace mecab
} // namespace Yomigana
