#include "mecab_tokenizer.hpp"
#include "encoding_utils.hpp"
#include "text_processor.hpp"
#include "user_dictionary.hpp"

#include <mecab.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Yomigana {
namespace mecab {

namespace {

bool isDebugEnabled() {
  static const bool debug = std::getenv("YOMIGANA_DEBUG") != nullptr;
  return debug;
}

std::string lastMeCabError() {
  const char *err = MeCab::getLastError();
  return (err && *err) ? std::string(err) : std::string("unknown MeCab error");
}

std::vector<char *> toArgv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &arg : args)
    argv.push_back(&arg[0]);
  argv.push_back(nullptr);
  return argv;
}

// リクエストごとの作業ディレクトリ。スコープを抜けると削除される
class ScopedWorkDir {
public:
  ScopedWorkDir() {
    static std::atomic<unsigned> counter{0};
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
      return;

    path_ = base / ("yomigana-userdic-" + std::to_string(::getpid()) + "-" +
                    std::to_string(counter++));
    if (!fs::create_directories(path_, ec) || ec)
      path_.clear();
  }

  ~ScopedWorkDir() {
    if (path_.empty())
      return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec && isDebugEnabled()) {
      std::cerr << "[DEBUG] failed to remove " << path_ << ": " << ec.message()
                << std::endl;
    }
  }

  ScopedWorkDir(const ScopedWorkDir &) = delete;
  ScopedWorkDir &operator=(const ScopedWorkDir &) = delete;

  bool valid() const { return !path_.empty(); }
  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

// mecab-dict-index は進捗を標準出力へ書くため、応答と混ざらないよう退避する
class ScopedStdoutCapture {
public:
  ScopedStdoutCapture() : saved_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~ScopedStdoutCapture() { std::cout.rdbuf(saved_); }

  ScopedStdoutCapture(const ScopedStdoutCapture &) = delete;
  ScopedStdoutCapture &operator=(const ScopedStdoutCapture &) = delete;

  std::string captured() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *saved_;
};

// left-id.def / right-id.def は辞書の文字コードで書かれている
bool readContextIdTable(const fs::path &path, const std::string &charset,
                        userdic::ContextIdTable &table, std::string &error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "cannot read " + path.string();
    return false;
  }
  std::ostringstream raw;
  raw << in.rdbuf();

  std::string text;
  encoding::CharsetConverter toUtf8(charset, "UTF-8");
  if (!toUtf8.convert(raw.str(), text)) {
    error = "cannot convert " + path.string() + " from " + charset;
    return false;
  }

  std::string parseError;
  if (!table.parse(text, parseError)) {
    error = path.filename().string() + " " + parseError;
    return false;
  }
  return true;
}

} // namespace

MeCabTokenizer::MeCabTokenizer(DictionaryVariant variant) : variant_(variant) {}

MeCabTokenizer::~MeCabTokenizer() = default;

std::unique_ptr<MeCab::Model>
MeCabTokenizer::createModel(const std::vector<std::string> &args) {
  std::vector<std::string> mutableArgs = args;
  std::vector<char *> argv = toArgv(mutableArgs);
  return std::unique_ptr<MeCab::Model>(MeCab::createModel(
      static_cast<int>(mutableArgs.size()), argv.data()));
}

std::vector<std::string> MeCabTokenizer::modelArgs() const {
  std::vector<std::string> args = {"mecab"};
  if (!config_.dicPath.empty()) {
    args.push_back("-d");
    args.push_back(config_.dicPath);
  }
  return args;
}

SystemDictionaryInfo MeCabTokenizer::inspectModel(const MeCab::Model &model) {
  SystemDictionaryInfo info;
  for (const MeCab::DictionaryInfo *d = model.dictionary_info(); d;
       d = d->next) {
    if (d->type != MECAB_SYS_DIC)
      continue;
    if (d->filename)
      info.dicPath = fs::path(d->filename).parent_path().string();
    if (d->charset)
      info.charset = d->charset;
    info.isAvailable = true;
    break;
  }
  return info;
}

bool MeCabTokenizer::initialize(const MeCabConfig &config) {
  config_ = config;

  std::unique_ptr<MeCab::Model> model = createModel(modelArgs());
  if (!model) {
    last_error_ = "failed to create MeCab model: " + lastMeCabError();
    return false;
  }

  std::unique_ptr<MeCab::Tagger> tagger(model->createTagger());
  if (!tagger) {
    last_error_ = "failed to create MeCab tagger: " + lastMeCabError();
    return false;
  }

  SystemDictionaryInfo info = inspectModel(*model);
  dic_dir_ = !config.dicPath.empty() ? config.dicPath : info.dicPath;
  system_charset_ = !config.charset.empty() ? config.charset
                    : !info.charset.empty() ? info.charset
                                            : std::string("UTF-8");

  if (!encoding::CharsetConverter("UTF-8", system_charset_).isOpen() ||
      !encoding::CharsetConverter(system_charset_, "UTF-8").isOpen()) {
    last_error_ = "unsupported dictionary charset: " + system_charset_;
    return false;
  }

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] MeCab initialized: dicdir=" << dic_dir_
              << ", charset=" << system_charset_
              << ", dictionary=" << toString(variant_) << std::endl;
  }

  model_ = std::move(model);
  tagger_ = std::move(tagger);
  return true;
}

TokenizeResult
MeCabTokenizer::tokenize(const std::string &text,
                         const std::optional<std::string> &userDictCsv) const {
  if (!model_ || !tagger_) {
    return TokenizeResult::failure(TokenizerErrorKind::Tokenization,
                                   "MeCab is not initialized");
  }

  if (!userDictCsv)
    return parseWith(*model_, *tagger_, text);

  ScopedWorkDir workDir;
  if (!workDir.valid()) {
    return TokenizeResult::failure(TokenizerErrorKind::UserDictionary,
                                   "cannot create a temporary directory");
  }

  std::string userDicPath = (workDir.path() / "user.dic").string();
  std::string error;
  if (!compileUserDictionary(*userDictCsv, userDicPath,
                             workDir.path().string(), error)) {
    return TokenizeResult::failure(TokenizerErrorKind::UserDictionary, error);
  }

  std::vector<std::string> args = modelArgs();
  args.push_back("-u");
  args.push_back(userDicPath);

  std::unique_ptr<MeCab::Model> model = createModel(args);
  if (!model) {
    return TokenizeResult::failure(TokenizerErrorKind::UserDictionary,
                                   lastMeCabError());
  }
  std::unique_ptr<MeCab::Tagger> tagger(model->createTagger());
  if (!tagger) {
    return TokenizeResult::failure(TokenizerErrorKind::UserDictionary,
                                   lastMeCabError());
  }

  return parseWith(*model, *tagger, text);
}

TokenizeResult MeCabTokenizer::parseWith(const MeCab::Model &model,
                                         const MeCab::Tagger &tagger,
                                         const std::string &text) const {
  encoding::CharsetConverter toSystem("UTF-8", system_charset_);
  encoding::CharsetConverter fromSystem(system_charset_, "UTF-8");

  std::string input;
  if (!toSystem.convert(text, input)) {
    return TokenizeResult::failure(TokenizerErrorKind::Tokenization,
                                   "cannot convert input text to " +
                                       system_charset_);
  }

  std::unique_ptr<MeCab::Lattice> lattice(model.createLattice());
  if (!lattice) {
    return TokenizeResult::failure(TokenizerErrorKind::Tokenization,
                                   lastMeCabError());
  }
  lattice->set_sentence(input.c_str(), input.size());

  if (!tagger.parse(lattice.get())) {
    const char *what = lattice->what();
    return TokenizeResult::failure(TokenizerErrorKind::Tokenization,
                                   what ? what : lastMeCabError());
  }

  TokenizeResult result;
  size_t cursor = 0;

  for (const MeCab::Node *node = lattice->bos_node(); node;
       node = node->next) {
    if (node->stat == MECAB_BOS_NODE || node->stat == MECAB_EOS_NODE)
      continue;

    std::string surface;
    std::string feature;
    if (!fromSystem.convert(std::string(node->surface, node->length),
                            surface) ||
        !fromSystem.convert(node->feature ? node->feature : "", feature)) {
      return TokenizeResult::failure(TokenizerErrorKind::Tokenization,
                                     "cannot convert MeCab output from " +
                                         system_charset_);
    }

    // rlength - length は直前の空白 (ASCII) のバイト数
    size_t start = cursor + (node->rlength - node->length);
    if (start > text.size() ||
        text.compare(start, surface.size(), surface) != 0) {
      start = text.find(surface, cursor);
      if (start == std::string::npos) {
        return TokenizeResult::failure(
            TokenizerErrorKind::Tokenization,
            "cannot locate token '" + surface + "' after byte " +
                std::to_string(cursor));
      }
    }

    Token token;
    token.surface = surface;
    token.startByte = start;
    token.endByte = start + surface.size();
    token.feature = text::TextProcessor::sanitizeUTF8(feature);
    cursor = token.endByte;
    result.tokens.push_back(std::move(token));
  }

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] MeCab produced " << result.tokens.size()
              << " tokens for " << text.size() << " bytes" << std::endl;
  }

  return result;
}

bool MeCabTokenizer::compileUserDictionary(const std::string &csv,
                                           const std::string &outputPath,
                                           const std::string &workDir,
                                           std::string &error) const {
  if (dic_dir_.empty()) {
    error = "system dictionary directory is unknown";
    return false;
  }

  // 文脈IDを空のまま渡すと mecab-dict-index は未知の素性でプロセスを終了させる
  userdic::ContextIds ids;
  if (!readContextIdTable(fs::path(dic_dir_) / "left-id.def", system_charset_,
                          ids.left, error) ||
      !readContextIdTable(fs::path(dic_dir_) / "right-id.def", system_charset_,
                          ids.right, error))
    return false;

  std::string rows;
  if (!userdic::expandCsv(csv, variant_, ids, rows, error))
    return false;

  std::string csvPath = (fs::path(workDir) / "user.csv").string();
  {
    std::ofstream out(csvPath, std::ios::binary);
    out << rows;
    if (!out) {
      error = "cannot write " + csvPath;
      return false;
    }
  }

  std::vector<std::string> args = {"mecab-dict-index", "-d", dic_dir_,
                                   "-u",               outputPath,
                                   "-f",               "UTF-8",
                                   "-t",               system_charset_,
                                   csvPath};
  std::vector<char *> argv = toArgv(args);

  int rc = 0;
  std::string progress;
  {
    ScopedStdoutCapture capture;
    rc = mecab_dict_index(static_cast<int>(args.size()), argv.data());
    progress = capture.captured();
  }

  if (isDebugEnabled() && !progress.empty()) {
    std::cerr << "[DEBUG] mecab-dict-index: " << progress << std::endl;
  }

  if (rc != 0 || !fs::exists(outputPath)) {
    error = "mecab-dict-index failed (exit code " + std::to_string(rc) + ")";
    return false;
  }
  return true;
}

} // namespace mecab
} // namespace Yomigana
