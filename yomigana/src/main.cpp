#include "analyzer.hpp"
#include "config.hpp"
#include "mecab_tokenizer.hpp"
#include "protocol.hpp"
#include "server.hpp"

#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace {

struct CommandLine {
  bool serve = false;
  bool help = false;
  std::optional<std::string> text;
  std::optional<std::string> configPath;
  std::optional<std::string> dicdir;
  std::optional<std::string> dictionary;
  std::optional<std::string> charset;
};

void printUsage(std::ostream &out) {
  out << "Usage: yomigana [options]\n"
         "\n"
         "Reads one JSON request {\"text\": ..., \"user_dict_csv\": ...} from "
         "stdin\n"
         "and writes the ruby annotation JSON (or \"Error: ...\") to "
         "stdout.\n"
         "\n"
         "Options:\n"
         "  --serve                 Handle Content-Length framed requests "
         "until EOF\n"
         "  --text <string>         Analyze the given text instead of stdin\n"
         "  --dicdir <dir>          MeCab dictionary directory\n"
         "  --dictionary <name>     Feature layout: ipadic (default) or "
         "unidic\n"
         "  --charset <charset>     Dictionary charset (default: detected)\n"
         "  --config <file>         JSON configuration file\n"
         "  --help                  Show this message\n"
         "\n"
         "Environment: YOMIGANA_DICDIR, YOMIGANA_DICTIONARY, YOMIGANA_DEBUG\n";
}

bool parseArgs(int argc, char **argv, CommandLine &cmd, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--serve") {
      cmd.serve = true;
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      cmd.help = true;
      continue;
    }

    std::optional<std::string> *target = nullptr;
    if (arg == "--text")
      target = &cmd.text;
    else if (arg == "--config")
      target = &cmd.configPath;
    else if (arg == "--dicdir")
      target = &cmd.dicdir;
    else if (arg == "--dictionary")
      target = &cmd.dictionary;
    else if (arg == "--charset")
      target = &cmd.charset;

    if (!target) {
      error = "unknown option: " + arg;
      return false;
    }
    if (i + 1 >= argc) {
      error = "missing value for " + arg;
      return false;
    }
    *target = argv[++i];
  }

  if (cmd.serve && cmd.text) {
    error = "--serve and --text cannot be combined";
    return false;
  }
  return true;
}

bool buildConfig(const CommandLine &cmd, Yomigana::YomiganaConfig &config,
                 std::string &error) {
  if (cmd.configPath &&
      !Yomigana::config::loadFile(*cmd.configPath, config, error))
    return false;
  if (!Yomigana::config::applyEnvironment(config, error))
    return false;

  if (cmd.dicdir)
    config.mecab.dicPath = *cmd.dicdir;
  if (cmd.charset)
    config.mecab.charset = *cmd.charset;
  if (cmd.dictionary) {
    auto variant = Yomigana::parseDictionaryVariant(*cmd.dictionary);
    if (!variant) {
      error = "unknown dictionary '" + *cmd.dictionary +
              "' (expected ipadic or unidic)";
      return false;
    }
    config.dictionary = *variant;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  std::ios::sync_with_stdio(false);

  CommandLine cmd;
  std::string error;
  if (!parseArgs(argc, argv, cmd, error)) {
    std::cerr << "[ERROR] " << error << std::endl;
    printUsage(std::cerr);
    return 2;
  }
  if (cmd.help) {
    printUsage(std::cout);
    return 0;
  }

  Yomigana::YomiganaConfig config;
  if (!buildConfig(cmd, config, error)) {
    std::cerr << "[ERROR] " << error << std::endl;
    return 2;
  }

  Yomigana::mecab::MeCabTokenizer tokenizer(config.dictionary);
  if (!tokenizer.initialize(config.mecab)) {
    std::cerr << "[ERROR] " << tokenizer.lastError() << std::endl;
    return 2;
  }

  Yomigana::Analyzer analyzer(tokenizer);

  if (cmd.serve) {
    Yomigana::RequestServer server(std::cin, std::cout, analyzer);
    server.run();
    return 0;
  }

  std::string response;
  if (cmd.text) {
    response = Yomigana::protocol::encodeOutcome(
        analyzer.analyze(Yomigana::AnalysisRequest{*cmd.text, std::nullopt}));
  } else {
    std::string request((std::istreambuf_iterator<char>(std::cin)),
                        std::istreambuf_iterator<char>());
    response = Yomigana::protocol::analyzeBytes(analyzer, request);
  }

  std::cout << response;
  std::cout.flush();
  return Yomigana::protocol::isErrorResponse(response) ? 1 : 0;
}
