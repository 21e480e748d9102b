#include "config.hpp"

#include <cstdlib>
#include <fstream>

using nlohmann::json;

namespace Yomigana {
namespace config {

namespace {

bool applyDictionaryName(const std::string &name, YomiganaConfig &config,
                         std::string &error) {
  auto variant = parseDictionaryVariant(name);
  if (!variant) {
    error = "unknown dictionary '" + name + "' (expected ipadic or unidic)";
    return false;
  }
  config.dictionary = *variant;
  return true;
}

} // namespace

bool applyJson(const json &opts, YomiganaConfig &config, std::string &error) {
  if (!opts.is_object()) {
    error = "configuration must be a JSON object";
    return false;
  }

  // MeCab設定
  if (opts.contains("mecab") && opts["mecab"].is_object()) {
    const auto &mecab = opts["mecab"];
    if (mecab.contains("dicdir") && mecab["dicdir"].is_string()) {
      config.mecab.dicPath = mecab["dicdir"].get<std::string>();
    }
    if (mecab.contains("charset") && mecab["charset"].is_string()) {
      config.mecab.charset = mecab["charset"].get<std::string>();
    }
  }

  if (opts.contains("dictionary") && opts["dictionary"].is_string()) {
    return applyDictionaryName(opts["dictionary"].get<std::string>(), config,
                               error);
  }

  return true;
}

bool loadFile(const std::string &path, YomiganaConfig &config,
              std::string &error) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open config file: " + path;
    return false;
  }

  try {
    json opts = json::parse(in);
    return applyJson(opts, config, error);
  } catch (const json::parse_error &e) {
    error = "invalid config file " + path + ": " + e.what();
    return false;
  }
}

bool applyEnvironment(YomiganaConfig &config, std::string &error) {
  if (const char *dicdir = std::getenv("YOMIGANA_DICDIR")) {
    config.mecab.dicPath = dicdir;
  }
  if (const char *dictionary = std::getenv("YOMIGANA_DICTIONARY")) {
    return applyDictionaryName(dictionary, config, error);
  }
  return true;
}

} // namespace config
} // namespace Yomigana
