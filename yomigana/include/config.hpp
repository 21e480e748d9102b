#pragma once

#include "feature_schema.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace Yomigana {

struct MeCabConfig {
  std::string dicPath; // Dictionary directory path (empty = MeCab default)
  std::string charset; // Dictionary charset (empty = detect from dictionary)
};

struct YomiganaConfig {
  MeCabConfig mecab;
  DictionaryVariant dictionary = DictionaryVariant::Ipadic;
};

namespace config {

// {"mecab": {"dicdir", "charset"}, "dictionary": "ipadic" | "unidic"}
// Keys of an unexpected type are ignored.
bool applyJson(const nlohmann::json &opts, YomiganaConfig &config,
               std::string &error);

bool loadFile(const std::string &path, YomiganaConfig &config,
              std::string &error);

// YOMIGANA_DICDIR, YOMIGANA_DICTIONARY
bool applyEnvironment(YomiganaConfig &config, std::string &error);

} // namespace config
} // namespace Yomigana
