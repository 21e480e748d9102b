#include "user_dictionary.hpp"
#include "text_processor.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace Yomigana {
namespace userdic {

namespace {

bool isInteger(const std::string &field) {
  if (field.empty())
    return false;
  size_t i = (field[0] == '-' || field[0] == '+') ? 1 : 0;
  if (i == field.size())
    return false;
  for (; i < field.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(field[i])))
      return false;
  }
  return true;
}

// 文脈IDとして扱える範囲の整数のみ
std::optional<int> toContextId(const std::string &field) {
  if (!isInteger(field) || field.size() > 6)
    return std::nullopt;
  return std::stoi(field);
}

bool fillContextId(std::string &field, const ContextIdTable &table,
                   const char *side, const std::string &pos,
                   std::string &error) {
  if (field.empty()) {
    std::optional<int> id = table.idFor(pos);
    if (!id) {
      error = std::string("no ") + side + " context id for part of speech '" +
              pos + "'";
      return false;
    }
    field = std::to_string(*id);
    return true;
  }

  std::optional<int> id = toContextId(field);
  if (!id || !table.contains(*id)) {
    error = std::string(side) + " context id " + field +
            " is not defined by the system dictionary";
    return false;
  }
  return true;
}

// 空の文脈IDを品詞から補い、指定済みのIDは辞書の範囲内か確認する
bool resolveContextIds(std::vector<std::string> &row, const ContextIds &ids,
                       std::string &error) {
  const std::string &pos = row[4];
  return fillContextId(row[1], ids.left, "left", pos, error) &&
         fillContextId(row[2], ids.right, "right", pos, error);
}

std::vector<std::string> expandSimpleEntry(const std::vector<std::string> &cols,
                                           DictionaryVariant variant) {
  const std::string &surface = cols[0];
  const std::string &pos = cols[1];
  const std::string &reading = cols[2];

  std::vector<std::string> features(pos::FeatureSchema::fieldCount(variant),
                                    kNotApplicable);
  features[0] = pos;
  if (variant == DictionaryVariant::Unidic) {
    features[6] = reading;  // 語彙素読み
    features[7] = surface;  // 語彙素
    features[8] = surface;  // 書字形出現形
    features[9] = reading;  // 発音形出現形
    features[10] = surface; // 書字形基本形
    features[11] = reading; // 発音形基本形
  } else {
    features[6] = surface; // 原形
    features[7] = reading; // 読み
  }

  // 文脈IDは resolveContextIds で埋める
  std::vector<std::string> row = {surface, "", "",
                                  std::to_string(kSimpleEntryCost)};
  row.insert(row.end(), features.begin(), features.end());
  return row;
}

} // namespace

bool ContextIdTable::parse(const std::string &text, std::string &error) {
  ContextIdTable parsed;
  std::vector<std::string> lines = text::TextProcessor::splitLines(text);

  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string &line = lines[i];
    if (text::TextProcessor::isBlank(line))
      continue;

    size_t space = line.find_first_of(" \t");
    size_t featureBegin = line.find_first_not_of(" \t", space);
    std::optional<int> id =
        featureBegin == std::string::npos ? std::nullopt
                                          : toContextId(line.substr(0, space));
    if (!id || *id < 0) {
      error = "line " + std::to_string(i + 1) + ": expected '<id> <feature>'";
      return false;
    }
    parsed.add(*id, line.substr(featureBegin));
  }

  *this = std::move(parsed);
  return true;
}

void ContextIdTable::add(int id, const std::string &feature) {
  std::vector<std::string> fields = pos::FeatureSchema::splitFeature(feature);
  if (fields.empty())
    return;
  const std::string &pos = fields[0];

  auto first = first_.find(pos);
  if (first == first_.end() || id < first->second)
    first_[pos] = id;

  if (std::find(fields.begin() + 1, fields.end(), "一般") != fields.end()) {
    auto general = general_.find(pos);
    if (general == general_.end() || id < general->second)
      general_[pos] = id;
  }

  size_ = std::max(size_, id + 1);
}

std::optional<int> ContextIdTable::idFor(const std::string &pos) const {
  auto general = general_.find(pos);
  if (general != general_.end())
    return general->second;
  auto first = first_.find(pos);
  if (first != first_.end())
    return first->second;
  return std::nullopt;
}

bool expandCsv(const std::string &csv, DictionaryVariant variant,
               const ContextIds &ids, std::string &out, std::string &error) {
  std::string result;
  std::vector<std::string> lines = text::TextProcessor::splitLines(csv);

  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string &line = lines[i];
    if (text::TextProcessor::isBlank(line))
      continue;

    std::vector<std::string> cols = pos::FeatureSchema::splitFeature(line);
    std::string lineLabel = "line " + std::to_string(i + 1);

    if (cols[0].empty()) {
      error = lineLabel + ": empty surface";
      return false;
    }

    if (cols.size() == 3) {
      std::vector<std::string> row = expandSimpleEntry(cols, variant);
      if (!resolveContextIds(row, ids, error)) {
        error = lineLabel + ": " + error;
        return false;
      }
      result += pos::FeatureSchema::joinFields(row);
      result += '\n';
      continue;
    }

    if (cols.size() < 5) {
      error = lineLabel + ": expected 3 columns (surface,pos,reading) or a "
                          "full entry, got " +
              std::to_string(cols.size());
      return false;
    }

    // 表層形,左文脈ID,右文脈ID,コスト,素性...
    if ((!cols[1].empty() && !isInteger(cols[1])) ||
        (!cols[2].empty() && !isInteger(cols[2]))) {
      error = lineLabel + ": context ids must be integers or empty";
      return false;
    }
    if (!isInteger(cols[3]) || cols[3].size() > 6 ||
        std::stol(cols[3]) < -32768 || std::stol(cols[3]) > 32767) {
      error = lineLabel + ": cost must be an integer in [-32768, 32767]";
      return false;
    }

    bool idsGiven = !cols[1].empty() && !cols[2].empty();
    if (!resolveContextIds(cols, ids, error)) {
      error = lineLabel + ": " + error;
      return false;
    }

    result += idsGiven ? line : pos::FeatureSchema::joinFields(cols);
    result += '\n';
  }

  if (result.empty()) {
    error = "no entries";
    return false;
  }

  out = std::move(result);
  return true;
}

} // namespace userdic
} // namespace Yomigana
