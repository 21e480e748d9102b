#pragma once

#include "feature_schema.hpp"

#include <map>
#include <optional>
#include <string>

namespace Yomigana {
namespace userdic {

// 簡易形式 (表層形,品詞,読み) の語に与えるコスト
inline constexpr int kSimpleEntryCost = -10000;

// Context ids of a system dictionary, read from left-id.def or right-id.def
// ("<id> <feature>" per line).
class ContextIdTable {
public:
  // Parses UTF-8 text in the .def format. On failure the table is unchanged.
  bool parse(const std::string &text, std::string &error);

  void add(int id, const std::string &feature);

  // 品詞 (素性の第1フィールド) に対応する代表ID。
  // 「一般」を含む素性があればその最小ID、なければ最小ID
  std::optional<int> idFor(const std::string &pos) const;

  bool contains(int id) const { return id >= 0 && id < size_; }
  bool empty() const { return size_ == 0; }

private:
  std::map<std::string, int> general_;
  std::map<std::string, int> first_;
  int size_ = 0;
};

struct ContextIds {
  ContextIdTable left;
  ContextIdTable right;
};

// Converts user dictionary CSV into rows mecab-dict-index accepts.
// Three-column rows (surface,pos,reading) are expanded into a full entry for
// the given dictionary variant. Rows with five or more columns are validated
// and passed through. Every emitted row carries explicit context ids that
// exist in `ids`, so mecab-dict-index never has to look them up. Returns
// false with a message naming the offending line otherwise.
bool expandCsv(const std::string &csv, DictionaryVariant variant,
               const ContextIds &ids, std::string &out, std::string &error);

} // namespace userdic
} // namespace Yomigana
