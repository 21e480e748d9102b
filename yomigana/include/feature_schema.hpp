#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Yomigana {

// 「該当なし」および「読みなし」を表す辞書の番兵値
inline constexpr const char *kNotApplicable = "*";

enum class DictionaryVariant { Ipadic, Unidic };

// IPAdic: 品詞,品詞細分類1,品詞細分類2,品詞細分類3,活用型,活用形,原形,読み,発音
struct IpadicFeatures {
  std::string pos;             // 品詞
  std::string subPos1;         // 品詞細分類1
  std::string subPos2;         // 品詞細分類2
  std::string subPos3;         // 品詞細分類3
  std::string conjugationType; // 活用型
  std::string conjugationForm; // 活用形
  std::string baseForm;        // 原形
  std::string reading;         // 読み
  std::string pronunciation;   // 発音

  static constexpr size_t kFieldCount = 9;
};

// UniDic (先頭17列)
struct UnidicFeatures {
  std::string pos1;              // 品詞大分類
  std::string pos2;              // 品詞中分類
  std::string pos3;              // 品詞小分類
  std::string pos4;              // 品詞細分類
  std::string conjugationType;   // 活用型
  std::string conjugationForm;   // 活用形
  std::string lemmaReading;      // 語彙素読み
  std::string lemma;             // 語彙素
  std::string orthography;       // 書字形出現形
  std::string pronunciation;     // 発音形出現形
  std::string orthographyBase;   // 書字形基本形
  std::string pronunciationBase; // 発音形基本形
  std::string wordOrigin;        // 語種
  std::string initialChangeType; // 語頭変化型
  std::string initialChangeForm; // 語頭変化形
  std::string finalChangeType;   // 語末変化型
  std::string finalChangeForm;   // 語末変化形

  static constexpr size_t kFieldCount = 17;
};

using TokenFeatures = std::variant<IpadicFeatures, UnidicFeatures>;

std::string toString(DictionaryVariant variant);
std::optional<DictionaryVariant> parseDictionaryVariant(const std::string &name);

namespace pos {

class FeatureSchema {
public:
  static size_t fieldCount(DictionaryVariant variant);

  static DictionaryVariant variantOf(const TokenFeatures &features);

  // 欠けた列は "*" で補い、余分な列は無視する
  static TokenFeatures parse(DictionaryVariant variant,
                             const std::string &feature);

  static TokenFeatures fromFields(DictionaryVariant variant,
                                  const std::vector<std::string> &fields);

  // 空白などトークン化されなかった範囲のメタデータ
  static TokenFeatures whitespace(DictionaryVariant variant);

  static std::vector<std::string> toFieldList(const TokenFeatures &features);

  // 引用符 ("...") で囲まれた列はカンマを含んでもよい
  static std::vector<std::string> splitFeature(const std::string &feature);

  static std::string joinFields(const std::vector<std::string> &fields);
};

} // namespace pos
} // namespace Yomigana
