#pragma once

#include "feature_schema.hpp"

#include <optional>
#include <string>

namespace Yomigana {
namespace furigana {

struct ReadingChoice {
  std::optional<std::string> reading; // nullopt = 読みなし
  bool reconstruct{false};            // 活用語: 表記の復元が必要
};

// IPAdic は「読み」をそのまま使う。UniDic は活用語なら発音形出現形、
// それ以外は語彙素読みを優先し、"*" なら語彙素読みに戻る。
ReadingChoice selectReading(const TokenFeatures &features);

} // namespace furigana
} // namespace Yomigana
