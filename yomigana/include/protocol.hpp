#pragma once

#include "analyzer.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace Yomigana {
namespace protocol {

// Failure responses share the success channel as "Error: <what>: <cause>".
inline constexpr const char *kErrorPrefix = "Error: ";

using RequestOutcome = std::variant<AnalysisRequest, AnalysisError>;
using EncodeOutcome = std::variant<std::string, AnalysisError>;

// {"text": string, "user_dict_csv"?: string | null}
RequestOutcome parseRequest(const std::string &bytes);

nlohmann::ordered_json annotationToJson(const TokenAnnotation &annotation);

EncodeOutcome encodeResult(const AnalysisResult &result);

std::string encodeError(const AnalysisError &error);

// Success JSON or error string for an analysis outcome
std::string encodeOutcome(const AnalysisOutcome &outcome);

bool isErrorResponse(const std::string &bytes);

// Decode, analyze and encode one request. Never throws.
std::string analyzeBytes(const Analyzer &analyzer,
                         const std::string &requestBytes);

} // namespace protocol
} // namespace Yomigana
