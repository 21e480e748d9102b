#include "protocol.hpp"

using nlohmann::json;
using nlohmann::ordered_json;

namespace Yomigana {
namespace protocol {

namespace {

const char *errorLabel(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MalformedRequest:
    return "Invalid JSON";
  case ErrorKind::TokenizationFailed:
    return "Tokenization failed";
  case ErrorKind::UserDictionaryFailed:
    return "Failed to build user dictionary";
  case ErrorKind::EncodingFailed:
    return "Serialization failed";
  }
  return "Internal error";
}

AnalysisError malformed(const std::string &message) {
  return AnalysisError{ErrorKind::MalformedRequest, message};
}

ordered_json segmentsToJson(const std::vector<furigana::RubySegment> &segments) {
  ordered_json list = ordered_json::array();
  for (const auto &segment : segments) {
    list.push_back(ordered_json{{"text", segment.text}, {"ruby", segment.ruby}});
  }
  return list;
}

} // namespace

RequestOutcome parseRequest(const std::string &bytes) {
  json req;
  try {
    req = json::parse(bytes);
  } catch (const json::parse_error &e) {
    return malformed(e.what());
  }

  if (!req.is_object())
    return malformed("expected an object");

  if (!req.contains("text"))
    return malformed("missing field `text`");
  if (!req["text"].is_string())
    return malformed("invalid type for field `text`: expected a string");

  AnalysisRequest request;
  request.text = req["text"].get<std::string>();

  if (req.contains("user_dict_csv")) {
    const json &csv = req["user_dict_csv"];
    if (csv.is_string()) {
      request.userDictCsv = csv.get<std::string>();
    } else if (!csv.is_null()) {
      return malformed(
          "invalid type for field `user_dict_csv`: expected a string");
    }
  }

  return request;
}

ordered_json annotationToJson(const TokenAnnotation &annotation) {
  std::vector<std::string> fields =
      pos::FeatureSchema::toFieldList(annotation.features);

  ordered_json obj;
  obj["surface"] = annotation.surface;

  if (const auto *ipadic = std::get_if<IpadicFeatures>(&annotation.features)) {
    obj["pos"] = ipadic->pos;
    obj["sub_pos"] = ipadic->subPos1;
    obj["reading"] = ipadic->reading;
    obj["base"] = ipadic->baseForm;
  }

  obj["details"] = fields;
  obj["ruby_segments"] = segmentsToJson(annotation.rubySegments);
  return obj;
}

EncodeOutcome encodeResult(const AnalysisResult &result) {
  ordered_json list = ordered_json::array();
  for (const auto &annotation : result.annotations) {
    list.push_back(annotationToJson(annotation));
  }

  try {
    return list.dump(-1, ' ', false, ordered_json::error_handler_t::strict);
  } catch (const json::type_error &e) {
    return AnalysisError{ErrorKind::EncodingFailed, e.what()};
  }
}

std::string encodeError(const AnalysisError &error) {
  return std::string(kErrorPrefix) + errorLabel(error.kind) + ": " +
         error.message;
}

std::string encodeOutcome(const AnalysisOutcome &outcome) {
  if (const auto *err = std::get_if<AnalysisError>(&outcome))
    return encodeError(*err);

  EncodeOutcome encoded = encodeResult(std::get<AnalysisResult>(outcome));
  if (const auto *err = std::get_if<AnalysisError>(&encoded))
    return encodeError(*err);

  return std::get<std::string>(std::move(encoded));
}

bool isErrorResponse(const std::string &bytes) {
  return bytes.rfind(kErrorPrefix, 0) == 0;
}

std::string analyzeBytes(const Analyzer &analyzer,
                         const std::string &requestBytes) {
  RequestOutcome request = parseRequest(requestBytes);
  if (const auto *err = std::get_if<AnalysisError>(&request))
    return encodeError(*err);

  return encodeOutcome(analyzer.analyze(std::get<AnalysisRequest>(request)));
}

} // namespace protocol
} // namespace Yomigana
