#include "feature_schema.hpp"

namespace Yomigana {

std::string toString(DictionaryVariant variant) {
  switch (variant) {
  case DictionaryVariant::Ipadic:
    return "ipadic";
  case DictionaryVariant::Unidic:
    return "unidic";
  }
  return "ipadic";
}

std::optional<DictionaryVariant> parseDictionaryVariant(const std::string &name) {
  if (name == "ipadic")
    return DictionaryVariant::Ipadic;
  if (name == "unidic")
    return DictionaryVariant::Unidic;
  return std::nullopt;
}

namespace pos {

namespace {

const std::string &fieldAt(const std::vector<std::string> &fields,
                           size_t index) {
  static const std::string notApplicable(kNotApplicable);
  return index < fields.size() ? fields[index] : notApplicable;
}

struct FieldListVisitor {
  std::vector<std::string> operator()(const IpadicFeatures &f) const {
    return {f.pos,
            f.subPos1,
            f.subPos2,
            f.subPos3,
            f.conjugationType,
            f.conjugationForm,
            f.baseForm,
            f.reading,
            f.pronunciation};
  }

  std::vector<std::string> operator()(const UnidicFeatures &f) const {
    return {f.pos1,
            f.pos2,
            f.pos3,
            f.pos4,
            f.conjugationType,
            f.conjugationForm,
            f.lemmaReading,
            f.lemma,
            f.orthography,
            f.pronunciation,
            f.orthographyBase,
            f.pronunciationBase,
            f.wordOrigin,
            f.initialChangeType,
            f.initialChangeForm,
            f.finalChangeType,
            f.finalChangeForm};
  }
};

} // namespace

size_t FeatureSchema::fieldCount(DictionaryVariant variant) {
  return variant == DictionaryVariant::Unidic ? UnidicFeatures::kFieldCount
                                              : IpadicFeatures::kFieldCount;
}

DictionaryVariant FeatureSchema::variantOf(const TokenFeatures &features) {
  return std::holds_alternative<UnidicFeatures>(features)
             ? DictionaryVariant::Unidic
             : DictionaryVariant::Ipadic;
}

TokenFeatures FeatureSchema::parse(DictionaryVariant variant,
                                   const std::string &feature) {
  return fromFields(variant, splitFeature(feature));
}

TokenFeatures FeatureSchema::fromFields(DictionaryVariant variant,
                                        const std::vector<std::string> &fields) {
  if (variant == DictionaryVariant::Unidic) {
    UnidicFeatures f;
    f.pos1 = fieldAt(fields, 0);
    f.pos2 = fieldAt(fields, 1);
    f.pos3 = fieldAt(fields, 2);
    f.pos4 = fieldAt(fields, 3);
    f.conjugationType = fieldAt(fields, 4);
    f.conjugationForm = fieldAt(fields, 5);
    f.lemmaReading = fieldAt(fields, 6);
    f.lemma = fieldAt(fields, 7);
    f.orthography = fieldAt(fields, 8);
    f.pronunciation = fieldAt(fields, 9);
    f.orthographyBase = fieldAt(fields, 10);
    f.pronunciationBase = fieldAt(fields, 11);
    f.wordOrigin = fieldAt(fields, 12);
    f.initialChangeType = fieldAt(fields, 13);
    f.initialChangeForm = fieldAt(fields, 14);
    f.finalChangeType = fieldAt(fields, 15);
    f.finalChangeForm = fieldAt(fields, 16);
    return f;
  }

  IpadicFeatures f;
  f.pos = fieldAt(fields, 0);
  f.subPos1 = fieldAt(fields, 1);
  f.subPos2 = fieldAt(fields, 2);
  f.subPos3 = fieldAt(fields, 3);
  f.conjugationType = fieldAt(fields, 4);
  f.conjugationForm = fieldAt(fields, 5);
  f.baseForm = fieldAt(fields, 6);
  f.reading = fieldAt(fields, 7);
  f.pronunciation = fieldAt(fields, 8);
  return f;
}

TokenFeatures FeatureSchema::whitespace(DictionaryVariant variant) {
  return fromFields(variant, {"Whitespace"});
}

std::vector<std::string>
FeatureSchema::toFieldList(const TokenFeatures &features) {
  return std::visit(FieldListVisitor{}, features);
}

std::vector<std::string> FeatureSchema::splitFeature(const std::string &feature) {
  std::vector<std::string> fields;
  if (feature.empty())
    return fields;

  std::string current;
  bool quoted = false;

  for (size_t i = 0; i < feature.size(); ++i) {
    char c = feature[i];

    if (quoted) {
      if (c == '"') {
        if (i + 1 < feature.size() && feature[i + 1] == '"') {
          current += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        current += c;
      }
      continue;
    }

    if (c == '"' && current.empty()) {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(current));
      current.clear();
    } else {
      current += c;
    }
  }

  fields.push_back(std::move(current));
  return fields;
}

std::string FeatureSchema::joinFields(const std::vector<std::string> &fields) {
  std::string out;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0)
      out += ',';

    const std::string &field = fields[i];
    if (field.find_first_of(",\"") == std::string::npos) {
      out += field;
      continue;
    }

    out += '"';
    for (char c : field) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
  }
  return out;
}

} // namespace pos
} // namespace Yomigana
