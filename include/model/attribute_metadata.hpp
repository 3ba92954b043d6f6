#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

enum class AttributeKind { Numeric = 0, Nominal };

// Schema entry for one column. Fixed once the dataset is loaded.
struct AttributeMetadata {
  std::string name;
  AttributeKind kind = AttributeKind::Nominal;
  std::vector<std::string> nominal_values; // empty for Numeric

  bool isNominal() const { return kind == AttributeKind::Nominal; }
  int numValues() const { return static_cast<int>(nominal_values.size()); }

  // Index of a nominal value name, -1 when unknown
  int valueIndex(const std::string &value) const {
    for (size_t i = 0; i < nominal_values.size(); ++i) {
      if (nominal_values[i] == value) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }
};

inline bool operator==(const AttributeMetadata &a, const AttributeMetadata &b) {
  return a.name == b.name && a.kind == b.kind &&
         a.nominal_values == b.nominal_values;
}

inline const char *kindToString(AttributeKind kind) {
  return kind == AttributeKind::Numeric ? "numeric" : "nominal";
}

inline void to_json(nlohmann::json &j, const AttributeMetadata &a) {
  j = nlohmann::json{{"name", a.name},
                     {"kind", kindToString(a.kind)},
                     {"nominal_values", a.nominal_values}};
}

inline void from_json(const nlohmann::json &j, AttributeMetadata &a) {
  j.at("name").get_to(a.name);
  std::string kind = j.at("kind").get<std::string>();
  if (kind == "numeric") {
    a.kind = AttributeKind::Numeric;
  } else if (kind == "nominal") {
    a.kind = AttributeKind::Nominal;
  } else {
    throw std::invalid_argument("Unknown attribute kind: " + kind);
  }
  a.nominal_values.clear();
  if (j.contains("nominal_values")) {
    j.at("nominal_values").get_to(a.nominal_values);
  }
}
