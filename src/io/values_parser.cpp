#include "io/values_parser.hpp"
#include "utils/error_codes.hpp"
#include "utils/logging.hpp"
#include <cctype>
#include <fstream>
#include <optional>

using vertree::DataFormatError;

namespace {

std::string trim(const std::string &text) {
  size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::optional<double> parseNumber(const std::string &text) {
  try {
    size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed == text.size()) {
      return value;
    }
  } catch (const std::logic_error &) {
  }
  return std::nullopt;
}

const AttributeMetadata *
findAttribute(const std::vector<AttributeMetadata> &attributes,
              const std::string &name) {
  for (const auto &attribute : attributes) {
    if (attribute.name == name) {
      return &attribute;
    }
  }
  return nullptr;
}

} // namespace

FeatureValues parseValues(std::istream &in,
                          const std::vector<AttributeMetadata> &attributes) {
  FeatureValues values;
  std::string raw;
  int line_number = 0;

  while (std::getline(in, raw)) {
    ++line_number;
    if (trim(raw).empty()) {
      continue;
    }

    size_t tab = raw.find('\t');
    if (tab == std::string::npos || raw.find('\t', tab + 1) != std::string::npos) {
      throw DataFormatError("line " + std::to_string(line_number) +
                            ": expected 'name<TAB>value'");
    }
    std::string name = trim(raw.substr(0, tab));
    std::string text = trim(raw.substr(tab + 1));
    if (name.empty() || text.empty()) {
      throw DataFormatError("line " + std::to_string(line_number) +
                            ": empty name or value");
    }

    const AttributeMetadata *attribute = findAttribute(attributes, name);
    if (attribute == nullptr) {
      DEBUG_WARN("Feature '" << name << "' is not an attribute of the model");
    }

    if (text == "t") {
      values[name] = 1.0;
    } else if (text == "f") {
      values[name] = 0.0;
    } else if (auto number = parseNumber(text)) {
      values[name] = *number;
    } else if (attribute != nullptr && attribute->valueIndex(text) >= 0) {
      values[name] = attribute->valueIndex(text);
    } else {
      throw DataFormatError("line " + std::to_string(line_number) + ": '" +
                            text + "' is not a value of " + name);
    }
  }
  return values;
}

FeatureValues loadValuesFile(const std::string &path,
                             const std::vector<AttributeMetadata> &attributes) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw DataFormatError("Cannot open values file " + path);
  }
  return parseValues(file, attributes);
}
