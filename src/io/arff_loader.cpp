#include "io/arff_loader.hpp"
#include "utils/error_codes.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

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

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

std::string unquote(const std::string &text) {
  std::string value = trim(text);
  if (value.size() >= 2 && (value.front() == '\'' || value.front() == '"') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool startsWithKeyword(const std::string &line, const std::string &keyword) {
  return line.size() >= keyword.size() &&
         lower(line.substr(0, keyword.size())) == keyword;
}

// Splits on commas outside quotes
std::vector<std::string> splitFields(const std::string &text) {
  std::vector<std::string> fields;
  std::string current;
  char quote = 0;
  for (char c : text) {
    if (quote != 0) {
      current += c;
      if (c == quote) {
        quote = 0;
      }
    } else if (c == '\'' || c == '"') {
      quote = c;
      current += c;
    } else if (c == ',') {
      fields.push_back(unquote(current));
      current.clear();
    } else {
      current += c;
    }
  }
  fields.push_back(unquote(current));
  return fields;
}

std::string formatError(const std::string &source, int line_number,
                        const std::string &detail) {
  return source + ":" + std::to_string(line_number) + ": " + detail;
}

AttributeMetadata parseAttribute(const std::string &declaration,
                                 const std::string &source, int line_number) {
  // declaration is everything after "@attribute"
  std::string rest = trim(declaration);
  AttributeMetadata attribute;

  size_t name_end = 0;
  if (!rest.empty() && (rest.front() == '\'' || rest.front() == '"')) {
    name_end = rest.find(rest.front(), 1);
    if (name_end == std::string::npos) {
      throw DataFormatError(formatError(source, line_number, "unterminated name"));
    }
    attribute.name = rest.substr(1, name_end - 1);
    ++name_end;
  } else {
    while (name_end < rest.size() &&
           !std::isspace(static_cast<unsigned char>(rest[name_end])) &&
           rest[name_end] != '{') {
      ++name_end;
    }
    attribute.name = rest.substr(0, name_end);
  }
  if (attribute.name.empty()) {
    throw DataFormatError(formatError(source, line_number, "attribute without a name"));
  }

  std::string type = trim(rest.substr(name_end));
  if (!type.empty() && type.front() == '{') {
    size_t close = type.rfind('}');
    if (close == std::string::npos) {
      throw DataFormatError(formatError(source, line_number, "unterminated nominal list"));
    }
    attribute.kind = AttributeKind::Nominal;
    for (const auto &value : splitFields(type.substr(1, close - 1))) {
      if (value.empty()) {
        throw DataFormatError(formatError(source, line_number, "empty nominal value"));
      }
      attribute.nominal_values.push_back(value);
    }
    return attribute;
  }

  std::string kind = lower(type);
  if (kind == "numeric" || kind == "real" || kind == "integer") {
    attribute.kind = AttributeKind::Numeric;
    return attribute;
  }
  throw DataFormatError(formatError(source, line_number,
                                    "unsupported attribute type '" + type + "'"));
}

} // namespace

int discretizeNumeric(double value) {
  if (value <= 0.0) {
    return 0;
  }
  if (value >= 1.0) {
    return 9;
  }
  return static_cast<int>(std::floor(value * 10.0));
}

Dataset loadArff(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw DataFormatError("Cannot open dataset file " + path);
  }
  return parseArff(file, path);
}

Dataset parseArff(std::istream &in, const std::string &source_name) {
  Dataset dataset;
  bool in_data = false;
  int line_number = 0;
  std::string raw;

  while (std::getline(in, raw)) {
    ++line_number;
    std::string line = trim(raw);
    if (line.empty() || line.front() == '%') {
      continue;
    }

    if (!in_data) {
      if (startsWithKeyword(line, "@relation")) {
        dataset.relation = unquote(line.substr(9));
      } else if (startsWithKeyword(line, "@attribute")) {
        dataset.attributes.push_back(
            parseAttribute(line.substr(10), source_name, line_number));
      } else if (startsWithKeyword(line, "@data")) {
        if (dataset.attributes.empty()) {
          throw DataFormatError(
              formatError(source_name, line_number, "@data before any @attribute"));
        }
        in_data = true;
      } else {
        throw DataFormatError(formatError(source_name, line_number,
                                          "unexpected header line '" + line + "'"));
      }
      continue;
    }

    if (line.front() == '{') {
      throw DataFormatError(
          formatError(source_name, line_number, "sparse rows are not supported"));
    }

    auto fields = splitFields(line);
    if (fields.size() != dataset.attributes.size()) {
      throw DataFormatError(formatError(
          source_name, line_number,
          std::to_string(fields.size()) + " values for " +
              std::to_string(dataset.attributes.size()) + " attributes"));
    }

    std::vector<int> row;
    row.reserve(fields.size());
    for (size_t i = 0; i < fields.size(); ++i) {
      const auto &attribute = dataset.attributes[i];
      const std::string &field = fields[i];
      if (field == "?") {
        row.push_back(kMissingValue);
      } else if (attribute.isNominal()) {
        int index = attribute.valueIndex(field);
        if (index < 0) {
          throw DataFormatError(formatError(
              source_name, line_number,
              "'" + field + "' is not a value of " + attribute.name));
        }
        row.push_back(index);
      } else {
        try {
          size_t consumed = 0;
          double value = std::stod(field, &consumed);
          if (consumed != field.size()) {
            throw std::invalid_argument(field);
          }
          row.push_back(discretizeNumeric(value));
        } catch (const std::logic_error &) {
          throw DataFormatError(formatError(
              source_name, line_number,
              "'" + field + "' is not numeric for " + attribute.name));
        }
      }
    }
    dataset.rows.push_back(std::move(row));
  }

  if (!in_data) {
    throw DataFormatError(source_name + ": no @data section");
  }

  dataset.class_index = static_cast<int>(dataset.attributes.size()) - 1;
  DEBUG_INFO("Loaded " << source_name << ": " << dataset.attributes.size()
                       << " attributes, " << dataset.rows.size() << " rows");
  return dataset;
}

void writeArff(std::ostream &out, const Dataset &dataset) {
  out << "@relation " << (dataset.relation.empty() ? "dataset" : dataset.relation)
      << "\n\n";
  for (const auto &attribute : dataset.attributes) {
    out << "@attribute '" << attribute.name << "' ";
    if (attribute.isNominal()) {
      out << "{";
      for (size_t i = 0; i < attribute.nominal_values.size(); ++i) {
        if (i > 0) out << ",";
        out << attribute.nominal_values[i];
      }
      out << "}\n";
    } else {
      out << "numeric\n";
    }
  }

  out << "\n@data\n";
  for (const auto &row : dataset.rows) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0) out << ",";
      const auto &attribute = dataset.attributes[i];
      if (row[i] == kMissingValue) {
        out << "?";
      } else if (attribute.isNominal()) {
        out << attribute.nominal_values.at(row[i]);
      } else {
        out << (row[i] + 0.5) / 10.0;
      }
    }
    out << "\n";
  }
}

void saveArff(const std::string &path, const Dataset &dataset) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw DataFormatError("Cannot write dataset file " + path);
  }
  writeArff(file, dataset);
}
