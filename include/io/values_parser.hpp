#pragma once
#include "model/attribute_metadata.hpp"
#include <istream>
#include <map>
#include <string>
#include <vector>

// Feature name -> value. Nominal values hold the index of the value name.
using FeatureValues = std::map<std::string, double>;

// One "name<TAB>value" pair per line; blank lines are skipped. "t" and "f"
// read as 1 and 0, numbers as themselves, and a nominal value name of a
// known attribute as its index. Throws vertree::DataFormatError.
FeatureValues parseValues(std::istream &in,
                          const std::vector<AttributeMetadata> &attributes);
FeatureValues loadValuesFile(const std::string &path,
                             const std::vector<AttributeMetadata> &attributes);
