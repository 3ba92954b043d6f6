#pragma once
#include "model/data_partition.hpp"
#include <istream>
#include <ostream>
#include <string>

// Numeric values are binned into 10 buckets over [0, 1): <= 0 -> 0,
// >= 1 -> 9, otherwise floor(v * 10)
int discretizeNumeric(double value);

// Reads an ARFF file: @relation, @attribute (nominal {a,b} or
// numeric/real/integer), @data rows as CSV, % comments, '?' for missing.
// The class is the last attribute. Throws vertree::DataFormatError.
Dataset loadArff(const std::string &path);
Dataset parseArff(std::istream &in, const std::string &source_name);

// Writes a dataset back out. Numeric bins are written as bin centres so
// loading the file again yields the same bins.
void writeArff(std::ostream &out, const Dataset &dataset);
void saveArff(const std::string &path, const Dataset &dataset);
