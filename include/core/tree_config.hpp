#pragma once
#include "utils/error_codes.hpp"
#include <map>
#include <string>

// Builder parameters. They travel to every party inside the Initiation
// configuration map, so they round-trip through strings.
struct TreeConfig {
  int max_depth = 10;
  int min_instances = 5;
  double min_gain = 0.01;
  int class_index = -1; // -1: last attribute
  bool allow_insecure_ring = false;

  // Recognized keys: maxDepth, minInstances, minGain, classIndex,
  // allowInsecureRing. Unknown keys are ignored.
  static vertree::Result<TreeConfig>
  fromMap(const std::map<std::string, std::string> &configuration);

  std::map<std::string, std::string> toMap() const;
};
