#include "core/tree_config.hpp"
#include "utils/logging.hpp"
#include <cstdlib>

using vertree::ErrorCode;
using vertree::Result;

namespace {

bool parseInt(const std::string &text, int &out) {
  try {
    size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool parseDouble(const std::string &text, double &out) {
  try {
    size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool parseBool(const std::string &text, bool &out) {
  if (text == "true" || text == "1") {
    out = true;
    return true;
  }
  if (text == "false" || text == "0") {
    out = false;
    return true;
  }
  return false;
}

} // namespace

Result<TreeConfig>
TreeConfig::fromMap(const std::map<std::string, std::string> &configuration) {
  TreeConfig config;

  for (const auto &[key, value] : configuration) {
    bool ok = true;
    if (key == "maxDepth") {
      ok = parseInt(value, config.max_depth) && config.max_depth >= 0;
    } else if (key == "minInstances") {
      ok = parseInt(value, config.min_instances) && config.min_instances >= 0;
    } else if (key == "minGain") {
      ok = parseDouble(value, config.min_gain) && config.min_gain >= 0.0;
    } else if (key == "classIndex") {
      ok = parseInt(value, config.class_index) && config.class_index >= -1;
    } else if (key == "allowInsecureRing") {
      ok = parseBool(value, config.allow_insecure_ring);
    } else {
      DEBUG_DEBUG("Ignoring unknown configuration key: " << key);
      continue;
    }

    if (!ok) {
      return Result<TreeConfig>(ErrorCode::SystemInvalidConfiguration,
                                "bad value '" + value + "' for " + key);
    }
  }

  return config;
}

std::map<std::string, std::string> TreeConfig::toMap() const {
  return {{"maxDepth", std::to_string(max_depth)},
          {"minInstances", std::to_string(min_instances)},
          {"minGain", std::to_string(min_gain)},
          {"classIndex", std::to_string(class_index)},
          {"allowInsecureRing", allow_insecure_ring ? "true" : "false"}};
}
