#include "utils/ids.hpp"
#include <sodium.h>
#include <sstream>
#include <stdexcept>

std::string generateSessionId(const std::string &prefix) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }

  std::stringstream ss;
  ss << std::hex;
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) {
      ss << "-";
    }
    ss << randombytes_uniform(16);
  }
  return prefix + "-" + ss.str();
}
