#pragma once
#include <string>

// "<prefix>-" followed by 32 random hex digits drawn from libsodium
std::string generateSessionId(const std::string &prefix);
