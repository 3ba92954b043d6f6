#pragma once
#include "utils/error_codes.hpp"
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

// State handed from party to party around the ring. It never carries the
// mask: the mask stays inside the SecureSum instance that initiated the sum,
// so only that instance can ever remove it.
struct SecureSumState {
  std::string sum_id;
  std::string initiator_id;
  std::vector<uint64_t> partial_sums; // one slot per summed quantity
  int round = 0;
};

inline void to_json(nlohmann::json &j, const SecureSumState &s) {
  j = nlohmann::json{{"sum_id", s.sum_id},
                     {"initiator_id", s.initiator_id},
                     {"partial_sums", s.partial_sums},
                     {"round", s.round}};
}

inline void from_json(const nlohmann::json &j, SecureSumState &s) {
  j.at("sum_id").get_to(s.sum_id);
  j.at("initiator_id").get_to(s.initiator_id);
  j.at("partial_sums").get_to(s.partial_sums);
  j.at("round").get_to(s.round);
}

// Additive-masking secure sum over an ordered ring of ring_size parties.
// Arithmetic is modulo 2^64 with a uniformly random 64-bit mask per slot, so
// every partial sum a non-initiator sees is uniformly distributed regardless
// of the values added before it.
//
// With ring_size == 2 the other party learns the initiator's value
// (sum - own value); such rings are refused unless allow_insecure_ring is set.
class SecureSum {
public:
  SecureSum(std::string node_id, int ring_size,
            bool allow_insecure_ring = false);

  // Initiator: masks local_value and opens round 1
  vertree::Result<SecureSumState> initiate(uint64_t local_value);
  vertree::Result<SecureSumState>
  initiateArray(const std::vector<uint64_t> &local_values);

  // Every other ring member, exactly once, in ring order
  vertree::Result<SecureSumState> participate(const SecureSumState &state,
                                              uint64_t local_value) const;
  vertree::Result<SecureSumState>
  participateArray(const SecureSumState &state,
                   const std::vector<uint64_t> &local_values) const;

  // Initiator only, once every ring member has participated
  vertree::Result<uint64_t> finalize(const SecureSumState &state);
  vertree::Result<std::vector<uint64_t>>
  finalizeArray(const SecureSumState &state);

  // Drops the mask of a sum whose ring pass failed
  void abandon(const std::string &sum_id);

  bool providesPrivacy() const { return ring_size_ >= 3; }
  size_t pendingSums() const;

private:
  vertree::Result<void> checkRing() const;
  static uint64_t randomMask();

  std::string node_id_;
  int ring_size_;
  bool allow_insecure_ring_;

  uint64_t next_sum_ = 0;
  std::unordered_map<std::string, std::vector<uint64_t>> masks_;
  mutable std::mutex masks_mutex_;
};
