#include "mpc/secure_sum.hpp"
#include "utils/logging.hpp"
#include <sodium.h>
#include <stdexcept>

using vertree::ErrorCode;
using vertree::Result;

SecureSum::SecureSum(std::string node_id, int ring_size,
                     bool allow_insecure_ring)
    : node_id_(std::move(node_id)), ring_size_(ring_size),
      allow_insecure_ring_(allow_insecure_ring) {
  // Initialize libsodium if not already done
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  if (ring_size_ == 2 && allow_insecure_ring_) {
    DEBUG_WARN("Secure sum on a two-party ring: the non-initiating party can "
               "recover the initiator's contribution");
  }
}

uint64_t SecureSum::randomMask() {
  uint64_t mask = 0;
  randombytes_buf(&mask, sizeof(mask));
  return mask;
}

Result<void> SecureSum::checkRing() const {
  if (ring_size_ < 2) {
    return Result<void>(ErrorCode::MPCInsufficientParticipants,
                        "ring of " + std::to_string(ring_size_) +
                            " cannot run a secure sum");
  }
  if (ring_size_ == 2 && !allow_insecure_ring_) {
    return Result<void>(ErrorCode::MPCInsufficientParticipants,
                        "two-party ring gives no privacy; at least 3 ring "
                        "members are required");
  }
  return Result<void>();
}

Result<SecureSumState> SecureSum::initiate(uint64_t local_value) {
  return initiateArray(std::vector<uint64_t>{local_value});
}

Result<SecureSumState>
SecureSum::initiateArray(const std::vector<uint64_t> &local_values) {
  if (auto ring = checkRing(); ring.isError()) {
    return Result<SecureSumState>(ring.error(), ring.message());
  }
  if (local_values.empty()) {
    return Result<SecureSumState>(ErrorCode::MPCComputationFailed,
                                  "nothing to sum");
  }

  SecureSumState state;
  state.initiator_id = node_id_;
  state.round = 1;
  state.partial_sums.reserve(local_values.size());

  std::vector<uint64_t> masks;
  masks.reserve(local_values.size());
  for (uint64_t value : local_values) {
    uint64_t mask = randomMask();
    masks.push_back(mask);
    state.partial_sums.push_back(value + mask); // wraps mod 2^64
  }

  {
    std::lock_guard<std::mutex> lock(masks_mutex_);
    state.sum_id = node_id_ + "#" + std::to_string(next_sum_++);
    masks_[state.sum_id] = std::move(masks);
  }

  DEBUG_DEBUG("Initiated secure sum " << state.sum_id << " with "
                                      << local_values.size() << " slots");
  return state;
}

Result<SecureSumState> SecureSum::participate(const SecureSumState &state,
                                              uint64_t local_value) const {
  if (state.partial_sums.size() != 1) {
    return Result<SecureSumState>(
        ErrorCode::ProtocolStateError,
        "scalar participation on a " +
            std::to_string(state.partial_sums.size()) + "-slot sum");
  }
  return participateArray(state, std::vector<uint64_t>{local_value});
}

Result<SecureSumState>
SecureSum::participateArray(const SecureSumState &state,
                            const std::vector<uint64_t> &local_values) const {
  if (state.round < 1 || state.round >= ring_size_) {
    return Result<SecureSumState>(
        ErrorCode::ProtocolSequenceError,
        "sum " + state.sum_id + " arrived in round " +
            std::to_string(state.round) + " on a ring of " +
            std::to_string(ring_size_));
  }
  if (local_values.size() != state.partial_sums.size()) {
    return Result<SecureSumState>(
        ErrorCode::DataSchemaMismatch,
        "contribution has " + std::to_string(local_values.size()) +
            " slots, sum has " + std::to_string(state.partial_sums.size()));
  }

  SecureSumState next = state;
  for (size_t i = 0; i < local_values.size(); ++i) {
    next.partial_sums[i] += local_values[i];
  }
  next.round = state.round + 1;
  return next;
}

Result<uint64_t> SecureSum::finalize(const SecureSumState &state) {
  auto sums = finalizeArray(state);
  if (sums.isError()) {
    return Result<uint64_t>(sums.error(), sums.message());
  }
  if (sums.value().size() != 1) {
    return Result<uint64_t>(ErrorCode::ProtocolStateError,
                            "scalar finalize on a multi-slot sum");
  }
  return sums.value().front();
}

Result<std::vector<uint64_t>>
SecureSum::finalizeArray(const SecureSumState &state) {
  if (state.initiator_id != node_id_) {
    return Result<std::vector<uint64_t>>(
        ErrorCode::ProtocolStateError,
        node_id_ + " cannot finalize a sum initiated by " + state.initiator_id);
  }
  if (state.round != ring_size_) {
    return Result<std::vector<uint64_t>>(
        ErrorCode::ProtocolStateError,
        "sum " + state.sum_id + " is in round " + std::to_string(state.round) +
            ", expected " + std::to_string(ring_size_));
  }

  std::vector<uint64_t> masks;
  {
    std::lock_guard<std::mutex> lock(masks_mutex_);
    auto it = masks_.find(state.sum_id);
    if (it == masks_.end()) {
      return Result<std::vector<uint64_t>>(
          ErrorCode::ProtocolStateError,
          "no open sum " + state.sum_id + " at " + node_id_);
    }
    if (it->second.size() != state.partial_sums.size()) {
      return Result<std::vector<uint64_t>>(ErrorCode::ProtocolStateError,
                                           "slot count changed in transit");
    }
    masks = std::move(it->second);
    masks_.erase(it);
  }

  std::vector<uint64_t> sums(state.partial_sums.size());
  for (size_t i = 0; i < sums.size(); ++i) {
    sums[i] = state.partial_sums[i] - masks[i];
  }
  return sums;
}

void SecureSum::abandon(const std::string &sum_id) {
  std::lock_guard<std::mutex> lock(masks_mutex_);
  masks_.erase(sum_id);
}

size_t SecureSum::pendingSums() const {
  std::lock_guard<std::mutex> lock(masks_mutex_);
  return masks_.size();
}
