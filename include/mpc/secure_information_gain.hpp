#pragma once
#include "mpc/secure_sum.hpp"
#include "utils/error_codes.hpp"
#include <cstdint>
#include <vector>

// counts[attribute value][class value]
using CountMatrix = std::vector<std::vector<uint64_t>>;

// Entropy-based split scoring over attribute x class count matrices whose
// global values are obtained with a batched secure sum. The class is
// transport-agnostic: the orchestrator moves the states between parties and
// calls initiate/participate/finalize where the ring says it should.
class SecureInformationGain {
public:
  explicit SecureInformationGain(SecureSum &secure_sum)
      : secure_sum_(secure_sum) {}

  // Positional tally. Values outside [0, cardinality) are skipped, so rows
  // with a missing attribute or class value do not count.
  static vertree::Result<CountMatrix>
  localCounts(const std::vector<int> &attribute_values,
              const std::vector<int> &class_values, int num_attribute_values,
              int num_class_values);

  static std::vector<uint64_t> flatten(const CountMatrix &counts);
  static vertree::Result<CountMatrix>
  unflatten(const std::vector<uint64_t> &flat, int num_attribute_values,
            int num_class_values);

  // One ring pass sums the whole matrix
  vertree::Result<SecureSumState> initiateCounts(const CountMatrix &local);
  vertree::Result<SecureSumState>
  participateCounts(const SecureSumState &state, const CountMatrix &local) const;
  vertree::Result<CountMatrix> finalizeCounts(const SecureSumState &state,
                                              int num_attribute_values,
                                              int num_class_values);

  // H(class) - sum_v (n_v / N) * H(class | attr = v), base 2, 0*log2(0) = 0
  static double informationGain(const CountMatrix &global_counts,
                                uint64_t total_instances);

  // gain / splitInformation, 0.0 when splitInformation < 1e-10
  static double gainRatio(double gain, const CountMatrix &global_counts,
                          uint64_t total_instances);

  static double splitInformation(const CountMatrix &global_counts,
                                 uint64_t total_instances);

  static constexpr double kMinSplitInformation = 1e-10;

private:
  SecureSum &secure_sum_;
};
