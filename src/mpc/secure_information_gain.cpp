#include "mpc/secure_information_gain.hpp"
#include "utils/logging.hpp"
#include <cmath>

using vertree::ErrorCode;
using vertree::Result;

namespace {

double entropyTerm(uint64_t count, uint64_t total) {
  if (count == 0 || total == 0) {
    return 0.0;
  }
  double p = static_cast<double>(count) / static_cast<double>(total);
  return -p * std::log2(p);
}

std::vector<uint64_t> attributeTotals(const CountMatrix &counts) {
  std::vector<uint64_t> totals(counts.size(), 0);
  for (size_t v = 0; v < counts.size(); ++v) {
    for (uint64_t n : counts[v]) {
      totals[v] += n;
    }
  }
  return totals;
}

} // namespace

Result<CountMatrix>
SecureInformationGain::localCounts(const std::vector<int> &attribute_values,
                                   const std::vector<int> &class_values,
                                   int num_attribute_values,
                                   int num_class_values) {
  if (attribute_values.size() != class_values.size()) {
    return Result<CountMatrix>(
        ErrorCode::DataSchemaMismatch,
        std::to_string(attribute_values.size()) + " attribute values vs " +
            std::to_string(class_values.size()) + " class values");
  }
  if (num_attribute_values <= 0 || num_class_values <= 0) {
    return Result<CountMatrix>(ErrorCode::DataSchemaMismatch,
                               "declared cardinality must be positive");
  }

  CountMatrix counts(num_attribute_values,
                     std::vector<uint64_t>(num_class_values, 0));
  for (size_t i = 0; i < attribute_values.size(); ++i) {
    int a = attribute_values[i];
    int c = class_values[i];
    if (a >= 0 && a < num_attribute_values && c >= 0 && c < num_class_values) {
      counts[a][c]++;
    }
  }
  return counts;
}

std::vector<uint64_t> SecureInformationGain::flatten(const CountMatrix &counts) {
  std::vector<uint64_t> flat;
  for (const auto &row : counts) {
    flat.insert(flat.end(), row.begin(), row.end());
  }
  return flat;
}

Result<CountMatrix>
SecureInformationGain::unflatten(const std::vector<uint64_t> &flat,
                                 int num_attribute_values,
                                 int num_class_values) {
  if (num_attribute_values <= 0 || num_class_values <= 0 ||
      flat.size() != static_cast<size_t>(num_attribute_values) *
                         static_cast<size_t>(num_class_values)) {
    return Result<CountMatrix>(ErrorCode::DataSchemaMismatch,
                               "flat count vector of " +
                                   std::to_string(flat.size()) +
                                   " does not match " +
                                   std::to_string(num_attribute_values) + "x" +
                                   std::to_string(num_class_values));
  }

  CountMatrix counts(num_attribute_values);
  for (int v = 0; v < num_attribute_values; ++v) {
    auto begin = flat.begin() + static_cast<std::ptrdiff_t>(v) * num_class_values;
    counts[v].assign(begin, begin + num_class_values);
  }
  return counts;
}

Result<SecureSumState>
SecureInformationGain::initiateCounts(const CountMatrix &local) {
  return secure_sum_.initiateArray(flatten(local));
}

Result<SecureSumState>
SecureInformationGain::participateCounts(const SecureSumState &state,
                                         const CountMatrix &local) const {
  return secure_sum_.participateArray(state, flatten(local));
}

Result<CountMatrix>
SecureInformationGain::finalizeCounts(const SecureSumState &state,
                                      int num_attribute_values,
                                      int num_class_values) {
  auto sums = secure_sum_.finalizeArray(state);
  if (sums.isError()) {
    return Result<CountMatrix>(sums.error(), sums.message());
  }
  return unflatten(sums.value(), num_attribute_values, num_class_values);
}

double SecureInformationGain::informationGain(const CountMatrix &global_counts,
                                              uint64_t total_instances) {
  if (total_instances == 0 || global_counts.empty()) {
    return 0.0;
  }

  std::vector<uint64_t> class_totals(global_counts.front().size(), 0);
  for (const auto &row : global_counts) {
    for (size_t c = 0; c < row.size() && c < class_totals.size(); ++c) {
      class_totals[c] += row[c];
    }
  }

  double class_entropy = 0.0;
  for (uint64_t n : class_totals) {
    class_entropy += entropyTerm(n, total_instances);
  }

  auto totals = attributeTotals(global_counts);
  double conditional_entropy = 0.0;
  for (size_t v = 0; v < global_counts.size(); ++v) {
    if (totals[v] == 0) {
      continue;
    }
    double value_entropy = 0.0;
    for (uint64_t n : global_counts[v]) {
      value_entropy += entropyTerm(n, totals[v]);
    }
    conditional_entropy += static_cast<double>(totals[v]) /
                           static_cast<double>(total_instances) * value_entropy;
  }

  // Rounding can leave a tiny negative value for a useless attribute
  double gain = class_entropy - conditional_entropy;
  return gain < 0.0 ? 0.0 : gain;
}

double SecureInformationGain::splitInformation(const CountMatrix &global_counts,
                                               uint64_t total_instances) {
  if (total_instances == 0) {
    return 0.0;
  }
  double split_info = 0.0;
  for (uint64_t n : attributeTotals(global_counts)) {
    split_info += entropyTerm(n, total_instances);
  }
  return split_info;
}

double SecureInformationGain::gainRatio(double gain,
                                        const CountMatrix &global_counts,
                                        uint64_t total_instances) {
  double split_info = splitInformation(global_counts, total_instances);
  if (split_info < kMinSplitInformation) {
    return 0.0;
  }
  return gain / split_info;
}
