#pragma once
#include "core/local_party.hpp"
#include "core/party_network.hpp"
#include "core/tree_config.hpp"
#include "mpc/secure_sum.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Runs the ring protocol between a coordinator and parties living in the
// same process. The hand-off is the one the network nodes perform, minus
// the HTTP hop: the same LocalParty objects validate and contribute, and
// the coordinator's SecureSum alone removes the mask.
class LocalPartyNetwork : public PartyNetwork {
public:
  LocalPartyNetwork(std::string coordinator_id,
                    std::vector<std::unique_ptr<LocalParty>> parties);

  vertree::Result<void>
  initiate(const std::string &dataset_name,
           const std::vector<std::string> &attribute_partitioning,
           const std::map<std::string, std::string> &configuration);

  // TreeComplete to every party
  void complete(uint64_t node_count);

  const GlobalSchema &schema() const override { return schema_; }
  vertree::Result<NodeStatistics>
  nodeStatistics(const std::string &tree_node_id) override;
  vertree::Result<CountMatrix> attributeCounts(const std::string &tree_node_id,
                                               int attribute_index) override;
  vertree::Result<void>
  splitNode(const std::string &tree_node_id, int attribute_index,
            const std::vector<std::string> &child_node_ids) override;
  uint64_t secureSumsRun() const override { return sums_run_; }

  const LocalParty &party(size_t index) const { return *parties_.at(index); }
  size_t partyCount() const { return parties_.size(); }

private:
  vertree::Result<std::vector<uint64_t>> ringPass(CountRoundPayload round,
                                                  size_t slots);

  std::string coordinator_id_;
  std::vector<std::unique_ptr<LocalParty>> parties_;
  std::unique_ptr<SecureSum> secure_sum_;
  std::string session_id_;
  GlobalSchema schema_;
  uint64_t sums_run_ = 0;
};
