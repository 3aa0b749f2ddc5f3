#pragma once

#include <synod/core/proposal.hpp>

#include <timber/logger.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace synod::sim {

// Global observer of votes and decisions
// A value is chosen once a majority of acceptors voted for the same proposal

class SafetyMonitor {
 public:
  SafetyMonitor(size_t acceptors, timber::ILogBackend* log);

  void OnVote(InstanceId instance, const NodeId& acceptor,
              const Proposal& vote);

  // Decision reported by a proposer or learner
  void OnDecision(InstanceId instance, const NodeId& reporter,
                  const Value& value);

  bool Safe() const {
    return violations_.empty();
  }

  const std::vector<std::string>& Violations() const {
    return violations_;
  }

  std::optional<Value> Chosen(InstanceId instance) const;
  std::optional<Value> Decided(InstanceId instance) const;

 private:
  void Violation(std::string what);

 private:
  timber::Logger logger_;
  const size_t quorum_;

  std::map<InstanceId, std::map<ProposalId, std::set<NodeId>>> votes_;
  std::map<InstanceId, Value> chosen_;
  std::map<InstanceId, Value> decided_;

  std::vector<std::string> violations_;
};

}  // namespace synod::sim
