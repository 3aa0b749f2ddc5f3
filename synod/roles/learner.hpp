#pragma once

#include <synod/core/proto.hpp>

#include <timber/logger.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace synod {

// Counts Accepted votes of one instance, grouped by (proposal id, value)
// Emits the decision exactly once, votes are dropped after it

class Learner {
 public:
  Learner(InstanceId instance, size_t quorum, timber::ILogBackend* log);

  // Decided when this vote completes the first quorum
  std::optional<proto::Decided> Observe(const NodeId& from,
                                        const proto::Accepted& vote);

  // Decision announced by a proposer that already collected a quorum
  std::optional<proto::Decided> Observe(const proto::Decided& decided);

  const std::optional<Value>& Decision() const {
    return decision_;
  }

  // Quorums or announcements that disagree with the decision
  size_t Conflicts() const {
    return conflicts_;
  }

  // Distinct votes counted before the decision
  size_t Votes() const {
    return votes_;
  }

  // Vote groups still tracked, none once decided
  size_t Groups() const {
    return groups_.size();
  }

 private:
  std::optional<proto::Decided> Learn(const Value& value);

 private:
  timber::Logger logger_;
  const InstanceId instance_;
  const size_t quorum_;

  std::map<std::pair<ProposalId, Value>, std::set<NodeId>> groups_;
  std::optional<Value> decision_;
  size_t votes_{0};
  size_t conflicts_{0};
};

}  // namespace synod
