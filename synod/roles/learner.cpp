#include <synod/roles/learner.hpp>

#include <timber/log.hpp>

namespace synod {

Learner::Learner(InstanceId instance, size_t quorum, timber::ILogBackend* log)
    : logger_("Synod.Learner", log), instance_(instance), quorum_(quorum) {
}

std::optional<proto::Decided> Learner::Observe(const NodeId& from,
                                               const proto::Accepted& vote) {
  const auto& proposal = vote.proposal;

  if (decision_) {
    return std::nullopt;  // Late vote
  }

  auto& voters = groups_[{proposal.id, proposal.value}];
  if (!voters.insert(from).second) {
    return std::nullopt;  // Duplicate
  }
  ++votes_;

  if (voters.size() != quorum_) {
    return std::nullopt;
  }

  LOG_DEBUG("#{} quorum of votes for A{}", instance_, proposal);
  return Learn(proposal.value);
}

std::optional<proto::Decided> Learner::Observe(const proto::Decided& decided) {
  return Learn(decided.value);
}

std::optional<proto::Decided> Learner::Learn(const Value& value) {
  if (decision_) {
    if (*decision_ != value) {
      ++conflicts_;
      LOG_ERROR("#{} learned '{}' but '{}' already decided", instance_, value,
                *decision_);
    }
    return std::nullopt;
  }

  decision_ = value;
  groups_.clear();
  LOG_INFO("#{} learned '{}'", instance_, value);
  return proto::Decided{instance_, value};
}

}  // namespace synod
