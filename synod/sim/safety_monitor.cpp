#include <synod/sim/safety_monitor.hpp>

#include <synod/core/quorum.hpp>

#include <timber/log.hpp>

#include <fmt/format.h>

namespace synod::sim {

SafetyMonitor::SafetyMonitor(size_t acceptors, timber::ILogBackend* log)
    : logger_("Synod.Safety", log), quorum_(Majority(acceptors)) {
}

void SafetyMonitor::OnVote(InstanceId instance, const NodeId& acceptor,
                           const Proposal& vote) {
  auto& voters = votes_[instance][vote.id];
  if (!voters.insert(acceptor).second || voters.size() != quorum_) {
    return;
  }

  // Proposal ids are unique, so a quorum for one id chooses one value
  auto [it, first] = chosen_.try_emplace(instance, vote.value);
  if (first) {
    LOG_DEBUG("#{} chosen '{}' by quorum for P{}", instance, vote.value,
              vote.id);
  } else if (it->second != vote.value) {
    Violation(fmt::format("#{} chosen '{}' and '{}'", instance, it->second,
                          vote.value));
  }
}

void SafetyMonitor::OnDecision(InstanceId instance, const NodeId& reporter,
                               const Value& value) {
  auto [it, first] = decided_.try_emplace(instance, value);
  if (!first && it->second != value) {
    Violation(fmt::format("#{} {} decided '{}', earlier decision '{}'",
                          instance, reporter, value, it->second));
  }

  auto chosen = chosen_.find(instance);
  if (chosen != chosen_.end() && chosen->second != value) {
    Violation(fmt::format("#{} {} decided '{}' but '{}' was chosen",
                          instance, reporter, value, chosen->second));
  }
}

std::optional<Value> SafetyMonitor::Chosen(InstanceId instance) const {
  auto it = chosen_.find(instance);
  if (it == chosen_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Value> SafetyMonitor::Decided(InstanceId instance) const {
  auto it = decided_.find(instance);
  if (it == decided_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SafetyMonitor::Violation(std::string what) {
  LOG_ERROR("Safety violation: {}", what);
  violations_.push_back(std::move(what));
}

}  // namespace synod::sim
