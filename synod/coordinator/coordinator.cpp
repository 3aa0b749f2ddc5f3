#include <synod/coordinator/coordinator.hpp>

#include <timber/log.hpp>

#include <stdexcept>

namespace synod {

void CoordinatorConfig::Validate() const {
  if (max_in_flight == 0) {
    throw std::invalid_argument("max_in_flight must be positive");
  }
}

Coordinator::Coordinator(ProposerActor& proposer, CoordinatorConfig config,
                         timber::ILogBackend* log)
    : logger_("Synod.Coordinator", log),
      proposer_(proposer),
      config_(config),
      next_slot_(config.first_slot) {
  config_.Validate();
}

void Coordinator::Submit(Value value, SubmitCallback callback) {
  queue_.push_back(Request{std::move(value), std::move(callback)});
  Pump();
}

void Coordinator::ObserveDecision(InstanceId slot, const Value& value) {
  decisions_.try_emplace(slot, value);
}

void Coordinator::Pump() {
  while (in_flight_.size() < config_.max_in_flight && !queue_.empty()) {
    Request request = std::move(queue_.front());
    queue_.pop_front();

    InstanceId slot = AllocateSlot();
    ++request.attempts;

    LOG_INFO("Slot #{} <- '{}'", slot, request.value);

    Value value = request.value;
    in_flight_.emplace(slot, std::move(request));

    auto status = proposer_.Propose(slot, std::move(value),
                                    [this, slot](const Outcome& outcome) {
                                      OnOutcome(slot, outcome);
                                    });
    if (status.HasError()) {
      // Slot is driven by someone else, take the next one
      LOG_WARN("Slot #{} unavailable: {}", slot,
               status.GetErrorCode().message());
      queue_.push_front(std::move(in_flight_.at(slot)));
      in_flight_.erase(slot);
    }
  }
}

InstanceId Coordinator::AllocateSlot() {
  while (decisions_.contains(next_slot_)) {
    ++next_slot_;
  }
  return next_slot_++;
}

void Coordinator::OnOutcome(InstanceId slot, const Outcome& outcome) {
  auto it = in_flight_.find(slot);
  if (it == in_flight_.end()) {
    return;
  }
  Request request = std::move(it->second);
  in_flight_.erase(it);

  if (outcome.Decided()) {
    decisions_[slot] = *outcome.value;

    if (*outcome.value != request.value && config_.repropose_displaced) {
      LOG_INFO("Slot #{} taken by '{}', propose '{}' again (attempt {})",
               slot, *outcome.value, request.value, request.attempts + 1);
      queue_.push_front(std::move(request));
      Pump();
      return;
    }
  } else {
    LOG_WARN("Slot #{} failed: {}", slot, outcome.error.message());
  }

  if (request.callback) {
    request.callback(slot, outcome);
  }
  Pump();
}

}  // namespace synod
