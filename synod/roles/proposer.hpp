#pragma once

#include <synod/core/backoff.hpp>
#include <synod/core/errors.hpp>
#include <synod/core/proto.hpp>
#include <synod/core/quorum.hpp>
#include <synod/roles/context.hpp>

#include <timber/logger.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace synod {

struct ProposerConfig {
  // Deadline for a quorum of replies in each phase
  Millis round_deadline{50};
  // Retries after the first round, then the instance fails
  size_t max_retries{10};
  Backoff::Params backoff{10, 1000, 2};
  // Sleep for a random delay in [backoff / 2, backoff]
  bool jitter{true};
  // Broadcast Decided to learners after quorum of Accepted
  bool notify_learners{true};

  // Throws std::invalid_argument
  void Validate() const;
};

struct Membership {
  std::vector<NodeId> acceptors;
  std::vector<NodeId> learners;
};

enum class ProposerPhase {
  Idle,
  Preparing,
  Accepting,
  Backoff,
  Decided,
  Failed,
};

const char* PhaseName(ProposerPhase phase);

// Terminal result of one instance

struct Outcome {
  InstanceId instance{0};
  // Set iff decided
  std::optional<Value> value;
  std::error_code error;
  size_t rounds{0};
  size_t retries{0};
  Millis started_at{0};
  Millis finished_at{0};

  bool Decided() const {
    return value.has_value();
  }

  Millis Latency() const {
    return finished_at - started_at;
  }
};

using OutcomeCallback = std::function<void(const Outcome&)>;

// Drives rounds of one instance until a value is chosen or retries run out
// Never issues two rounds concurrently

class Proposer {
 public:
  // Rounds start above `min_round`, the last round an earlier proposer of
  // the same node used for this instance
  Proposer(Context context, InstanceId instance, Membership membership,
           ProposerConfig config, Value candidate, OutcomeCallback callback,
           uint64_t min_round = 0);

  // Cancels pending timers
  ~Proposer();

  Proposer(const Proposer&) = delete;
  Proposer& operator=(const Proposer&) = delete;

  void Start();

  // Promise, Nack and Accepted from acceptors, other messages are ignored
  void Handle(const NodeId& from, const proto::Message& message);

  ProposerPhase Phase() const {
    return phase_;
  }

  bool Terminal() const {
    return phase_ == ProposerPhase::Decided ||
           phase_ == ProposerPhase::Failed;
  }

  const ProposalId& CurrentId() const {
    return id_;
  }

  // Highest round used or seen in promises and nacks
  uint64_t HighestRound() const {
    return std::max(id_.round, highest_seen_);
  }

  // Value proposed in the current Accept phase
  const std::optional<Proposal>& CurrentProposal() const {
    return proposal_;
  }

  const Value& Candidate() const {
    return candidate_;
  }

  size_t Retries() const {
    return retries_;
  }

  size_t Rounds() const {
    return rounds_;
  }

 private:
  // Phases
  void StartRound();
  void StartAccept(Value value);
  void Decide(const Value& value);
  void Abandon(Errc reason);
  void Fail();

  // Replies
  void OnPromise(const NodeId& from, const proto::Promise& promise);
  void OnNack(const NodeId& from, const proto::Nack& nack);
  void OnAccepted(const NodeId& from, const proto::Accepted& accepted);
  void OnDeadline(uint64_t epoch);

  Value ChooseValue() const;
  uint64_t NextRound() const;
  void UpdateHighestSeen(const ProposalId& id);

  void Broadcast(const std::vector<NodeId>& to, const proto::Message& message,
                 EventType event);
  void ArmDeadline();
  void CancelTimer();
  void Emit(EventType type, const NodeId& peer = {},
            std::string detail = {});
  void Finish(std::error_code error);

 private:
  mutable timber::Logger logger_;

  const Context context_;
  const InstanceId instance_;
  const Membership membership_;
  const ProposerConfig config_;
  const Value candidate_;
  OutcomeCallback callback_;

  Backoff backoff_;

  ProposerPhase phase_{ProposerPhase::Idle};
  ProposalId id_{ProposalId::Zero()};
  uint64_t highest_seen_{0};
  std::optional<Proposal> proposal_;

  QuorumCollector<std::optional<Proposal>> promises_;
  QuorumCollector<bool> accepted_;

  // Bumped on every transition, stale timers compare against it
  uint64_t epoch_{0};
  std::optional<TimerId> timer_;

  size_t rounds_{0};
  size_t retries_{0};
  Millis started_at_{0};
};

}  // namespace synod
