#include <synod/roles/proposer.hpp>

#include <timber/log.hpp>

#include <fmt/core.h>

#include <wheels/support/assert.hpp>

#include <algorithm>
#include <stdexcept>

namespace synod {

using namespace proto;

//////////////////////////////////////////////////////////////////////

void ProposerConfig::Validate() const {
  if (round_deadline == 0) {
    throw std::invalid_argument("round deadline must be positive");
  }
  if (backoff.init == 0 || backoff.init > backoff.max) {
    throw std::invalid_argument(
        fmt::format("invalid backoff range [{}, {}]", backoff.init,
                    backoff.max));
  }
  if (backoff.factor == 0) {
    throw std::invalid_argument("backoff factor must be at least 1");
  }
}

const char* PhaseName(ProposerPhase phase) {
  switch (phase) {
    case ProposerPhase::Idle:
      return "idle";
    case ProposerPhase::Preparing:
      return "preparing";
    case ProposerPhase::Accepting:
      return "accepting";
    case ProposerPhase::Backoff:
      return "backoff";
    case ProposerPhase::Decided:
      return "decided";
    case ProposerPhase::Failed:
      return "failed";
  }
  return "?";
}

//////////////////////////////////////////////////////////////////////

Proposer::Proposer(Context context, InstanceId instance,
                   Membership membership, ProposerConfig config,
                   Value candidate, OutcomeCallback callback,
                   uint64_t min_round)
    : logger_("Synod.Proposer", context.runtime->LoggerBackend()),
      context_(std::move(context)),
      instance_(instance),
      membership_(std::move(membership)),
      config_(config),
      candidate_(std::move(candidate)),
      callback_(std::move(callback)),
      backoff_(config.backoff),
      highest_seen_(min_round),
      promises_(Majority(membership_.acceptors.size())),
      accepted_(Majority(membership_.acceptors.size())) {
}

Proposer::~Proposer() {
  CancelTimer();
}

void Proposer::Start() {
  WHEELS_VERIFY(phase_ == ProposerPhase::Idle, "Proposer already started");
  started_at_ = context_.runtime->Now();
  StartRound();
}

void Proposer::Handle(const NodeId& from, const Message& message) {
  if (Terminal()) {
    return;
  }

  std::visit(Overloaded{
                 [&](const proto::Promise& promise) {
                   OnPromise(from, promise);
                 },
                 [&](const proto::Nack& nack) {
                   OnNack(from, nack);
                 },
                 [&](const proto::Accepted& accepted) {
                   OnAccepted(from, accepted);
                 },
                 [&](const proto::Prepare&) {},
                 [&](const proto::Accept&) {},
                 [&](const proto::Decided&) {},
             },
             message);
}

//////////////////////////////////////////////////////////////////////

// Phase I

void Proposer::StartRound() {
  ++epoch_;
  ++rounds_;

  id_ = ProposalId{NextRound(), context_.self};
  phase_ = ProposerPhase::Preparing;
  proposal_.reset();
  promises_.Reset();

  LOG_INFO("#{} prepare P{}", instance_, id_);

  Broadcast(membership_.acceptors, proto::Prepare{id_},
            EventType::PrepareSent);
  ArmDeadline();
}

void Proposer::OnPromise(const NodeId& from, const proto::Promise& promise) {
  if (phase_ != ProposerPhase::Preparing || promise.id != id_) {
    LOG_DEBUG("#{} discard stale promise P{} from {}", instance_, promise.id,
              from);
    return;
  }

  if (!promises_.Add(from, promise.vote)) {
    return;
  }
  Emit(EventType::PromiseRecv, from);

  if (promise.vote) {
    UpdateHighestSeen(promise.vote->id);
  }

  if (promises_.Reached()) {
    StartAccept(ChooseValue());
  }
}

// Value of the highest vote among promises, own candidate if none

Value Proposer::ChooseValue() const {
  std::optional<Proposal> latest;
  for (const auto& [voter, vote] : promises_.Votes()) {
    if (vote && (!latest || latest->id < vote->id)) {
      latest = vote;
    }
  }
  if (latest) {
    if (latest->value != candidate_) {
      LOG_INFO("#{} adopt value '{}' of A{}", instance_, latest->value,
               latest->id);
    }
    return latest->value;
  }
  return candidate_;
}

//////////////////////////////////////////////////////////////////////

// Phase II

void Proposer::StartAccept(Value value) {
  CancelTimer();
  ++epoch_;

  phase_ = ProposerPhase::Accepting;
  proposal_ = Proposal{id_, std::move(value)};
  accepted_.Reset();

  LOG_INFO("#{} accept A{}", instance_, *proposal_);

  Broadcast(membership_.acceptors, proto::Accept{*proposal_},
            EventType::AcceptSent);
  ArmDeadline();
}

void Proposer::OnAccepted(const NodeId& from,
                          const proto::Accepted& accepted) {
  if (phase_ != ProposerPhase::Accepting ||
      accepted.proposal.id != id_) {
    LOG_DEBUG("#{} discard stale vote A{} from {}", instance_,
              accepted.proposal, from);
    return;
  }

  if (!accepted_.Add(from, true)) {
    return;
  }
  Emit(EventType::AcceptedRecv, from);

  if (accepted_.Reached()) {
    Decide(proposal_->value);
  }
}

void Proposer::Decide(const Value& value) {
  CancelTimer();
  ++epoch_;
  phase_ = ProposerPhase::Decided;

  LOG_INFO("#{} chosen '{}' in P{} after {} retries", instance_, value, id_,
           retries_);
  Emit(EventType::Decided, {}, value);

  if (config_.notify_learners) {
    for (const auto& learner : membership_.learners) {
      context_.messenger->Send(
          Envelope{context_.self, learner, instance_,
                   proto::Decided{instance_, value}});
    }
  }

  Finish({});
}

//////////////////////////////////////////////////////////////////////

// Retries

void Proposer::OnNack(const NodeId& from, const proto::Nack& nack) {
  bool pending = phase_ == ProposerPhase::Preparing ||
                 phase_ == ProposerPhase::Accepting;
  if (!pending || nack.id != id_) {
    LOG_DEBUG("#{} discard stale nack P{} from {}", instance_, nack.id, from);
    return;
  }

  // Duplicated Prepare rejected by an acceptor that already promised it
  if (nack.advice == id_) {
    return;
  }

  Emit(EventType::NackRecv, from, fmt::format("{}", nack.advice));
  UpdateHighestSeen(nack.advice);

  LOG_INFO("#{} P{} rejected by {}, advice P{}", instance_, id_, from,
           nack.advice);
  Abandon(Errc::Rejected);
}

void Proposer::OnDeadline(uint64_t epoch) {
  if (epoch != epoch_) {
    return;
  }
  timer_.reset();

  LOG_INFO("#{} P{} timed out in {} phase", instance_, id_,
           PhaseName(phase_));
  Emit(EventType::Timeout, {}, PhaseName(phase_));
  Abandon(Errc::Timeout);
}

void Proposer::Abandon(Errc reason) {
  CancelTimer();
  ++epoch_;

  if (retries_ >= config_.max_retries) {
    Fail();
    return;
  }

  ++retries_;
  phase_ = ProposerPhase::Backoff;

  Millis delay = backoff_();
  if (config_.jitter && delay > 1) {
    delay = context_.runtime->RandomNumber(delay / 2, delay);
  }

  Emit(EventType::Retry, {},
       fmt::format("{} {}", make_error_code(reason).message(), delay));

  timer_ = context_.runtime->Timers()->After(
      delay, [this, epoch = epoch_]() {
        if (epoch == epoch_) {
          timer_.reset();
          StartRound();
        }
      });
}

void Proposer::Fail() {
  phase_ = ProposerPhase::Failed;

  LOG_WARN("#{} gave up after {} retries", instance_, retries_);
  Emit(EventType::LivenessFailure, {}, fmt::format("{}", retries_));

  Finish(QuorumUnavailable());
}

void Proposer::Finish(std::error_code error) {
  Outcome outcome;
  outcome.instance = instance_;
  if (!error && proposal_) {
    outcome.value = proposal_->value;
  }
  outcome.error = error;
  outcome.rounds = rounds_;
  outcome.retries = retries_;
  outcome.started_at = started_at_;
  outcome.finished_at = context_.runtime->Now();

  if (auto callback = std::move(callback_)) {
    callback(outcome);
  }
}

//////////////////////////////////////////////////////////////////////

uint64_t Proposer::NextRound() const {
  return HighestRound() + 1;
}

void Proposer::UpdateHighestSeen(const ProposalId& id) {
  highest_seen_ = std::max(highest_seen_, id.round);
}

void Proposer::Broadcast(const std::vector<NodeId>& to,
                         const Message& message, EventType event) {
  for (const auto& peer : to) {
    Emit(event, peer);
    context_.messenger->Send(Envelope{context_.self, peer, instance_, message});
  }
}

void Proposer::ArmDeadline() {
  timer_ = context_.runtime->Timers()->After(
      config_.round_deadline, [this, epoch = epoch_]() {
        OnDeadline(epoch);
      });
}

void Proposer::CancelTimer() {
  if (timer_) {
    context_.runtime->Timers()->Cancel(*timer_);
    timer_.reset();
  }
}

void Proposer::Emit(EventType type, const NodeId& peer, std::string detail) {
  if (context_.events == nullptr) {
    return;
  }
  context_.events->Record(Event{instance_, Role::Proposer, context_.self, peer,
                                type, context_.runtime->Now(),
                                std::move(detail)});
}

}  // namespace synod
