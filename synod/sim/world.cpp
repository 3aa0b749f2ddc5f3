#include <synod/sim/world.hpp>

#include <synod/core/quorum.hpp>

#include <timber/log.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace synod::sim {

void WorldConfig::Validate() const {
  if (acceptors == 0) {
    throw std::invalid_argument("at least one acceptor required");
  }
  if (proposers == 0) {
    throw std::invalid_argument("at least one proposer required");
  }
  proposer.Validate();
  coordinator.Validate();
  link.Validate();
}

namespace {

NodeId MakeId(char prefix, size_t index) {
  return fmt::format("{}{}", prefix, index + 1);
}

WorldConfig Validated(WorldConfig config) {
  config.Validate();
  return config;
}

}  // namespace

World::World(WorldConfig config, std::ostream& log)
    : config_(Validated(std::move(config))),
      simulator_(config_.seed, config_.log_level, log),
      logger_("Synod.World", simulator_.LoggerBackend()) {
  network_ = std::make_unique<Network>(simulator_, config_.link, &events_);
  safety_ = std::make_unique<SafetyMonitor>(config_.acceptors,
                                            simulator_.LoggerBackend());

  for (size_t i = 0; i < config_.acceptors; ++i) {
    membership_.acceptors.push_back(MakeId('A', i));
  }
  for (size_t i = 0; i < config_.learners; ++i) {
    membership_.learners.push_back(MakeId('L', i));
  }

  for (const auto& id : membership_.acceptors) {
    auto& store = stores_.emplace_back(std::make_unique<MemoryAcceptorStore>());
    auto& acceptor = acceptors_.emplace_back(std::make_unique<AcceptorActor>(
        MakeContext(id), *store, membership_.learners));
    acceptor->SetVoteObserver([this](InstanceId instance,
                                     const NodeId& voter,
                                     const Proposal& vote) {
      safety_->OnVote(instance, voter, vote);
    });
    network_->Attach(id, acceptor.get());
  }

  for (const auto& id : membership_.learners) {
    auto& learner = learners_.emplace_back(std::make_unique<LearnerActor>(
        MakeContext(id), Majority(config_.acceptors)));
    learner->OnDecision([this, id](InstanceId instance, const Value& value) {
      OnLearned(id, instance, value);
    });
    network_->Attach(id, learner.get());
  }

  for (size_t i = 0; i < config_.proposers; ++i) {
    NodeId id = MakeId('P', i);
    auto& proposer = proposers_.emplace_back(std::make_unique<ProposerActor>(
        MakeContext(id), membership_, config_.proposer));
    network_->Attach(id, proposer.get());
    coordinators_.push_back(std::make_unique<Coordinator>(
        *proposer, config_.coordinator, simulator_.LoggerBackend()));
  }

  LOG_INFO("World: {} acceptors, {} proposers, {} learners, seed {}",
           config_.acceptors, config_.proposers, config_.learners,
           config_.seed);
}

Context World::MakeContext(const NodeId& self) {
  return Context{self, &simulator_, network_.get(), &events_};
}

std::vector<NodeId> World::ProposerIds() const {
  std::vector<NodeId> ids;
  for (const auto& proposer : proposers_) {
    ids.push_back(proposer->Id());
  }
  return ids;
}

wheels::Status World::Propose(size_t proposer, InstanceId instance,
                              Value value, OutcomeCallback callback) {
  auto& actor = Proposer(proposer);
  return actor.Propose(
      instance, std::move(value),
      [this, proposer, id = actor.Id(),
       callback = std::move(callback)](const Outcome& outcome) {
        outcomes_.insert_or_assign({proposer, outcome.instance}, outcome);
        if (outcome.value) {
          decisions_.try_emplace(outcome.instance, *outcome.value);
          safety_->OnDecision(outcome.instance, id, *outcome.value);
        }
        if (callback) {
          callback(outcome);
        }
      });
}

void World::Submit(size_t proposer, Value value,
                   Coordinator::SubmitCallback callback) {
  CoordinatorOf(proposer).Submit(
      std::move(value),
      [this, id = Proposer(proposer).Id(), callback = std::move(callback)](
          InstanceId slot, const Outcome& outcome) {
        if (outcome.value) {
          decisions_.try_emplace(slot, *outcome.value);
          safety_->OnDecision(slot, id, *outcome.value);
        }
        if (callback) {
          callback(slot, outcome);
        }
      });
}

std::optional<Outcome> World::OutcomeOf(size_t proposer,
                                        InstanceId instance) const {
  auto it = outcomes_.find({proposer, instance});
  if (it == outcomes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Value> World::Decision(InstanceId instance) const {
  auto it = decisions_.find(instance);
  if (it == decisions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void World::OnLearned(const NodeId& learner, InstanceId instance,
                      const Value& value) {
  decisions_.try_emplace(instance, value);
  safety_->OnDecision(instance, learner, value);
  for (auto& coordinator : coordinators_) {
    coordinator->ObserveDecision(instance, value);
  }
}

void World::Crash(size_t acceptor) {
  Acceptor(acceptor).Crash();
}

void World::Recover(size_t acceptor) {
  Acceptor(acceptor).Recover();
}

void World::Isolate(const NodeId& node) {
  network_->Isolate(node);
}

void World::Rejoin(const NodeId& node) {
  network_->Rejoin(node);
}

void World::Block(const NodeId& from, const NodeId& to) {
  network_->Block(from, to);
}

void World::Unblock(const NodeId& from, const NodeId& to) {
  network_->Unblock(from, to);
}

void World::RunFor(Millis duration) {
  simulator_.RunFor(duration);
}

bool World::RunUntil(const std::function<bool()>& predicate,
                     Millis deadline) {
  return simulator_.RunUntil(predicate, deadline);
}

bool World::RunUntilDecided(InstanceId instance, Millis deadline) {
  return RunUntil(
      [this, instance]() {
        return decisions_.contains(instance);
      },
      deadline);
}

std::vector<const ISnapshotSource*> World::SnapshotSources() const {
  std::vector<const ISnapshotSource*> sources;
  for (const auto& proposer : proposers_) {
    sources.push_back(proposer.get());
  }
  for (const auto& acceptor : acceptors_) {
    sources.push_back(acceptor.get());
  }
  for (const auto& learner : learners_) {
    sources.push_back(learner.get());
  }
  return sources;
}

std::vector<NodeSnapshot> World::Snapshots() const {
  std::vector<NodeSnapshot> snapshots;
  for (const auto* source : SnapshotSources()) {
    snapshots.push_back(source->Snapshot());
  }
  return snapshots;
}

}  // namespace synod::sim
