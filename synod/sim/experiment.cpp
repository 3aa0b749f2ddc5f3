#include <synod/sim/experiment.hpp>

#include <synod/sim/snapshot_recorder.hpp>
#include <synod/sim/world.hpp>

#include <timber/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace synod::sim {

static const InstanceId kInstance = 1;

void ExperimentConfig::Validate() const {
  if (acceptors == 0 || proposers == 0) {
    throw std::invalid_argument(
        "experiment needs at least one acceptor and one proposer");
  }
  if (crashed_acceptors > acceptors) {
    throw std::invalid_argument(
        fmt::format("cannot crash {} of {} acceptors", crashed_acceptors,
                    acceptors));
  }
  if (trials == 0) {
    throw std::invalid_argument("number of trials must be positive");
  }
  if (time_limit == 0) {
    throw std::invalid_argument("time limit must be positive");
  }
  proposer.Validate();
  link.Validate();
}

static WorldConfig MakeWorldConfig(const ExperimentConfig& config,
                                   size_t trial) {
  WorldConfig world;
  world.acceptors = config.acceptors;
  world.proposers = config.proposers;
  world.learners = config.learners;
  world.proposer = config.proposer;
  world.link = config.link;
  world.seed = config.seed + trial;
  world.log_level = config.log_level;
  return world;
}

static std::optional<Millis> FirstDecisionAt(const EventLog& events) {
  std::optional<Millis> first;
  for (auto type : {EventType::Decided, EventType::Learned}) {
    if (auto event = events.First(type, kInstance)) {
      first = std::min(first.value_or(event->timestamp), event->timestamp);
    }
  }
  return first;
}

TrialResult RunTrial(const ExperimentConfig& config, size_t trial,
                     const TrialOutputs& outputs) {
  config.Validate();

  World world(MakeWorldConfig(config, trial),
              outputs.log != nullptr ? *outputs.log : std::cerr);

  timber::Logger logger_("Synod.Experiment", world.Sim().LoggerBackend());

  // Crash the last acceptors
  for (size_t i = 0; i < config.crashed_acceptors; ++i) {
    world.Crash(config.acceptors - 1 - i);
  }

  std::unique_ptr<SnapshotRecorder> recorder;
  if (config.snapshot_interval > 0) {
    recorder = std::make_unique<SnapshotRecorder>(world.Sim(),
                                                  config.snapshot_interval);
    for (const auto* source : world.SnapshotSources()) {
      recorder->Watch(source);
    }
    recorder->Start();
  }

  size_t terminal = 0;
  size_t failures = 0;

  for (size_t i = 0; i < config.proposers; ++i) {
    world.Sim().Schedule(i * config.stagger, [&world, &terminal, &failures,
                                              i]() {
      world
          .Propose(i, kInstance, fmt::format("value-P{}", i + 1),
                   [&terminal, &failures](const Outcome& outcome) {
                     ++terminal;
                     if (!outcome.Decided()) {
                       ++failures;
                     }
                   })
          .ExpectOk();
    });
  }

  world.RunUntil(
      [&]() {
        return terminal == config.proposers;
      },
      config.time_limit);

  if (recorder) {
    recorder->Stop();
  }

  TrialResult result;
  result.trial = trial;
  result.seed = config.seed + trial;
  result.drop = config.link.drop;
  result.crashed = config.crashed_acceptors;
  result.decided = world.Decision(kInstance);
  result.latency = FirstDecisionAt(world.Events());
  result.liveness_failures = failures;

  for (size_t i = 0; i < config.proposers; ++i) {
    const auto& actor = world.Proposer(i);
    if (const auto* record = actor.Last(kInstance)) {
      result.rounds += record->outcome.rounds;
      result.retries += record->outcome.retries;
    } else if (const auto* proposer = actor.Find(kInstance)) {
      // Still running at the time limit
      result.rounds += proposer->Rounds();
      result.retries += proposer->Retries();
    }
  }

  const auto& stats = world.Net().Stats();
  result.messages_sent = stats.sent;
  result.messages_dropped = stats.dropped;
  result.messages_duplicated = stats.duplicated;
  result.safe = world.Safety().Safe();

  LOG_INFO("Trial {}: decided '{}' in {} rounds, {} retries", trial,
           result.decided.value_or("-"), result.rounds, result.retries);

  if (outputs.events != nullptr) {
    world.Events().WriteCsv(*outputs.events);
  }
  if (outputs.snapshots != nullptr && recorder) {
    recorder->WriteCsv(*outputs.snapshots);
  }

  return result;
}

std::vector<TrialResult> RunExperiment(const ExperimentConfig& config,
                                       const TrialOutputs& outputs) {
  std::vector<TrialResult> results;
  results.reserve(config.trials);

  TrialOutputs rest;
  rest.log = outputs.log;

  for (size_t trial = 0; trial < config.trials; ++trial) {
    results.push_back(RunTrial(config, trial, trial == 0 ? outputs : rest));
  }
  return results;
}

}  // namespace synod::sim
