#pragma once

#include <synod/metrics/stats.hpp>
#include <synod/roles/proposer.hpp>
#include <synod/sim/network.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <vector>

namespace synod::sim {

struct ExperimentConfig {
  size_t acceptors{5};
  size_t proposers{2};
  size_t learners{1};
  // Crashed before the trial starts
  size_t crashed_acceptors{0};

  ProposerConfig proposer;
  LinkConfig link;

  size_t trials{10};
  // Trial i runs with seed + i
  uint64_t seed{42};
  // Proposer i starts at i * stagger
  Millis stagger{0};
  Millis time_limit{10'000};
  // 0 disables snapshots
  Millis snapshot_interval{0};

  timber::Level log_level{timber::Level::Warning};

  // Throws std::invalid_argument
  void Validate() const;
};

// Optional dumps of a single trial
struct TrialOutputs {
  std::ostream* events{nullptr};
  std::ostream* snapshots{nullptr};
  std::ostream* log{&std::cerr};
};

// Every proposer proposes "value-P<i>" to instance 1
TrialResult RunTrial(const ExperimentConfig& config, size_t trial,
                     const TrialOutputs& outputs = {});

// Outputs are written for the first trial only
std::vector<TrialResult> RunExperiment(const ExperimentConfig& config,
                                       const TrialOutputs& outputs = {});

}  // namespace synod::sim
