#pragma once

#include <synod/core/proposal.hpp>
#include <synod/core/time.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace synod {

// Result of one simulated trial

struct TrialResult {
  size_t trial{0};
  uint64_t seed{0};
  // Network drop probability the trial ran with
  double drop{0.0};
  // Acceptors crashed for the whole trial
  size_t crashed{0};

  std::optional<Value> decided;
  // From start of the trial to the first decision
  std::optional<Millis> latency;

  size_t rounds{0};
  size_t retries{0};
  size_t liveness_failures{0};

  size_t messages_sent{0};
  size_t messages_dropped{0};
  size_t messages_duplicated{0};

  bool safe{true};
};

struct Summary {
  size_t trials{0};
  size_t decided{0};
  size_t liveness_failures{0};
  size_t safety_violations{0};

  double success_rate{0.0};

  double mean_latency{0.0};
  Millis p50_latency{0};
  Millis p95_latency{0};
  Millis max_latency{0};

  double mean_retries{0.0};
  double mean_messages_sent{0.0};
  double mean_messages_dropped{0.0};
};

Summary Summarize(const std::vector<TrialResult>& trials);

// Nearest-rank percentile, p in [0, 100], 0 for empty input
Millis Percentile(std::vector<Millis> samples, double p);

void WriteTrialsCsv(const std::vector<TrialResult>& trials, std::ostream& out);

// One row per sweep point (drop rate, crashed acceptors)
// Header is written iff `header` is set, so sweeps can share one file
void WriteSummaryCsv(double drop, size_t crashed, const Summary& summary,
                     std::ostream& out, bool header = true);

}  // namespace synod
