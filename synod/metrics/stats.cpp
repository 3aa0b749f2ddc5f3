#include <synod/metrics/stats.hpp>

#include <synod/metrics/csv.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <cmath>

namespace synod {

Millis Percentile(std::vector<Millis> samples, double p) {
  if (samples.empty()) {
    return 0;
  }
  std::sort(samples.begin(), samples.end());
  auto rank = static_cast<size_t>(
      std::ceil(p / 100.0 * static_cast<double>(samples.size())));
  rank = std::clamp<size_t>(rank, 1, samples.size());
  return samples[rank - 1];
}

Summary Summarize(const std::vector<TrialResult>& trials) {
  Summary summary;
  summary.trials = trials.size();
  if (trials.empty()) {
    return summary;
  }

  std::vector<Millis> latencies;
  size_t retries = 0;
  size_t sent = 0;
  size_t dropped = 0;

  for (const auto& trial : trials) {
    if (trial.decided) {
      ++summary.decided;
    }
    summary.liveness_failures += trial.liveness_failures;
    if (!trial.safe) {
      ++summary.safety_violations;
    }
    if (trial.latency) {
      latencies.push_back(*trial.latency);
    }
    retries += trial.retries;
    sent += trial.messages_sent;
    dropped += trial.messages_dropped;
  }

  const auto count = static_cast<double>(trials.size());

  summary.success_rate = static_cast<double>(summary.decided) / count;
  summary.mean_retries = static_cast<double>(retries) / count;
  summary.mean_messages_sent = static_cast<double>(sent) / count;
  summary.mean_messages_dropped = static_cast<double>(dropped) / count;

  if (!latencies.empty()) {
    double total = 0;
    for (auto latency : latencies) {
      total += static_cast<double>(latency);
    }
    summary.mean_latency = total / static_cast<double>(latencies.size());
    summary.p50_latency = Percentile(latencies, 50);
    summary.p95_latency = Percentile(latencies, 95);
    summary.max_latency = *std::max_element(latencies.begin(), latencies.end());
  }

  return summary;
}

void WriteTrialsCsv(const std::vector<TrialResult>& trials,
                    std::ostream& out) {
  fmt::print(out,
             "trial,seed,drop,crashed,decided,value,latency_ms,rounds,"
             "retries,liveness_failures,sent,dropped,duplicated,safe\n");
  for (const auto& trial : trials) {
    fmt::print(out, "{},{},{:.3f},{},{},{},{},{},{},{},{},{},{},{}\n",
               trial.trial, trial.seed, trial.drop, trial.crashed,
               trial.decided.has_value() ? 1 : 0,
               CsvField(trial.decided.value_or("")),
               trial.latency ? fmt::to_string(*trial.latency) : "",
               trial.rounds, trial.retries, trial.liveness_failures,
               trial.messages_sent, trial.messages_dropped,
               trial.messages_duplicated, trial.safe ? 1 : 0);
  }
}

void WriteSummaryCsv(double drop, size_t crashed, const Summary& summary,
                     std::ostream& out, bool header) {
  if (header) {
    fmt::print(out,
               "drop,crashed,trials,decided,success_rate,liveness_failures,"
               "safety_violations,mean_latency_ms,p50_latency_ms,"
               "p95_latency_ms,max_latency_ms,mean_retries,mean_sent,"
               "mean_dropped\n");
  }
  fmt::print(out,
             "{:.3f},{},{},{},{:.3f},{},{},{:.2f},{},{},{},{:.2f},{:.2f},"
             "{:.2f}\n",
             drop, crashed, summary.trials, summary.decided,
             summary.success_rate, summary.liveness_failures,
             summary.safety_violations, summary.mean_latency,
             summary.p50_latency, summary.p95_latency, summary.max_latency,
             summary.mean_retries, summary.mean_messages_sent,
             summary.mean_messages_dropped);
}

}  // namespace synod
