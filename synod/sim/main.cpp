#include <synod/sim/experiment.hpp>
#include <synod/sim/log_backend.hpp>

#include <lyra/lyra.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace synod;
using namespace synod::sim;

static std::unique_ptr<std::ofstream> OpenOutput(const std::string& path) {
  if (path.empty()) {
    return nullptr;
  }
  auto file = std::make_unique<std::ofstream>(path);
  if (!file->is_open()) {
    throw std::runtime_error(fmt::format("cannot open '{}'", path));
  }
  return file;
}

int main(int argc, char* argv[]) {
  ExperimentConfig config;

  std::string delay = "uniform:5-10";
  std::vector<double> drops;
  std::vector<size_t> crashes;
  bool no_jitter = false;
  bool no_notify = false;
  std::string log_level = "warning";

  std::string trials_path;
  std::string summary_path;
  std::string events_path;
  std::string snapshots_path;

  bool get_help = false;

  lyra::cli cli;
  cli.add_argument(lyra::help(get_help))
      .add_argument(lyra::opt(config.acceptors, "n")
                        .name("-a")
                        .name("--acceptors")
                        .help("Number of acceptors"))
      .add_argument(lyra::opt(config.proposers, "n")
                        .name("-p")
                        .name("--proposers")
                        .help("Number of competing proposers"))
      .add_argument(lyra::opt(config.learners, "n")
                        .name("-l")
                        .name("--learners")
                        .help("Number of learners"))
      .add_argument(lyra::opt(crashes, "n")
                        .name("--crashed")
                        .help("Acceptors crashed before the trial starts, "
                              "repeat to sweep"))
      .add_argument(lyra::opt(config.trials, "n")
                        .name("-t")
                        .name("--trials")
                        .help("Number of trials"))
      .add_argument(lyra::opt(config.seed, "seed")
                        .name("-s")
                        .name("--seed")
                        .help("Seed of the first trial"))
      .add_argument(lyra::opt(delay, "dist")
                        .name("--delay")
                        .help("Link delay: const:D, uniform:MIN-MAX or exp:MEAN:CAP (ms)"))
      .add_argument(lyra::opt(drops, "p")
                        .name("--drop")
                        .help("Message drop probability, repeat to sweep"))
      .add_argument(lyra::opt(config.link.duplicate, "p")
                        .name("--duplicate")
                        .help("Message duplication probability"))
      .add_argument(lyra::opt(config.link.fifo)
                        .name("--fifo")
                        .help("FIFO delivery on every link"))
      .add_argument(lyra::opt(config.proposer.round_deadline, "ms")
                        .name("--deadline")
                        .help("Round deadline"))
      .add_argument(lyra::opt(config.proposer.max_retries, "n")
                        .name("--max-retries")
                        .help("Retries before a proposer gives up"))
      .add_argument(lyra::opt(config.proposer.backoff.init, "ms")
                        .name("--backoff-init")
                        .help("Initial retry backoff"))
      .add_argument(lyra::opt(config.proposer.backoff.max, "ms")
                        .name("--backoff-max")
                        .help("Maximal retry backoff"))
      .add_argument(lyra::opt(config.proposer.backoff.factor, "k")
                        .name("--backoff-factor")
                        .help("Backoff multiplier"))
      .add_argument(lyra::opt(no_jitter)
                        .name("--no-jitter")
                        .help("Disable randomized backoff"))
      .add_argument(lyra::opt(no_notify)
                        .name("--no-notify")
                        .help("Proposers do not announce decisions to learners"))
      .add_argument(lyra::opt(config.stagger, "ms")
                        .name("--stagger")
                        .help("Delay between proposer starts"))
      .add_argument(lyra::opt(config.time_limit, "ms")
                        .name("--time-limit")
                        .help("Virtual time limit per trial"))
      .add_argument(lyra::opt(config.snapshot_interval, "ms")
                        .name("--snapshot-interval")
                        .help("Node snapshot period, 0 disables"))
      .add_argument(lyra::opt(log_level, "level")
                        .name("--log-level")
                        .help("debug, info, warning or error"))
      .add_argument(lyra::opt(trials_path, "path")
                        .name("--trials-csv")
                        .help("Per-trial results"))
      .add_argument(lyra::opt(summary_path, "path")
                        .name("--summary-csv")
                        .help("Summary per drop rate and crash count"))
      .add_argument(lyra::opt(events_path, "path")
                        .name("--events")
                        .help("Event log of the first trial"))
      .add_argument(lyra::opt(snapshots_path, "path")
                        .name("--snapshots")
                        .help("Node snapshots of the first trial"));

  auto result = cli.parse({argc, argv});
  if (get_help) {
    std::cout << cli;
    return 0;
  }
  if (!result) {
    std::cerr << "Error in command line: " << result.errorMessage() << std::endl;
    return 1;
  }

  try {
    config.link.delay = ParseDelay(delay);
    config.log_level = ParseLogLevel(log_level);
    config.proposer.jitter = !no_jitter;
    config.proposer.notify_learners = !no_notify;
    if (drops.empty()) {
      drops.push_back(config.link.drop);
    }
    if (crashes.empty()) {
      crashes.push_back(config.crashed_acceptors);
    }

    auto trials_out = OpenOutput(trials_path);
    auto summary_out = OpenOutput(summary_path);
    auto events_out = OpenOutput(events_path);
    auto snapshots_out = OpenOutput(snapshots_path);

    std::vector<TrialResult> all;
    bool first = true;

    for (size_t crashed : crashes) {
      for (double drop : drops) {
        config.crashed_acceptors = crashed;
        config.link.drop = drop;
        config.Validate();

        TrialOutputs outputs;
        if (first) {
          outputs.events = events_out.get();
          outputs.snapshots = snapshots_out.get();
        }

        auto results = RunExperiment(config, outputs);
        auto summary = Summarize(results);

        fmt::print(
            "drop={:.3f} crashed={}: decided {}/{} ({:.1f}%), latency mean "
            "{:.1f} ms p50 {} p95 {} max {}, retries {:.2f}, sent {:.1f}, "
            "safety violations {}\n",
            drop, crashed, summary.decided, summary.trials,
            summary.success_rate * 100, summary.mean_latency,
            summary.p50_latency, summary.p95_latency, summary.max_latency,
            summary.mean_retries, summary.mean_messages_sent,
            summary.safety_violations);

        if (summary_out) {
          WriteSummaryCsv(drop, crashed, summary, *summary_out, first);
        }
        all.insert(all.end(), results.begin(), results.end());
        first = false;
      }
    }

    if (trials_out) {
      WriteTrialsCsv(all, *trials_out);
    }

    return Summarize(all).safety_violations == 0 ? 0 : 2;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
