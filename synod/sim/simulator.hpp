#pragma once

#include <synod/core/runtime.hpp>
#include <synod/sim/log_backend.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <random>
#include <utility>

namespace synod::sim {

// Single-threaded discrete event simulator
// Events run in (time, scheduling order), all randomness comes from one seed

class Simulator : public IRuntime, public ITimerService {
 public:
  using Task = TimerCallback;

 public:
  explicit Simulator(uint64_t seed,
                     timber::Level log_level = timber::Level::Warning,
                     std::ostream& log = std::cerr);

  Simulator(const Simulator&) = delete;
  Simulator& operator=(const Simulator&) = delete;

  // IRuntime

  Millis Now() const override {
    return now_;
  }

  ITimerService* Timers() override {
    return this;
  }

  uint64_t RandomNumber(uint64_t lo, uint64_t hi) override;

  timber::ILogBackend* LoggerBackend() override {
    return &log_;
  }

  // ITimerService

  TimerId After(Millis delay, TimerCallback callback) override;
  void Cancel(TimerId id) override;

  // Scheduling

  TimerId Schedule(Millis delay, Task task) {
    return After(delay, std::move(task));
  }

  // Runs the next event, false if none left
  bool Step();

  // Runs events up to Now() + duration, then advances clock to that point
  // Returns number of events executed
  size_t RunFor(Millis duration);

  // Runs until predicate holds or clock passes deadline (absolute)
  bool RunUntil(const std::function<bool()>& predicate, Millis deadline);

  size_t Pending() const {
    return queue_.size();
  }

  uint64_t Seed() const {
    return seed_;
  }

  // In [0, 1)
  double RandomDouble();

  std::mt19937_64& Random() {
    return random_;
  }

  void SetLogLevel(timber::Level level) {
    log_.SetMinLevel(level);
  }

 private:
  // (time, id), ids grow monotonically so equal times run in FIFO order
  using Key = std::pair<Millis, TimerId>;

  const uint64_t seed_;
  std::mt19937_64 random_;
  LogBackend log_;

  Millis now_{0};
  TimerId next_id_{0};
  std::map<Key, Task> queue_;
  std::map<TimerId, Millis> deadlines_;
};

}  // namespace synod::sim
