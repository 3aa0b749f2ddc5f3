#pragma once

#include <synod/core/runtime.hpp>

#include <await/fibers/sync/mutex.hpp>

#include <set>

namespace synod::node {

// IRuntime over the whirl node runtime
// Timer callbacks run in fibers under the node mutex

class NodeRuntime : public IRuntime, public ITimerService {
 public:
  explicit NodeRuntime(await::fibers::Mutex& mutex);

  // IRuntime

  Millis Now() const override;

  ITimerService* Timers() override {
    return this;
  }

  uint64_t RandomNumber(uint64_t lo, uint64_t hi) override;

  timber::ILogBackend* LoggerBackend() override;

  // ITimerService

  TimerId After(Millis delay, TimerCallback callback) override;
  void Cancel(TimerId id) override;

 private:
  await::fibers::Mutex& mutex_;
  TimerId next_id_{0};
  std::set<TimerId> pending_;
};

}  // namespace synod::node
