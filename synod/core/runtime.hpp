#pragma once

#include <synod/core/time.hpp>

#include <timber/logger.hpp>

#include <cstdint>
#include <functional>

namespace synod {

using TimerId = uint64_t;

using TimerCallback = std::function<void()>;

struct ITimerService {
  virtual ~ITimerService() = default;

  // Invokes callback once after delay unless cancelled
  virtual TimerId After(Millis delay, TimerCallback callback) = 0;

  // No-op for fired or unknown timers
  virtual void Cancel(TimerId id) = 0;
};

// Clock, timers, randomness and logging of the hosting environment

struct IRuntime {
  virtual ~IRuntime() = default;

  virtual Millis Now() const = 0;

  virtual ITimerService* Timers() = 0;

  // Uniformly distributed in [lo, hi]
  virtual uint64_t RandomNumber(uint64_t lo, uint64_t hi) = 0;

  virtual timber::ILogBackend* LoggerBackend() = 0;
};

}  // namespace synod
