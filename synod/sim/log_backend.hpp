#pragma once

#include <synod/core/time.hpp>

#include <timber/backend.hpp>

#include <functional>
#include <ostream>
#include <string>

namespace synod::sim {

// Writes records prefixed with virtual time, filters by level

class LogBackend : public timber::ILogBackend {
 public:
  using Clock = std::function<Millis()>;

 public:
  LogBackend(Clock clock, timber::Level min_level, std::ostream& out);

  void SetMinLevel(timber::Level level) {
    min_level_ = level;
  }

  // timber::ILogBackend

  timber::Level GetMinLevelFor(const std::string& component) const override;
  void Log(timber::Event event) override;

 private:
  Clock clock_;
  timber::Level min_level_;
  std::ostream& out_;
};

// "debug", "info", "warning", "error"
// Throws std::invalid_argument for unknown names
timber::Level ParseLogLevel(const std::string& name);

const char* LogLevelName(timber::Level level);

}  // namespace synod::sim
