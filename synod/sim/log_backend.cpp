#include <synod/sim/log_backend.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <stdexcept>

namespace synod::sim {

LogBackend::LogBackend(Clock clock, timber::Level min_level,
                       std::ostream& out)
    : clock_(std::move(clock)), min_level_(min_level), out_(out) {
}

timber::Level LogBackend::GetMinLevelFor(const std::string& /*component*/) const {
  return min_level_;
}

void LogBackend::Log(timber::Event event) {
  fmt::print(out_, "[T {:>6}] {:<7} [{}] {}\n", clock_(),
             LogLevelName(event.level), event.component, event.message);
}

timber::Level ParseLogLevel(const std::string& name) {
  if (name == "debug") {
    return timber::Level::Debug;
  }
  if (name == "info") {
    return timber::Level::Info;
  }
  if (name == "warning") {
    return timber::Level::Warning;
  }
  if (name == "error") {
    return timber::Level::Error;
  }
  throw std::invalid_argument(fmt::format("unknown log level '{}'", name));
}

const char* LogLevelName(timber::Level level) {
  switch (level) {
    case timber::Level::Debug:
      return "debug";
    case timber::Level::Info:
      return "info";
    case timber::Level::Warning:
      return "warning";
    case timber::Level::Error:
      return "error";
    default:
      return "log";
  }
}

}  // namespace synod::sim
