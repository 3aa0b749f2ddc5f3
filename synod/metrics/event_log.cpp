#include <synod/metrics/event_log.hpp>

#include <synod/metrics/csv.hpp>

#include <timber/log.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>

namespace synod {

void EventLog::Record(Event event) {
  events_.push_back(std::move(event));
}

size_t EventLog::Count(EventType type) const {
  return std::count_if(events_.begin(), events_.end(),
                       [type](const Event& event) {
                         return event.type == type;
                       });
}

size_t EventLog::Count(EventType type, InstanceId instance) const {
  return std::count_if(events_.begin(), events_.end(),
                       [type, instance](const Event& event) {
                         return event.type == type &&
                                event.instance == instance;
                       });
}

std::optional<Event> EventLog::First(EventType type,
                                     InstanceId instance) const {
  auto it = std::find_if(events_.begin(), events_.end(),
                         [type, instance](const Event& event) {
                           return event.type == type &&
                                  event.instance == instance;
                         });
  if (it == events_.end()) {
    return std::nullopt;
  }
  return *it;
}

void EventLog::Clear() {
  events_.clear();
}

void EventLog::WriteCsv(std::ostream& out) const {
  fmt::print(out, "instance,role,node,peer,type,timestamp,detail\n");
  for (const auto& event : events_) {
    fmt::print(out, "{},{},{},{},{},{},{}\n", event.instance,
               RoleName(event.role), CsvField(event.node),
               CsvField(event.peer), EventTypeName(event.type),
               event.timestamp, CsvField(event.detail));
  }
}

LoggingEventSink::LoggingEventSink(timber::ILogBackend* backend)
    : logger_("Synod.Events", backend) {
}

void LoggingEventSink::Record(Event event) {
  LOG_DEBUG("{}", event);
}

}  // namespace synod
