#pragma once

#include <synod/metrics/event.hpp>

#include <timber/logger.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <vector>

namespace synod {

// In-memory event stream

class EventLog : public IEventSink {
 public:
  void Record(Event event) override;

  const std::vector<Event>& Events() const {
    return events_;
  }

  size_t Count(EventType type) const;
  size_t Count(EventType type, InstanceId instance) const;

  std::optional<Event> First(EventType type, InstanceId instance) const;

  void Clear();

  // Header: instance,role,node,peer,type,timestamp,detail
  void WriteCsv(std::ostream& out) const;

 private:
  std::vector<Event> events_;
};

// Forwards events to a logger, for nodes without a metrics collector

class LoggingEventSink : public IEventSink {
 public:
  explicit LoggingEventSink(timber::ILogBackend* backend);

  void Record(Event event) override;

 private:
  timber::Logger logger_;
};

}  // namespace synod
