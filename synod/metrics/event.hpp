#pragma once

#include <synod/core/proposal.hpp>
#include <synod/core/time.hpp>

#include <fmt/ostream.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace synod {

enum class Role : uint8_t {
  Proposer = 1,  // Do not format
  Acceptor = 2,
  Learner = 3,
  Messenger = 4,
};

enum class EventType : uint8_t {
  // Proposer
  PrepareSent,
  PromiseRecv,
  NackRecv,
  AcceptSent,
  AcceptedRecv,
  Decided,
  Retry,
  Timeout,
  LivenessFailure,
  // Acceptor
  PromiseSent,
  NackSent,
  AcceptedSent,
  PersistFailed,
  // Learner
  Learned,
  // Messenger
  MessageSent,
  MessageDelivered,
  MessageDropped,
  MessageDuplicated,
};

const char* RoleName(Role role);
const char* EventTypeName(EventType type);

struct Event {
  InstanceId instance{0};
  Role role{Role::Messenger};
  NodeId node;
  // Other side of a message, if any
  NodeId peer;
  EventType type{EventType::MessageSent};
  Millis timestamp{0};
  std::string detail;
};

std::ostream& operator<<(std::ostream& out, const Event& event);

// Append-only stream consumed by metrics collectors

struct IEventSink {
  virtual ~IEventSink() = default;

  virtual void Record(Event event) = 0;
};

}  // namespace synod

template <>
struct fmt::formatter<synod::Event> : fmt::ostream_formatter {};
