#include <synod/metrics/event.hpp>

namespace synod {

const char* RoleName(Role role) {
  switch (role) {
    case Role::Proposer:
      return "proposer";
    case Role::Acceptor:
      return "acceptor";
    case Role::Learner:
      return "learner";
    case Role::Messenger:
      return "messenger";
  }
  return "?";
}

const char* EventTypeName(EventType type) {
  switch (type) {
    case EventType::PrepareSent:
      return "prepare_sent";
    case EventType::PromiseRecv:
      return "promise_recv";
    case EventType::NackRecv:
      return "nack_recv";
    case EventType::AcceptSent:
      return "accept_sent";
    case EventType::AcceptedRecv:
      return "accepted_recv";
    case EventType::Decided:
      return "decided";
    case EventType::Retry:
      return "retry";
    case EventType::Timeout:
      return "timeout";
    case EventType::LivenessFailure:
      return "liveness_failure";
    case EventType::PromiseSent:
      return "promise_sent";
    case EventType::NackSent:
      return "nack_sent";
    case EventType::AcceptedSent:
      return "accepted_sent";
    case EventType::PersistFailed:
      return "persist_failed";
    case EventType::Learned:
      return "learned";
    case EventType::MessageSent:
      return "message_sent";
    case EventType::MessageDelivered:
      return "message_delivered";
    case EventType::MessageDropped:
      return "message_dropped";
    case EventType::MessageDuplicated:
      return "message_duplicated";
  }
  return "?";
}

std::ostream& operator<<(std::ostream& out, const Event& event) {
  out << "[" << event.timestamp << "] #" << event.instance << " "
      << RoleName(event.role) << " " << event.node << " "
      << EventTypeName(event.type);
  if (!event.peer.empty()) {
    out << " peer=" << event.peer;
  }
  if (!event.detail.empty()) {
    out << " " << event.detail;
  }
  return out;
}

}  // namespace synod
