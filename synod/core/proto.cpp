#include <synod/core/proto.hpp>

namespace synod::proto {

MessageKind KindOf(const Message& message) {
  return static_cast<MessageKind>(message.index());
}

const char* KindName(MessageKind kind) {
  switch (kind) {
    case MessageKind::Prepare:
      return "Prepare";
    case MessageKind::Promise:
      return "Promise";
    case MessageKind::Nack:
      return "Nack";
    case MessageKind::Accept:
      return "Accept";
    case MessageKind::Accepted:
      return "Accepted";
    case MessageKind::Decided:
      return "Decided";
  }
  return "?";
}

const char* KindName(const Message& message) {
  return KindName(KindOf(message));
}

std::ostream& operator<<(std::ostream& out, const Message& message) {
  std::visit(Overloaded{
                 [&out](const Prepare& prepare) {
                   out << "Prepare" << prepare.id;
                 },
                 [&out](const Promise& promise) {
                   out << "Promise" << promise.id;
                   if (promise.vote) {
                     out << " vote=" << *promise.vote;
                   }
                 },
                 [&out](const Nack& nack) {
                   out << "Nack" << nack.id << " advice=" << nack.advice;
                 },
                 [&out](const Accept& accept) {
                   out << "Accept" << accept.proposal;
                 },
                 [&out](const Accepted& accepted) {
                   out << "Accepted" << accepted.proposal;
                 },
                 [&out](const Decided& decided) {
                   out << "Decided{" << decided.instance << ", "
                       << decided.value << "}";
                 },
             },
             message);
  return out;
}

std::ostream& operator<<(std::ostream& out, const Envelope& envelope) {
  out << envelope.from << " -> " << envelope.to << " #" << envelope.instance
      << " " << envelope.message;
  return out;
}

}  // namespace synod::proto
