#pragma once

#include <synod/core/proposal.hpp>

#include <muesli/serializable.hpp>

#include <cereal/types/common.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/variant.hpp>

#include <fmt/ostream.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <variant>

namespace synod {

namespace proto {

////////////////////////////////////////////////////////////////////////////////

// Phase I

struct Prepare {
  ProposalId id;

  MUESLI_SERIALIZABLE(id)
};

struct Promise {
  ProposalId id;
  // Highest proposal accepted so far by the acceptor
  std::optional<Proposal> vote;

  MUESLI_SERIALIZABLE(id, vote)
};

////////////////////////////////////////////////////////////////////////////////

// Phase II

struct Accept {
  Proposal proposal;

  MUESLI_SERIALIZABLE(proposal)
};

struct Accepted {
  Proposal proposal;

  MUESLI_SERIALIZABLE(proposal)
};

////////////////////////////////////////////////////////////////////////////////

// Rejection of Prepare or Accept

enum class NackReason : uint8_t {
  PrepareRejected = 1,  // Do not format
  AcceptRejected = 2,
};

struct Nack {
  // Rejected proposal
  ProposalId id;
  // Highest id promised by the acceptor
  ProposalId advice;
  NackReason reason{NackReason::PrepareRejected};

  MUESLI_SERIALIZABLE(id, advice, reason)
};

////////////////////////////////////////////////////////////////////////////////

// Learning

struct Decided {
  InstanceId instance{0};
  Value value;

  MUESLI_SERIALIZABLE(instance, value)
};

////////////////////////////////////////////////////////////////////////////////

// Closed set of messages, alternatives are dispatched with std::visit

using Message = std::variant<Prepare, Promise, Nack, Accept, Accepted, Decided>;

// Same order as Message alternatives
enum class MessageKind : uint8_t {
  Prepare = 0,
  Promise = 1,
  Nack = 2,
  Accept = 3,
  Accepted = 4,
  Decided = 5,
};

MessageKind KindOf(const Message& message);
const char* KindName(MessageKind kind);
const char* KindName(const Message& message);

struct Envelope {
  NodeId from;
  NodeId to;
  InstanceId instance{0};
  Message message;

  MUESLI_SERIALIZABLE(from, to, instance, message)
};

std::ostream& operator<<(std::ostream& out, const Message& message);
std::ostream& operator<<(std::ostream& out, const Envelope& envelope);

////////////////////////////////////////////////////////////////////////////////

template <typename... Handlers>
struct Overloaded : Handlers... {
  using Handlers::operator()...;
};

template <typename... Handlers>
Overloaded(Handlers...) -> Overloaded<Handlers...>;

}  // namespace proto

}  // namespace synod

template <>
struct fmt::formatter<synod::proto::Message> : fmt::ostream_formatter {};

template <>
struct fmt::formatter<synod::proto::Envelope> : fmt::ostream_formatter {};
