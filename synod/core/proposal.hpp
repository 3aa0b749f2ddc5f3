#pragma once

// Enable string serialization
#include <cereal/types/string.hpp>

#include <muesli/serializable.hpp>

#include <fmt/ostream.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

namespace synod {

////////////////////////////////////////////////////////////////////////////////

using Value = std::string;

using NodeId = std::string;

// Decision instance / slot
using InstanceId = uint64_t;

////////////////////////////////////////////////////////////////////////////////

// Proposal id = (round, proposer uid)
// Rounds are compared first, uid breaks ties

struct ProposalId {
  uint64_t round{0};
  NodeId uid{};

  static ProposalId Zero() {
    return {};
  }

  bool IsZero() const {
    return round == 0;
  }

  bool operator<(const ProposalId& that) const {
    return std::tie(round, uid) < std::tie(that.round, that.uid);
  }

  bool operator==(const ProposalId& that) const {
    return round == that.round && uid == that.uid;
  }

  bool operator!=(const ProposalId& that) const {
    return !(*this == that);
  }

  bool operator<=(const ProposalId& that) const {
    return !(that < *this);
  }

  bool operator>(const ProposalId& that) const {
    return that < *this;
  }

  bool operator>=(const ProposalId& that) const {
    return !(*this < that);
  }

  MUESLI_SERIALIZABLE(round, uid)
};

inline std::ostream& operator<<(std::ostream& out, const ProposalId& id) {
  out << "{" << id.round << ", " << id.uid << "}";
  return out;
}

////////////////////////////////////////////////////////////////////////////////

// Proposal = Proposal id + Value

struct Proposal {
  ProposalId id{};
  Value value{};

  bool operator==(const Proposal& that) const {
    return id == that.id && value == that.value;
  }

  MUESLI_SERIALIZABLE(id, value)
};

inline std::ostream& operator<<(std::ostream& out, const Proposal& proposal) {
  out << "{" << proposal.id << ", " << proposal.value << "}";
  return out;
}

}  // namespace synod

template <>
struct fmt::formatter<synod::ProposalId> : fmt::ostream_formatter {};

template <>
struct fmt::formatter<synod::Proposal> : fmt::ostream_formatter {};
