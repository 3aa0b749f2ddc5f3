#pragma once

#include <synod/core/proto.hpp>
#include <synod/net/messenger.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace synod::test {

// Keeps sent envelopes for inspection, delivers nothing
class CapturingMessenger : public IMessenger {
 public:
  void Send(proto::Envelope envelope) override {
    sent.push_back(std::move(envelope));
  }

  template <typename M>
  std::vector<proto::Envelope> OfKind() const {
    std::vector<proto::Envelope> found;
    for (const auto& envelope : sent) {
      if (std::holds_alternative<M>(envelope.message)) {
        found.push_back(envelope);
      }
    }
    return found;
  }

  template <typename M>
  size_t Count() const {
    return OfKind<M>().size();
  }

  void Clear() {
    sent.clear();
  }

  std::vector<proto::Envelope> sent;
};

inline ProposalId Id(uint64_t round, const NodeId& uid = "P1") {
  return ProposalId{round, uid};
}

inline Proposal Make(uint64_t round, Value value,
                     const NodeId& uid = "P1") {
  return Proposal{ProposalId{round, uid}, std::move(value)};
}

}  // namespace synod::test
