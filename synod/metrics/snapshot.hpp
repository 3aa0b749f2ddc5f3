#pragma once

#include <synod/core/proposal.hpp>
#include <synod/metrics/event.hpp>

#include <cstdint>
#include <string>

namespace synod {

// Read-only view of a node for visualization

struct NodeSnapshot {
  NodeId node_id;
  Role role{Role::Acceptor};
  uint64_t current_round{0};
  std::string state;
  std::string last_message_type;
};

struct ISnapshotSource {
  virtual ~ISnapshotSource() = default;

  virtual NodeSnapshot Snapshot() const = 0;
};

}  // namespace synod
