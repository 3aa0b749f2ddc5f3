#pragma once

#include <synod/metrics/event.hpp>
#include <synod/net/messenger.hpp>
#include <synod/sim/delay.hpp>
#include <synod/sim/simulator.hpp>

#include <timber/logger.hpp>

#include <cstddef>
#include <map>
#include <set>
#include <utility>

namespace synod::sim {

struct LinkConfig {
  DelayDistribution delay{DelayDistribution::Constant(1)};
  // Independent probabilities per message
  double drop{0.0};
  double duplicate{0.0};
  // Deliver messages of the link in send order
  bool fifo{false};

  // Throws std::invalid_argument
  void Validate() const;
};

struct NetworkStats {
  size_t sent{0};
  size_t delivered{0};
  size_t dropped{0};
  size_t duplicated{0};
};

// Simulated unreliable network between endpoints attached by node id

class Network : public IMessenger {
  using Link = std::pair<NodeId, NodeId>;

 public:
  Network(Simulator& simulator, LinkConfig defaults, IEventSink* events);

  void Attach(const NodeId& node, IEndpoint* endpoint);

  // Overrides default config for one direction
  void Configure(const NodeId& from, const NodeId& to, LinkConfig config);

  void Send(proto::Envelope envelope) override;

  // Faults

  // Cuts all links of node in both directions
  void Isolate(const NodeId& node);
  void Rejoin(const NodeId& node);

  // Cuts one direction
  void Block(const NodeId& from, const NodeId& to);
  void Unblock(const NodeId& from, const NodeId& to);

  bool Reachable(const NodeId& from, const NodeId& to) const;

  const NetworkStats& Stats() const {
    return stats_;
  }

 private:
  const LinkConfig& ConfigOf(const Link& link) const;

  void Transmit(const proto::Envelope& envelope, const LinkConfig& config);
  void Deliver(const proto::Envelope& envelope);
  void Drop(const proto::Envelope& envelope, const char* why);

  void Emit(const proto::Envelope& envelope, EventType type,
            const char* detail = nullptr);

 private:
  timber::Logger logger_;
  Simulator& simulator_;
  const LinkConfig defaults_;
  IEventSink* events_;

  std::map<NodeId, IEndpoint*> endpoints_;
  std::map<Link, LinkConfig> links_;
  std::set<NodeId> isolated_;
  std::set<Link> blocked_;
  // Latest scheduled delivery per FIFO link
  std::map<Link, Millis> last_delivery_;

  NetworkStats stats_;
};

}  // namespace synod::sim
