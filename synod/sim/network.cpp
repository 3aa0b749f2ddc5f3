#include <synod/sim/network.hpp>

#include <timber/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace synod::sim {

void LinkConfig::Validate() const {
  delay.Validate();
  if (drop < 0.0 || drop > 1.0) {
    throw std::invalid_argument(
        fmt::format("drop probability {} not in [0, 1]", drop));
  }
  if (duplicate < 0.0 || duplicate > 1.0) {
    throw std::invalid_argument(
        fmt::format("duplication probability {} not in [0, 1]", duplicate));
  }
}

Network::Network(Simulator& simulator, LinkConfig defaults,
                 IEventSink* events)
    : logger_("Synod.Network", simulator.LoggerBackend()),
      simulator_(simulator),
      defaults_(std::move(defaults)),
      events_(events) {
  defaults_.Validate();
}

void Network::Attach(const NodeId& node, IEndpoint* endpoint) {
  endpoints_[node] = endpoint;
}

void Network::Configure(const NodeId& from, const NodeId& to,
                        LinkConfig config) {
  config.Validate();
  links_.insert_or_assign(Link{from, to}, std::move(config));
}

void Network::Send(proto::Envelope envelope) {
  ++stats_.sent;
  Emit(envelope, EventType::MessageSent);

  if (!Reachable(envelope.from, envelope.to)) {
    Drop(envelope, "unreachable");
    return;
  }

  const auto& config = ConfigOf({envelope.from, envelope.to});

  if (config.drop > 0.0 && simulator_.RandomDouble() < config.drop) {
    Drop(envelope, "lost");
    return;
  }

  if (config.duplicate > 0.0 &&
      simulator_.RandomDouble() < config.duplicate) {
    ++stats_.duplicated;
    Emit(envelope, EventType::MessageDuplicated);
    Transmit(envelope, config);
  }

  Transmit(envelope, config);
}

void Network::Transmit(const proto::Envelope& envelope,
                       const LinkConfig& config) {
  Millis at = simulator_.Now() + config.delay.Sample(simulator_.Random());

  if (config.fifo) {
    auto& last = last_delivery_[{envelope.from, envelope.to}];
    at = std::max(at, last);
    last = at;
  }

  simulator_.Schedule(at - simulator_.Now(), [this, envelope]() {
    Deliver(envelope);
  });
}

void Network::Deliver(const proto::Envelope& envelope) {
  // Partitions applied while message was in flight
  if (!Reachable(envelope.from, envelope.to)) {
    Drop(envelope, "unreachable");
    return;
  }

  auto it = endpoints_.find(envelope.to);
  if (it == endpoints_.end()) {
    Drop(envelope, "unknown destination");
    return;
  }

  ++stats_.delivered;
  Emit(envelope, EventType::MessageDelivered);
  LOG_DEBUG("{}", envelope);

  it->second->Handle(envelope);
}

void Network::Drop(const proto::Envelope& envelope, const char* why) {
  ++stats_.dropped;
  LOG_DEBUG("drop {}: {}", envelope, why);
  Emit(envelope, EventType::MessageDropped, why);
}

void Network::Isolate(const NodeId& node) {
  LOG_INFO("isolate {}", node);
  isolated_.insert(node);
}

void Network::Rejoin(const NodeId& node) {
  LOG_INFO("rejoin {}", node);
  isolated_.erase(node);
}

void Network::Block(const NodeId& from, const NodeId& to) {
  LOG_INFO("block {} -> {}", from, to);
  blocked_.insert({from, to});
}

void Network::Unblock(const NodeId& from, const NodeId& to) {
  LOG_INFO("unblock {} -> {}", from, to);
  blocked_.erase({from, to});
}

bool Network::Reachable(const NodeId& from, const NodeId& to) const {
  return !isolated_.contains(from) && !isolated_.contains(to) &&
         !blocked_.contains({from, to});
}

const LinkConfig& Network::ConfigOf(const Link& link) const {
  auto it = links_.find(link);
  return it != links_.end() ? it->second : defaults_;
}

void Network::Emit(const proto::Envelope& envelope, EventType type,
                   const char* detail) {
  if (events_ == nullptr) {
    return;
  }
  std::string text = proto::KindName(envelope.message);
  if (detail != nullptr) {
    text = fmt::format("{} {}", text, detail);
  }
  events_->Record(Event{envelope.instance, Role::Messenger, envelope.from,
                        envelope.to, type, simulator_.Now(), std::move(text)});
}

}  // namespace synod::sim
