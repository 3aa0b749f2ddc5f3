#pragma once

#include <synod/core/proposal.hpp>
#include <synod/core/runtime.hpp>
#include <synod/metrics/event.hpp>
#include <synod/net/messenger.hpp>

namespace synod {

// Environment shared by the roles hosted on one node

struct Context {
  NodeId self;
  IRuntime* runtime{nullptr};
  IMessenger* messenger{nullptr};
  IEventSink* events{nullptr};
};

}  // namespace synod
