#pragma once

#include <synod/core/proto.hpp>

namespace synod {

// Message entry point of an actor

struct IEndpoint {
  virtual ~IEndpoint() = default;

  virtual void Handle(const proto::Envelope& envelope) = 0;
};

// Asynchronous, unreliable delivery to envelope.to
// Messages may be delayed, dropped, duplicated and reordered

struct IMessenger {
  virtual ~IMessenger() = default;

  virtual void Send(proto::Envelope envelope) = 0;
};

}  // namespace synod
