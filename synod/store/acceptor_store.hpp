#pragma once

#include <synod/roles/acceptor_state.hpp>

#include <wheels/support/result.hpp>

#include <optional>

namespace synod {

// Durable acceptor state, one record per instance

struct IAcceptorStore {
  virtual ~IAcceptorStore() = default;

  virtual std::optional<AcceptorState> Load(InstanceId instance) = 0;

  // State is durable once Ok is returned
  virtual wheels::Status Save(InstanceId instance,
                              const AcceptorState& state) = 0;
};

}  // namespace synod
