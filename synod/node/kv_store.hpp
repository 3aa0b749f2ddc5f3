#pragma once

#include <synod/store/acceptor_store.hpp>

#include <timber/logger.hpp>

#include <whirl/node/store/kv.hpp>

namespace synod::node {

// Acceptor state in the node's local database, one key per instance

class KVAcceptorStore : public IAcceptorStore {
 public:
  KVAcceptorStore();

  std::optional<AcceptorState> Load(InstanceId instance) override;
  wheels::Status Save(InstanceId instance,
                      const AcceptorState& state) override;

 private:
  whirl::node::store::KVStore<AcceptorState> states_;
  timber::Logger logger_;
};

}  // namespace synod::node
