#include <synod/node/kv_store.hpp>

#include <synod/core/errors.hpp>

#include <timber/log.hpp>

#include <whirl/node/runtime/shortcuts.hpp>

#include <fmt/core.h>

#include <exception>

namespace synod::node {

namespace rt = whirl::node::rt;

KVAcceptorStore::KVAcceptorStore()
    : states_(rt::Database(), "acceptor"),
      logger_("Synod.Store", rt::LoggerBackend()) {
}

std::optional<AcceptorState> KVAcceptorStore::Load(InstanceId instance) {
  return states_.TryGet(fmt::to_string(instance));
}

wheels::Status KVAcceptorStore::Save(InstanceId instance,
                                     const AcceptorState& state) {
  try {
    states_.Put(fmt::to_string(instance), state);
  } catch (const std::exception& e) {
    LOG_ERROR("#{} write failed: {}", instance, e.what());
    return wheels::make_result::Fail(PersistenceFailure());
  }
  return wheels::make_result::Ok();
}

}  // namespace synod::node
