#include <synod/node/runtime.hpp>

#include <await/fibers/core/api.hpp>
#include <await/fibers/sync/future.hpp>

#include <whirl/node/runtime/shortcuts.hpp>

namespace synod::node {

namespace rt = whirl::node::rt;

NodeRuntime::NodeRuntime(await::fibers::Mutex& mutex) : mutex_(mutex) {
}

Millis NodeRuntime::Now() const {
  return rt::MonotonicNow().ToJiffies().Count();
}

uint64_t NodeRuntime::RandomNumber(uint64_t lo, uint64_t hi) {
  return rt::RandomNumber(lo, hi);
}

timber::ILogBackend* NodeRuntime::LoggerBackend() {
  return rt::LoggerBackend();
}

// Called with the node mutex held
TimerId NodeRuntime::After(Millis delay, TimerCallback callback) {
  TimerId id = ++next_id_;
  pending_.insert(id);

  await::fibers::Go([this, id, delay, callback = std::move(callback)]() {
    await::fibers::Await(rt::TimeService()->After(delay)).ExpectOk();

    auto guard = mutex_.Guard();
    if (pending_.erase(id) > 0) {
      callback();
    }
  });

  return id;
}

void NodeRuntime::Cancel(TimerId id) {
  pending_.erase(id);
}

}  // namespace synod::node
