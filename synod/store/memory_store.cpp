#include <synod/store/memory_store.hpp>

#include <synod/core/errors.hpp>

#include <muesli/serialize.hpp>

namespace synod {

std::optional<AcceptorState> MemoryAcceptorStore::Load(InstanceId instance) {
  auto it = records_.find(instance);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return muesli::Deserialize<AcceptorState>(it->second);
}

wheels::Status MemoryAcceptorStore::Save(InstanceId instance,
                                         const AcceptorState& state) {
  if (NextWriteFails()) {
    ++failed_writes_;
    return wheels::make_result::Fail(PersistenceFailure());
  }
  records_[instance] = muesli::Serialize(state);
  ++writes_;
  return wheels::make_result::Ok();
}

void MemoryAcceptorStore::FailAfter(size_t writes) {
  writes_left_ = writes;
}

void MemoryAcceptorStore::FailAll() {
  writes_left_ = 0;
}

void MemoryAcceptorStore::Heal() {
  writes_left_.reset();
}

bool MemoryAcceptorStore::NextWriteFails() {
  if (!writes_left_.has_value()) {
    return false;
  }
  if (*writes_left_ == 0) {
    return true;
  }
  --*writes_left_;
  return false;
}

}  // namespace synod
