#pragma once

#include <synod/store/acceptor_store.hpp>

#include <muesli/bytes.hpp>

#include <cstddef>
#include <map>
#include <optional>

namespace synod {

// Keeps serialized records outside of the acceptor, so they survive
// acceptor crashes. Write failures can be injected

class MemoryAcceptorStore : public IAcceptorStore {
 public:
  std::optional<AcceptorState> Load(InstanceId instance) override;
  wheels::Status Save(InstanceId instance,
                      const AcceptorState& state) override;

  // Fault injection

  // Next `writes` writes succeed, all later writes fail
  void FailAfter(size_t writes);
  void FailAll();
  void Heal();

  size_t Writes() const {
    return writes_;
  }

  size_t FailedWrites() const {
    return failed_writes_;
  }

 private:
  bool NextWriteFails();

 private:
  std::map<InstanceId, muesli::Bytes> records_;
  std::optional<size_t> writes_left_;
  size_t writes_{0};
  size_t failed_writes_{0};
};

}  // namespace synod
