#pragma once

#include <synod/core/time.hpp>

#include <cstdint>

namespace synod {

struct Backoff {
 public:
  struct Params {
    Millis init;
    Millis max;
    uint64_t factor;
  };

 public:
  explicit Backoff(Params params);

  // Returns backoff delay
  Millis operator()();

  void Reset();

 private:
  Millis ComputeNext(Millis curr) const;

 private:
  const Params params_;
  Millis next_;
};

}  // namespace synod
