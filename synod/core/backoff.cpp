#include <synod/core/backoff.hpp>

#include <algorithm>

namespace synod {

Backoff::Backoff(Params params) : params_(params), next_(params.init) {
}

Millis Backoff::operator()() {
  auto curr = next_;
  next_ = ComputeNext(curr);
  return curr;
}

void Backoff::Reset() {
  next_ = params_.init;
}

Millis Backoff::ComputeNext(Millis curr) const {
  return std::min(params_.max, curr * params_.factor);
}

}  // namespace synod
