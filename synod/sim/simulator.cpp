#include <synod/sim/simulator.hpp>

#include <wheels/support/assert.hpp>

#include <algorithm>

namespace synod::sim {

Simulator::Simulator(uint64_t seed, timber::Level log_level,
                     std::ostream& log)
    : seed_(seed),
      random_(seed),
      log_(
          [this]() {
            return now_;
          },
          log_level, log) {
}

uint64_t Simulator::RandomNumber(uint64_t lo, uint64_t hi) {
  WHEELS_VERIFY(lo <= hi, "Empty random range");
  return std::uniform_int_distribution<uint64_t>(lo, hi)(random_);
}

double Simulator::RandomDouble() {
  return std::uniform_real_distribution<double>(0.0, 1.0)(random_);
}

TimerId Simulator::After(Millis delay, TimerCallback callback) {
  TimerId id = ++next_id_;
  Millis at = now_ + delay;
  queue_.emplace(Key{at, id}, std::move(callback));
  deadlines_.emplace(id, at);
  return id;
}

void Simulator::Cancel(TimerId id) {
  auto it = deadlines_.find(id);
  if (it == deadlines_.end()) {
    return;
  }
  queue_.erase(Key{it->second, id});
  deadlines_.erase(it);
}

bool Simulator::Step() {
  if (queue_.empty()) {
    return false;
  }

  auto it = queue_.begin();
  auto [at, id] = it->first;
  Task task = std::move(it->second);
  queue_.erase(it);
  deadlines_.erase(id);

  now_ = at;
  task();
  return true;
}

size_t Simulator::RunFor(Millis duration) {
  const Millis until = now_ + duration;
  size_t steps = 0;
  while (!queue_.empty() && queue_.begin()->first.first <= until) {
    Step();
    ++steps;
  }
  now_ = until;
  return steps;
}

bool Simulator::RunUntil(const std::function<bool()>& predicate,
                         Millis deadline) {
  while (!predicate()) {
    if (queue_.empty() || queue_.begin()->first.first > deadline) {
      now_ = std::max(now_, deadline);
      return false;
    }
    Step();
  }
  return true;
}

}  // namespace synod::sim
