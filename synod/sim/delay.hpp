#pragma once

#include <synod/core/time.hpp>

#include <cstdint>
#include <random>
#include <string>

namespace synod::sim {

// Per-link message delay

struct DelayDistribution {
  enum class Kind {
    Constant,
    Uniform,
    Exponential,
  };

  Kind kind{Kind::Constant};
  // Constant: min, Uniform: [min, max], Exponential: mean capped by max
  Millis min{1};
  Millis max{1};
  Millis mean{1};

  static DelayDistribution Constant(Millis delay) {
    return {Kind::Constant, delay, delay, delay};
  }

  static DelayDistribution Uniform(Millis min, Millis max) {
    return {Kind::Uniform, min, max, (min + max) / 2};
  }

  static DelayDistribution Exponential(Millis mean, Millis cap) {
    return {Kind::Exponential, 0, cap, mean};
  }

  Millis Sample(std::mt19937_64& random) const;

  // Throws std::invalid_argument
  void Validate() const;

  std::string Describe() const;
};

// "const:5", "uniform:1-10", "exp:5:100"
// Throws std::invalid_argument
DelayDistribution ParseDelay(const std::string& input);

}  // namespace synod::sim
