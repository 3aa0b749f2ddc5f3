#include <synod/sim/delay.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace synod::sim {

Millis DelayDistribution::Sample(std::mt19937_64& random) const {
  switch (kind) {
    case Kind::Constant:
      return min;
    case Kind::Uniform:
      return std::uniform_int_distribution<Millis>(min, max)(random);
    case Kind::Exponential: {
      double sample = std::exponential_distribution<double>(
          1.0 / static_cast<double>(mean))(random);
      return std::min(max, static_cast<Millis>(std::llround(sample)));
    }
  }
  return min;
}

void DelayDistribution::Validate() const {
  switch (kind) {
    case Kind::Constant:
      return;
    case Kind::Uniform:
      if (min > max) {
        throw std::invalid_argument(
            fmt::format("empty delay range [{}, {}]", min, max));
      }
      return;
    case Kind::Exponential:
      if (mean == 0 || max < mean) {
        throw std::invalid_argument(fmt::format(
            "exponential delay needs 0 < mean <= cap, got {} / {}", mean,
            max));
      }
      return;
  }
}

std::string DelayDistribution::Describe() const {
  switch (kind) {
    case Kind::Constant:
      return fmt::format("const:{}", min);
    case Kind::Uniform:
      return fmt::format("uniform:{}-{}", min, max);
    case Kind::Exponential:
      return fmt::format("exp:{}:{}", mean, max);
  }
  return "?";
}

namespace {

// Digits only, stoull would accept a sign or leading spaces
Millis ParseMillis(const std::string& text, const std::string& input) {
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
    throw std::invalid_argument(fmt::format("bad delay '{}'", input));
  }
  try {
    size_t consumed = 0;
    auto value = std::stoull(text, &consumed);
    if (consumed == text.size()) {
      return value;
    }
  } catch (const std::logic_error&) {
    // Reported below
  }
  throw std::invalid_argument(fmt::format("bad delay '{}'", input));
}

}  // namespace

DelayDistribution ParseDelay(const std::string& input) {
  auto colon = input.find(':');
  if (colon == std::string::npos) {
    return DelayDistribution::Constant(ParseMillis(input, input));
  }

  auto kind = input.substr(0, colon);
  auto args = input.substr(colon + 1);

  DelayDistribution delay;

  if (kind == "const") {
    delay = DelayDistribution::Constant(ParseMillis(args, input));
  } else if (kind == "uniform") {
    auto dash = args.find('-');
    if (dash == std::string::npos) {
      throw std::invalid_argument(fmt::format("bad delay '{}'", input));
    }
    delay = DelayDistribution::Uniform(ParseMillis(args.substr(0, dash), input),
                                       ParseMillis(args.substr(dash + 1), input));
  } else if (kind == "exp") {
    auto sep = args.find(':');
    if (sep == std::string::npos) {
      throw std::invalid_argument(fmt::format("bad delay '{}'", input));
    }
    delay =
        DelayDistribution::Exponential(ParseMillis(args.substr(0, sep), input),
                                       ParseMillis(args.substr(sep + 1), input));
  } else {
    throw std::invalid_argument(
        fmt::format("unknown delay distribution '{}'", kind));
  }

  delay.Validate();
  return delay;
}

}  // namespace synod::sim
