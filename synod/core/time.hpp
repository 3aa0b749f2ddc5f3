#pragma once

#include <cstdint>

namespace synod {

// Milliseconds: virtual in simulation, monotonic on a real node
using Millis = uint64_t;

}  // namespace synod
