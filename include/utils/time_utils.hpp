#pragma once

#include <string>
#include "common/types.hpp"

namespace gate {
namespace time_utils {

// UTC, millisecond precision. Journal records only; cycle evaluation
// never reads the clock.
std::string to_iso8601(WallClock t);

std::string now_iso8601();

} // namespace time_utils
} // namespace gate
