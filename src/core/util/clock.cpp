#include "core/util/clock.hpp"

#include "core/util/canonical.hpp"

namespace hogpen::util {

std::int64_t SystemClock::now() const {
  return unix_timestamp_now();
}

}  // namespace hogpen::util
