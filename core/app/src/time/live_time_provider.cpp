#include "rsvp/time/live_time_provider.hpp"

#include <chrono>

namespace rsvp {

// -----------------------------------------------------------------------------
// now_ms(): delegate to system_clock and convert to epoch milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  auto now = std::chrono::system_clock::now();
  auto duration = now.time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration)
      .count();
}

}  // namespace rsvp
