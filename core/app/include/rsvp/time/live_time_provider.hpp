#pragma once

#include "rsvp/time/i_time_provider.hpp"

namespace rsvp {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the production executable. Event lifecycle status is derived from
// this clock on every read and persisted on every ledger write.
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
//   No internal mutex is needed.
//
// Ownership:
//   Stack-allocated in main() and passed by const reference to the
//   ReservationEngine, which lends it to its components.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  // @brief  Returns the current wall-clock time in milliseconds since epoch.
  std::int64_t now_ms() const override;
};

}  // namespace rsvp
