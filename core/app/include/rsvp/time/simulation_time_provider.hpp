#pragma once

#include "rsvp/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace rsvp {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         by the caller rather than read from the system clock.
//
// @details
// Lifecycle transitions are hours apart (an event is ongoing for the length
// of its duration hint). Tests pin "now" with set_time() and move it with
// advance_by() so a single test can observe upcoming → ongoing → completed
// deterministically, and so createdAt ordering of reservations is
// reproducible.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_
//
// Thread model:
//   - set_time() / advance_by() are intended for a single writer.
//   - now_ms() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Initializes the simulation clock to the given epoch milliseconds
  //         (0 when omitted).
  // -------------------------------------------------------------------------
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  // @brief  Returns the last time set by set_time() / advance_by().
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // set_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulation clock to the given timestamp.
  //
  // @param  new_time_ms  Epoch milliseconds. Monotonicity is not enforced;
  //                      tests may move the clock backwards on purpose.
  //
  // Thread-safety: Safe to call from any thread.
  // Side-effects:  Changes the value returned by now_ms() globally.
  // -------------------------------------------------------------------------
  void set_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by delta_ms and returns the new value.
  //
  // @details
  // Atomic fetch_add, so concurrent advancers never lose an increment.
  // -------------------------------------------------------------------------
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace rsvp
