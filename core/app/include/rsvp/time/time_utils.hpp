#pragma once

#include "rsvp/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace rsvp {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between the bus Timestamp type
//         (std::chrono::system_clock::time_point) and int64_t milliseconds
//         since epoch, plus the duration constants used by the lifecycle
//         evaluator and configuration.
//
// @details
// ITimeProvider and every ledger record use int64_t milliseconds. Bus events
// carry a Timestamp so subscribers can use chrono arithmetic. These helpers
// bridge the two representations.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;

// @brief  Converts epoch milliseconds to a Timestamp (time_point).
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// @brief  Converts a Timestamp (time_point) to epoch milliseconds.
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// @brief  Whole hours expressed in milliseconds.
constexpr std::int64_t hours_to_ms(std::int64_t hours) {
  return hours * kMillisPerHour;
}

}  // namespace rsvp
