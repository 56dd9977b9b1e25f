#pragma once

#include <cstddef>
#include <cstdint>

namespace rsvp {
namespace domain {

// -----------------------------------------------------------------------------
// ReservationLimits: engine-wide bounds applied to organizer and user input
// -----------------------------------------------------------------------------
//
// @brief  Value-type collection of validation bounds and the lifecycle
//         duration hint.
//
// @details
// Loaded from the "limits" section of the engine configuration (every key
// optional) and copied into ReservationService and InMemoryEventLedger at
// construction. Constant for the engine's lifetime.
//
//   min_capacity / max_capacity   bounds for Event::capacity
//   duration_hint_ms              how long an event stays Ongoing after its
//                                 scheduled start (default 4h)
//   max_*_length                  character bounds on descriptive fields
// -----------------------------------------------------------------------------
struct ReservationLimits {
  std::int32_t min_capacity{1};
  std::int32_t max_capacity{10000};

  std::int64_t duration_hint_ms{4LL * 60 * 60 * 1000};

  std::size_t max_title_length{100};
  std::size_t max_description_length{2000};
  std::size_t max_location_length{200};
  std::size_t max_notes_length{500};
};

}  // namespace domain
}  // namespace rsvp
