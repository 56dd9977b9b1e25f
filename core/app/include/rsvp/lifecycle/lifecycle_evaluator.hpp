#pragma once

#include "rsvp/domain/event.hpp"
#include "rsvp/time/time_utils.hpp"

#include <cstdint>

namespace rsvp {

// -----------------------------------------------------------------------------
// LifecycleEvaluator: derives an event's phase from its schedule and "now"
// -----------------------------------------------------------------------------
//
// @brief  Stateless, pure functions. No clock is read here; callers pass the
//         value of ITimeProvider::now_ms() so the result is deterministic
//         under SimulationTimeProvider.
//
// @details
//   now <  scheduledAt                     → Upcoming
//   scheduledAt <= now < scheduledAt+hint  → Ongoing
//   now >= scheduledAt+hint                → Completed
//   Cancelled (explicitly set)             → Cancelled, never recomputed
//
// The event ledger calls evaluate() inside every mutation and persists the
// result; ReservationService calls it on every read path that surfaces a
// status, so stored and surfaced statuses can never lag the clock.
//
// Thread-safety: Stateless. Safe from any thread.
// -----------------------------------------------------------------------------
class LifecycleEvaluator {
 public:
  static constexpr std::int64_t kDefaultDurationHintMs = hours_to_ms(4);

  // -------------------------------------------------------------------------
  // deriveStatus(scheduled_at_ms, duration_hint_ms, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Time-based phase only; never returns Cancelled.
  //
  // @param  duration_hint_ms  Negative values are treated as 0, in which
  //                           case an event goes straight from Upcoming to
  //                           Completed.
  // -------------------------------------------------------------------------
  static domain::EventStatus deriveStatus(std::int64_t scheduled_at_ms,
                                          std::int64_t duration_hint_ms,
                                          std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // evaluate(event, duration_hint_ms, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Status the event should hold at now_ms: Cancelled stays
  //         Cancelled, everything else is re-derived.
  // -------------------------------------------------------------------------
  static domain::EventStatus evaluate(const domain::Event& event,
                                      std::int64_t duration_hint_ms,
                                      std::int64_t now_ms);

  // @brief  True for Upcoming and Ongoing.
  static bool acceptsReservations(domain::EventStatus status);
};

}  // namespace rsvp
