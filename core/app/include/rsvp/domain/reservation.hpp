#pragma once

#include "rsvp/domain/event.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rsvp {
namespace domain {

using ReservationId = std::uint64_t;

// -----------------------------------------------------------------------------
// ReservationStatus
// -----------------------------------------------------------------------------
// Confirmed holds a slot. Cancelled is the record left behind by Leave.
// Waitlist is representable (snapshots, listings) but nothing promotes it.
// -----------------------------------------------------------------------------
enum class ReservationStatus {
  Confirmed,
  Cancelled,
  Waitlist,
};

// -----------------------------------------------------------------------------
// Reservation: one user's claim on one event
// -----------------------------------------------------------------------------
//
// @brief  Record held by the reservation ledger.
//
// @details
// For any (user_id, event_id) pair at most one record is Confirmed at a time.
// Leave transitions the record to Cancelled and stamps cancelled_at_ms; the
// record is kept for history. Records are physically removed only when their
// event or their user is deleted.
// -----------------------------------------------------------------------------
struct Reservation {
  ReservationId id{0};
  UserId user_id;
  EventId event_id{0};
  ReservationStatus status{ReservationStatus::Confirmed};
  std::int64_t created_at_ms{0};
  std::optional<std::int64_t> cancelled_at_ms;
  std::string notes;
};

inline const char* reservationStatusToString(ReservationStatus status) {
  switch (status) {
    case ReservationStatus::Confirmed: return "confirmed";
    case ReservationStatus::Cancelled: return "cancelled";
    case ReservationStatus::Waitlist:  return "waitlist";
  }
  return "unknown";
}

inline std::optional<ReservationStatus> reservationStatusFromString(
    const std::string& s) {
  if (s == "confirmed") return ReservationStatus::Confirmed;
  if (s == "cancelled") return ReservationStatus::Cancelled;
  if (s == "waitlist") return ReservationStatus::Waitlist;
  return std::nullopt;
}

}  // namespace domain
}  // namespace rsvp
