#pragma once

#include "rsvp/domain/error.hpp"
#include "rsvp/domain/event.hpp"
#include "rsvp/domain/reservation.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by every bus event. Built from the engine's
// ITimeProvider via ms_to_timestamp() so simulated clocks flow through.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// ReservationConfirmedEvent
// -----------------------------------------------------------------------------
// Published by ReservationService after a Join has been applied to both
// ledgers. available_spots is the value right after this join.
// -----------------------------------------------------------------------------
struct ReservationConfirmedEvent {
  domain::Reservation reservation;
  std::int32_t available_spots{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// ReservationCancelledEvent
// -----------------------------------------------------------------------------
// Published after a Leave released its slot, and for every reservation the
// startup reconciliation cancelled as capacity overflow.
// -----------------------------------------------------------------------------
struct ReservationCancelledEvent {
  domain::Reservation reservation;
  std::int32_t available_spots{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// JoinRejectedEvent
// -----------------------------------------------------------------------------
// A Join that ended in an Error. Useful to watch contention on popular events
// (CapacityExceeded bursts) from the telemetry socket.
// -----------------------------------------------------------------------------
struct JoinRejectedEvent {
  domain::EventId event_id{0};
  domain::UserId user_id;
  domain::ErrorCode code{domain::ErrorCode::NotFound};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// ReconciliationRequiredEvent
// -----------------------------------------------------------------------------
// The reservation of (event_id, user_id) is cancelled but its slot could not
// be released. The pair is now pending; ReconciliationWorker retries it.
// -----------------------------------------------------------------------------
struct ReconciliationRequiredEvent {
  domain::EventId event_id{0};
  domain::UserId user_id;
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// ReconciliationResolvedEvent
// -----------------------------------------------------------------------------
// A previously pending pair has been released; ledgers agree again.
// -----------------------------------------------------------------------------
struct ReconciliationResolvedEvent {
  domain::EventId event_id{0};
  domain::UserId user_id;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// EventUpdatedEvent
// -----------------------------------------------------------------------------
// Organizer-side change to an event record. `event` is the state after the
// change (for Deleted, the last state before removal).
// -----------------------------------------------------------------------------
struct EventUpdatedEvent {
  enum class Change { Created, CapacityChanged, Rescheduled, Cancelled, Deleted };

  domain::Event event;
  Change change{Change::Created};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

inline const char* changeToString(EventUpdatedEvent::Change change) {
  switch (change) {
    case EventUpdatedEvent::Change::Created:         return "created";
    case EventUpdatedEvent::Change::CapacityChanged: return "capacity_changed";
    case EventUpdatedEvent::Change::Rescheduled:     return "rescheduled";
    case EventUpdatedEvent::Change::Cancelled:       return "cancelled";
    case EventUpdatedEvent::Change::Deleted:         return "deleted";
  }
  return "unknown";
}

}  // namespace rsvp
