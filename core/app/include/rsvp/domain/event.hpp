#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace rsvp {
namespace domain {

using EventId = std::uint64_t;

// Opaque, already-authenticated user identifier supplied by the caller.
using UserId = std::string;

// -----------------------------------------------------------------------------
// EventCategory: descriptive classification carried for the authoring side
// -----------------------------------------------------------------------------
enum class EventCategory {
  Conference,
  Workshop,
  Meetup,
  Seminar,
  Webinar,
  Social,
  Other,
};

// -----------------------------------------------------------------------------
// EventStatus: lifecycle phase of an event
// -----------------------------------------------------------------------------
//
// @brief  Upcoming / Ongoing / Completed are derived from the schedule and the
//         current time by LifecycleEvaluator. Cancelled is set explicitly by
//         the organizer and is never recomputed.
//
// @details
//
//   Upcoming ──(now ≥ scheduledAt)──> Ongoing ──(now ≥ scheduledAt+hint)──>
//   Completed
//      │                                 │
//      └────────────> Cancelled <────────┘      (organizer action, terminal)
//
// Only Upcoming and Ongoing accept new reservations.
// -----------------------------------------------------------------------------
enum class EventStatus {
  Upcoming,
  Ongoing,
  Completed,
  Cancelled,
};

// -----------------------------------------------------------------------------
// Event: the capacity-bounded record held by the event ledger
// -----------------------------------------------------------------------------
//
// @brief  One organizer-published event together with its slot accounting.
//
// @details
// Slot accounting invariants (maintained by InMemoryEventLedger under the
// per-event record lock):
//   - 0 <= current_attendees <= capacity
//   - attendees.size() == current_attendees
//   - 1 <= capacity <= ReservationLimits::max_capacity
//
// Only the reservation service mutates current_attendees / attendees.
// Only the organizer (through the service) mutates capacity, schedule and
// cancellation.
//
// Thread model:
//   Plain value type. The ledger hands out copies; holding a copy never
//   blocks a writer.
// -----------------------------------------------------------------------------
struct Event {
  EventId id{0};
  UserId organizer_id;

  std::string title;
  std::string description;
  std::string location;
  EventCategory category{EventCategory::Other};

  std::int64_t scheduled_at_ms{0};

  std::int32_t capacity{0};
  std::int32_t current_attendees{0};
  std::set<UserId> attendees;

  EventStatus status{EventStatus::Upcoming};

  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
};

// -----------------------------------------------------------------------------
// EventDraft: organizer input for CreateEvent
// -----------------------------------------------------------------------------
struct EventDraft {
  std::string title;
  std::string description;
  std::string location;
  EventCategory category{EventCategory::Other};
  std::int64_t scheduled_at_ms{0};
  std::int32_t capacity{0};
};

// -----------------------------------------------------------------------------
// Derived values. Computed on demand, never stored.
// -----------------------------------------------------------------------------
inline std::int32_t available_spots(const Event& event) {
  return event.capacity - event.current_attendees;
}

inline bool is_full(const Event& event) {
  return event.current_attendees >= event.capacity;
}

inline bool is_past(const Event& event, std::int64_t now_ms) {
  return event.scheduled_at_ms < now_ms;
}

inline const char* eventStatusToString(EventStatus status) {
  switch (status) {
    case EventStatus::Upcoming:  return "upcoming";
    case EventStatus::Ongoing:   return "ongoing";
    case EventStatus::Completed: return "completed";
    case EventStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

inline std::optional<EventStatus> eventStatusFromString(const std::string& s) {
  if (s == "upcoming") return EventStatus::Upcoming;
  if (s == "ongoing") return EventStatus::Ongoing;
  if (s == "completed") return EventStatus::Completed;
  if (s == "cancelled") return EventStatus::Cancelled;
  return std::nullopt;
}

inline const char* eventCategoryToString(EventCategory category) {
  switch (category) {
    case EventCategory::Conference: return "conference";
    case EventCategory::Workshop:   return "workshop";
    case EventCategory::Meetup:     return "meetup";
    case EventCategory::Seminar:    return "seminar";
    case EventCategory::Webinar:    return "webinar";
    case EventCategory::Social:     return "social";
    case EventCategory::Other:      return "other";
  }
  return "other";
}

inline std::optional<EventCategory> eventCategoryFromString(
    const std::string& s) {
  if (s == "conference") return EventCategory::Conference;
  if (s == "workshop") return EventCategory::Workshop;
  if (s == "meetup") return EventCategory::Meetup;
  if (s == "seminar") return EventCategory::Seminar;
  if (s == "webinar") return EventCategory::Webinar;
  if (s == "social") return EventCategory::Social;
  if (s == "other") return EventCategory::Other;
  return std::nullopt;
}

}  // namespace domain
}  // namespace rsvp
