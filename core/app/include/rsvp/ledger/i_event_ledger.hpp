#pragma once

#include "rsvp/domain/event.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <vector>

namespace rsvp {

// -----------------------------------------------------------------------------
// SlotOutcome: result of the capacity gate and of a slot release
// -----------------------------------------------------------------------------
enum class SlotOutcome {
  Reserved,       // tryReserveSlot: counter incremented, user added
  Released,       // releaseSlot: counter decremented, user removed
  NotHeld,        // releaseSlot: user held no slot (release is idempotent)
  AlreadyHeld,    // tryReserveSlot: user already in the attendee set
  CapacityFull,   // tryReserveSlot: current_attendees == capacity
  EventClosed,    // tryReserveSlot: status is Completed or Cancelled
  EventNotFound,  // either: no such event
};

// `event` is the record right after the call; empty only for EventNotFound.
struct SlotResult {
  SlotOutcome outcome{SlotOutcome::EventNotFound};
  std::optional<domain::Event> event;
};

// -----------------------------------------------------------------------------
// UpdateOutcome: result of organizer-side conditional updates
// -----------------------------------------------------------------------------
enum class UpdateOutcome {
  Updated,
  BelowAttendees,  // setCapacity: requested capacity < current_attendees
  EventNotFound,
};

struct UpdateResult {
  UpdateOutcome outcome{UpdateOutcome::EventNotFound};
  std::optional<domain::Event> event;
};

// -----------------------------------------------------------------------------
// IEventLedger: durable record of events and their slot accounting
// -----------------------------------------------------------------------------
//
// @brief  Owns Event::capacity, current_attendees and the attendee set, and
//         is the only place they change.
//
// @details
// Every mutation is a single atomic conditional update on one event record:
// the check and the write happen under the same per-event lock, and the
// lifecycle status derived at `now_ms` is persisted as part of the same
// update. No method waits for another event's lock.
//
// Reads return copies and may be momentarily stale relative to an in-flight
// mutation on another thread.
//
// Failure model:
//   Store faults throw StoreError. Conditional outcomes are returned.
//
// Thread-safety:
//   All methods are safe to call concurrently.
// -----------------------------------------------------------------------------
class IEventLedger {
 public:
  virtual ~IEventLedger() = default;

  // @brief  Adds a new record. Throws StoreError if the id is already taken.
  virtual void insert(const domain::Event& event) = 0;

  virtual std::optional<domain::Event> find(domain::EventId id) const = 0;

  // @brief  Events organized by the user, in ascending id order.
  virtual std::vector<domain::Event> listByOrganizer(
      const domain::UserId& organizer_id) const = 0;

  // @brief  Every event, in ascending id order.
  virtual std::vector<domain::Event> listAll() const = 0;

  virtual std::size_t size() const = 0;

  // -------------------------------------------------------------------------
  // tryReserveSlot(id, user_id, now_ms): the capacity gate
  // -------------------------------------------------------------------------
  // @brief  Increments current_attendees and adds user_id to the attendee
  //         set only if the event exists, accepts reservations at now_ms,
  //         user_id is not already present, and there is a free slot.
  //         Checks run in that order.
  // -------------------------------------------------------------------------
  virtual SlotResult tryReserveSlot(domain::EventId id,
                                    const domain::UserId& user_id,
                                    std::int64_t now_ms) = 0;

  // -------------------------------------------------------------------------
  // releaseSlot(id, user_id, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Decrements current_attendees and removes user_id, if present.
  //         Idempotent: releasing a slot that is not held returns NotHeld
  //         and changes nothing. Allowed regardless of lifecycle status.
  // -------------------------------------------------------------------------
  virtual SlotResult releaseSlot(domain::EventId id,
                                 const domain::UserId& user_id,
                                 std::int64_t now_ms) = 0;

  // @brief  Sets capacity unless it would drop below current_attendees.
  //         Range validation is the caller's.
  virtual UpdateResult setCapacity(domain::EventId id, std::int32_t capacity,
                                   std::int64_t now_ms) = 0;

  // @brief  Moves the schedule; the persisted status is re-derived.
  virtual UpdateResult setSchedule(domain::EventId id,
                                   std::int64_t scheduled_at_ms,
                                   std::int64_t now_ms) = 0;

  // @brief  Marks the event Cancelled. Cancelling twice is a no-op Updated.
  virtual UpdateResult cancel(domain::EventId id, std::int64_t now_ms) = 0;

  // -------------------------------------------------------------------------
  // overwriteAttendees(id, attendees, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Replaces the attendee set and sets current_attendees to its
  //         size. Reconciliation only.
  //
  // @return The updated record, or std::nullopt if the event is gone.
  // @throws StoreError if attendees.size() exceeds the event's capacity.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::Event> overwriteAttendees(
      domain::EventId id, const std::set<domain::UserId>& attendees,
      std::int64_t now_ms) = 0;

  // @brief  Removes the record and returns its last state, if it existed.
  //         Slot operations racing with erase observe EventNotFound.
  virtual std::optional<domain::Event> erase(domain::EventId id) = 0;

  // @brief  Replaces the whole contents (snapshot load).
  virtual void restore(const std::vector<domain::Event>& events) = 0;
};

}  // namespace rsvp
