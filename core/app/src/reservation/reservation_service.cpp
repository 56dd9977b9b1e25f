#include "rsvp/reservation/reservation_service.hpp"

#include "rsvp/ledger/store_error.hpp"
#include "rsvp/lifecycle/lifecycle_evaluator.hpp"
#include "rsvp/time/time_utils.hpp"

#include <algorithm>
#include <iostream>

namespace rsvp {

using domain::Error;
using domain::ErrorCode;
using domain::Event;
using domain::EventId;
using domain::Reservation;
using domain::ReservationStatus;
using domain::Result;
using domain::UserId;

ReservationService::ReservationService(IEventLedger& events,
                                       IReservationLedger& reservations,
                                       const ITimeProvider& clock,
                                       IdGenerator& event_ids,
                                       IdGenerator& reservation_ids,
                                       EventBus& bus,
                                       const domain::ReservationLimits& limits)
    : events_(events),
      reservations_(reservations),
      clock_(clock),
      event_ids_(event_ids),
      reservation_ids_(reservation_ids),
      bus_(bus),
      limits_(limits) {}

// =============================================================================
// join
// =============================================================================
Result<ReservationService::JoinReceipt> ReservationService::join(
    EventId event_id, const UserId& user_id, const std::string& notes) {
  if (user_id.empty()) {
    return Error{ErrorCode::InvalidArgument, "user id must not be empty"};
  }
  if (notes.size() > limits_.max_notes_length) {
    return Error{ErrorCode::InvalidArgument,
                 "notes exceed " + std::to_string(limits_.max_notes_length) +
                     " characters"};
  }

  const std::int64_t now = clock_.now_ms();

  // --- Step 1: capacity gate ------------------------------------------------
  SlotResult gate;
  try {
    gate = events_.tryReserveSlot(event_id, user_id, now);

    // The slot may still be held only because this user's previous Leave is
    // waiting for its release. Finish that release and re-run the gate once.
    if (gate.outcome == SlotOutcome::AlreadyHeld &&
        isPending(event_id, user_id)) {
      if (resolvePending(event_id, user_id, nullptr) != Resolution::Resolved) {
        publishRejected(event_id, user_id, ErrorCode::ReconciliationRequired,
                        now);
        return Error{ErrorCode::ReconciliationRequired,
                     "previous leave of this event is still being reconciled"};
      }
      gate = events_.tryReserveSlot(event_id, user_id, now);
    }
  } catch (const StoreError& e) {
    std::cerr << "[ReservationService] WARNING: capacity gate failed for event "
              << event_id << ": " << e.what() << "\n";
    publishRejected(event_id, user_id, ErrorCode::Infrastructure, now);
    return Error{ErrorCode::Infrastructure, e.what()};
  }

  // --- Step 2: map gate rejections -------------------------------------------
  switch (gate.outcome) {
    case SlotOutcome::Reserved:
      break;
    case SlotOutcome::EventNotFound:
      publishRejected(event_id, user_id, ErrorCode::NotFound, now);
      return Error{ErrorCode::NotFound,
                   "event " + std::to_string(event_id) + " not found"};
    case SlotOutcome::EventClosed:
      publishRejected(event_id, user_id, ErrorCode::EventClosed, now);
      return Error{ErrorCode::EventClosed,
                   std::string("event is ") +
                       domain::eventStatusToString(gate.event->status)};
    case SlotOutcome::CapacityFull:
      publishRejected(event_id, user_id, ErrorCode::CapacityExceeded, now);
      return Error{ErrorCode::CapacityExceeded, "event is full"};
    case SlotOutcome::AlreadyHeld:
    default:
      publishRejected(event_id, user_id, ErrorCode::AlreadyReserved, now);
      return Error{ErrorCode::AlreadyReserved,
                   "user already holds a reservation for this event"};
  }

  // --- Step 3: membership record ---------------------------------------------
  Reservation reservation;
  reservation.id = reservation_ids_.next_id();
  reservation.user_id = user_id;
  reservation.event_id = event_id;
  reservation.status = ReservationStatus::Confirmed;
  reservation.created_at_ms = now;
  reservation.notes = notes;

  InsertOutcome inserted = InsertOutcome::Inserted;
  try {
    inserted = reservations_.insertConfirmed(reservation);
  } catch (const StoreError& e) {
    std::cerr << "[ReservationService] WARNING: reservation insert failed for"
              << " event " << event_id << " user " << user_id << ": "
              << e.what() << "\n";
    compensate(event_id, user_id, "reservation insert failed");
    publishRejected(event_id, user_id, ErrorCode::Infrastructure, now);
    return Error{ErrorCode::Infrastructure, e.what()};
  }

  if (inserted == InsertOutcome::DuplicateConfirmed) {
    compensate(event_id, user_id, "duplicate confirmed reservation");
    publishRejected(event_id, user_id, ErrorCode::AlreadyReserved, now);
    return Error{ErrorCode::AlreadyReserved,
                 "user already holds a reservation for this event"};
  }

  // --- Step 4: the event may have been deleted while we were inserting -------
  if (!events_.find(event_id)) {
    try {
      reservations_.remove(event_id, reservation.id);
    } catch (const StoreError& e) {
      std::cerr << "[ReservationService] WARNING: orphan reservation "
                << reservation.id << " of deleted event " << event_id
                << " not removed: " << e.what() << "\n";
    }
    publishRejected(event_id, user_id, ErrorCode::NotFound, now);
    return Error{ErrorCode::NotFound,
                 "event " + std::to_string(event_id) + " was deleted"};
  }

  JoinReceipt receipt{reservation, domain::available_spots(*gate.event)};

  ReservationConfirmedEvent confirmed;
  confirmed.reservation = reservation;
  confirmed.available_spots = receipt.available_spots;
  confirmed.timestamp = ms_to_timestamp(now);
  confirmed.sequence_id = sequence_ids_.next_id();
  bus_.publish(confirmed);

  return receipt;
}

// =============================================================================
// leave
// =============================================================================
Result<std::int32_t> ReservationService::leave(EventId event_id,
                                               const UserId& user_id) {
  const std::int64_t now = clock_.now_ms();

  // --- Step 1: cancel the membership record ----------------------------------
  std::optional<Reservation> cancelled;
  try {
    cancelled = reservations_.cancelConfirmed(event_id, user_id, now);
  } catch (const StoreError& e) {
    std::cerr << "[ReservationService] WARNING: cancel failed for event "
              << event_id << " user " << user_id << ": " << e.what() << "\n";
    return Error{ErrorCode::Infrastructure, e.what()};
  }

  if (!cancelled) {
    // Retrying a Leave that previously returned ReconciliationRequired.
    std::optional<Event> after;
    switch (resolvePending(event_id, user_id, &after)) {
      case Resolution::Resolved:
        if (after) {
          return domain::available_spots(*after);
        }
        return Error{ErrorCode::NotFound,
                     "event " + std::to_string(event_id) + " not found"};
      case Resolution::StillPending:
        return Error{ErrorCode::ReconciliationRequired,
                     "slot release still pending reconciliation"};
      case Resolution::NotPending:
      default:
        return Error{ErrorCode::NotFound,
                     "no confirmed reservation for this event"};
    }
  }

  // --- Step 2: release the slot ------------------------------------------------
  SlotResult released;
  try {
    released = events_.releaseSlot(event_id, user_id, now);
  } catch (const StoreError& e) {
    std::cerr << "[ReservationService] CRITICAL: reservation " << cancelled->id
              << " cancelled but slot release failed for event " << event_id
              << ": " << e.what() << ". Registered for reconciliation.\n";
    registerPending(event_id, user_id, e.what());
    return Error{ErrorCode::ReconciliationRequired,
                 "reservation cancelled, slot release pending reconciliation"};
  }

  if (released.outcome == SlotOutcome::EventNotFound) {
    return Error{ErrorCode::NotFound,
                 "event " + std::to_string(event_id) + " not found"};
  }
  if (released.outcome == SlotOutcome::NotHeld) {
    std::cerr << "[ReservationService] WARNING: user " << user_id
              << " had a confirmed reservation but no slot on event "
              << event_id << "\n";
  }

  const std::int32_t spots = domain::available_spots(*released.event);

  ReservationCancelledEvent evt;
  evt.reservation = *cancelled;
  evt.available_spots = spots;
  evt.timestamp = ms_to_timestamp(now);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);

  return spots;
}

// =============================================================================
// Reads
// =============================================================================
bool ReservationService::status(EventId event_id, const UserId& user_id) const {
  return reservations_.findConfirmed(event_id, user_id).has_value();
}

std::vector<Reservation> ReservationService::listAttendees(
    EventId event_id) const {
  return reservations_.listConfirmed(event_id);
}

std::vector<Reservation> ReservationService::listUserReservations(
    const UserId& user_id, std::optional<ReservationStatus> status) const {
  return reservations_.listByUser(user_id, status);
}

Result<ReservationService::EventView> ReservationService::getEvent(
    EventId event_id) const {
  auto event = events_.find(event_id);
  if (!event) {
    return Error{ErrorCode::NotFound,
                 "event " + std::to_string(event_id) + " not found"};
  }
  return makeView(std::move(*event), clock_.now_ms());
}

std::vector<ReservationService::EventView>
ReservationService::listOrganizerEvents(const UserId& organizer_id) const {
  const std::int64_t now = clock_.now_ms();
  std::vector<EventView> views;
  for (auto& event : events_.listByOrganizer(organizer_id)) {
    views.push_back(makeView(std::move(event), now));
  }
  std::sort(views.begin(), views.end(),
            [](const EventView& a, const EventView& b) {
              if (a.event.created_at_ms != b.event.created_at_ms) {
                return a.event.created_at_ms > b.event.created_at_ms;
              }
              return a.event.id > b.event.id;
            });
  return views;
}

ReservationService::EventView ReservationService::makeView(
    Event event, std::int64_t now_ms) const {
  event.status =
      LifecycleEvaluator::evaluate(event, limits_.duration_hint_ms, now_ms);
  EventView view;
  view.available_spots = domain::available_spots(event);
  view.is_full = domain::is_full(event);
  view.is_past = domain::is_past(event, now_ms);
  view.event = std::move(event);
  return view;
}

// =============================================================================
// Organizer operations
// =============================================================================
std::optional<Error> ReservationService::validateDraft(
    const domain::EventDraft& draft, std::int64_t now_ms) const {
  if (draft.title.empty()) {
    return Error{ErrorCode::InvalidArgument, "title is required"};
  }
  if (draft.title.size() > limits_.max_title_length) {
    return Error{ErrorCode::InvalidArgument,
                 "title exceeds " + std::to_string(limits_.max_title_length) +
                     " characters"};
  }
  if (draft.description.size() > limits_.max_description_length) {
    return Error{ErrorCode::InvalidArgument,
                 "description exceeds " +
                     std::to_string(limits_.max_description_length) +
                     " characters"};
  }
  if (draft.location.empty()) {
    return Error{ErrorCode::InvalidArgument, "location is required"};
  }
  if (draft.location.size() > limits_.max_location_length) {
    return Error{ErrorCode::InvalidArgument,
                 "location exceeds " +
                     std::to_string(limits_.max_location_length) +
                     " characters"};
  }
  if (draft.capacity < limits_.min_capacity ||
      draft.capacity > limits_.max_capacity) {
    return Error{ErrorCode::InvalidArgument,
                 "capacity must be between " +
                     std::to_string(limits_.min_capacity) + " and " +
                     std::to_string(limits_.max_capacity)};
  }
  if (draft.scheduled_at_ms <= now_ms) {
    return Error{ErrorCode::InvalidArgument,
                 "event date must be in the future"};
  }
  return std::nullopt;
}

Result<Event> ReservationService::createEvent(const UserId& organizer_id,
                                              const domain::EventDraft& draft) {
  if (organizer_id.empty()) {
    return Error{ErrorCode::InvalidArgument, "organizer id must not be empty"};
  }
  const std::int64_t now = clock_.now_ms();
  if (auto invalid = validateDraft(draft, now)) {
    return *invalid;
  }

  Event event;
  event.id = event_ids_.next_id();
  event.organizer_id = organizer_id;
  event.title = draft.title;
  event.description = draft.description;
  event.location = draft.location;
  event.category = draft.category;
  event.scheduled_at_ms = draft.scheduled_at_ms;
  event.capacity = draft.capacity;
  event.status = LifecycleEvaluator::deriveStatus(
      draft.scheduled_at_ms, limits_.duration_hint_ms, now);
  event.created_at_ms = now;
  event.updated_at_ms = now;

  try {
    events_.insert(event);
  } catch (const StoreError& e) {
    std::cerr << "[ReservationService] WARNING: event insert failed: "
              << e.what() << "\n";
    return Error{ErrorCode::Infrastructure, e.what()};
  }

  EventUpdatedEvent evt;
  evt.event = event;
  evt.change = EventUpdatedEvent::Change::Created;
  evt.timestamp = ms_to_timestamp(now);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);

  return event;
}

Result<Event> ReservationService::loadOwned(EventId event_id,
                                            const UserId& organizer_id) const {
  auto event = events_.find(event_id);
  if (!event) {
    return Error{ErrorCode::NotFound,
                 "event " + std::to_string(event_id) + " not found"};
  }
  if (event->organizer_id != organizer_id) {
    return Error{ErrorCode::Unauthorized,
                 "only the organizer can modify this event"};
  }
  return *event;
}

Result<Event> ReservationService::updateCapacity(EventId event_id,
                                                 const UserId& organizer_id,
                                                 std::int32_t capacity) {
  auto owned = loadOwned(event_id, organizer_id);
  if (!owned) {
    return owned.error();
  }
  if (capacity < limits_.min_capacity || capacity > limits_.max_capacity) {
    return Error{ErrorCode::InvalidArgument,
                 "capacity must be between " +
                     std::to_string(limits_.min_capacity) + " and " +
                     std::to_string(limits_.max_capacity)};
  }

  const std::int64_t now = clock_.now_ms();
  UpdateResult updated;
  try {
    updated = events_.setCapacity(event_id, capacity, now);
  } catch (const StoreError& e) {
    return Error{ErrorCode::Infrastructure, e.what()};
  }

  if (updated.outcome == UpdateOutcome::EventNotFound) {
    return Error{ErrorCode::NotFound,
                 "event " + std::to_string(event_id) + " not found"};
  }
  if (updated.outcome == UpdateOutcome::BelowAttendees) {
    return Error{ErrorCode::InvalidArgument,
                 "capacity cannot be less than current attendees (" +
                     std::to_string(updated.event->current_attendees) + ")"};
  }

  EventUpdatedEvent evt;
  evt.event = *updated.event;
  evt.change = EventUpdatedEvent::Change::CapacityChanged;
  evt.timestamp = ms_to_timestamp(now);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);

  return *updated.event;
}

Result<Event> ReservationService::reschedule(EventId event_id,
                                             const UserId& organizer_id,
                                             std::int64_t scheduled_at_ms) {
  auto owned = loadOwned(event_id, organizer_id);
  if (!owned) {
    return owned.error();
  }
  if (scheduled_at_ms < 0) {
    return Error{ErrorCode::InvalidArgument, "invalid event date"};
  }

  const std::int64_t now = clock_.now_ms();
  UpdateResult updated;
  try {
    updated = events_.setSchedule(event_id, scheduled_at_ms, now);
  } catch (const StoreError& e) {
    return Error{ErrorCode::Infrastructure, e.what()};
  }
  if (updated.outcome != UpdateOutcome::Updated) {
    return Error{ErrorCode::NotFound,
                 "event " + std::to_string(event_id) + " not found"};
  }

  EventUpdatedEvent evt;
  evt.event = *updated.event;
  evt.change = EventUpdatedEvent::Change::Rescheduled;
  evt.timestamp = ms_to_timestamp(now);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);

  return *updated.event;
}

Result<Event> ReservationService::cancelEvent(EventId event_id,
                                              const UserId& organizer_id) {
  auto owned = loadOwned(event_id, organizer_id);
  if (!owned) {
    return owned.error();
  }

  const std::int64_t now = clock_.now_ms();
  UpdateResult updated;
  try {
    updated = events_.cancel(event_id, now);
  } catch (const StoreError& e) {
    return Error{ErrorCode::Infrastructure, e.what()};
  }
  if (updated.outcome != UpdateOutcome::Updated) {
    return Error{ErrorCode::NotFound,
                 "event " + std::to_string(event_id) + " not found"};
  }

  std::cout << "[ReservationService] Event " << event_id << " cancelled by "
            << organizer_id << "\n";

  EventUpdatedEvent evt;
  evt.event = *updated.event;
  evt.change = EventUpdatedEvent::Change::Cancelled;
  evt.timestamp = ms_to_timestamp(now);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);

  return *updated.event;
}

Result<std::size_t> ReservationService::deleteEvent(
    EventId event_id, const UserId& organizer_id) {
  auto owned = loadOwned(event_id, organizer_id);
  if (!owned) {
    return owned.error();
  }

  const std::int64_t now = clock_.now_ms();
  std::optional<Event> erased;
  std::size_t removed = 0;
  try {
    // Event first: joins racing with the delete fail at the gate or at
    // their post-insert existence check instead of leaving orphans.
    erased = events_.erase(event_id);
    removed = reservations_.removeByEvent(event_id).size();
  } catch (const StoreError& e) {
    return Error{ErrorCode::Infrastructure, e.what()};
  }
  forgetPendingForEvent(event_id);

  if (!erased) {
    return Error{ErrorCode::NotFound,
                 "event " + std::to_string(event_id) + " not found"};
  }

  std::cout << "[ReservationService] Event " << event_id << " deleted, "
            << removed << " reservations removed\n";

  EventUpdatedEvent evt;
  evt.event = *erased;
  evt.change = EventUpdatedEvent::Change::Deleted;
  evt.timestamp = ms_to_timestamp(now);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);

  return removed;
}

ReservationService::UserDeletionSummary ReservationService::deleteUser(
    const UserId& user_id) {
  UserDeletionSummary summary;

  for (const auto& event : events_.listByOrganizer(user_id)) {
    auto deleted = deleteEvent(event.id, user_id);
    if (deleted) {
      ++summary.events_deleted;
      summary.reservations_removed += deleted.value();
    } else if (deleted.code() != ErrorCode::NotFound) {
      std::cerr << "[ReservationService] WARNING: could not delete event "
                << event.id << " of user " << user_id << ": "
                << deleted.error().message << "\n";
    }
  }

  const std::int64_t now = clock_.now_ms();
  const auto removed = reservations_.removeByUser(user_id);
  summary.reservations_removed += removed.size();

  for (const auto& reservation : removed) {
    if (reservation.status != ReservationStatus::Confirmed) {
      continue;
    }
    try {
      auto released = events_.releaseSlot(reservation.event_id, user_id, now);
      if (released.outcome == SlotOutcome::Released) {
        ++summary.slots_released;
      }
    } catch (const StoreError& e) {
      std::cerr << "[ReservationService] CRITICAL: slot release failed for "
                << "deleted user " << user_id << " on event "
                << reservation.event_id << ": " << e.what() << "\n";
      registerPending(reservation.event_id, user_id, e.what());
    }
  }

  std::cout << "[ReservationService] User " << user_id << " deleted: "
            << summary.events_deleted << " events, "
            << summary.reservations_removed << " reservations, "
            << summary.slots_released << " slots released\n";
  return summary;
}

// =============================================================================
// Compensation and pending releases
// =============================================================================
void ReservationService::compensate(EventId event_id, const UserId& user_id,
                                    const char* reason) {
  std::cerr << "[ReservationService] WARNING: rolling back slot on event "
            << event_id << " for user " << user_id << " (" << reason << ")\n";
  try {
    events_.releaseSlot(event_id, user_id, clock_.now_ms());
  } catch (const StoreError& e) {
    std::cerr << "[ReservationService] CRITICAL: rollback failed for event "
              << event_id << " user " << user_id << ": " << e.what()
              << ". Registered for reconciliation.\n";
    registerPending(event_id, user_id, e.what());
  }
}

void ReservationService::registerPending(EventId event_id,
                                         const UserId& user_id,
                                         const std::string& reason) {
  const std::int64_t now = clock_.now_ms();
  {
    std::lock_guard lock(pending_mutex_);
    auto [it, inserted] = pending_.try_emplace(PairKey{event_id, user_id});
    if (inserted) {
      it->second.info.event_id = event_id;
      it->second.info.user_id = user_id;
      it->second.info.registered_at_ms = now;
    }
    it->second.info.last_error = reason;
  }

  ReconciliationRequiredEvent evt;
  evt.event_id = event_id;
  evt.user_id = user_id;
  evt.reason = reason;
  evt.timestamp = ms_to_timestamp(now);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);
}

ReservationService::Resolution ReservationService::resolvePending(
    EventId event_id, const UserId& user_id, std::optional<Event>* after) {
  const PairKey key{event_id, user_id};
  {
    std::lock_guard lock(pending_mutex_);
    auto it = pending_.find(key);
    if (it == pending_.end()) {
      return Resolution::NotPending;
    }
    if (it->second.in_flight) {
      return Resolution::StillPending;
    }
    it->second.in_flight = true;
    ++it->second.info.attempts;
  }

  const std::int64_t now = clock_.now_ms();
  try {
    SlotResult released = events_.releaseSlot(event_id, user_id, now);
    if (after) {
      *after = released.event;
    }
  } catch (const StoreError& e) {
    std::lock_guard lock(pending_mutex_);
    auto it = pending_.find(key);
    if (it != pending_.end()) {
      it->second.in_flight = false;
      it->second.info.last_error = e.what();
    }
    return Resolution::StillPending;
  }

  {
    std::lock_guard lock(pending_mutex_);
    pending_.erase(key);
  }

  std::cout << "[ReservationService] Pending release resolved: event "
            << event_id << " user " << user_id << "\n";

  ReconciliationResolvedEvent evt;
  evt.event_id = event_id;
  evt.user_id = user_id;
  evt.timestamp = ms_to_timestamp(now);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);

  return Resolution::Resolved;
}

ReservationService::RetrySummary ReservationService::retryPendingReleases() {
  std::vector<PairKey> keys;
  {
    std::lock_guard lock(pending_mutex_);
    keys.reserve(pending_.size());
    for (const auto& [key, entry] : pending_) {
      keys.push_back(key);
    }
  }

  RetrySummary summary;
  for (const auto& [event_id, user_id] : keys) {
    ++summary.attempted;
    if (resolvePending(event_id, user_id, nullptr) == Resolution::Resolved) {
      ++summary.resolved;
    }
  }
  return summary;
}

void ReservationService::forgetPendingForEvent(EventId event_id) {
  std::lock_guard lock(pending_mutex_);
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (it->first.first == event_id && !it->second.in_flight) {
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
}

std::vector<ReservationService::PendingRelease>
ReservationService::pendingReleases() const {
  std::lock_guard lock(pending_mutex_);
  std::vector<PendingRelease> result;
  result.reserve(pending_.size());
  for (const auto& [key, entry] : pending_) {
    result.push_back(entry.info);
  }
  return result;
}

std::size_t ReservationService::pendingCount() const {
  std::lock_guard lock(pending_mutex_);
  return pending_.size();
}

bool ReservationService::isPending(EventId event_id,
                                   const UserId& user_id) const {
  std::lock_guard lock(pending_mutex_);
  return pending_.count(PairKey{event_id, user_id}) != 0;
}

void ReservationService::publishRejected(EventId event_id,
                                         const UserId& user_id,
                                         ErrorCode code, std::int64_t now_ms) {
  JoinRejectedEvent evt;
  evt.event_id = event_id;
  evt.user_id = user_id;
  evt.code = code;
  evt.timestamp = ms_to_timestamp(now_ms);
  evt.sequence_id = sequence_ids_.next_id();
  bus_.publish(evt);
}

}  // namespace rsvp
