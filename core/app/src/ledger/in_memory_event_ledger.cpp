#include "rsvp/ledger/in_memory_event_ledger.hpp"

#include "rsvp/ledger/store_error.hpp"
#include "rsvp/lifecycle/lifecycle_evaluator.hpp"

#include <algorithm>
#include <string>

namespace rsvp {

using domain::Event;
using domain::EventId;
using domain::UserId;

InMemoryEventLedger::InMemoryEventLedger(std::int64_t duration_hint_ms)
    : duration_hint_ms_(duration_hint_ms) {}

// -----------------------------------------------------------------------------
// lookup / allRecords: copy record pointers out under the shared index lock
// -----------------------------------------------------------------------------
std::shared_ptr<InMemoryEventLedger::EventRecord> InMemoryEventLedger::lookup(
    EventId id) const {
  std::shared_lock lock(index_mutex_);
  auto it = index_.find(id);
  return (it != index_.end()) ? it->second : nullptr;
}

std::vector<std::shared_ptr<InMemoryEventLedger::EventRecord>>
InMemoryEventLedger::allRecords() const {
  std::vector<std::shared_ptr<EventRecord>> records;
  {
    std::shared_lock lock(index_mutex_);
    records.reserve(index_.size());
    for (const auto& [id, record] : index_) {
      records.push_back(record);
    }
  }
  return records;
}

void InMemoryEventLedger::touch(Event& event, std::int64_t now_ms) const {
  event.status =
      LifecycleEvaluator::evaluate(event, duration_hint_ms_, now_ms);
  event.updated_at_ms = now_ms;
}

// -----------------------------------------------------------------------------
// insert
// -----------------------------------------------------------------------------
void InMemoryEventLedger::insert(const Event& event) {
  auto record = std::make_shared<EventRecord>();
  record->event = event;
  record->event.current_attendees =
      static_cast<std::int32_t>(record->event.attendees.size());

  std::unique_lock lock(index_mutex_);
  auto [it, inserted] = index_.emplace(event.id, std::move(record));
  if (!inserted) {
    throw StoreError("event id " + std::to_string(event.id) +
                     " already exists");
  }
}

// -----------------------------------------------------------------------------
// find
// -----------------------------------------------------------------------------
std::optional<Event> InMemoryEventLedger::find(EventId id) const {
  auto record = lookup(id);
  if (!record) {
    return std::nullopt;
  }
  std::lock_guard lock(record->mutex);
  if (record->erased) {
    return std::nullopt;
  }
  return record->event;
}

// -----------------------------------------------------------------------------
// listAll / listByOrganizer: lock each record briefly, sort by id
// -----------------------------------------------------------------------------
std::vector<Event> InMemoryEventLedger::listAll() const {
  std::vector<Event> result;
  for (const auto& record : allRecords()) {
    std::lock_guard lock(record->mutex);
    if (!record->erased) {
      result.push_back(record->event);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Event& a, const Event& b) { return a.id < b.id; });
  return result;
}

std::vector<Event> InMemoryEventLedger::listByOrganizer(
    const UserId& organizer_id) const {
  std::vector<Event> result;
  for (const auto& record : allRecords()) {
    std::lock_guard lock(record->mutex);
    if (!record->erased && record->event.organizer_id == organizer_id) {
      result.push_back(record->event);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Event& a, const Event& b) { return a.id < b.id; });
  return result;
}

std::size_t InMemoryEventLedger::size() const {
  std::shared_lock lock(index_mutex_);
  return index_.size();
}

// -----------------------------------------------------------------------------
// tryReserveSlot: the capacity gate
// -----------------------------------------------------------------------------
SlotResult InMemoryEventLedger::tryReserveSlot(EventId id,
                                               const UserId& user_id,
                                               std::int64_t now_ms) {
  auto record = lookup(id);
  if (!record) {
    return {SlotOutcome::EventNotFound, std::nullopt};
  }

  std::lock_guard lock(record->mutex);
  if (record->erased) {
    return {SlotOutcome::EventNotFound, std::nullopt};
  }

  Event& event = record->event;
  touch(event, now_ms);

  if (!LifecycleEvaluator::acceptsReservations(event.status)) {
    return {SlotOutcome::EventClosed, event};
  }
  if (event.attendees.count(user_id) != 0) {
    return {SlotOutcome::AlreadyHeld, event};
  }
  if (event.current_attendees >= event.capacity) {
    return {SlotOutcome::CapacityFull, event};
  }

  event.attendees.insert(user_id);
  ++event.current_attendees;
  return {SlotOutcome::Reserved, event};
}

// -----------------------------------------------------------------------------
// releaseSlot: idempotent decrement
// -----------------------------------------------------------------------------
SlotResult InMemoryEventLedger::releaseSlot(EventId id, const UserId& user_id,
                                            std::int64_t now_ms) {
  auto record = lookup(id);
  if (!record) {
    return {SlotOutcome::EventNotFound, std::nullopt};
  }

  std::lock_guard lock(record->mutex);
  if (record->erased) {
    return {SlotOutcome::EventNotFound, std::nullopt};
  }

  Event& event = record->event;
  touch(event, now_ms);

  if (event.attendees.erase(user_id) == 0) {
    return {SlotOutcome::NotHeld, event};
  }
  --event.current_attendees;
  return {SlotOutcome::Released, event};
}

// -----------------------------------------------------------------------------
// Organizer-side conditional updates
// -----------------------------------------------------------------------------
UpdateResult InMemoryEventLedger::setCapacity(EventId id,
                                              std::int32_t capacity,
                                              std::int64_t now_ms) {
  auto record = lookup(id);
  if (!record) {
    return {UpdateOutcome::EventNotFound, std::nullopt};
  }

  std::lock_guard lock(record->mutex);
  if (record->erased) {
    return {UpdateOutcome::EventNotFound, std::nullopt};
  }

  Event& event = record->event;
  if (capacity < event.current_attendees) {
    return {UpdateOutcome::BelowAttendees, event};
  }
  event.capacity = capacity;
  touch(event, now_ms);
  return {UpdateOutcome::Updated, event};
}

UpdateResult InMemoryEventLedger::setSchedule(EventId id,
                                              std::int64_t scheduled_at_ms,
                                              std::int64_t now_ms) {
  auto record = lookup(id);
  if (!record) {
    return {UpdateOutcome::EventNotFound, std::nullopt};
  }

  std::lock_guard lock(record->mutex);
  if (record->erased) {
    return {UpdateOutcome::EventNotFound, std::nullopt};
  }

  record->event.scheduled_at_ms = scheduled_at_ms;
  touch(record->event, now_ms);
  return {UpdateOutcome::Updated, record->event};
}

UpdateResult InMemoryEventLedger::cancel(EventId id, std::int64_t now_ms) {
  auto record = lookup(id);
  if (!record) {
    return {UpdateOutcome::EventNotFound, std::nullopt};
  }

  std::lock_guard lock(record->mutex);
  if (record->erased) {
    return {UpdateOutcome::EventNotFound, std::nullopt};
  }

  record->event.status = domain::EventStatus::Cancelled;
  record->event.updated_at_ms = now_ms;
  return {UpdateOutcome::Updated, record->event};
}

// -----------------------------------------------------------------------------
// overwriteAttendees: reconciliation rebuild
// -----------------------------------------------------------------------------
std::optional<Event> InMemoryEventLedger::overwriteAttendees(
    EventId id, const std::set<UserId>& attendees, std::int64_t now_ms) {
  auto record = lookup(id);
  if (!record) {
    return std::nullopt;
  }

  std::lock_guard lock(record->mutex);
  if (record->erased) {
    return std::nullopt;
  }

  Event& event = record->event;
  if (attendees.size() > static_cast<std::size_t>(event.capacity)) {
    throw StoreError("attendee set of event " + std::to_string(id) +
                     " exceeds capacity " + std::to_string(event.capacity));
  }
  event.attendees = attendees;
  event.current_attendees = static_cast<std::int32_t>(attendees.size());
  touch(event, now_ms);
  return event;
}

// -----------------------------------------------------------------------------
// erase
// -----------------------------------------------------------------------------
std::optional<Event> InMemoryEventLedger::erase(EventId id) {
  std::shared_ptr<EventRecord> record;
  {
    std::unique_lock lock(index_mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
      return std::nullopt;
    }
    record = std::move(it->second);
    index_.erase(it);
  }

  std::lock_guard lock(record->mutex);
  record->erased = true;
  return record->event;
}

// -----------------------------------------------------------------------------
// restore: replace everything (snapshot load)
// -----------------------------------------------------------------------------
void InMemoryEventLedger::restore(const std::vector<Event>& events) {
  std::unordered_map<EventId, std::shared_ptr<EventRecord>> fresh;
  for (const auto& event : events) {
    auto record = std::make_shared<EventRecord>();
    record->event = event;
    record->event.current_attendees =
        static_cast<std::int32_t>(event.attendees.size());
    if (!fresh.emplace(event.id, std::move(record)).second) {
      throw StoreError("duplicate event id " + std::to_string(event.id) +
                       " in restore set");
    }
  }

  std::unique_lock lock(index_mutex_);
  for (auto& [id, old_record] : index_) {
    std::lock_guard record_lock(old_record->mutex);
    old_record->erased = true;
  }
  index_ = std::move(fresh);
}

}  // namespace rsvp
