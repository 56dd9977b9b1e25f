#pragma once

#include "rsvp/ledger/i_event_ledger.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace rsvp {

// -----------------------------------------------------------------------------
// InMemoryEventLedger: process-local IEventLedger
// -----------------------------------------------------------------------------
//
// @brief  Holds every event record in memory. Durability across restarts is
//         provided by LedgerSnapshot.
//
// @details
// Two-level locking:
//
//   index_mutex_ (std::shared_mutex)
//     Guards the id → record map. Taken shared for lookups and listings,
//     exclusive only for insert / erase / restore.
//
//   EventRecord::mutex (std::mutex, one per event)
//     Guards one event's fields. Every check-and-write runs entirely under
//     it, which is what makes the capacity gate atomic. Joins on different
//     events never contend.
//
// Lock order is always index → record, and a record lock is never held
// while taking the index lock. Lookups copy the shared_ptr out of the index
// and release the index lock before locking the record; erase() marks the
// record `erased` under its own lock, so a racing slot operation that
// already holds the pointer observes EventNotFound.
//
// Every mutation persists the status LifecycleEvaluator derives at the
// caller's `now_ms`, with the duration hint given at construction.
// -----------------------------------------------------------------------------
class InMemoryEventLedger final : public IEventLedger {
 public:
  explicit InMemoryEventLedger(std::int64_t duration_hint_ms);

  InMemoryEventLedger(const InMemoryEventLedger&) = delete;
  InMemoryEventLedger& operator=(const InMemoryEventLedger&) = delete;

  void insert(const domain::Event& event) override;
  std::optional<domain::Event> find(domain::EventId id) const override;
  std::vector<domain::Event> listByOrganizer(
      const domain::UserId& organizer_id) const override;
  std::vector<domain::Event> listAll() const override;
  std::size_t size() const override;

  SlotResult tryReserveSlot(domain::EventId id, const domain::UserId& user_id,
                            std::int64_t now_ms) override;
  SlotResult releaseSlot(domain::EventId id, const domain::UserId& user_id,
                         std::int64_t now_ms) override;

  UpdateResult setCapacity(domain::EventId id, std::int32_t capacity,
                           std::int64_t now_ms) override;
  UpdateResult setSchedule(domain::EventId id, std::int64_t scheduled_at_ms,
                           std::int64_t now_ms) override;
  UpdateResult cancel(domain::EventId id, std::int64_t now_ms) override;

  std::optional<domain::Event> overwriteAttendees(
      domain::EventId id, const std::set<domain::UserId>& attendees,
      std::int64_t now_ms) override;

  std::optional<domain::Event> erase(domain::EventId id) override;
  void restore(const std::vector<domain::Event>& events) override;

 private:
  struct EventRecord {
    std::mutex mutex;
    domain::Event event;
    bool erased{false};
  };

  std::shared_ptr<EventRecord> lookup(domain::EventId id) const;
  std::vector<std::shared_ptr<EventRecord>> allRecords() const;

  // Re-derives and stores the lifecycle status, stamps updated_at_ms.
  // Caller holds record.mutex.
  void touch(domain::Event& event, std::int64_t now_ms) const;

  const std::int64_t duration_hint_ms_;

  mutable std::shared_mutex index_mutex_;
  std::unordered_map<domain::EventId, std::shared_ptr<EventRecord>> index_;
};

}  // namespace rsvp
