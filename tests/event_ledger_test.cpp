// =============================================================================
// event_ledger_test.cpp
// =============================================================================
// Unit tests for rsvp::InMemoryEventLedger.
//
// Validates:
//   - insert / find / listByOrganizer / erase
//   - tryReserveSlot gate order: closed, already held, full, then reserve
//   - releaseSlot is idempotent and never drives the counter below zero
//   - setCapacity refuses to drop below current attendees
//   - cancel is sticky and closes the gate
//   - concurrent reservers never exceed capacity
//   - overwriteAttendees / restore used by reconciliation and snapshot load
// =============================================================================

#include "rsvp/ledger/in_memory_event_ledger.hpp"
#include "rsvp/ledger/store_error.hpp"
#include "rsvp/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using rsvp::SlotOutcome;
using rsvp::UpdateOutcome;
using rsvp::domain::EventStatus;

class EventLedgerTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kNow = 1'700'000'000'000;
  static constexpr std::int64_t kHint = 4 * rsvp::kMillisPerHour;

  rsvp::InMemoryEventLedger ledger{kHint};

  static rsvp::domain::Event makeEvent(rsvp::domain::EventId id,
                                       std::int32_t capacity,
                                       const std::string& organizer = "org") {
    rsvp::domain::Event e;
    e.id = id;
    e.organizer_id = organizer;
    e.title = "Event " + std::to_string(id);
    e.capacity = capacity;
    e.scheduled_at_ms = kNow + rsvp::hours_to_ms(24);
    e.created_at_ms = kNow;
    e.updated_at_ms = kNow;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. insert then find returns the stored record; duplicate ids are refused.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, InsertAndFind) {
  ledger.insert(makeEvent(1, 5));

  auto found = ledger.find(1);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->title, "Event 1");
  EXPECT_EQ(found->capacity, 5);
  EXPECT_EQ(found->current_attendees, 0);
  EXPECT_EQ(ledger.size(), 1u);

  EXPECT_FALSE(ledger.find(2).has_value());
  EXPECT_THROW(ledger.insert(makeEvent(1, 9)), rsvp::StoreError);
}

// -----------------------------------------------------------------------------
// 2. listByOrganizer filters by owner and returns ascending ids.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, ListByOrganizer) {
  ledger.insert(makeEvent(3, 5, "alice"));
  ledger.insert(makeEvent(1, 5, "alice"));
  ledger.insert(makeEvent(2, 5, "bob"));

  auto mine = ledger.listByOrganizer("alice");
  ASSERT_EQ(mine.size(), 2u);
  EXPECT_EQ(mine[0].id, 1u);
  EXPECT_EQ(mine[1].id, 3u);

  EXPECT_EQ(ledger.listAll().size(), 3u);
  EXPECT_TRUE(ledger.listByOrganizer("nobody").empty());
}

// -----------------------------------------------------------------------------
// 3. Capacity 1: first reserver wins, second sees CapacityFull.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, ReserveUntilFull) {
  ledger.insert(makeEvent(1, 1));

  auto first = ledger.tryReserveSlot(1, "a", kNow);
  EXPECT_EQ(first.outcome, SlotOutcome::Reserved);
  ASSERT_TRUE(first.event.has_value());
  EXPECT_EQ(first.event->current_attendees, 1);
  EXPECT_EQ(first.event->attendees.count("a"), 1u);

  auto second = ledger.tryReserveSlot(1, "b", kNow);
  EXPECT_EQ(second.outcome, SlotOutcome::CapacityFull);
  EXPECT_EQ(ledger.find(1)->current_attendees, 1);
}

// -----------------------------------------------------------------------------
// 4. A user already in the set is reported as AlreadyHeld, even when full.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, AlreadyHeldCheckedBeforeFull) {
  ledger.insert(makeEvent(1, 1));
  ASSERT_EQ(ledger.tryReserveSlot(1, "a", kNow).outcome, SlotOutcome::Reserved);

  EXPECT_EQ(ledger.tryReserveSlot(1, "a", kNow).outcome,
            SlotOutcome::AlreadyHeld);
  EXPECT_EQ(ledger.find(1)->current_attendees, 1);
}

// -----------------------------------------------------------------------------
// 5. Completed events are closed, and the derived status is persisted.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, CompletedEventIsClosed) {
  ledger.insert(makeEvent(1, 5));
  const std::int64_t later = kNow + rsvp::hours_to_ms(24) + kHint;

  auto result = ledger.tryReserveSlot(1, "a", later);
  EXPECT_EQ(result.outcome, SlotOutcome::EventClosed);
  EXPECT_EQ(ledger.find(1)->status, EventStatus::Completed);
  EXPECT_EQ(ledger.find(1)->current_attendees, 0);
}

// -----------------------------------------------------------------------------
// 6. Ongoing events still accept reservations.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, OngoingEventAcceptsReservations) {
  ledger.insert(makeEvent(1, 5));
  const std::int64_t during = kNow + rsvp::hours_to_ms(25);

  auto result = ledger.tryReserveSlot(1, "a", during);
  EXPECT_EQ(result.outcome, SlotOutcome::Reserved);
  EXPECT_EQ(result.event->status, EventStatus::Ongoing);
}

// -----------------------------------------------------------------------------
// 7. releaseSlot is idempotent.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, ReleaseIsIdempotent) {
  ledger.insert(makeEvent(1, 2));
  ledger.tryReserveSlot(1, "a", kNow);

  auto first = ledger.releaseSlot(1, "a", kNow);
  EXPECT_EQ(first.outcome, SlotOutcome::Released);
  EXPECT_EQ(first.event->current_attendees, 0);

  auto second = ledger.releaseSlot(1, "a", kNow);
  EXPECT_EQ(second.outcome, SlotOutcome::NotHeld);
  EXPECT_EQ(second.event->current_attendees, 0);

  EXPECT_EQ(ledger.releaseSlot(99, "a", kNow).outcome,
            SlotOutcome::EventNotFound);
}

// -----------------------------------------------------------------------------
// 8. setCapacity below current attendees is refused; above is applied.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, SetCapacityRespectsAttendees) {
  ledger.insert(makeEvent(1, 3));
  ledger.tryReserveSlot(1, "a", kNow);
  ledger.tryReserveSlot(1, "b", kNow);

  EXPECT_EQ(ledger.setCapacity(1, 1, kNow).outcome,
            UpdateOutcome::BelowAttendees);
  EXPECT_EQ(ledger.find(1)->capacity, 3);

  auto ok = ledger.setCapacity(1, 2, kNow + 5);
  EXPECT_EQ(ok.outcome, UpdateOutcome::Updated);
  EXPECT_EQ(ok.event->capacity, 2);
  EXPECT_EQ(ok.event->updated_at_ms, kNow + 5);

  EXPECT_EQ(ledger.tryReserveSlot(1, "c", kNow).outcome,
            SlotOutcome::CapacityFull);
  EXPECT_EQ(ledger.setCapacity(42, 10, kNow).outcome,
            UpdateOutcome::EventNotFound);
}

// -----------------------------------------------------------------------------
// 9. setSchedule moves the event and re-derives its status.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, SetScheduleRederivesStatus) {
  ledger.insert(makeEvent(1, 3));

  auto past = ledger.setSchedule(1, kNow - kHint - 1, kNow);
  EXPECT_EQ(past.outcome, UpdateOutcome::Updated);
  EXPECT_EQ(past.event->status, EventStatus::Completed);

  auto future = ledger.setSchedule(1, kNow + 1000, kNow);
  EXPECT_EQ(future.event->status, EventStatus::Upcoming);
}

// -----------------------------------------------------------------------------
// 10. cancel closes the gate permanently; release still works.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, CancelIsStickyAndClosesGate) {
  ledger.insert(makeEvent(1, 3));
  ledger.tryReserveSlot(1, "a", kNow);

  auto cancelled = ledger.cancel(1, kNow);
  EXPECT_EQ(cancelled.outcome, UpdateOutcome::Updated);
  EXPECT_EQ(cancelled.event->status, EventStatus::Cancelled);

  EXPECT_EQ(ledger.tryReserveSlot(1, "b", kNow).outcome,
            SlotOutcome::EventClosed);

  auto moved = ledger.setSchedule(1, kNow + 1000, kNow);
  EXPECT_EQ(moved.event->status, EventStatus::Cancelled);

  EXPECT_EQ(ledger.releaseSlot(1, "a", kNow).outcome, SlotOutcome::Released);
}

// -----------------------------------------------------------------------------
// 11. erase removes the event; later operations see EventNotFound.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, EraseRemovesEvent) {
  ledger.insert(makeEvent(1, 3));

  auto erased = ledger.erase(1);
  ASSERT_TRUE(erased.has_value());
  EXPECT_EQ(erased->id, 1u);

  EXPECT_FALSE(ledger.find(1).has_value());
  EXPECT_EQ(ledger.tryReserveSlot(1, "a", kNow).outcome,
            SlotOutcome::EventNotFound);
  EXPECT_FALSE(ledger.erase(1).has_value());
  EXPECT_EQ(ledger.size(), 0u);
}

// -----------------------------------------------------------------------------
// 12. Many threads racing for a small event: exactly `capacity` win.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, ConcurrentReserversNeverExceedCapacity) {
  constexpr int kCapacity = 7;
  constexpr int kThreads = 32;
  ledger.insert(makeEvent(1, kCapacity));

  std::atomic<int> reserved{0};
  std::atomic<int> full{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, i, &reserved, &full] {
      auto result = ledger.tryReserveSlot(1, "user" + std::to_string(i), kNow);
      if (result.outcome == SlotOutcome::Reserved) {
        reserved.fetch_add(1);
      } else if (result.outcome == SlotOutcome::CapacityFull) {
        full.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(reserved.load(), kCapacity);
  EXPECT_EQ(full.load(), kThreads - kCapacity);
  auto event = ledger.find(1);
  EXPECT_EQ(event->current_attendees, kCapacity);
  EXPECT_EQ(event->attendees.size(), static_cast<std::size_t>(kCapacity));
}

// -----------------------------------------------------------------------------
// 13. overwriteAttendees replaces the set and recomputes the counter.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, OverwriteAttendees) {
  ledger.insert(makeEvent(1, 2));
  ledger.tryReserveSlot(1, "ghost", kNow);

  auto rebuilt = ledger.overwriteAttendees(1, {"a", "b"}, kNow);
  ASSERT_TRUE(rebuilt.has_value());
  EXPECT_EQ(rebuilt->current_attendees, 2);
  EXPECT_EQ(rebuilt->attendees.count("ghost"), 0u);

  EXPECT_THROW(ledger.overwriteAttendees(1, {"a", "b", "c"}, kNow),
               rsvp::StoreError);
  EXPECT_FALSE(ledger.overwriteAttendees(9, {}, kNow).has_value());
}

// -----------------------------------------------------------------------------
// 14. restore replaces contents and recomputes counters from attendee sets.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, RestoreReplacesContents) {
  ledger.insert(makeEvent(1, 2));

  auto restored = makeEvent(5, 4);
  restored.attendees = {"x", "y"};
  restored.current_attendees = 99;
  ledger.restore({restored});

  EXPECT_FALSE(ledger.find(1).has_value());
  auto found = ledger.find(5);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->current_attendees, 2);

  EXPECT_THROW(ledger.restore({makeEvent(7, 1), makeEvent(7, 1)}),
               rsvp::StoreError);
  EXPECT_TRUE(ledger.find(5).has_value());
}
