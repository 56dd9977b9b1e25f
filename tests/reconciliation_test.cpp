// =============================================================================
// reconciliation_test.cpp
// =============================================================================
// Tests for partial-failure handling between the event ledger and the
// reservation ledger.
//
// Validates:
//   - a Leave whose slot release fails returns ReconciliationRequired and
//     registers the pair as pending (seat still held, record cancelled)
//   - retryPendingReleases(), a repeated Leave and a new Join all finish the
//     pending release exactly once
//   - ReconciliationWorker resolves pending releases in the background
//   - a failed reservation insert rolls the slot back
//   - LedgerReconciler removes orphans, cancels overflow and rebuilds the
//     attendee set from confirmed reservations
// =============================================================================

#include "rsvp/concurrent/id_generator.hpp"
#include "rsvp/domain/reservation_limits.hpp"
#include "rsvp/eventbus/event_bus.hpp"
#include "rsvp/ledger/in_memory_event_ledger.hpp"
#include "rsvp/ledger/in_memory_reservation_ledger.hpp"
#include "rsvp/ledger/store_error.hpp"
#include "rsvp/reconcile/ledger_reconciler.hpp"
#include "rsvp/reconcile/reconciliation_worker.hpp"
#include "rsvp/reservation/reservation_service.hpp"
#include "rsvp/time/simulation_time_provider.hpp"
#include "rsvp/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

using rsvp::domain::ErrorCode;
using rsvp::domain::ReservationStatus;

namespace {

// -----------------------------------------------------------------------------
// Event ledger decorator: forwards to an in-memory ledger, throws StoreError
// from releaseSlot() while fail_release is set.
// -----------------------------------------------------------------------------
class FaultyEventLedger final : public rsvp::IEventLedger {
 public:
  explicit FaultyEventLedger(std::int64_t duration_hint_ms)
      : inner_(duration_hint_ms) {}

  std::atomic<bool> fail_release{false};
  std::atomic<int> release_calls{0};

  void insert(const rsvp::domain::Event& event) override {
    inner_.insert(event);
  }
  std::optional<rsvp::domain::Event> find(
      rsvp::domain::EventId id) const override {
    return inner_.find(id);
  }
  std::vector<rsvp::domain::Event> listByOrganizer(
      const rsvp::domain::UserId& organizer_id) const override {
    return inner_.listByOrganizer(organizer_id);
  }
  std::vector<rsvp::domain::Event> listAll() const override {
    return inner_.listAll();
  }
  std::size_t size() const override { return inner_.size(); }

  rsvp::SlotResult tryReserveSlot(rsvp::domain::EventId id,
                                  const rsvp::domain::UserId& user_id,
                                  std::int64_t now_ms) override {
    return inner_.tryReserveSlot(id, user_id, now_ms);
  }

  rsvp::SlotResult releaseSlot(rsvp::domain::EventId id,
                               const rsvp::domain::UserId& user_id,
                               std::int64_t now_ms) override {
    release_calls.fetch_add(1);
    if (fail_release.load()) {
      throw rsvp::StoreError("injected release failure");
    }
    return inner_.releaseSlot(id, user_id, now_ms);
  }

  rsvp::UpdateResult setCapacity(rsvp::domain::EventId id,
                                 std::int32_t capacity,
                                 std::int64_t now_ms) override {
    return inner_.setCapacity(id, capacity, now_ms);
  }
  rsvp::UpdateResult setSchedule(rsvp::domain::EventId id,
                                 std::int64_t scheduled_at_ms,
                                 std::int64_t now_ms) override {
    return inner_.setSchedule(id, scheduled_at_ms, now_ms);
  }
  rsvp::UpdateResult cancel(rsvp::domain::EventId id,
                            std::int64_t now_ms) override {
    return inner_.cancel(id, now_ms);
  }
  std::optional<rsvp::domain::Event> overwriteAttendees(
      rsvp::domain::EventId id,
      const std::set<rsvp::domain::UserId>& attendees,
      std::int64_t now_ms) override {
    return inner_.overwriteAttendees(id, attendees, now_ms);
  }
  std::optional<rsvp::domain::Event> erase(rsvp::domain::EventId id) override {
    return inner_.erase(id);
  }
  void restore(const std::vector<rsvp::domain::Event>& events) override {
    inner_.restore(events);
  }

 private:
  rsvp::InMemoryEventLedger inner_;
};

// -----------------------------------------------------------------------------
// Reservation ledger decorator: throws StoreError from insertConfirmed()
// while fail_insert is set.
// -----------------------------------------------------------------------------
class FaultyReservationLedger final : public rsvp::IReservationLedger {
 public:
  std::atomic<bool> fail_insert{false};

  rsvp::InsertOutcome insertConfirmed(
      const rsvp::domain::Reservation& reservation) override {
    if (fail_insert.load()) {
      throw rsvp::StoreError("injected insert failure");
    }
    return inner_.insertConfirmed(reservation);
  }
  std::optional<rsvp::domain::Reservation> cancelConfirmed(
      rsvp::domain::EventId event_id, const rsvp::domain::UserId& user_id,
      std::int64_t now_ms) override {
    return inner_.cancelConfirmed(event_id, user_id, now_ms);
  }
  std::optional<rsvp::domain::Reservation> findConfirmed(
      rsvp::domain::EventId event_id,
      const rsvp::domain::UserId& user_id) const override {
    return inner_.findConfirmed(event_id, user_id);
  }
  std::vector<rsvp::domain::Reservation> listConfirmed(
      rsvp::domain::EventId event_id) const override {
    return inner_.listConfirmed(event_id);
  }
  std::vector<rsvp::domain::Reservation> listByUser(
      const rsvp::domain::UserId& user_id,
      std::optional<ReservationStatus> status) const override {
    return inner_.listByUser(user_id, status);
  }
  std::size_t countConfirmed(rsvp::domain::EventId event_id) const override {
    return inner_.countConfirmed(event_id);
  }
  std::vector<rsvp::domain::Reservation> listAll() const override {
    return inner_.listAll();
  }
  bool remove(rsvp::domain::EventId event_id,
              rsvp::domain::ReservationId id) override {
    return inner_.remove(event_id, id);
  }
  std::vector<rsvp::domain::Reservation> removeByEvent(
      rsvp::domain::EventId event_id) override {
    return inner_.removeByEvent(event_id);
  }
  std::vector<rsvp::domain::Reservation> removeByUser(
      const rsvp::domain::UserId& user_id) override {
    return inner_.removeByUser(user_id);
  }
  void restore(const std::vector<rsvp::domain::Reservation>& records) override {
    inner_.restore(records);
  }

 private:
  rsvp::InMemoryReservationLedger inner_;
};

}  // namespace

// =============================================================================
// Fixture: service over fault-injecting ledgers.
// =============================================================================
class ReconciliationTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kNow = 1'700'000'000'000;

  rsvp::domain::ReservationLimits limits;
  rsvp::SimulationTimeProvider clock{kNow};
  FaultyEventLedger events{limits.duration_hint_ms};
  FaultyReservationLedger reservations;
  rsvp::IdGenerator event_ids;
  rsvp::IdGenerator reservation_ids;
  rsvp::EventBus bus;
  rsvp::ReservationService service{events,    reservations,    clock,
                                   event_ids, reservation_ids, bus,
                                   limits};

  rsvp::domain::EventId createEvent(std::int32_t capacity) {
    rsvp::domain::EventDraft draft;
    draft.title = "Workshop";
    draft.location = "Room 2";
    draft.scheduled_at_ms = kNow + rsvp::hours_to_ms(24);
    draft.capacity = capacity;
    auto created = service.createEvent("org", draft);
    EXPECT_TRUE(created.ok());
    return created.value().id;
  }

  std::int32_t seatsHeld(rsvp::domain::EventId id) const {
    auto event = events.find(id);
    return event ? event->current_attendees : -1;
  }

  // Join then leave with release failing: leaves the pair pending.
  void leaveWithFailedRelease(rsvp::domain::EventId id,
                              const rsvp::domain::UserId& user) {
    ASSERT_TRUE(service.join(id, user).ok());
    events.fail_release.store(true);
    auto left = service.leave(id, user);
    ASSERT_FALSE(left.ok());
    ASSERT_EQ(left.code(), ErrorCode::ReconciliationRequired);
  }
};

// -----------------------------------------------------------------------------
// 1. Failed release: record cancelled, seat still held, pair pending.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, FailedReleaseRegistersPending) {
  std::vector<rsvp::ReconciliationRequiredEvent> required;
  bus.subscribe<rsvp::ReconciliationRequiredEvent>(
      [&required](const rsvp::ReconciliationRequiredEvent& e) {
        required.push_back(e);
      });

  const auto id = createEvent(1);
  leaveWithFailedRelease(id, "alice");

  EXPECT_TRUE(rsvp::domain::isRetriable(ErrorCode::ReconciliationRequired));
  EXPECT_FALSE(service.status(id, "alice"));
  EXPECT_EQ(seatsHeld(id), 1);
  EXPECT_TRUE(service.isPending(id, "alice"));
  ASSERT_EQ(service.pendingCount(), 1u);

  auto pending = service.pendingReleases();
  EXPECT_EQ(pending[0].event_id, id);
  EXPECT_EQ(pending[0].user_id, "alice");
  EXPECT_EQ(pending[0].last_error, "injected release failure");

  ASSERT_EQ(required.size(), 1u);
  EXPECT_EQ(required[0].user_id, "alice");

  // The held seat keeps the event full until the release lands.
  EXPECT_EQ(service.join(id, "bob").code(), ErrorCode::CapacityExceeded);
}

// -----------------------------------------------------------------------------
// 2. retryPendingReleases() frees the seat once the ledger recovers.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, RetryPendingReleasesFreesSeat) {
  int resolved_events = 0;
  bus.subscribe<rsvp::ReconciliationResolvedEvent>(
      [&resolved_events](const rsvp::ReconciliationResolvedEvent&) {
        ++resolved_events;
      });

  const auto id = createEvent(1);
  leaveWithFailedRelease(id, "alice");

  auto still_failing = service.retryPendingReleases();
  EXPECT_EQ(still_failing.attempted, 1u);
  EXPECT_EQ(still_failing.resolved, 0u);
  EXPECT_EQ(service.pendingReleases()[0].attempts, 1u);

  events.fail_release.store(false);
  auto summary = service.retryPendingReleases();
  EXPECT_EQ(summary.attempted, 1u);
  EXPECT_EQ(summary.resolved, 1u);
  EXPECT_EQ(service.pendingCount(), 0u);
  EXPECT_EQ(seatsHeld(id), 0);
  EXPECT_EQ(resolved_events, 1);

  EXPECT_TRUE(service.join(id, "bob").ok());
  EXPECT_EQ(service.retryPendingReleases().attempted, 0u);
}

// -----------------------------------------------------------------------------
// 3. Repeating the Leave completes the release and returns the spot count.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, RepeatedLeaveResolvesPending) {
  const auto id = createEvent(2);
  leaveWithFailedRelease(id, "alice");

  auto still_failing = service.leave(id, "alice");
  ASSERT_FALSE(still_failing.ok());
  EXPECT_EQ(still_failing.code(), ErrorCode::ReconciliationRequired);

  events.fail_release.store(false);
  auto left = service.leave(id, "alice");
  ASSERT_TRUE(left.ok());
  EXPECT_EQ(left.value(), 2);
  EXPECT_FALSE(service.isPending(id, "alice"));

  auto again = service.leave(id, "alice");
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.code(), ErrorCode::NotFound);
  EXPECT_EQ(seatsHeld(id), 0);
}

// -----------------------------------------------------------------------------
// 4. Joining again finishes the pending release first, then re-reserves.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, JoinResolvesOwnPendingRelease) {
  const auto id = createEvent(1);
  leaveWithFailedRelease(id, "alice");

  auto blocked = service.join(id, "alice");
  ASSERT_FALSE(blocked.ok());
  EXPECT_EQ(blocked.code(), ErrorCode::ReconciliationRequired);
  EXPECT_TRUE(service.isPending(id, "alice"));

  events.fail_release.store(false);
  auto joined = service.join(id, "alice");
  ASSERT_TRUE(joined.ok());
  EXPECT_EQ(joined.value().available_spots, 0);
  EXPECT_FALSE(service.isPending(id, "alice"));
  EXPECT_EQ(seatsHeld(id), 1);
  EXPECT_TRUE(service.status(id, "alice"));
  EXPECT_EQ(service.listUserReservations("alice", std::nullopt).size(), 2u);
}

// -----------------------------------------------------------------------------
// 5. Deleting the event drops its pending releases.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, DeleteEventForgetsPending) {
  const auto id = createEvent(2);
  leaveWithFailedRelease(id, "alice");

  auto deleted = service.deleteEvent(id, "org");
  ASSERT_TRUE(deleted.ok());
  EXPECT_EQ(service.pendingCount(), 0u);
}

// -----------------------------------------------------------------------------
// 6. A failed reservation insert rolls the seat back.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, InsertFailureRollsBackSeat) {
  const auto id = createEvent(1);
  reservations.fail_insert.store(true);

  auto joined = service.join(id, "alice");
  ASSERT_FALSE(joined.ok());
  EXPECT_EQ(joined.code(), ErrorCode::Infrastructure);
  EXPECT_EQ(seatsHeld(id), 0);
  EXPECT_EQ(service.pendingCount(), 0u);

  reservations.fail_insert.store(false);
  EXPECT_TRUE(service.join(id, "bob").ok());
}

// -----------------------------------------------------------------------------
// 7. Insert fails and so does the rollback: the seat is registered pending.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, FailedRollbackIsRegisteredPending) {
  const auto id = createEvent(1);
  reservations.fail_insert.store(true);
  events.fail_release.store(true);

  auto joined = service.join(id, "alice");
  ASSERT_FALSE(joined.ok());
  EXPECT_EQ(joined.code(), ErrorCode::Infrastructure);
  EXPECT_EQ(seatsHeld(id), 1);
  EXPECT_TRUE(service.isPending(id, "alice"));

  events.fail_release.store(false);
  EXPECT_EQ(service.retryPendingReleases().resolved, 1u);
  EXPECT_EQ(seatsHeld(id), 0);
}

// -----------------------------------------------------------------------------
// 8. The background worker drains pending releases.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, WorkerDrainsPendingReleases) {
  const auto id = createEvent(1);
  leaveWithFailedRelease(id, "alice");
  events.fail_release.store(false);

  rsvp::ReconciliationWorker worker(service, std::chrono::milliseconds(5));
  worker.start();
  EXPECT_TRUE(worker.isRunning());

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (service.pendingCount() > 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  worker.stop();

  EXPECT_FALSE(worker.isRunning());
  EXPECT_EQ(service.pendingCount(), 0u);
  EXPECT_GE(worker.passes(), 1u);
  EXPECT_EQ(seatsHeld(id), 0);
}

// -----------------------------------------------------------------------------
// 9. start()/stop() are idempotent and stop() returns promptly.
// -----------------------------------------------------------------------------
TEST_F(ReconciliationTest, WorkerStartStopIdempotent) {
  rsvp::ReconciliationWorker worker(service, std::chrono::seconds(60));
  worker.start();
  worker.start();

  const auto before = std::chrono::steady_clock::now();
  worker.stop();
  worker.stop();
  const auto elapsed = std::chrono::steady_clock::now() - before;

  EXPECT_FALSE(worker.isRunning());
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// =============================================================================
// LedgerReconciler: whole-ledger repair used at startup.
// =============================================================================
class LedgerReconcilerTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kNow = 1'700'000'000'000;

  rsvp::SimulationTimeProvider clock{kNow};
  rsvp::InMemoryEventLedger events{4 * rsvp::kMillisPerHour};
  rsvp::InMemoryReservationLedger reservations;
  rsvp::LedgerReconciler reconciler{events, reservations, clock};

  static rsvp::domain::Event makeEvent(rsvp::domain::EventId id,
                                       std::int32_t capacity) {
    rsvp::domain::Event e;
    e.id = id;
    e.organizer_id = "org";
    e.title = "Seminar";
    e.capacity = capacity;
    e.scheduled_at_ms = kNow + rsvp::hours_to_ms(24);
    return e;
  }

  static rsvp::domain::Reservation confirmed(rsvp::domain::ReservationId id,
                                             rsvp::domain::EventId event_id,
                                             const std::string& user,
                                             std::int64_t created_at_ms) {
    rsvp::domain::Reservation r;
    r.id = id;
    r.event_id = event_id;
    r.user_id = user;
    r.status = ReservationStatus::Confirmed;
    r.created_at_ms = created_at_ms;
    return r;
  }
};

// -----------------------------------------------------------------------------
// 10. Orphans removed, overflow cancelled (latest first), set rebuilt.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, RepairsDivergedLedgers) {
  auto event = makeEvent(1, 2);
  event.attendees = {"ghost"};
  events.insert(event);

  reservations.insertConfirmed(confirmed(1, 1, "a", 10));
  reservations.insertConfirmed(confirmed(2, 1, "b", 20));
  reservations.insertConfirmed(confirmed(3, 1, "c", 30));
  reservations.insertConfirmed(confirmed(4, 99, "a", 10));

  auto report = reconciler.reconcileAll();
  EXPECT_EQ(report.events_checked, 1u);
  EXPECT_EQ(report.orphans_removed, 1u);
  EXPECT_EQ(report.overflow_cancelled, 1u);
  EXPECT_EQ(report.events_repaired, 1u);

  auto repaired = events.find(1);
  ASSERT_TRUE(repaired.has_value());
  EXPECT_EQ(repaired->current_attendees, 2);
  EXPECT_EQ(repaired->attendees, (std::set<std::string>{"a", "b"}));

  EXPECT_FALSE(reservations.findConfirmed(1, "c").has_value());
  EXPECT_TRUE(reservations.listConfirmed(99).empty());
  EXPECT_EQ(reservations.countConfirmed(1), 2u);
}

// -----------------------------------------------------------------------------
// 11. Consistent ledgers are left untouched.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, ConsistentLedgersUntouched) {
  auto event = makeEvent(1, 3);
  event.attendees = {"a", "b"};
  events.insert(event);
  events.insert(makeEvent(2, 1));
  reservations.insertConfirmed(confirmed(1, 1, "a", 10));
  reservations.insertConfirmed(confirmed(2, 1, "b", 20));

  auto report = reconciler.reconcileAll();
  EXPECT_EQ(report.events_checked, 2u);
  EXPECT_EQ(report.events_repaired, 0u);
  EXPECT_EQ(report.orphans_removed, 0u);
  EXPECT_EQ(report.overflow_cancelled, 0u);
}

// -----------------------------------------------------------------------------
// 12. A seat held without a confirmed reservation is released.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, ReleasesSeatsWithoutReservation) {
  events.insert(makeEvent(1, 2));
  ASSERT_EQ(events.tryReserveSlot(1, "left-early", kNow).outcome,
            rsvp::SlotOutcome::Reserved);

  auto report = reconciler.reconcileAll();
  EXPECT_EQ(report.events_repaired, 1u);
  EXPECT_EQ(events.find(1)->current_attendees, 0);
}
