#pragma once

#include "rsvp/ledger/i_reservation_ledger.hpp"

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace rsvp {

// -----------------------------------------------------------------------------
// InMemoryReservationLedger: process-local IReservationLedger
// -----------------------------------------------------------------------------
//
// @brief  Reservations partitioned by event id. Each partition has its own
//         std::shared_mutex; readers (Status, ListAttendees) take it shared
//         and never wait on writers of other events.
//
// @details
// A partition keeps its records in insertion order plus the set of users
// that currently hold a Confirmed record, which is the uniqueness index
// checked by insertConfirmed() under the partition's exclusive lock.
//
// removeByEvent() detaches a partition from the index and marks it
// `detached`. A writer that looked the partition up just before that
// re-resolves it, so no record is ever written into a detached partition.
//
// Lock order: index_mutex_ → Partition::mutex. The index lock is never
// taken while a partition lock is held.
// -----------------------------------------------------------------------------
class InMemoryReservationLedger final : public IReservationLedger {
 public:
  InMemoryReservationLedger() = default;

  InMemoryReservationLedger(const InMemoryReservationLedger&) = delete;
  InMemoryReservationLedger& operator=(const InMemoryReservationLedger&) =
      delete;

  InsertOutcome insertConfirmed(
      const domain::Reservation& reservation) override;
  std::optional<domain::Reservation> cancelConfirmed(
      domain::EventId event_id, const domain::UserId& user_id,
      std::int64_t now_ms) override;

  std::optional<domain::Reservation> findConfirmed(
      domain::EventId event_id, const domain::UserId& user_id) const override;
  std::vector<domain::Reservation> listConfirmed(
      domain::EventId event_id) const override;
  std::vector<domain::Reservation> listByUser(
      const domain::UserId& user_id,
      std::optional<domain::ReservationStatus> status) const override;
  std::size_t countConfirmed(domain::EventId event_id) const override;
  std::vector<domain::Reservation> listAll() const override;

  bool remove(domain::EventId event_id, domain::ReservationId id) override;
  std::vector<domain::Reservation> removeByEvent(
      domain::EventId event_id) override;
  std::vector<domain::Reservation> removeByUser(
      const domain::UserId& user_id) override;
  void restore(const std::vector<domain::Reservation>& records) override;

 private:
  struct Partition {
    mutable std::shared_mutex mutex;
    std::vector<domain::Reservation> records;
    std::unordered_set<domain::UserId> confirmed_users;
    bool detached{false};
  };

  std::shared_ptr<Partition> lookup(domain::EventId event_id) const;
  std::shared_ptr<Partition> lookupOrCreate(domain::EventId event_id);
  std::vector<std::pair<domain::EventId, std::shared_ptr<Partition>>>
  allPartitions() const;

  mutable std::shared_mutex index_mutex_;
  std::unordered_map<domain::EventId, std::shared_ptr<Partition>> index_;
};

}  // namespace rsvp
