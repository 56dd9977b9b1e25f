#pragma once

#include "rsvp/domain/reservation.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace rsvp {

enum class InsertOutcome {
  Inserted,
  DuplicateConfirmed,  // the user already holds a Confirmed record here
};

// -----------------------------------------------------------------------------
// IReservationLedger: record of every (user, event) reservation
// -----------------------------------------------------------------------------
//
// @brief  Owns membership uniqueness: at most one Confirmed reservation per
//         (user_id, event_id) pair.
//
// @details
// insertConfirmed() checks for an existing Confirmed record and inserts in
// one critical section, so two concurrent inserts for the same pair cannot
// both succeed. Cancelled records stay in the ledger as history.
//
// Failure model:
//   Store faults throw StoreError. Conditional outcomes are returned.
//
// Thread-safety:
//   All methods are safe to call concurrently. Readers never block on a
//   writer of a different event.
// -----------------------------------------------------------------------------
class IReservationLedger {
 public:
  virtual ~IReservationLedger() = default;

  // @brief  Inserts `reservation` (which must be Confirmed) unless the pair
  //         already holds a Confirmed record.
  virtual InsertOutcome insertConfirmed(
      const domain::Reservation& reservation) = 0;

  // @brief  Transitions the pair's Confirmed record to Cancelled and stamps
  //         cancelled_at_ms. Returns the updated record, or std::nullopt if
  //         the pair held no Confirmed record.
  virtual std::optional<domain::Reservation> cancelConfirmed(
      domain::EventId event_id, const domain::UserId& user_id,
      std::int64_t now_ms) = 0;

  virtual std::optional<domain::Reservation> findConfirmed(
      domain::EventId event_id, const domain::UserId& user_id) const = 0;

  // @brief  Confirmed records of the event ordered by created_at_ms, then id.
  virtual std::vector<domain::Reservation> listConfirmed(
      domain::EventId event_id) const = 0;

  // @brief  The user's records across all events, newest first. When
  //         `status` is set, only records in that status.
  virtual std::vector<domain::Reservation> listByUser(
      const domain::UserId& user_id,
      std::optional<domain::ReservationStatus> status) const = 0;

  virtual std::size_t countConfirmed(domain::EventId event_id) const = 0;

  // @brief  Every record, grouped by event in ascending event id.
  virtual std::vector<domain::Reservation> listAll() const = 0;

  // @brief  Physically removes one record. Returns false if absent.
  virtual bool remove(domain::EventId event_id, domain::ReservationId id) = 0;

  // @brief  Physically removes every record of the event (cascade delete).
  virtual std::vector<domain::Reservation> removeByEvent(
      domain::EventId event_id) = 0;

  // @brief  Physically removes every record of the user (account deletion).
  virtual std::vector<domain::Reservation> removeByUser(
      const domain::UserId& user_id) = 0;

  // @brief  Replaces the whole contents (snapshot load).
  virtual void restore(const std::vector<domain::Reservation>& records) = 0;
};

}  // namespace rsvp
