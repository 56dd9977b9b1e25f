#pragma once

#include "rsvp/concurrent/id_generator.hpp"
#include "rsvp/domain/error.hpp"
#include "rsvp/domain/event.hpp"
#include "rsvp/domain/reservation.hpp"
#include "rsvp/domain/reservation_limits.hpp"
#include "rsvp/eventbus/event_bus.hpp"
#include "rsvp/ledger/i_event_ledger.hpp"
#include "rsvp/ledger/i_reservation_ledger.hpp"
#include "rsvp/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rsvp {

// -----------------------------------------------------------------------------
// ReservationService: Join / Leave / Status / ListAttendees
// -----------------------------------------------------------------------------
//
// @brief  Sequences the event ledger (slot accounting) and the reservation
//         ledger (membership) so that, for every event,
//
//             current_attendees == number of Confirmed reservations
//
//         and never exceeds capacity, under any interleaving of concurrent
//         calls.
//
// @details
// Join:  capacity gate on the event ledger first, then the uniqueness-checked
//        insert on the reservation ledger. A failed insert is compensated by
//        releasing the slot before returning.
//
// Leave: cancel the Confirmed reservation first, then release the slot. A
//        store fault between the two leaves a slot held with no Confirmed
//        reservation behind it, so the event can be under-filled but never
//        over-booked. The pair is then registered as a pending
//        release and ErrorCode::ReconciliationRequired is returned;
//        retryPendingReleases() (driven by ReconciliationWorker) or a retry
//        of the same Leave finishes the release.
//
// Pending releases are claimed before they are retried, so the worker and a
// caller's retry never release the same slot twice.
//
// Every operation is synchronous and completes its compensation before
// returning. A caller that stops waiting never leaves a half-applied state.
//
// Thread model:
//   All public methods are safe to call concurrently from any thread. Bus
//   events are published after the ledgers' locks are released.
//
// Ownership:
//   Holds references to the ledgers, clock, id generator and bus; all are
//   owned by ReservationEngine and outlive the service.
// -----------------------------------------------------------------------------
class ReservationService {
 public:
  struct JoinReceipt {
    domain::Reservation reservation;
    std::int32_t available_spots{0};
  };

  // Event with its derived fields evaluated at read time.
  struct EventView {
    domain::Event event;
    std::int32_t available_spots{0};
    bool is_full{false};
    bool is_past{false};
  };

  struct PendingRelease {
    domain::EventId event_id{0};
    domain::UserId user_id;
    std::int64_t registered_at_ms{0};
    std::uint32_t attempts{0};
    std::string last_error;
  };

  struct RetrySummary {
    std::size_t attempted{0};
    std::size_t resolved{0};
  };

  struct UserDeletionSummary {
    std::size_t events_deleted{0};
    std::size_t reservations_removed{0};
    std::size_t slots_released{0};
  };

  ReservationService(IEventLedger& events, IReservationLedger& reservations,
                     const ITimeProvider& clock, IdGenerator& event_ids,
                     IdGenerator& reservation_ids, EventBus& bus,
                     const domain::ReservationLimits& limits);

  ReservationService(const ReservationService&) = delete;
  ReservationService& operator=(const ReservationService&) = delete;

  // ===========================================================================
  // Reservation surface
  // ===========================================================================

  // -------------------------------------------------------------------------
  // join(event_id, user_id, notes)
  // -------------------------------------------------------------------------
  // @brief  Reserves one slot for user_id.
  //
  // @return The Confirmed reservation and the event's available spots right
  //         after this join, or one of:
  //           NotFound          event missing (or deleted mid-join)
  //           EventClosed       event cancelled or completed
  //           CapacityExceeded  event full
  //           AlreadyReserved   user already holds a slot
  //           ReconciliationRequired  the user's previous Leave is still
  //                             pending and could not be finished inline
  //           Infrastructure    a ledger write failed; nothing applied
  //           InvalidArgument   empty user id or notes too long
  //
  // Side-effects: on success, current_attendees +1 and one Confirmed record.
  //               On any failure, neither ledger changes.
  // -------------------------------------------------------------------------
  domain::Result<JoinReceipt> join(domain::EventId event_id,
                                   const domain::UserId& user_id,
                                   const std::string& notes = {});

  // -------------------------------------------------------------------------
  // leave(event_id, user_id)
  // -------------------------------------------------------------------------
  // @brief  Cancels the user's Confirmed reservation and frees the slot.
  //
  // @return Available spots after the release, or NotFound (no Confirmed
  //         reservation and no pending release for the pair),
  //         ReconciliationRequired (reservation cancelled, slot release
  //         failed; retry is idempotent) or Infrastructure.
  // -------------------------------------------------------------------------
  domain::Result<std::int32_t> leave(domain::EventId event_id,
                                     const domain::UserId& user_id);

  // @brief  True iff the pair holds a Confirmed reservation. Read-only;
  //         never waits on an in-flight join / leave.
  bool status(domain::EventId event_id, const domain::UserId& user_id) const;

  // @brief  Confirmed reservations of the event, oldest first. Empty for an
  //         unknown event.
  std::vector<domain::Reservation> listAttendees(domain::EventId event_id) const;

  // @brief  The user's reservations, newest first. Defaults to Confirmed;
  //         std::nullopt lists every status.
  std::vector<domain::Reservation> listUserReservations(
      const domain::UserId& user_id,
      std::optional<domain::ReservationStatus> status =
          domain::ReservationStatus::Confirmed) const;

  // ===========================================================================
  // Organizer surface
  // ===========================================================================

  domain::Result<domain::Event> createEvent(const domain::UserId& organizer_id,
                                            const domain::EventDraft& draft);

  domain::Result<EventView> getEvent(domain::EventId event_id) const;

  // @brief  Events organized by the user, newest first.
  std::vector<EventView> listOrganizerEvents(
      const domain::UserId& organizer_id) const;

  // @brief  Organizer only. Rejects values outside the configured range and
  //         values below the current attendee count (checked atomically with
  //         the write) with InvalidArgument.
  domain::Result<domain::Event> updateCapacity(
      domain::EventId event_id, const domain::UserId& organizer_id,
      std::int32_t capacity);

  // @brief  Organizer only. Status is re-derived unless Cancelled.
  domain::Result<domain::Event> reschedule(domain::EventId event_id,
                                           const domain::UserId& organizer_id,
                                           std::int64_t scheduled_at_ms);

  // @brief  Organizer only. Cancelled is terminal; later joins get
  //         EventClosed. Existing reservations are kept.
  domain::Result<domain::Event> cancelEvent(domain::EventId event_id,
                                            const domain::UserId& organizer_id);

  // @brief  Organizer only. Removes the event, then every reservation that
  //         referenced it. Returns the number of reservations removed.
  domain::Result<std::size_t> deleteEvent(domain::EventId event_id,
                                          const domain::UserId& organizer_id);

  // -------------------------------------------------------------------------
  // deleteUser(user_id)
  // -------------------------------------------------------------------------
  // @brief  Account deletion cascade: deletes every event the user
  //         organizes (with their reservations), then removes the user's
  //         own reservations elsewhere, releasing the slot of each one that
  //         was Confirmed.
  // -------------------------------------------------------------------------
  UserDeletionSummary deleteUser(const domain::UserId& user_id);

  // ===========================================================================
  // Reconciliation
  // ===========================================================================

  // @brief  Retries every pending release once. Called periodically by
  //         ReconciliationWorker and by the "reconcile" IPC command.
  RetrySummary retryPendingReleases();

  std::vector<PendingRelease> pendingReleases() const;
  std::size_t pendingCount() const;
  bool isPending(domain::EventId event_id, const domain::UserId& user_id) const;

  const domain::ReservationLimits& limits() const { return limits_; }

 private:
  using PairKey = std::pair<domain::EventId, domain::UserId>;

  struct PendingEntry {
    PendingRelease info;
    bool in_flight{false};
  };

  enum class Resolution { Resolved, StillPending, NotPending };

  // Releases the slot just reserved by a join that is being rolled back.
  // A failure here registers the pair as pending.
  void compensate(domain::EventId event_id, const domain::UserId& user_id,
                  const char* reason);

  void registerPending(domain::EventId event_id, const domain::UserId& user_id,
                       const std::string& reason);

  // Claims the pending entry, retries releaseSlot, and erases the entry on
  // success. `after` receives the event record after the release, if any.
  Resolution resolvePending(domain::EventId event_id,
                            const domain::UserId& user_id,
                            std::optional<domain::Event>* after);

  void forgetPendingForEvent(domain::EventId event_id);

  std::optional<domain::Error> validateDraft(const domain::EventDraft& draft,
                                             std::int64_t now_ms) const;

  // Loads the event and checks that `organizer_id` owns it.
  domain::Result<domain::Event> loadOwned(domain::EventId event_id,
                                          const domain::UserId& organizer_id)
      const;

  EventView makeView(domain::Event event, std::int64_t now_ms) const;

  void publishRejected(domain::EventId event_id, const domain::UserId& user_id,
                       domain::ErrorCode code, std::int64_t now_ms);

  IEventLedger& events_;
  IReservationLedger& reservations_;
  const ITimeProvider& clock_;
  IdGenerator& event_ids_;
  IdGenerator& reservation_ids_;
  EventBus& bus_;
  const domain::ReservationLimits limits_;

  IdGenerator sequence_ids_;  // sequence_id of published bus events

  mutable std::mutex pending_mutex_;
  std::map<PairKey, PendingEntry> pending_;
};

}  // namespace rsvp
