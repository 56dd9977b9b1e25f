#include "rsvp/reconcile/ledger_reconciler.hpp"

#include <iostream>
#include <set>

namespace rsvp {

LedgerReconciler::LedgerReconciler(IEventLedger& events,
                                   IReservationLedger& reservations,
                                   const ITimeProvider& clock)
    : events_(events), reservations_(reservations), clock_(clock) {}

ReconciliationReport LedgerReconciler::reconcileAll() {
  ReconciliationReport report;
  const std::int64_t now = clock_.now_ms();

  const auto events = events_.listAll();
  std::set<domain::EventId> live_ids;
  for (const auto& event : events) {
    live_ids.insert(event.id);
  }

  // --- 1) Orphans ------------------------------------------------------------
  for (const auto& reservation : reservations_.listAll()) {
    if (live_ids.count(reservation.event_id) == 0 &&
        reservations_.remove(reservation.event_id, reservation.id)) {
      ++report.orphans_removed;
    }
  }

  for (const auto& event : events) {
    ++report.events_checked;

    // --- 2) Overflow ---------------------------------------------------------
    auto confirmed = reservations_.listConfirmed(event.id);
    const auto capacity = static_cast<std::size_t>(event.capacity);
    if (confirmed.size() > capacity) {
      std::cerr << "[LedgerReconciler] WARNING: event " << event.id << " has "
                << confirmed.size() << " confirmed reservations for capacity "
                << event.capacity << ". Cancelling the latest "
                << (confirmed.size() - capacity) << ".\n";
      for (std::size_t i = capacity; i < confirmed.size(); ++i) {
        if (reservations_.cancelConfirmed(event.id, confirmed[i].user_id,
                                          now)) {
          ++report.overflow_cancelled;
        }
      }
      confirmed.resize(capacity);
    }

    // --- 3) Attendee set -----------------------------------------------------
    std::set<domain::UserId> members;
    for (const auto& reservation : confirmed) {
      members.insert(reservation.user_id);
    }

    if (members != event.attendees ||
        event.current_attendees != static_cast<std::int32_t>(members.size())) {
      std::cerr << "[LedgerReconciler] WARNING: event " << event.id
                << " attendee count " << event.current_attendees
                << " repaired to " << members.size() << ".\n";
      if (events_.overwriteAttendees(event.id, members, now)) {
        ++report.events_repaired;
      }
    }
  }

  std::cout << "[LedgerReconciler] Checked " << report.events_checked
            << " event(s): " << report.events_repaired << " repaired, "
            << report.orphans_removed << " orphan(s) removed, "
            << report.overflow_cancelled << " overflow cancelled.\n";
  return report;
}

}  // namespace rsvp
