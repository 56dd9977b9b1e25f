#pragma once

#include "rsvp/ledger/i_event_ledger.hpp"
#include "rsvp/ledger/i_reservation_ledger.hpp"
#include "rsvp/reconcile/i_reconciler.hpp"
#include "rsvp/time/i_time_provider.hpp"

namespace rsvp {

// -----------------------------------------------------------------------------
// LedgerReconciler: rebuilds slot accounting from the reservation ledger
// -----------------------------------------------------------------------------
//
// @brief  Treats Confirmed reservations as the source of truth for
//         membership and rewrites each event's attendee set to match.
//
// @details
// Pass order:
//   1. Remove every reservation whose event no longer exists.
//   2. Per event, if Confirmed reservations exceed capacity, keep the
//      earliest `capacity` of them (created_at, then id) and cancel the rest.
//   3. Per event, overwrite the attendee set with the remaining Confirmed
//      users when it differs.
//
// Each repair is logged to std::cerr with the before/after counts.
// -----------------------------------------------------------------------------
class LedgerReconciler final : public IReconciler {
 public:
  LedgerReconciler(IEventLedger& events, IReservationLedger& reservations,
                   const ITimeProvider& clock);

  ReconciliationReport reconcileAll() override;

 private:
  IEventLedger& events_;
  IReservationLedger& reservations_;
  const ITimeProvider& clock_;
};

}  // namespace rsvp
