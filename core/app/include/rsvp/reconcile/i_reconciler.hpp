#pragma once

#include <cstddef>

namespace rsvp {

// -----------------------------------------------------------------------------
// ReconciliationReport: what a full reconciliation pass changed
// -----------------------------------------------------------------------------
struct ReconciliationReport {
  std::size_t events_checked{0};
  std::size_t events_repaired{0};     // attendee set / count rewritten
  std::size_t orphans_removed{0};     // reservations whose event is gone
  std::size_t overflow_cancelled{0};  // confirmed beyond capacity, cancelled
};

// -----------------------------------------------------------------------------
// IReconciler: startup ledger agreement gate
// -----------------------------------------------------------------------------
//
// @brief  Brings the event ledger and the reservation ledger back into
//         agreement after a crash or an interrupted operation.
//
// @details
// After reconcileAll() returns, for every event:
//
//   current_attendees == |attendees| == number of Confirmed reservations
//   current_attendees <= capacity
//
// and no reservation references a missing event.
//
// Calling convention:
//   Called exactly once, synchronously, on the main thread during
//   ReservationEngine::start(), after the snapshot is loaded and before the
//   service, worker and IPC server exist. Nothing else touches the ledgers
//   while it runs.
//
// Ownership:
//   ReservationEngine owns its default LedgerReconciler. A caller may pass
//   its own non-owning IReconciler* to start() instead.
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  virtual ReconciliationReport reconcileAll() = 0;
};

}  // namespace rsvp
