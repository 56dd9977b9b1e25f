#pragma once

#include "rsvp/concurrent/id_generator.hpp"
#include "rsvp/config/engine_config.hpp"
#include "rsvp/eventbus/event_bus.hpp"
#include "rsvp/ledger/in_memory_event_ledger.hpp"
#include "rsvp/ledger/in_memory_reservation_ledger.hpp"
#include "rsvp/network/ipc_server.hpp"
#include "rsvp/reconcile/i_reconciler.hpp"
#include "rsvp/reconcile/ledger_reconciler.hpp"
#include "rsvp/reconcile/reconciliation_worker.hpp"
#include "rsvp/reservation/reservation_service.hpp"
#include "rsvp/time/i_time_provider.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// ReservationEngine
// -----------------------------------------------------------------------------
//
// @brief  Root object of the reservation engine: owns the ledgers, the
//         service, the reconciliation worker and the IPC server, and brings
//         them up and down in a fixed order.
//
// @details
// Lifecycle:
//
//   start()                                 stop()
//   ───────                                 ──────
//   1. load ledger snapshot (if any)        1. close the command gate
//   2. reconciliation gate                  2. stop reconciliation worker
//   3. create ReservationService            3. stop IPC server
//   4. start ReconciliationWorker           4. save ledger snapshot (if any)
//   5. open the command gate                5. destroy ReservationService
//   6. start IpcServer (if configured)
//
// No request reaches the service before the ledgers agree (step 2), and the
// snapshot is written only after every thread that could mutate the ledgers
// has been joined. Closing the command gate waits for in-flight
// executeCommand() calls, so nothing publishes to the telemetry subscriber
// once the worker is joined and the IPC server is torn down.
//
// Thread layout while running:
//
//   caller threads      → service() → ReservationService (thread-safe)
//   reconcile thread    → ReconciliationWorker → retryPendingReleases()
//   ipc thread          → IpcServer → executeCommand()
//
// Ownership:
//   ReservationEngine
//    ├── clock_                (const ITimeProvider&, non-owning)
//    ├── config_               (EngineConfig, value member)
//    ├── event_ids_            (IdGenerator, value member)
//    ├── reservation_ids_      (IdGenerator, value member)
//    ├── bus_                  (EventBus, value member)
//    ├── event_ledger_         (InMemoryEventLedger, value member)
//    ├── reservation_ledger_   (InMemoryReservationLedger, value member)
//    ├── default_reconciler_   (LedgerReconciler, value member)
//    ├── service_              (unique_ptr<ReservationService>)
//    ├── worker_               (unique_ptr<ReconciliationWorker>)
//    └── ipc_server_           (unique_ptr<IpcServer>)
//
// Heap-allocated members are reset in stop() in reverse start order; value
// members outlive them.
// -----------------------------------------------------------------------------
class ReservationEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock   Time source for every component. Must outlive the
  //                 engine.
  // @param  config  Copied. Empty IPC endpoints disable the IPC server; an
  //                 empty snapshot path disables persistence.
  //
  // No threads, sockets or files are touched here.
  // -------------------------------------------------------------------------
  ReservationEngine(const ITimeProvider& clock, EngineConfig config);

  ~ReservationEngine();

  ReservationEngine(const ReservationEngine&) = delete;
  ReservationEngine& operator=(const ReservationEngine&) = delete;
  ReservationEngine(ReservationEngine&&) = delete;
  ReservationEngine& operator=(ReservationEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(reconciler)
  // -------------------------------------------------------------------------
  // @param  reconciler  Optional non-owning override of the startup gate.
  //                     nullptr runs the built-in LedgerReconciler.
  //
  // @throws StoreError if the snapshot exists but cannot be loaded, and
  //         zmq::error_t if an IPC endpoint cannot be bound. The engine is
  //         left stopped in both cases.
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void start(IReconciler* reconciler = nullptr);

  // Idempotent. Never throws; a failed snapshot save is logged.
  void stop();

  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // @brief  Protocol-agnostic operation surface. JSON request in, JSON
  //         response out; bound to the IPC REP socket.
  //
  // @details
  // Request:  {"op": "<name>", ...arguments}
  //
  //   ping                                          → response:"pong"
  //   join          event_id, user_id, [notes]      → reservation, available_spots
  //   leave         event_id, user_id               → available_spots
  //   status        event_id, user_id               → reserved
  //   attendees     event_id                        → attendees[]
  //   my_reservations user_id, [filter]             → reservations[]
  //   event         event_id                        → event
  //   my_events     user_id                         → events[]
  //   create_event  user_id, title, location, scheduled_at_ms, capacity,
  //                 [description], [category]       → event
  //   update_capacity event_id, user_id, capacity   → event
  //   reschedule    event_id, user_id, scheduled_at_ms → event
  //   cancel_event  event_id, user_id               → event
  //   delete_event  event_id, user_id               → removed_reservations
  //   delete_user   user_id                         → summary
  //   reconcile                                     → attempted, resolved, pending
  //   stats                                         → counters
  //
  // Success: {"status":"ok", ...}
  // Failure: {"status":"error","code":"<ErrorCode>","message":"...",
  //           "retriable":bool}
  //
  // Malformed JSON, missing or mistyped arguments and integers outside the
  // range of the target field map to InvalidArgument. Calls while the engine
  // is stopped (or stopping) map to Infrastructure.
  //
  // Thread-safety: Safe to call from any thread, concurrently with stop().
  // Each call holds command_mutex_ shared; stop() takes it exclusively.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  // nullptr while stopped. Unlike executeCommand(), direct callers must not
  // race stop().
  ReservationService* service() { return service_.get(); }

  EventBus& eventBus() { return bus_; }
  IEventLedger& eventLedger() { return event_ledger_; }
  IReservationLedger& reservationLedger() { return reservation_ledger_; }

  // Report of the most recent startup gate.
  const std::optional<ReconciliationReport>& lastReconciliation() const {
    return last_reconciliation_;
  }

 private:
  void loadSnapshot();
  void saveSnapshot();

  const ITimeProvider& clock_;
  const EngineConfig config_;

  IdGenerator event_ids_;
  IdGenerator reservation_ids_;

  EventBus bus_;

  InMemoryEventLedger event_ledger_;
  InMemoryReservationLedger reservation_ledger_;
  LedgerReconciler default_reconciler_;

  std::unique_ptr<ReservationService> service_;
  std::unique_ptr<ReconciliationWorker> worker_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_sub_;

  std::optional<ReconciliationReport> last_reconciliation_;
  bool running_{false};

  // Guards accepting_commands_ and, through it, every executeCommand() use
  // of service_.
  mutable std::shared_mutex command_mutex_;
  bool accepting_commands_{false};
};

}  // namespace rsvp
