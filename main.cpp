// -----------------------------------------------------------------------------
// rsvp_engine: single executable entry point.
//
//   1) Load EngineConfig from the JSON file given as argv[1] (defaults apply
//      when no path is given).
//   2) Create a LiveTimeProvider (wall clock drives event lifecycles).
//   3) Create the ReservationEngine, attach logging subscribers, start it.
//      start() loads the ledger snapshot, runs the startup reconciliation
//      gate, and brings up the retry worker and the IPC server.
//   4) Idle on the main thread until SIGINT / SIGTERM.
//   5) Stop the engine (joins threads, writes the snapshot).
//
// Thread layout:
//   main thread       → start(), wait for shutdown, stop()
//   reconcile thread  → pending-release retries
//   ipc thread        → JSON commands (REP) + telemetry (PUB)
// -----------------------------------------------------------------------------

#include "rsvp/config/config_loader.hpp"
#include "rsvp/engine/reservation_engine.hpp"
#include "rsvp/events/event_types.hpp"
#include "rsvp/ledger/store_error.hpp"
#include "rsvp/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag set by the signal handler. Lock-free atomic store only.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_stop_requested{false};

static void signal_handler(int /*signum*/) { g_stop_requested.store(true); }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  rsvp::EngineConfig config;
  if (argc > 1) {
    try {
      config = rsvp::ConfigLoader::loadFromFile(argv[1]);
    } catch (const rsvp::ConfigError& e) {
      std::cerr << "[main] CRITICAL: " << e.what() << "\n";
      return 1;
    }
  } else {
    std::cout << "[main] No config file given, using defaults.\n";
  }

  // -------------------------------------------------------------------------
  // 2) Clock and engine
  // -------------------------------------------------------------------------
  rsvp::LiveTimeProvider clock;
  rsvp::ReservationEngine engine(clock, config);

  engine.eventBus().subscribe<rsvp::ReservationConfirmedEvent>(
      [](const rsvp::ReservationConfirmedEvent& e) {
        std::cout << "[Reservation] confirmed event=" << e.reservation.event_id
                  << " user=" << e.reservation.user_id
                  << " spots_left=" << e.available_spots << "\n";
      });

  engine.eventBus().subscribe<rsvp::ReservationCancelledEvent>(
      [](const rsvp::ReservationCancelledEvent& e) {
        std::cout << "[Reservation] cancelled event=" << e.reservation.event_id
                  << " user=" << e.reservation.user_id
                  << " spots_left=" << e.available_spots << "\n";
      });

  engine.eventBus().subscribe<rsvp::ReconciliationRequiredEvent>(
      [](const rsvp::ReconciliationRequiredEvent& e) {
        std::cerr << "[Reservation] WARNING: reconciliation required event="
                  << e.event_id << " user=" << e.user_id
                  << " reason=" << e.reason << "\n";
      });

  try {
    engine.start();
  } catch (const rsvp::StoreError& e) {
    std::cerr << "[main] CRITICAL: cannot start engine: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] CRITICAL: cannot start engine: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Wait for shutdown
  // -------------------------------------------------------------------------
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  std::cout << "[main] Engine running. Send JSON commands to "
            << config.ipc_cmd_endpoint << ", e.g. {\"op\":\"ping\"}\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 4) Clean shutdown
  // -------------------------------------------------------------------------
  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
