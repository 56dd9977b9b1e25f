#pragma once

#include "rsvp/domain/reservation_limits.hpp"

#include <cstdint>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// EngineConfig: everything ReservationEngine needs to start
// -----------------------------------------------------------------------------
//
// @details
//   limits                 validation bounds and lifecycle duration hint
//   ipc_cmd_endpoint       REP socket; empty disables the IPC server
//   ipc_pub_endpoint       PUB socket; empty disables the IPC server
//   snapshot_path          ledger snapshot file; empty disables persistence
//   reconcile_interval_ms  period of the pending-release retry worker
//
// Built by ConfigLoader from JSON, or directly by tests.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::ReservationLimits limits;

  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  std::string snapshot_path;

  std::int64_t reconcile_interval_ms{1000};
};

}  // namespace rsvp
