#pragma once

#include <cstdint>

namespace rsvp {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts the concept of "current time"
//         away from std::chrono::system_clock.
//
// @details
// Every time-sensitive decision in the reservation engine reads "now" through
// this interface: the lifecycle evaluator (upcoming / ongoing / completed),
// the capacity gate (an event that has completed no longer accepts joins),
// and the createdAt / cancelledAt stamps on reservations.
//
// Two implementations are injected depending on context:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set explicitly by the caller,
//                              so tests can walk an event from upcoming to
//                              completed without sleeping.
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a timestamp.
//
// Ledger records, JSON snapshots and IPC payloads all carry integer epoch
// milliseconds.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   Writers (e.g. SimulationTimeProvider::advance_time) must synchronize
//   with readers internally (e.g. via std::atomic).
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch
  //         (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace rsvp
