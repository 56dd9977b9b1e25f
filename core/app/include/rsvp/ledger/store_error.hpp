#pragma once

#include <stdexcept>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// StoreError: a ledger could not apply or persist a write
// -----------------------------------------------------------------------------
//
// @brief  Raised by ledger implementations and LedgerSnapshot for faults of
//         the store itself (I/O failure, corrupt snapshot, a write that could
//         not be applied). Expected outcomes such as "event full" are never
//         reported this way; they come back as SlotOutcome / InsertOutcome
//         values.
//
// @details
// ReservationService catches StoreError, compensates any partial effect, and
// surfaces it to the caller as ErrorCode::Infrastructure (or
// ReconciliationRequired when compensation itself failed).
// -----------------------------------------------------------------------------
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace rsvp
