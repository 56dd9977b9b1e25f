#pragma once

#include "rsvp/concurrent/id_generator.hpp"
#include "rsvp/ledger/i_event_ledger.hpp"
#include "rsvp/ledger/i_reservation_ledger.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// LedgerSnapshot: JSON persistence of both ledgers
// -----------------------------------------------------------------------------
//
// @brief  Writes the full contents of the event and reservation ledgers to a
//         single JSON document and reads it back.
//
// @details
// Document layout:
//
//   {
//     "version": 1,
//     "saved_at_ms": <int64>,
//     "events":       [ <Event JSON>, ... ],
//     "reservations": [ <Reservation JSON>, ... ]
//   }
//
// save() writes `<path>.tmp` and renames it over `<path>`, so a crash
// mid-write leaves the previous snapshot intact.
//
// load() replaces both ledgers' contents and advances the id generators past
// the highest loaded ids. The two ledgers are NOT cross-checked here; the
// engine runs LedgerReconciler right after loading.
//
// Failure model:
//   Any I/O, parse or shape error throws StoreError. A failed load leaves the
//   ledgers untouched.
//
// Thread model:
//   Called by ReservationEngine during start() and stop(), when no request
//   is in flight.
// -----------------------------------------------------------------------------
class LedgerSnapshot {
 public:
  static constexpr int kFormatVersion = 1;

  struct LoadSummary {
    std::size_t events{0};
    std::size_t reservations{0};
    std::int64_t saved_at_ms{0};
  };

  static void save(const std::string& path, const IEventLedger& events,
                   const IReservationLedger& reservations,
                   std::int64_t saved_at_ms);

  static LoadSummary load(const std::string& path, IEventLedger& events,
                          IReservationLedger& reservations,
                          IdGenerator& event_ids,
                          IdGenerator& reservation_ids);
};

}  // namespace rsvp
