#pragma once

#include <atomic>
#include <cstdint>

namespace rsvp {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing record id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique uint64 ids for events and reservations via an
//         atomic counter.
//
// @details
// Starts at 1; id 0 is reserved as the "unset" sentinel. Joins on many
// threads each take a reservation id without any lock. memory_order_relaxed
// is sufficient: the only requirement is that each call returns a distinct
// value.
//
// After a snapshot is loaded, advance_past() lifts the counter above the
// highest id on record so restored and newly created records never collide.
//
// Thread model:
//   next_id() and advance_past() are safe to call concurrently.
//
// Ownership:
//   Owned by ReservationEngine as a value member (one per record kind) and
//   lent by reference to ReservationService and LedgerSnapshot.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // @brief  Returns the next unique id. Values start at 1.
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // advance_past(id)
  // -------------------------------------------------------------------------
  // @brief  Guarantees every later next_id() returns a value greater than id.
  //
  // @details
  // CAS loop so a concurrent next_id() is never moved backwards.
  // -------------------------------------------------------------------------
  void advance_past(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

  // @brief  The value the next call to next_id() would return.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace rsvp
