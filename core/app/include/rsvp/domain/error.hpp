#pragma once

#include <string>
#include <utility>
#include <variant>

namespace rsvp {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorCode: every expected failure a reservation operation can report
// -----------------------------------------------------------------------------
//
// @details
//   NotFound               event (or the caller's reservation) does not exist
//   CapacityExceeded       event is full
//   AlreadyReserved        caller already holds a confirmed reservation
//   EventClosed            event is cancelled or completed
//   Unauthorized           caller is not the event's organizer
//   InvalidArgument        malformed input or out-of-range value
//   ReconciliationRequired ledgers temporarily disagree for this pair; the
//                          background worker will repair it, retry later
//   Infrastructure         a ledger write failed; nothing was applied
//
// Only ReconciliationRequired and Infrastructure are retriable. The rest are
// terminal for the same input.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  NotFound,
  CapacityExceeded,
  AlreadyReserved,
  EventClosed,
  Unauthorized,
  InvalidArgument,
  ReconciliationRequired,
  Infrastructure,
};

inline const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:               return "NotFound";
    case ErrorCode::CapacityExceeded:       return "CapacityExceeded";
    case ErrorCode::AlreadyReserved:        return "AlreadyReserved";
    case ErrorCode::EventClosed:            return "EventClosed";
    case ErrorCode::Unauthorized:           return "Unauthorized";
    case ErrorCode::InvalidArgument:        return "InvalidArgument";
    case ErrorCode::ReconciliationRequired: return "ReconciliationRequired";
    case ErrorCode::Infrastructure:         return "Infrastructure";
  }
  return "Unknown";
}

inline bool isRetriable(ErrorCode code) {
  return code == ErrorCode::ReconciliationRequired ||
         code == ErrorCode::Infrastructure;
}

struct Error {
  ErrorCode code{ErrorCode::Infrastructure};
  std::string message;
};

// -----------------------------------------------------------------------------
// Result<T>: value or Error
// -----------------------------------------------------------------------------
//
// @brief  Return type of every ReservationService operation. Expected
//         outcomes (full, duplicate, not found) travel here and are never
//         thrown.
//
// @details
// Implicitly constructible from either a T or an Error so operations can
// simply `return event;` or `return Error{ErrorCode::NotFound, "..."};`.
// value() / error() on the wrong alternative throw std::bad_variant_access.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : state_(std::move(value)) {}
  Result(Error error) : state_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(state_); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<T>(state_); }
  T& value() { return std::get<T>(state_); }

  const Error& error() const { return std::get<Error>(state_); }

  // Convenience for callers that only branch on the failure kind.
  ErrorCode code() const { return error().code; }

 private:
  std::variant<T, Error> state_;
};

}  // namespace domain
}  // namespace rsvp
