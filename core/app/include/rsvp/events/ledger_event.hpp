#pragma once

#include "rsvp/events/event_types.hpp"

#include <variant>

namespace rsvp {

// -----------------------------------------------------------------------------
// LedgerEvent (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by EventBus. Subscribers dispatch with
// std::get_if or the typed EventBus::subscribe<T>(). Adding a kind means
// adding it here and to IpcServer::formatTelemetry().
// -----------------------------------------------------------------------------
using LedgerEvent = std::variant<
    ReservationConfirmedEvent,
    ReservationCancelledEvent,
    JoinRejectedEvent,
    ReconciliationRequiredEvent,
    ReconciliationResolvedEvent,
    EventUpdatedEvent>;

}  // namespace rsvp
