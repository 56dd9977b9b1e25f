#pragma once

#include "rsvp/domain/event.hpp"
#include "rsvp/domain/reservation.hpp"

#include <nlohmann/json.hpp>

namespace rsvp {
namespace domain {

// -----------------------------------------------------------------------------
// JSON codec for domain records
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json ADL hooks so records convert with plain
//         `nlohmann::json j = event;` and `j.get<Event>()`.
//
// @details
// One wire shape is shared by the ledger snapshot, IPC responses and
// telemetry. Enums travel as their lower-case names ("upcoming",
// "confirmed", "workshop"). Timestamps are integer epoch milliseconds;
// an absent cancelled_at is written as null.
//
// from_json throws nlohmann::json::exception for missing keys / wrong types
// and std::invalid_argument for unknown enum names.
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Event& event);
void from_json(const nlohmann::json& j, Event& event);

void to_json(nlohmann::json& j, const Reservation& reservation);
void from_json(const nlohmann::json& j, Reservation& reservation);

}  // namespace domain
}  // namespace rsvp
