#include "rsvp/domain/json_codec.hpp"

#include <stdexcept>

namespace rsvp {
namespace domain {

void to_json(nlohmann::json& j, const Event& event) {
  j = nlohmann::json{
      {"id", event.id},
      {"organizer_id", event.organizer_id},
      {"title", event.title},
      {"description", event.description},
      {"location", event.location},
      {"category", eventCategoryToString(event.category)},
      {"scheduled_at_ms", event.scheduled_at_ms},
      {"capacity", event.capacity},
      {"current_attendees", event.current_attendees},
      {"attendees", event.attendees},
      {"status", eventStatusToString(event.status)},
      {"created_at_ms", event.created_at_ms},
      {"updated_at_ms", event.updated_at_ms},
  };
}

void from_json(const nlohmann::json& j, Event& event) {
  j.at("id").get_to(event.id);
  j.at("organizer_id").get_to(event.organizer_id);
  j.at("title").get_to(event.title);
  event.description = j.value("description", std::string{});
  j.at("location").get_to(event.location);

  const auto category =
      eventCategoryFromString(j.value("category", std::string{"other"}));
  if (!category) {
    throw std::invalid_argument("unknown event category: " +
                                j.value("category", std::string{}));
  }
  event.category = *category;

  j.at("scheduled_at_ms").get_to(event.scheduled_at_ms);
  j.at("capacity").get_to(event.capacity);
  event.attendees =
      j.value("attendees", std::set<UserId>{});
  event.current_attendees = static_cast<std::int32_t>(event.attendees.size());

  const auto status = eventStatusFromString(j.at("status").get<std::string>());
  if (!status) {
    throw std::invalid_argument("unknown event status: " +
                                j.at("status").get<std::string>());
  }
  event.status = *status;

  event.created_at_ms = j.value("created_at_ms", std::int64_t{0});
  event.updated_at_ms = j.value("updated_at_ms", event.created_at_ms);
}

void to_json(nlohmann::json& j, const Reservation& reservation) {
  j = nlohmann::json{
      {"id", reservation.id},
      {"user_id", reservation.user_id},
      {"event_id", reservation.event_id},
      {"status", reservationStatusToString(reservation.status)},
      {"created_at_ms", reservation.created_at_ms},
      {"notes", reservation.notes},
  };
  if (reservation.cancelled_at_ms) {
    j["cancelled_at_ms"] = *reservation.cancelled_at_ms;
  } else {
    j["cancelled_at_ms"] = nullptr;
  }
}

void from_json(const nlohmann::json& j, Reservation& reservation) {
  j.at("id").get_to(reservation.id);
  j.at("user_id").get_to(reservation.user_id);
  j.at("event_id").get_to(reservation.event_id);

  const auto status =
      reservationStatusFromString(j.at("status").get<std::string>());
  if (!status) {
    throw std::invalid_argument("unknown reservation status: " +
                                j.at("status").get<std::string>());
  }
  reservation.status = *status;

  j.at("created_at_ms").get_to(reservation.created_at_ms);
  reservation.notes = j.value("notes", std::string{});

  auto cancelled = j.find("cancelled_at_ms");
  if (cancelled != j.end() && !cancelled->is_null()) {
    reservation.cancelled_at_ms = cancelled->get<std::int64_t>();
  } else {
    reservation.cancelled_at_ms.reset();
  }
}

}  // namespace domain
}  // namespace rsvp
