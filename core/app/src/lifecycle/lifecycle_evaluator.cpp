#include "rsvp/lifecycle/lifecycle_evaluator.hpp"

#include <algorithm>

namespace rsvp {

using domain::EventStatus;

EventStatus LifecycleEvaluator::deriveStatus(std::int64_t scheduled_at_ms,
                                             std::int64_t duration_hint_ms,
                                             std::int64_t now_ms) {
  if (now_ms < scheduled_at_ms) {
    return EventStatus::Upcoming;
  }
  const std::int64_t hint = std::max<std::int64_t>(duration_hint_ms, 0);
  // Compare as elapsed time to stay clear of overflow on far-future schedules.
  if (now_ms - scheduled_at_ms < hint) {
    return EventStatus::Ongoing;
  }
  return EventStatus::Completed;
}

EventStatus LifecycleEvaluator::evaluate(const domain::Event& event,
                                         std::int64_t duration_hint_ms,
                                         std::int64_t now_ms) {
  if (event.status == EventStatus::Cancelled) {
    return EventStatus::Cancelled;
  }
  return deriveStatus(event.scheduled_at_ms, duration_hint_ms, now_ms);
}

bool LifecycleEvaluator::acceptsReservations(EventStatus status) {
  return status == EventStatus::Upcoming || status == EventStatus::Ongoing;
}

}  // namespace rsvp
