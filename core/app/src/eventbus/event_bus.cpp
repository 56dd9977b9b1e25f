#include "rsvp/eventbus/event_bus.hpp"

#include <algorithm>

namespace rsvp {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const LedgerEvent& event) {
  std::vector<SubscriberEntry> copy;
  {
    // Copy under the lock, invoke outside it: a callback that publishes or
    // unsubscribes must not deadlock.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  for (const auto& [id, callback] : copy) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace rsvp
