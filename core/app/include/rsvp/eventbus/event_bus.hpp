#pragma once

#include "rsvp/events/ledger_event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace rsvp {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish-subscribe channel for ledger events.
// ReservationService publishes after every applied (or rejected) operation;
// the IPC server, tests and any monitoring hook subscribe.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread, outside the bus
// mutex, so a callback may itself publish or unsubscribe. Publishing happens
// after the ledgers' locks are released; a slow subscriber delays only the
// caller that published.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const LedgerEvent&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published event.
  // Returns the id to pass to unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the published variant holds
  // EventType (e.g. ReservationConfirmedEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // After return, no later publish() invokes the callback. A publish already
  // in flight on another thread may still deliver its current event.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the event to every registered subscriber before returning.
  // -------------------------------------------------------------------------
  void publish(const LedgerEvent& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;   // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Typed subscribe: wrap in a generic callback that filters with std::get_if.
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const LedgerEvent& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace rsvp
