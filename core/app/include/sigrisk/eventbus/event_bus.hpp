#pragma once

#include "sigrisk/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace sigrisk {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel. Subscribers register callbacks;
// publish() invokes every matching subscriber synchronously on the calling
// thread.
//
// In the engine each EventLoopThread owns one bus, so callbacks registered
// on the risk loop's bus run on the risk thread only.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// publish() copies the subscriber list under the lock and invokes callbacks
// without holding it, so a callback may publish or unsubscribe.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback invoked for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the published variant holds an
  // EventType. Implemented as a generic subscriber that filters with
  // std::get_if.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes the subscription. Unknown ids are ignored. A publish() already in
  // progress may still deliver the current event to it.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriber_count() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace sigrisk
