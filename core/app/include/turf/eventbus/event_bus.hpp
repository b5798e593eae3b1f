#pragma once

#include "turf/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace turf {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish-subscribe channel for engine
// notifications (fold lifecycle, skipped folds, numerical incidents, rating
// passes). The evaluator and RaceEngine publish; the CLI and tests
// subscribe.
//
// The bus only observes. No component reads its own state back through it,
// so a run without subscribers behaves identically.
//
// Thread model: subscribe, unsubscribe and publish are safe from any
// thread. Callbacks run synchronously on the publishing thread, which for
// fold events is a worker thread. Callbacks must therefore be thread-safe
// when worker_threads > 1.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const EngineEvent&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the published variant holds an
  // EventType, e.g. subscribe<FoldSkippedEvent>(...).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // A publish() already in flight on another thread may still invoke the
  // callback once; later publishes will not.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every subscriber before returning. The subscriber list is copied
  // under the lock and the callbacks run without it, so a callback may
  // publish or unsubscribe without deadlocking.
  // -------------------------------------------------------------------------
  void publish(const EngineEvent& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const EngineEvent& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace turf
