#include "turf/eventbus/event_bus.hpp"

#include <algorithm>

namespace turf {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  // Same mutex as publish(): evaluator workers may be publishing while a
  // subscriber registers.
  std::lock_guard lock(mutex_);

  // Ids are never reused within one bus; unsubscribe() keys on them.
  SubscriptionId id = next_id_++;

  // The callback is moved in: it may own captured state (a report sink, a
  // progress counter) that should not be copied.
  subscribers_.emplace_back(id, std::move(callback));

  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);

  // Erase-remove: at most one entry matches. An unknown id is a no-op.
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const EngineEvent& event) {
  std::vector<SubscriberEntry> copy;

  {
    // The lock covers the copy only. Callbacks run unlocked, so a subscriber
    // may call cancel(), publish() or unsubscribe() from inside its handler.
    // A subscriber added during this call first hears the next event.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  // Delivery order is subscription order. Callbacks run on the publishing
  // thread; with a worker pool that is whichever worker finished the fold.
  for (const auto& [id, callback] : copy) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace turf
