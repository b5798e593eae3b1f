// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for turf::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every notification type
//   - Typed subscription receives only the matching type
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - Payload fields survive the variant dispatch path
//   - Subscribe/unsubscribe from inside a callback affect later events only
//
// All tests are single-threaded. Delivery from evaluator worker threads is
// covered in forward_chaining_evaluator_test.cpp.
// =============================================================================

#include "turf/eventbus/event_bus.hpp"
#include "turf/events/event.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  turf::EventBus bus;

  static turf::FoldStateEvent makeTransition(std::size_t fold,
                                             turf::FoldState from,
                                             turf::FoldState to) {
    turf::FoldStateEvent e;
    e.fold_index = fold;
    e.from = from;
    e.to = to;
    return e;
  }

  static turf::FoldSkippedEvent makeSkipped(std::size_t fold) {
    turf::FoldSkippedEvent e;
    e.fold_index = fold;
    e.reason = "empty training window";
    e.test_start_ms = 86400000;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every notification type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const turf::EngineEvent&) { ++call_count; });

  bus.publish(makeTransition(0, turf::FoldState::Idle, turf::FoldState::Training));
  bus.publish(makeSkipped(1));
  bus.publish(turf::NumericalIncidentEvent{});
  bus.publish(turf::RatingPassEvent{});

  EXPECT_EQ(call_count, 4);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int skipped_count = 0;
  bus.subscribe<turf::FoldSkippedEvent>(
      [&skipped_count](const turf::FoldSkippedEvent&) { ++skipped_count; });

  bus.publish(makeSkipped(0));
  bus.publish(makeTransition(1, turf::FoldState::Idle, turf::FoldState::Training));
  bus.publish(turf::RatingPassEvent{});

  EXPECT_EQ(skipped_count, 1);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id), the callback no longer fires.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<turf::FoldSkippedEvent>(
      [&call_count](const turf::FoldSkippedEvent&) { ++call_count; });

  bus.publish(makeSkipped(0));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeSkipped(1));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 4. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdAndPublishToEmptyBus) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeSkipped(0)));
}

// -----------------------------------------------------------------------------
// 5. A subscriber may publish from inside its callback.
// Why: the evaluator's subscribers (the CLI logger, tests) react to one
//      notification by emitting another; holding the lock across callbacks
//      would hang here.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::vector<std::size_t> skipped;

  bus.subscribe<turf::FoldSkippedEvent>(
      [&skipped](const turf::FoldSkippedEvent& e) {
        skipped.push_back(e.fold_index);
      });

  // A Skipped transition is re-announced as a FoldSkippedEvent.
  bus.subscribe<turf::FoldStateEvent>([this](const turf::FoldStateEvent& e) {
    if (e.to == turf::FoldState::Skipped) {
      bus.publish(makeSkipped(e.fold_index));
    }
  });

  bus.publish(makeTransition(3, turf::FoldState::Idle, turf::FoldState::Skipped));
  bus.publish(makeTransition(4, turf::FoldState::Idle, turf::FoldState::Training));

  EXPECT_EQ(skipped, (std::vector<std::size_t>{3}));
}

// -----------------------------------------------------------------------------
// 6. Field values survive publish -> dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  turf::NumericalIncidentEvent received;

  bus.subscribe<turf::NumericalIncidentEvent>(
      [&received](const turf::NumericalIncidentEvent& e) { received = e; });

  turf::NumericalIncidentEvent sent;
  sent.fold_index = 2;
  sent.event_id = 1042;
  sent.reason = "non-finite score";
  bus.publish(sent);

  ASSERT_TRUE(received.fold_index.has_value());
  EXPECT_EQ(*received.fold_index, 2u);
  EXPECT_EQ(received.event_id, 1042u);
  EXPECT_EQ(received.reason, "non-finite score");
}

// -----------------------------------------------------------------------------
// 7. Callbacks run in subscription order; a subscriber may unsubscribe itself
//    mid-delivery, and one added mid-delivery first hears the next event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriptionChangesDuringDelivery) {
  std::vector<std::string> calls;
  turf::EventBus::SubscriptionId once = 0;

  once = bus.subscribe<turf::FoldSkippedEvent>(
      [this, &calls, &once](const turf::FoldSkippedEvent&) {
        calls.push_back("once");
        bus.unsubscribe(once);
      });
  bool added = false;
  bus.subscribe<turf::FoldSkippedEvent>(
      [this, &calls, &added](const turf::FoldSkippedEvent&) {
        calls.push_back("steady");
        if (!added) {
          added = true;
          bus.subscribe<turf::FoldSkippedEvent>(
              [&calls](const turf::FoldSkippedEvent&) {
                calls.push_back("late");
              });
        }
      });

  bus.publish(makeSkipped(0));
  EXPECT_EQ(calls, (std::vector<std::string>{"once", "steady"}));
  EXPECT_EQ(bus.subscriberCount(), 2u);

  calls.clear();
  bus.publish(makeSkipped(1));
  EXPECT_EQ(calls, (std::vector<std::string>{"steady", "late"}));
}
