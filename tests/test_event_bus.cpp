// Event bus unit tests

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "transcode_queue/events.hpp"

namespace transcode_queue {
namespace {

TEST(EventBusTest, DeliversToAllSubscribers) {
  EventBus bus;
  std::vector<std::string> a, b;
  bus.subscribe([&](const JobEvent &e) { a.push_back(e.job_id); });
  bus.subscribe([&](const JobEvent &e) { b.push_back(e.job_id); });

  bus.publish({EventKind::JOB_STARTED, "j1"});
  EXPECT_EQ(a, std::vector<std::string>{"j1"});
  EXPECT_EQ(b, std::vector<std::string>{"j1"});
  EXPECT_EQ(bus.subscriber_count(), 2u);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
  EventBus bus;
  int calls = 0;
  size_t token = bus.subscribe([&](const JobEvent &) { ++calls; });
  bus.publish({EventKind::QUEUE_UPDATED});
  EXPECT_TRUE(bus.unsubscribe(token));
  EXPECT_FALSE(bus.unsubscribe(token));
  bus.publish({EventKind::QUEUE_UPDATED});
  EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
  EventBus bus;
  int calls = 0;
  bus.subscribe([](const JobEvent &) { throw std::runtime_error("boom"); });
  bus.subscribe([&](const JobEvent &) { ++calls; });
  bus.publish({EventKind::JOB_FAILED, "j1"});
  EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, HandlerMayResubscribe) {
  EventBus bus;
  int nested = 0;
  bus.subscribe([&](const JobEvent &) {
    bus.subscribe([&](const JobEvent &) { ++nested; });
  });
  bus.publish({EventKind::QUEUE_UPDATED});
  EXPECT_EQ(nested, 0);
  EXPECT_EQ(bus.subscriber_count(), 2u);
}

TEST(EventBusTest, KindNames) {
  EXPECT_STREQ(to_string(EventKind::ALL_COMPLETED), "all_completed");
  EXPECT_STREQ(to_string(EventKind::WORKER_ERROR), "worker_error");
}

} // namespace
} // namespace transcode_queue
