#include <gtest/gtest.h>
#include "auth/ip_reputation.hpp"
#include "test_util.hpp"

using namespace voxgate;
using std::chrono::minutes;

TEST(IPReputationTest, FiveFailuresBlockForFifteenMinutes) {
    testutil::ManualClock clock;
    audit::SecurityEventLog events;
    auth::IPReputationTracker tracker(events, {}, clock.now_fn());

    for (int i = 0; i < 4; i++) {
        EXPECT_FALSE(tracker.track_failure("10.0.0.1"));
    }
    EXPECT_FALSE(tracker.is_blocked("10.0.0.1"));

    EXPECT_TRUE(tracker.track_failure("10.0.0.1"));
    EXPECT_TRUE(tracker.is_blocked("10.0.0.1"));
    EXPECT_EQ(*tracker.blocked_until("10.0.0.1"), clock.now() + minutes(15));
    EXPECT_EQ(events.entries(audit::events::IP_BLOCKED).size(), 1u);

    clock.advance(minutes(15));
    EXPECT_FALSE(tracker.is_blocked("10.0.0.1"));
}

TEST(IPReputationTest, TenFailuresBlockForThirtyMinutes) {
    testutil::ManualClock clock;
    audit::SecurityEventLog events;
    auth::IPReputationTracker tracker(events, {}, clock.now_fn());

    for (int i = 0; i < 10; i++) {
        tracker.track_failure("10.0.0.2");
    }
    EXPECT_EQ(*tracker.blocked_until("10.0.0.2"), clock.now() + minutes(30));

    clock.advance(minutes(29));
    EXPECT_TRUE(tracker.is_blocked("10.0.0.2"));
    clock.advance(minutes(1));
    EXPECT_FALSE(tracker.is_blocked("10.0.0.2"));
}

TEST(IPReputationTest, FailuresOutsideWindowDoNotCount) {
    testutil::ManualClock clock;
    audit::SecurityEventLog events;
    auth::IPReputationTracker tracker(events, {}, clock.now_fn());

    for (int i = 0; i < 4; i++) {
        tracker.track_failure("10.0.0.3");
    }
    clock.advance(minutes(61));
    EXPECT_FALSE(tracker.track_failure("10.0.0.3"));
    EXPECT_EQ(tracker.failure_counts()["10.0.0.3"], 1u);
}

TEST(IPReputationTest, StaleHistoriesAreForgotten) {
    testutil::ManualClock clock;
    audit::SecurityEventLog events;
    auth::IPReputationTracker tracker(events, {}, clock.now_fn());

    for (int i = 0; i < 100; i++) {
        tracker.track_failure("192.0.2." + std::to_string(i));
    }
    EXPECT_EQ(tracker.tracked_count(), 100u);

    clock.advance(minutes(60));
    EXPECT_EQ(tracker.tracked_count(), 0u);
    EXPECT_TRUE(tracker.failure_counts().empty());
}

TEST(IPReputationTest, BlockedCountDropsExpiredEntries) {
    testutil::ManualClock clock;
    audit::SecurityEventLog events;
    auth::IPReputationTracker tracker(events, {}, clock.now_fn());

    for (int i = 0; i < 5; i++) {
        tracker.track_failure("a");
        tracker.track_failure("b");
    }
    tracker.track_failure("c");

    EXPECT_EQ(tracker.blocked_count(), 2u);
    clock.advance(minutes(16));
    EXPECT_EQ(tracker.blocked_count(), 0u);
    EXPECT_FALSE(tracker.is_blocked("c"));
}
