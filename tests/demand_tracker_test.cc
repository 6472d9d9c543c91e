#include <gtest/gtest.h>

#include <vector>

#include "../server/storage/demand_tracker.hh"

TEST(DemandTrackerTest, RecordsAndAccumulatesShortfall) {
    DemandTracker tracker;
    tracker.record_miss(7, 2);
    tracker.record_miss(7, 3);
    EXPECT_EQ(tracker.misses(7), 5);
    EXPECT_EQ(tracker.misses(8), 0);
}

TEST(DemandTrackerTest, IgnoresNonPositiveShortfall) {
    DemandTracker tracker;
    tracker.record_miss(1, 0);
    tracker.record_miss(2, -4);
    EXPECT_TRUE(tracker.isbns_in_demand().empty());
}

TEST(DemandTrackerTest, InDemandIsAscending) {
    DemandTracker tracker;
    tracker.record_miss(30, 1);
    tracker.record_miss(10, 1);
    tracker.record_miss(20, 4);
    EXPECT_EQ(tracker.isbns_in_demand(), (std::vector<int32_t>{10, 20, 30}));
}

TEST(DemandTrackerTest, ClearRemovesCounters) {
    DemandTracker tracker;
    tracker.record_miss(1, 1);
    tracker.record_miss(2, 1);
    tracker.clear(1);
    EXPECT_EQ(tracker.misses(1), 0);
    EXPECT_EQ(tracker.isbns_in_demand(), (std::vector<int32_t>{2}));
    tracker.clear_all();
    EXPECT_TRUE(tracker.isbns_in_demand().empty());
}
