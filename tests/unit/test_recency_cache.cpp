#include "infrastructure/cache/recency_cache.hpp"

#include <gtest/gtest.h>

using infrastructure::cache::RecencyCache;

static domain::Reading make_reading(const std::string& sensor, double temperature, int minutesAgo = 0) {
    domain::Reading r;
    r.sensorId = sensor;
    r.temperature = temperature;
    r.timestamp = domain::nowTimestamp() - std::chrono::minutes(minutesAgo);
    return r;
}

TEST(RecencyCache, EmptyCache) {
    RecencyCache cache(4);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.capacity(), 4u);
    EXPECT_TRUE(cache.mostRecent(10).empty());
}

TEST(RecencyCache, EvictsLeastRecentlyInserted) {
    RecencyCache cache(3);
    cache.record(make_reading("A", 1.0));
    cache.record(make_reading("B", 2.0));
    cache.record(make_reading("C", 3.0));
    cache.record(make_reading("D", 4.0));

    auto recent = cache.mostRecent(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].sensorId, "D");
    EXPECT_EQ(recent[1].sensorId, "C");
    EXPECT_EQ(recent[2].sensorId, "B");
    EXPECT_EQ(cache.size(), 3u);
}

TEST(RecencyCache, CapacityPlusOneEvictsExactlyTheFirst) {
    RecencyCache cache(5);
    for (int i = 0; i < 6; ++i) {
        cache.record(make_reading("s" + std::to_string(i), i));
    }

    auto all = cache.mostRecent(100);
    ASSERT_EQ(all.size(), 5u);
    for (const auto& r : all) {
        EXPECT_NE(r.sensorId, "s0");
    }
    EXPECT_EQ(all.back().sensorId, "s1");
}

TEST(RecencyCache, SizeNeverExceedsCapacity) {
    RecencyCache cache(7);
    for (int i = 0; i < 100; ++i) {
        cache.record(make_reading("s", i % 40));
        EXPECT_LE(cache.size(), 7u);
    }
    EXPECT_EQ(cache.size(), 7u);
}

TEST(RecencyCache, EvictionIgnoresReadingTimestamp) {
    RecencyCache cache(2);
    cache.record(make_reading("newest-timestamp", 1.0, 0));
    cache.record(make_reading("old-timestamp", 2.0, 120));
    cache.record(make_reading("third", 3.0, 60));

    // 按写入顺序淘汰：第一条写入的被淘汰，即使它的时间戳最新
    auto recent = cache.mostRecent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].sensorId, "third");
    EXPECT_EQ(recent[1].sensorId, "old-timestamp");
}

TEST(RecencyCache, DoesNotDeduplicate) {
    RecencyCache cache(4);
    auto reading = make_reading("same", 20.0);
    cache.record(reading);
    cache.record(reading);
    cache.record(reading);
    EXPECT_EQ(cache.size(), 3u);
}

TEST(RecencyCache, MostRecentLimits) {
    RecencyCache cache(4);
    cache.record(make_reading("a", 1.0));
    cache.record(make_reading("b", 2.0));

    EXPECT_TRUE(cache.mostRecent(0).empty());
    EXPECT_TRUE(cache.mostRecent(-3).empty());
    EXPECT_EQ(cache.mostRecent(1).size(), 1u);
    EXPECT_EQ(cache.mostRecent(1)[0].sensorId, "b");
    EXPECT_EQ(cache.mostRecent(50).size(), 2u);
}

TEST(RecencyCache, ReadsDoNotChangeEvictionOrder) {
    RecencyCache cache(3);
    cache.record(make_reading("A", 1.0));
    cache.record(make_reading("B", 2.0));
    cache.record(make_reading("C", 3.0));

    // 读操作不算访问
    cache.mostRecent(3);
    cache.snapshotSince(domain::Timestamp{});

    cache.record(make_reading("D", 4.0));
    auto recent = cache.mostRecent(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[2].sensorId, "B");
}

TEST(RecencyCache, SnapshotSinceFiltersByTimestamp) {
    RecencyCache cache(10);
    cache.record(make_reading("old", 10.0, 90));
    cache.record(make_reading("mid", 20.0, 30));
    cache.record(make_reading("new", 30.0, 1));

    auto cutoff = domain::nowTimestamp() - std::chrono::minutes(60);
    auto snapshot = cache.snapshotSince(cutoff);
    ASSERT_EQ(snapshot.size(), 2u);
    for (const auto& r : snapshot) {
        EXPECT_GE(r.timestamp, cutoff);
    }
}

TEST(RecencyCache, SnapshotSinceCanBeEmptyWhileHoldingData) {
    RecencyCache cache(3);
    cache.record(make_reading("stale", 10.0, 500));
    EXPECT_TRUE(cache.snapshotSince(domain::nowTimestamp() - std::chrono::minutes(60)).empty());
    EXPECT_EQ(cache.size(), 1u);
}

TEST(RecencyCache, ClearEmptiesCache) {
    RecencyCache cache(3);
    cache.record(make_reading("a", 1.0));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    cache.record(make_reading("b", 2.0));
    EXPECT_EQ(cache.mostRecent(5).size(), 1u);
}
