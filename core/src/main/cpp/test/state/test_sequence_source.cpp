/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Unit tests for the UUIDv7 sequence source
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include <vector>
#include "state/sequence_source.h"
#include "test_helpers.h"

using namespace pollcache::state;
using pollcache::state::test::ManualClock;

class SequenceSourceTest : public ::testing::Test {
protected:
    ManualClock clock;
};

TEST_F(SequenceSourceTest, LayoutIsVersion7) {
    auto source = clock.source();
    auto id = source->next();

    EXPECT_EQ(id.data[6] >> 4, 7);            // version nibble
    EXPECT_EQ(id.data[8] & 0xC0, 0x80);       // RFC 4122/9562 variant
    EXPECT_EQ(uuid_v7_timestamp_ms(id), clock.now());
}

TEST_F(SequenceSourceTest, StrictlyIncreasingWithinOneMillisecond) {
    auto source = clock.source();
    auto prev = source->next();
    for (int i = 0; i < 10000; i++) {
        auto cur = source->next();
        ASSERT_TRUE(prev < cur) << "iteration " << i;
        EXPECT_EQ(uuid_v7_timestamp_ms(cur), clock.now());
        prev = cur;
    }
}

TEST_F(SequenceSourceTest, FollowsAdvancingClock) {
    auto source = clock.source();
    auto first = source->next();
    clock.advance(5);
    auto second = source->next();
    EXPECT_TRUE(first < second);
    EXPECT_EQ(uuid_v7_timestamp_ms(second) - uuid_v7_timestamp_ms(first), 5u);
}

TEST_F(SequenceSourceTest, SmallRollbackIsAbsorbed) {
    auto source = clock.source(1000);
    auto before = source->next();
    clock.rewind(500);
    auto after = source->next();

    EXPECT_TRUE(before < after);
    EXPECT_EQ(uuid_v7_timestamp_ms(after), uuid_v7_timestamp_ms(before));
}

TEST_F(SequenceSourceTest, LargeRollbackRestartsLower) {
    auto source = clock.source(1000);
    auto before = source->next();
    clock.rewind(5000);
    auto after = source->next();

    EXPECT_TRUE(after < before);
    EXPECT_EQ(uuid_v7_timestamp_ms(after), clock.now());

    // Growth resumes from the new position
    auto next = source->next();
    EXPECT_TRUE(after < next);
}

TEST_F(SequenceSourceTest, ZeroAllowanceStillMonotonicWithinMillisecond) {
    auto source = clock.source(0);
    auto a = source->next();
    auto b = source->next();
    EXPECT_TRUE(a < b);

    clock.rewind(1);
    auto c = source->next();
    EXPECT_TRUE(c < b);
}

TEST_F(SequenceSourceTest, NullClockRejected) {
    EXPECT_THROW(SystemSequenceSource{SystemSequenceSource::Clock()}, std::invalid_argument);
}

TEST_F(SequenceSourceTest, SystemSourceIsShared) {
    auto a = system_sequence_source();
    auto b = system_sequence_source();
    EXPECT_EQ(a.get(), b.get());

    auto id = a->next();
    uint64_t now = SystemSequenceSource::system_clock_ms();
    EXPECT_LE(uuid_v7_timestamp_ms(id), now + 1);
}

TEST_F(SequenceSourceTest, ConcurrentCallersGetDistinctOrderedValues) {
    auto source = clock.source();
    const int kThreads = 4;
    const int kPerThread = 5000;
    std::vector<std::vector<boost::uuids::uuid>> results(kThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&, t]() {
            results[t].reserve(kPerThread);
            for (int i = 0; i < kPerThread; i++) {
                results[t].push_back(source->next());
            }
        });
    }
    for (auto& th : threads) th.join();

    std::vector<boost::uuids::uuid> all;
    for (auto& r : results) {
        // Each thread sees its own values increase
        for (size_t i = 1; i < r.size(); i++) {
            ASSERT_TRUE(r[i - 1] < r[i]);
        }
        all.insert(all.end(), r.begin(), r.end());
    }
    std::sort(all.begin(), all.end());
    EXPECT_TRUE(std::adjacent_find(all.begin(), all.end()) == all.end());
}
