/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Unit tests for the conditional read decision
 */

#include <gtest/gtest.h>
#include "state/conditional_read.h"
#include "test_helpers.h"

using namespace pollcache::state;
using pollcache::state::test::ManualClock;

class ConditionalReadTest : public ::testing::Test {
protected:
    void SetUp() override {
        stamp = std::make_unique<VersionStamp>(clock.source());
        current = stamp->token();
    }

    ManualClock clock;
    std::unique_ptr<VersionStamp> stamp;
    VersionToken current;
};

TEST_F(ConditionalReadTest, NoPriorValueIsFull) {
    EXPECT_EQ(evaluate_poll(current, PollRequest::fresh()), ReadOutcome::Full);
}

TEST_F(ConditionalReadTest, PartialPriorValueIsFull) {
    PollRequest only_method;
    only_method.method_uuid = current.method_uuid;
    EXPECT_EQ(evaluate_poll(current, only_method), ReadOutcome::Full);

    PollRequest only_data;
    only_data.data_uuid = current.data_uuid;
    EXPECT_EQ(evaluate_poll(current, only_data), ReadOutcome::Full);
}

TEST_F(ConditionalReadTest, MatchingTokenIsUnchanged) {
    EXPECT_EQ(evaluate_poll(current, PollRequest::since(current)), ReadOutcome::Unchanged);
}

TEST_F(ConditionalReadTest, OlderSequenceIsFull) {
    VersionToken seen = current;
    clock.advance(1);
    stamp->increment();
    VersionToken now = stamp->token();

    ASSERT_EQ(seen.method_uuid, now.method_uuid);
    EXPECT_EQ(evaluate_poll(now, PollRequest::since(seen)), ReadOutcome::Full);
}

TEST_F(ConditionalReadTest, DifferentInstanceIsFullEvenWithSameSequence) {
    // e.g. the daemon restarted and happened to land on the same data value
    PollRequest req = PollRequest::since(current);
    req.method_uuid = VersionStamp(clock.source()).instance_token();
    EXPECT_EQ(evaluate_poll(current, req), ReadOutcome::Full);
}

TEST_F(ConditionalReadTest, GarbageTokenIsFull) {
    PollRequest req;
    req.method_uuid = "not-a-token";
    req.data_uuid = "";
    EXPECT_EQ(evaluate_poll(current, req), ReadOutcome::Full);
}

TEST_F(ConditionalReadTest, OutcomeNames) {
    EXPECT_STREQ(readOutcomeToString(ReadOutcome::Full), "Full");
    EXPECT_STREQ(readOutcomeToString(ReadOutcome::Unchanged), "Unchanged");
}
