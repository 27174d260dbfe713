/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Tests for PolledCategory / PolledRegistry - versioned state with
 * conditional reads
 */

#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include "state/polled_category.hpp"
#include "test_helpers.h"

using namespace pollcache::state;
using pollcache::state::test::Entry;
using pollcache::state::test::ManualClock;

namespace {

struct StatusData {
    std::string status = "DISABLED";
    std::string info = "INITIALIZING";
};

std::string renderStatus(const StatusData& d) {
    return d.status + ":" + d.info;
}

std::vector<std::string> renderAliases(const SlabRegistry<Entry>& reg) {
    std::vector<std::string> out;
    for (auto [i, e] : reg) {
        out.push_back(e.alias);
    }
    return out;
}

} // namespace

class PolledCategoryTest : public ::testing::Test {
protected:
    ManualClock clock;
};

TEST_F(PolledCategoryTest, PollerScenario) {
    PolledCategory<StatusData> status("status", clock.source());

    // Writer sets state, stamp S0
    status.mutate([](StatusData& d) { d.status = "OK"; d.info = "all links up"; });
    VersionToken s0 = status.token();

    // First poll with no prior stamp: full payload + S0
    auto r1 = status.poll(PollRequest::fresh(), renderStatus);
    EXPECT_EQ(r1.outcome, ReadOutcome::Full);
    ASSERT_TRUE(r1.payload.has_value());
    EXPECT_EQ(*r1.payload, "OK:all links up");
    EXPECT_EQ(r1.header, s0);

    // Writer mutates, stamp S1
    clock.advance(1);
    status.mutate([](StatusData& d) { d.info = "50% degraded"; });
    VersionToken s1 = status.token();
    EXPECT_EQ(s1.method_uuid, s0.method_uuid);
    EXPECT_NE(s1.data_uuid, s0.data_uuid);

    // Re-poll with S0: full payload + S1
    auto r2 = status.poll(PollRequest::since(r1.header), renderStatus);
    EXPECT_EQ(r2.outcome, ReadOutcome::Full);
    ASSERT_TRUE(r2.payload.has_value());
    EXPECT_EQ(*r2.payload, "OK:50% degraded");
    EXPECT_EQ(r2.header, s1);

    // Re-poll with S1: unchanged, no payload, same stamp
    auto r3 = status.poll(PollRequest::since(r2.header), renderStatus);
    EXPECT_TRUE(r3.unchanged());
    EXPECT_FALSE(r3.payload.has_value());
    EXPECT_EQ(r3.header, s1);

    auto stats = status.stats();
    EXPECT_EQ(stats.polls, 3u);
    EXPECT_EQ(stats.unchanged_polls, 1u);
    EXPECT_EQ(stats.mutations, 2u);
}

TEST_F(PolledCategoryTest, RenderOnlyCalledForFullReads) {
    PolledCategory<StatusData> status("status", clock.source());
    int renders = 0;
    auto render = [&](const StatusData& d) { renders++; return d.status; };

    auto first = status.poll(PollRequest::fresh(), render);
    for (int i = 0; i < 10; i++) {
        auto again = status.poll(PollRequest::since(first.header), render);
        EXPECT_TRUE(again.unchanged());
    }
    EXPECT_EQ(renders, 1);
}

TEST_F(PolledCategoryTest, ThrowingMutationStillAdvancesStamp) {
    PolledCategory<StatusData> status("status", clock.source());
    auto cached = status.poll(PollRequest::fresh(), renderStatus);

    // Half-applied change: the status is written before the failure
    EXPECT_THROW(status.mutate([](StatusData& d) {
                     d.status = "OK";
                     throw std::runtime_error("link check failed");
                 }),
                 std::runtime_error);

    auto again = status.poll(PollRequest::since(cached.header), renderStatus);
    EXPECT_FALSE(again.unchanged());
    ASSERT_TRUE(again.payload.has_value());
    EXPECT_EQ(*again.payload, "OK:INITIALIZING");
    EXPECT_NE(again.header, cached.header);
    EXPECT_EQ(status.stats().mutations, 1u);
}

TEST_F(PolledCategoryTest, ThrowingMutateIfStillAdvancesStamp) {
    PolledCategory<StatusData> status("status", clock.source());
    VersionToken before = status.token();

    EXPECT_THROW(status.mutate_if([](StatusData& d) -> bool {
                     d.info = "partial";
                     throw std::runtime_error("boom");
                 }),
                 std::runtime_error);
    EXPECT_NE(status.token(), before);
}

TEST_F(PolledCategoryTest, MutateReturnsByValue) {
    PolledCategory<StatusData> status("status", clock.source());

    auto copy = status.mutate([](StatusData& d) -> StatusData& {
        d.status = "OK";
        return d;
    });
    static_assert(std::is_same<decltype(copy), StatusData>::value,
                  "mutate must not hand out references into guarded data");
    EXPECT_EQ(copy.status, "OK");

    copy.status = "changed outside the lock";
    EXPECT_EQ(status.read([](const StatusData& d) { return d.status; }), "OK");
}

TEST_F(PolledCategoryTest, MutateIfOnlyAdvancesOnChange) {
    PolledCategory<StatusData> status("status", clock.source());
    VersionToken before = status.token();

    EXPECT_FALSE(status.mutate_if([](StatusData&) { return false; }));
    EXPECT_EQ(status.token(), before);

    EXPECT_TRUE(status.mutate_if([](StatusData& d) { d.status = "DOWN"; return true; }));
    EXPECT_NE(status.token(), before);
    EXPECT_EQ(status.read([](const StatusData& d) { return d.status; }), "DOWN");
}

TEST_F(PolledCategoryTest, ClockRegressionForcesFullRefresh) {
    PolledCategory<StatusData> status("status", clock.source(0));
    auto first = status.poll(PollRequest::fresh(), renderStatus);

    clock.rewind(60000);
    status.mutate([](StatusData& d) { d.status = "OK"; });

    auto after = status.poll(PollRequest::since(first.header), renderStatus);
    EXPECT_EQ(after.outcome, ReadOutcome::Full);
    EXPECT_NE(after.header.method_uuid, first.header.method_uuid);
    EXPECT_EQ(status.stamp().epoch_state(), EpochState::Resynced);
}

TEST_F(PolledCategoryTest, CategoriesAreIndependent) {
    PolledCategory<StatusData> links("links", clock.source());
    PolledCategory<StatusData> packages("packages", clock.source());

    EXPECT_NE(links.token().method_uuid, packages.token().method_uuid);

    VersionToken pkg_before = packages.token();
    links.mutate([](StatusData& d) { d.status = "OK"; });
    EXPECT_EQ(packages.token(), pkg_before);
}

TEST_F(PolledCategoryTest, InvalidConfigRejected) {
    StateConfig bad;
    bad.registry_max_slots = 0;
    EXPECT_THROW(PolledCategory<StatusData>("bad", bad), std::invalid_argument);
    EXPECT_NO_THROW(PolledCategory<StatusData>("good", StateConfig()));
}

class PolledRegistryTest : public ::testing::Test {
protected:
    ManualClock clock;
};

TEST_F(PolledRegistryTest, InsertLookupErase) {
    PolledRegistry<Entry> links("links", clock.source());
    VersionToken t0 = links.token();

    auto a = links.insert(Entry("mainnet-1"));
    auto b = links.insert(Entry("mainnet-2"));
    EXPECT_EQ(links.size(), 2u);
    VersionToken t1 = links.token();
    EXPECT_NE(t1, t0);

    std::string seen;
    EXPECT_TRUE(links.lookup(b, [&](const Entry& e) { seen = e.alias; }));
    EXPECT_EQ(seen, "mainnet-2");

    auto removed = links.erase(a);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->alias, "mainnet-1");
    EXPECT_FALSE(removed->slab_index().has_value());
    VersionToken t2 = links.token();
    EXPECT_NE(t2, t1);

    // A cached index for a removed element is a miss, not an error
    EXPECT_FALSE(links.lookup(a, [&](const Entry&) { FAIL(); }));

    // Misses do not advance the stamp
    EXPECT_FALSE(links.erase(a).has_value());
    EXPECT_FALSE(links.update(a, [](Entry& e) { e.value = 1; }));
    EXPECT_EQ(links.token(), t2);
}

TEST_F(PolledRegistryTest, UpdateAdvancesStamp) {
    PolledRegistry<Entry> links("links", clock.source());
    auto a = links.insert(Entry("link", 1));
    VersionToken before = links.token();

    EXPECT_TRUE(links.update(a, [](Entry& e) { e.value = 99; }));
    EXPECT_NE(links.token(), before);

    int value = 0;
    links.lookup(a, [&](const Entry& e) { value = e.value; });
    EXPECT_EQ(value, 99);
}

TEST_F(PolledRegistryTest, ThrowingUpdateStillAdvancesStamp) {
    PolledRegistry<Entry> links("links", clock.source());
    auto a = links.insert(Entry("link", 1));
    auto cached = links.poll(PollRequest::fresh(), renderAliases);

    EXPECT_THROW(links.update(a, [](Entry& e) {
                     e.alias = "renamed";
                     throw std::runtime_error("boom");
                 }),
                 std::runtime_error);

    auto again = links.poll(PollRequest::since(cached.header), renderAliases);
    ASSERT_TRUE(again.payload.has_value());
    EXPECT_EQ(*again.payload, std::vector<std::string>{"renamed"});
}

TEST_F(PolledRegistryTest, CapacityErrorDoesNotAdvanceStamp) {
    PolledRegistry<Entry> links("links", clock.source(), 2);
    links.insert(Entry("a"));
    links.insert(Entry("b"));
    VersionToken before = links.token();

    EXPECT_THROW(links.insert(Entry("c")), SlabCapacityError);
    EXPECT_EQ(links.token(), before);
    EXPECT_EQ(links.size(), 2u);
}

TEST_F(PolledRegistryTest, ConfigLimitsRegistry) {
    PolledRegistry<Entry> links("links", StateConfig::small());
    for (int i = 0; i < 4; i++) {
        links.insert(Entry("l" + std::to_string(i)));
    }
    EXPECT_THROW(links.insert(Entry("l4")), SlabCapacityError);
    EXPECT_EQ(links.read([](const SlabRegistry<Entry>& r) { return r.max_slots(); }), 4u);
}

TEST_F(PolledRegistryTest, PollRendersRegistrySnapshot) {
    PolledRegistry<Entry> links("links", clock.source());
    links.insert(Entry("a"));
    auto b = links.insert(Entry("b"));
    links.insert(Entry("c"));
    links.erase(b);

    auto full = links.poll(PollRequest::fresh(), renderAliases);
    ASSERT_TRUE(full.payload.has_value());
    EXPECT_EQ(*full.payload, (std::vector<std::string>{"a", "c"}));

    auto same = links.poll(PollRequest::since(full.header), renderAliases);
    EXPECT_TRUE(same.unchanged());

    links.insert(Entry("d"));   // recycles index 1
    auto next = links.poll(PollRequest::since(full.header), renderAliases);
    ASSERT_TRUE(next.payload.has_value());
    EXPECT_EQ(*next.payload, (std::vector<std::string>{"a", "d", "c"}));
}

TEST_F(PolledRegistryTest, ConcurrentPollersSeeConsistentSnapshots) {
    PolledRegistry<Entry> links("links");
    links.insert(Entry("seed", 0));

    // Every mutation moves all elements to a new generation, so a consistent
    // render never mixes generations and each token maps to one generation
    std::atomic<bool> done{false};
    std::atomic<int> full_reads{0};
    std::vector<std::thread> pollers;
    for (int p = 0; p < 4; p++) {
        pollers.emplace_back([&]() {
            std::map<std::string, int> generation_of;
            PollRequest req;
            while (!done.load()) {
                auto r = links.poll(req, [](const SlabRegistry<Entry>& reg) {
                    int gen = -1;
                    for (auto [i, e] : reg) {
                        if (gen < 0) {
                            gen = e.value;
                        } else if (gen != e.value) {
                            return -2;
                        }
                    }
                    return gen;
                });
                if (r.payload) {
                    full_reads++;
                    ASSERT_NE(*r.payload, -2);
                    auto it = generation_of.find(r.header.data_uuid);
                    if (it != generation_of.end()) {
                        ASSERT_EQ(it->second, *r.payload);
                    }
                    generation_of[r.header.data_uuid] = *r.payload;
                }
                req = PollRequest::since(r.header);
            }
        });
    }

    std::vector<PolledRegistry<Entry>::index_type> held;
    for (int gen = 1; gen <= 2000; gen++) {
        links.mutate([&](SlabRegistry<Entry>& reg) {
            if (gen % 3 == 0) {
                held.push_back(reg.push(Entry("x")));
            }
            if (held.size() > 20) {
                reg.remove(held.front());
                held.erase(held.begin());
            }
            for (auto [i, e] : reg) {
                e.value = gen;
            }
        });
    }
    done.store(true);
    for (auto& th : pollers) {
        th.join();
    }

    EXPECT_GT(full_reads.load(), 0);
    EXPECT_EQ(links.stats().mutations, 2001u);
}
