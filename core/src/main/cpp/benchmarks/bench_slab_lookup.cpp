/*
 * Benchmark SlabRegistry index lookups against keyed lookups and measure
 * conditional poll cost
 */

#include <gtest/gtest.h>
#include "../src/state/polled_category.hpp"
#include "../src/util/log.h"
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

using namespace pollcache;
using namespace pollcache::state;

namespace {

struct Peer {
    explicit Peer(std::string name) : name(std::move(name)), bytes(0) {}

    std::optional<DefaultSlabIndex> slab_index() const { return idx; }
    void set_slab_index(std::optional<DefaultSlabIndex> i) { idx = i; }

    std::string name;
    uint64_t bytes;
    std::optional<DefaultSlabIndex> idx;
};

template<class Fn>
int64_t time_ns(Fn&& fn) {
    auto start = std::chrono::high_resolution_clock::now();
    fn();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now() - start).count();
}

} // namespace

class SlabLookupBenchmark : public ::testing::Test {
protected:
    void SetUp() override {
        original_level_ = logLevel.load(std::memory_order_relaxed);
        logLevel.store(LOG_WARNING, std::memory_order_relaxed);
    }

    void TearDown() override {
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    int original_level_;
};

TEST_F(SlabLookupBenchmark, IndexVersusKeyedLookup) {
    const int peers = 200;
    const int iterations = 5000000;

    SlabRegistry<Peer> registry;
    std::unordered_map<std::string, Peer> by_name;
    std::vector<DefaultSlabIndex> handles;
    std::vector<std::string> names;
    for (int i = 0; i < peers; i++) {
        std::string name = "peer-" + std::to_string(i) + ".example.net";
        handles.push_back(registry.push(Peer(name)));
        by_name.emplace(name, Peer(name));
        names.push_back(name);
    }

    uint64_t sink = 0;
    auto slab_ns = time_ns([&]() {
        for (int i = 0; i < iterations; i++) {
            Peer* p = registry.get_mut(handles[i % peers]);
            p->bytes += i;
            sink += p->bytes;
        }
    });
    auto map_ns = time_ns([&]() {
        for (int i = 0; i < iterations; i++) {
            Peer& p = by_name.find(names[i % peers])->second;
            p.bytes += i;
            sink += p.bytes;
        }
    });

    std::cout << "\nLookup of " << peers << " peers (" << iterations << " iterations):\n";
    std::cout << "  SlabRegistry index: " << (double)slab_ns / iterations << " ns/op\n";
    std::cout << "  unordered_map key:  " << (double)map_ns / iterations << " ns/op\n";
    std::cout << "  (checksum " << sink << ")\n";

    EXPECT_LT(slab_ns, map_ns) << "index lookup should beat hashing a string key";
}

TEST_F(SlabLookupBenchmark, ConditionalPollCost) {
    const int iterations = 1000000;

    PolledRegistry<Peer> peers("peers");
    for (int i = 0; i < 200; i++) {
        peers.insert(Peer("peer-" + std::to_string(i)));
    }
    auto render = [](const SlabRegistry<Peer>& reg) {
        std::string out;
        for (auto [idx, p] : reg) {
            out += p.name;
            out += '\n';
        }
        return out;
    };

    auto first = peers.poll(PollRequest::fresh(), render);
    PollRequest cached = PollRequest::since(first.header);

    size_t unchanged = 0;
    auto unchanged_ns = time_ns([&]() {
        for (int i = 0; i < iterations; i++) {
            unchanged += peers.poll(cached, render).unchanged();
        }
    });
    size_t bytes = 0;
    auto full_ns = time_ns([&]() {
        for (int i = 0; i < iterations / 100; i++) {
            bytes += peers.poll(PollRequest::fresh(), render).payload->size();
        }
    });

    std::cout << "\nConditional poll over 200 peers:\n";
    std::cout << "  unchanged: " << (double)unchanged_ns / iterations << " ns/poll\n";
    std::cout << "  full:      " << (double)full_ns / (iterations / 100) << " ns/poll ("
              << bytes / (iterations / 100) << " bytes)\n";

    EXPECT_EQ(unchanged, (size_t)iterations);
}

TEST_F(SlabLookupBenchmark, IncrementThroughput) {
    const int iterations = 1000000;
    MTVersionStamp stamp;

    auto ns = time_ns([&]() {
        for (int i = 0; i < iterations; i++) {
            stamp.increment();
        }
    });

    std::cout << "\nMTVersionStamp::increment: " << (double)ns / iterations << " ns/op\n";
    EXPECT_EQ(stamp.epoch_state(), EpochState::MonotonicRun);
}
