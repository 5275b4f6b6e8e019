/**
 * bench_hooks.cpp
 *
 * Per-hook latency of EvictionEngine, single-threaded, plus ShardedEngine
 * throughput under contention.
 *
 * Each sample runs a batch of accesses so that timer overhead stays small
 * compared to the ~100 ns hook calls being measured.
 *
 * Run with:
 *   BENCH_PIN_CPU=2 ./bench_hooks "[hooks]"
 *   ./bench_hooks "[sharded]"
 */

#include <catch2/catch_test_macros.hpp>

#include "BenchEngine.h"

#include <jcailloux/arbiter/policy/EvictionEngine.h>
#include <jcailloux/arbiter/policy/ShardedEngine.h>

#include "fixtures/TraceStore.h"
#include "fixtures/Traces.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <thread>
#include <vector>

using namespace arbiter_bench;
using namespace jcailloux::arbiter;
using namespace jcailloux::arbiter::policy;

namespace {

constexpr size_t CAPACITY = 10'000;
constexpr int BATCH = 100;

using Engine = EvictionEngine<uint64_t>;
using Store = arbiter_test::TraceStore<uint64_t>;

/// Walks a pre-generated trace forever, wrapping around.
struct TraceCursor {
    std::vector<uint64_t> keys;
    size_t pos = 0;

    uint64_t next() {
        auto k = keys[pos];
        if (++pos == keys.size()) pos = 0;
        return k;
    }
};

} // anonymous namespace

TEST_CASE("Benchmark - hook latency", "[benchmark][hooks]")
{
    std::vector<HookLatency> results;

    // Hits only: store holds every key of the working set.
    {
        Engine engine(CAPACITY);
        Store store(CAPACITY);
        for (uint64_t k = 0; k < CAPACITY; ++k) store.access(engine, k);
        TraceCursor cursor{arbiter_test::traces::uniform(1'000'000, CAPACITY, 1)};
        results.push_back(measureHook("onHit", BATCH, [&] {
            auto k = cursor.next();
            engine.onHit(store, k);
            doNotOptimize(k);
        }));
    }

    // Misses only: a never-ending scan, every access evicts.
    {
        Engine engine(CAPACITY);
        Store store(CAPACITY);
        store.setUseAdmit(false);
        uint64_t next_key = 0;
        results.push_back(measureHook("miss + evict (scan)", BATCH, [&] {
            doNotOptimize(store.access(engine, next_key++));
        }));
    }

    // Admission gate on a full store.
    {
        Engine engine(CAPACITY);
        Store store(CAPACITY);
        for (uint64_t k = 0; k < CAPACITY; ++k) store.access(engine, k);
        uint64_t next_key = arbiter_test::traces::kScanBase;
        results.push_back(measureHook("admit (full store)", BATCH, [&] {
            doNotOptimize(engine.admit(store, next_key++));
        }));
    }

    // Mixed skewed workload through the full protocol.
    for (double alpha : {0.8, 1.2}) {
        Engine engine(CAPACITY);
        Store store(CAPACITY);
        TraceCursor cursor{arbiter_test::traces::pareto(1'000'000, CAPACITY * 10, alpha, 7)};
        for (int i = 0; i < 200'000; ++i) store.access(engine, cursor.next());
        std::ostringstream lbl;
        lbl << "access pareto a=" << std::fixed << std::setprecision(1) << alpha;
        results.push_back(measureHook(lbl.str(), BATCH, [&] {
            doNotOptimize(store.access(engine, cursor.next()));
        }));
    }

    WARN(formatLatencies("EvictionEngine hooks (C=10000)", results));
}

TEST_CASE("Benchmark - sharded throughput", "[benchmark][sharded]")
{
    static constexpr size_t SHARDS = 8;
    static constexpr size_t PER_SHARD = CAPACITY / SHARDS;
    static constexpr int OPS = 200'000;

    auto threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

    ShardedEngine<uint64_t, SHARDS> sharded(PER_SHARD);
    std::vector<Store> stores(SHARDS, Store(PER_SHARD));

    std::vector<std::vector<uint64_t>> traces;
    for (int t = 0; t < threads; ++t)
        traces.push_back(arbiter_test::traces::pareto(OPS, CAPACITY * 10, 1.0, 100 + t));

    auto elapsed = runThreads(threads, [&](int tid) {
        for (auto k : traces[static_cast<size_t>(tid)]) {
            sharded.withShard(k, [&](auto& engine, size_t shard) {
                doNotOptimize(stores[shard].access(engine, k));
            });
        }
    });

    auto total = static_cast<int64_t>(threads) * OPS;
    WARN(formatThroughput("ShardedEngine<8> pareto a=1.0", threads, total, elapsed,
                          sharded.metrics().hitRatio()));
}
