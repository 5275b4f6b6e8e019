/**
 * test_scenarios.cpp
 *
 * Workload-level behaviour of the default (Balanced) engine.
 *
 * Covers:
 *   1. Cyclic trace slightly larger than the cache (LRU worst case)
 *   2. Transient intruder between two hot keys
 *   3. Recency convergence on a C + 10 loop
 *   4. Frequency convergence on a hot set with one-time filler
 *   5. Recovery of a hot set after a long one-time scan
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <jcailloux/arbiter/policy/EvictionEngine.h>

#include "fixtures/ArbiterTestAccessors.h"
#include "fixtures/TraceStore.h"
#include "fixtures/Traces.h"

using namespace jcailloux::arbiter;
using arbiter_test::TestInternals;
using arbiter_test::TraceStore;
namespace traces = arbiter_test::traces;

TEST_CASE("Scenario - loop of C + 1 keys", "[scenario][loop]") {
    policy::EvictionEngine<char> engine(4);
    TraceStore<char> store(4);

    auto hits = store.replay(engine, traces::letters("ABCDE", 3));

    size_t total = 0;
    for (bool h : hits) total += h ? 1 : 0;
    REQUIRE(total == 2);
    // D and E of the second pass survive the first wrap-around.
    REQUIRE(hits[8]);
    REQUIRE(hits[9]);
}

TEST_CASE("Scenario - transient intruder", "[scenario][gate]") {
    policy::EvictionEngine<char> engine(2);
    TraceStore<char> store(2);

    auto hits = store.replay(engine, traces::letters("ABABABCAB"));

    REQUIRE(hits == std::vector<bool>{false, false, true, true, true, true, false, true, true});
    REQUIRE(engine.metrics().admissions_rejected == 1);
    REQUIRE_FALSE(store.contains('C'));
}

TEST_CASE("Scenario - recency then frequency convergence", "[scenario][adaptation]") {
    constexpr size_t C = 100;
    policy::EvictionEngine<uint64_t> engine(C);
    TraceStore<uint64_t> store(C);
    std::string failure;

    // Phase 1: cyclic loop of C + 10 keys. Recency ghosts keep hitting.
    for (auto k : traces::cyclic(C + 10, 30)) {
        store.access(engine, k);
        if (failure.empty()) failure = TestInternals::checkInvariants(engine, store);
    }
    REQUIRE(failure.empty());
    auto loop_p = engine.targetP();
    REQUIRE(loop_p >= C * 9 / 10);

    // Phase 2: 20 hot keys interleaved with one-time filler.
    size_t hot_hits = 0;
    size_t hot_total = 0;
    auto trace = traces::hotWithFiller(20, 40);
    for (size_t i = 0; i < trace.size(); ++i) {
        bool hit = store.access(engine, trace[i]);
        if (i % 2 == 0) {
            ++hot_total;
            hot_hits += hit ? 1 : 0;
        }
        if (failure.empty()) failure = TestInternals::checkInvariants(engine, store);
    }
    REQUIRE(failure.empty());
    REQUIRE(engine.targetP() <= C / 5);
    REQUIRE(engine.targetP() < loop_p);
    REQUIRE(hot_hits * 10 >= hot_total * 8);
}

TEST_CASE("Scenario - scan recovery", "[scenario][scan]") {
    constexpr size_t C = 100;
    policy::EvictionEngine<uint64_t> engine(C);
    TraceStore<uint64_t> store(C);

    for (auto k : traces::cyclic(50, 20, traces::kHotBase)) store.access(engine, k);

    size_t pre = 0;
    for (auto k : traces::cyclic(50, 1, traces::kHotBase)) pre += store.access(engine, k) ? 1 : 0;
    REQUIRE(pre == 50);

    std::string failure;
    auto scan = traces::scan(10'000);
    for (size_t i = 0; i < scan.size(); ++i) {
        store.access(engine, scan[i]);
        if (i % 97 == 0 && failure.empty()) failure = TestInternals::checkInvariants(engine, store);
    }
    REQUIRE(failure.empty());

    // Hot-set hit rate within 2C accesses after the scan.
    size_t post = 0;
    auto after = traces::cyclic(50, 4, traces::kHotBase);
    for (auto k : after) post += store.access(engine, k) ? 1 : 0;

    double pre_rate = static_cast<double>(pre) / 50.0;
    double post_rate = static_cast<double>(post) / static_cast<double>(after.size());
    REQUIRE(post_rate >= 0.9 * pre_rate);
}
