/**
 * test_eviction_engine.cpp
 *
 * Tests for EvictionEngine hooks driven through a TraceStore.
 * Compiled with ARBITER_ENABLE_METRICS=1 and ARBITER_BUILDING_TESTS.
 *
 * Covers:
 *   1. Construction and configuration errors
 *   2. Pool placement, promotion, ghost labelling
 *   3. One clock tick and one adaptation per miss
 *   4. Protocol violations
 *   5. Capacity change, emptied store, desync healing
 *   6. Invariants after every access under several configurations
 *   7. Determinism
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <jcailloux/arbiter/Log.h>
#include <jcailloux/arbiter/policy/EvictionEngine.h>

#include "fixtures/ArbiterTestAccessors.h"
#include "fixtures/TraceStore.h"
#include "fixtures/Traces.h"

using namespace jcailloux::arbiter;
using policy::Segment;
using policy::ScanState;
using arbiter_test::TestInternals;
using arbiter_test::TraceStore;

using Engine = policy::EvictionEngine<uint64_t>;
using Store = TraceStore<uint64_t>;

namespace {

// No idle decay and a sketch wide enough to be collision-free for small tests.
inline constexpr auto Quiet = config::Balanced
    .with_idle_fraction(64.0f)
    .with_sketch_width_factor(512);

struct CapturedLog {
    log::Level level;
    std::string message;
};

std::vector<CapturedLog> captured_logs;

void testLogCallback(log::Level level, const char* msg, size_t len) {
    captured_logs.push_back({level, std::string(msg, len)});
}

bool logged(log::Level level, const std::string& fragment) {
    for (const auto& l : captured_logs)
        if (l.level == level && l.message.find(fragment) != std::string::npos) return true;
    return false;
}

void fill(Engine& engine, Store& store, uint64_t first, uint64_t count) {
    for (uint64_t k = first; k < first + count; ++k) store.access(engine, k);
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("EvictionEngine - construction", "[engine][config]") {
    SECTION("[config] zero capacity throws ConfigException") {
        try {
            Engine e(0);
            FAIL("expected ConfigException");
        } catch (const ConfigException& ex) {
            REQUIRE(ex.error().type == ConfigError::Type::ZeroCapacity);
        }
    }

    SECTION("[config] invalid config throws at construction") {
        REQUIRE_THROWS_AS(Engine(8, config::Balanced.with_ghost_multiple(3)), ConfigException);
        REQUIRE_THROWS_AS(Engine(8, config::Balanced.with_counter_max(0)), EngineError);
    }

    SECTION("[config] fresh engine is empty and Normal") {
        Engine e(16);
        REQUIRE(e.capacity() == 16);
        REQUIRE(e.targetP() == 0);
        REQUIRE(e.recencySize() == 0);
        REQUIRE(e.frequencySize() == 0);
        REQUIRE(e.ghostSize() == 0);
        REQUIRE(e.scanState() == ScanState::Normal);
        REQUIRE(e.tuning().sample_size == 4);
    }
}

// =============================================================================
// Placement and ghosts
// =============================================================================

TEST_CASE("EvictionEngine - placement", "[engine]") {
    Engine e(8, Quiet);
    Store s(8);

    SECTION("[place] misses land in recency, hits promote to frequency") {
        fill(e, s, 1, 3);
        REQUIRE(e.recencySize() == 3);
        REQUIRE(s.access(e, 2));
        REQUIRE(e.segmentOf(2) == Segment::Frequency);
        REQUIRE(e.recencySize() == 2);
        REQUIRE(e.frequencySize() == 1);
    }

    SECTION("[place] evicted key becomes a ghost") {
        fill(e, s, 1, 9);
        REQUIRE(s.victims().size() == 1);
        auto v = s.victims().front();
        REQUIRE_FALSE(e.segmentOf(v).has_value());
        REQUIRE(e.ghostOf(v) == Segment::Recency);
        REQUIRE(e.ghostSize() == 1);
    }

    SECTION("[place] ghost hit is consumed and enters frequency") {
        fill(e, s, 1, 9);
        auto v = s.victims().front();
        REQUIRE_FALSE(s.access(e, v));
        REQUIRE(e.segmentOf(v) == Segment::Frequency);
        REQUIRE_FALSE(e.ghostOf(v).has_value());
        REQUIRE(e.targetP() == 1);
    }

    SECTION("[place] preview names the next victim without side effects") {
        fill(e, s, 1, 8);
        REQUIRE(s.access(e, 1));   // clears the scan guard
        auto now = e.now();
        auto p = e.targetP();
        auto next = e.preview(100);
        REQUIRE(next.has_value());
        REQUIRE(e.now() == now);
        REQUIRE(e.targetP() == p);
        REQUIRE(e.residentSize() == 8);
        REQUIRE(e.estimate(100) == 0);
        s.access(e, 100);
        REQUIRE(s.victims().back() == *next);
    }
}

TEST_CASE("EvictionEngine - ghost hit with a full ghost history", "[engine][ghosts]") {
    SECTION("[ghosts] the incoming key is the oldest ghost") {
        Engine e(2, Quiet);
        Store s(2);
        fill(e, s, 1, 4);          // evicts 1 then 2
        REQUIRE(e.ghostSize() == e.tuning().ghost_bound);
        REQUIRE(TestInternals::ghostKeys(e, Segment::Recency).front() == 1);

        REQUIRE_FALSE(s.access(e, 1));
        REQUIRE(s.victims().back() == 3);
        REQUIRE(e.segmentOf(1) == Segment::Frequency);
        REQUIRE(e.targetP() == 1);
        REQUIRE_FALSE(e.ghostOf(1).has_value());
        REQUIRE(e.ghostOf(2) == Segment::Recency);
        REQUIRE(e.ghostOf(3) == Segment::Recency);
    }

    SECTION("[ghosts] every ghost-hit miss lands in frequency") {
        for (size_t cap : {4, 16}) {
            Engine e(cap, Quiet);
            Store s(cap);
            s.setUseAdmit(false);
            size_t ghost_misses = 0;
            for (auto k : arbiter_test::traces::uniform(5000, cap * 4, cap)) {
                bool was_ghost = !s.contains(k) && e.ghostOf(k).has_value();
                s.access(e, k);
                if (!was_ghost) continue;
                ++ghost_misses;
                REQUIRE(e.segmentOf(k) == Segment::Frequency);
            }
            REQUIRE(ghost_misses > 0);
        }
    }
}

TEST_CASE("EvictionEngine - earned-frequency ghost labelling", "[engine][ghosts]") {
    Engine e(8, Quiet);
    Store s(8);
    s.setUseAdmit(false);

    fill(e, s, 1, 8);
    REQUIRE(s.access(e, 1));   // 1 → frequency
    REQUIRE(s.access(e, 1));   // 1 earns a hit in frequency
    REQUIRE(s.access(e, 2));   // 2 → frequency, no hit there yet
    TestInternals::setTargetP(e, 8);

    SECTION("[label] frequency entry without hits is ghosted as recency") {
        s.access(e, 100);
        REQUIRE(s.victims().back() == 2);
        REQUIRE(e.ghostOf(2) == Segment::Recency);
    }

    SECTION("[label] frequency entry with hits keeps frequency origin") {
        s.access(e, 100);
        s.access(e, 101);
        REQUIRE(s.victims().back() == 1);
        REQUIRE(e.ghostOf(1) == Segment::Frequency);
    }
}

TEST_CASE("EvictionEngine - one tick and one adaptation per miss", "[engine][clock]") {
    Engine e(8, Quiet);
    Store s(8);
    fill(e, s, 1, 9);
    auto v = s.victims().front();
    REQUIRE(e.now() == 9);

    SECTION("[clock] full miss protocol advances the clock once") {
        s.access(e, v);
        REQUIRE(e.now() == 10);
        REQUIRE(e.targetP() == 1);
    }

    SECTION("[clock] adaptation in selectVictim is not repeated in onInserted") {
        REQUIRE(e.admit(s, v));
        auto victim = e.selectVictim(s, v);
        REQUIRE(e.targetP() == 1);
        s.eraseRaw(victim);
        e.onEvicted(s, victim);
        s.insertRaw(v);
        e.onInserted(s, v);
        REQUIRE(e.targetP() == 1);
        REQUIRE(e.now() == 10);
    }

    SECTION("[clock] a hit advances the clock once") {
        s.access(e, 9);
        REQUIRE(e.now() == 10);
    }
}

TEST_CASE("EvictionEngine - scan guard", "[engine][scan]") {
    Engine e(8, Quiet);
    Store s(8);

    fill(e, s, 1, 4);
    REQUIRE(e.scanState() == ScanState::Normal);
    s.access(e, 5);
    REQUIRE(e.scanState() == ScanState::Guarded);

    SECTION("[scan] guarded cold admissions go to the recency LRU end") {
        auto r = TestInternals::poolKeys(e, Segment::Recency);
        REQUIRE(r.front() == 5);
    }

    SECTION("[scan] a hit clears the guard") {
        s.access(e, 1);
        REQUIRE(e.scanState() == ScanState::Normal);
        REQUIRE(TestInternals::coldStreak(e) == 0);
    }

    SECTION("[scan] reset is Normal before the next access") {
        e.reset();
        REQUIRE(e.now() == 0);
        REQUIRE(e.scanState() == ScanState::Normal);
    }
}

// =============================================================================
// Protocol violations and healing
// =============================================================================

TEST_CASE("EvictionEngine - protocol violations", "[engine][errors]") {
    captured_logs.clear();
    log::setCallback(testLogCallback);
    Engine e(4);
    Store s(4);

    SECTION("[errors] selectVictim on an empty store throws") {
        REQUIRE_THROWS_AS(e.selectVictim(s, 1), ProtocolError);
        REQUIRE(logged(log::Level::Error, "below capacity"));
    }

    SECTION("[errors] selectVictim below capacity throws") {
        fill(e, s, 1, 2);
        REQUIRE_THROWS_AS(e.selectVictim(s, 9), ProtocolError);
        REQUIRE(e.recencySize() == 2);
    }

    SECTION("[errors] eviction of an untracked key is absorbed") {
        fill(e, s, 1, 2);
        e.onEvicted(s, 77);
        REQUIRE(TestInternals::checkInvariants(e, s).empty());
        REQUIRE(logged(log::Level::Debug, "untracked"));
    }

    log::setCallback(nullptr);
}

TEST_CASE("EvictionEngine - capacity change resets", "[engine][errors]") {
    captured_logs.clear();
    log::setCallback(testLogCallback);
    Engine e(4, Quiet);
    Store s(4);
    fill(e, s, 1, 6);
    REQUIRE(e.ghostSize() == 2);

    s.setCapacity(8);
    s.access(e, 50);

    REQUIRE(e.capacity() == 8);
    REQUIRE(e.tuning().capacity == 8);
    REQUIRE(e.ghostSize() == 0);
    REQUIRE(e.targetP() == 0);
    REQUIRE(TestInternals::checkInvariants(e, s).empty());
    REQUIRE(logged(log::Level::Warn, "capacity changed 4 -> 8"));
    REQUIRE(e.metrics().capacity_resets == 1);

    log::setCallback(nullptr);
}

TEST_CASE("EvictionEngine - emptied store starts a new run", "[engine][errors]") {
    Engine e(4, Quiet);
    Store s(4);
    fill(e, s, 1, 6);

    s.clearRaw();
    s.access(e, 42);

    REQUIRE(e.residentSize() == 1);
    REQUIRE(e.ghostSize() == 0);
    REQUIRE(e.now() == 1);
    REQUIRE(e.metrics().store_resets == 1);
    REQUIRE(TestInternals::checkInvariants(e, s).empty());
}

TEST_CASE("EvictionEngine - desync healing", "[engine][resync]") {
    captured_logs.clear();
    log::setCallback(testLogCallback);
    Engine e(4, Quiet);
    Store s(4);
    fill(e, s, 1, 4);

    SECTION("[resync] hit on an untracked resident adopts it") {
        s.eraseRaw(1);
        s.insertRaw(50);
        REQUIRE(s.access(e, 50));
        REQUIRE(e.segmentOf(50) == Segment::Frequency);
        REQUIRE(TestInternals::poolKeys(e, Segment::Frequency).back() == 50);
        REQUIRE(TestInternals::residentHits(e, uint64_t{50}) == 0u);
        REQUIRE_FALSE(e.segmentOf(1).has_value());
        REQUIRE(TestInternals::checkInvariants(e, s).empty());
        REQUIRE(logged(log::Level::Debug, "adopted"));
    }

    SECTION("[resync] size disagreement triggers a full pass") {
        s.eraseRaw(2);
        s.access(e, 60);
        REQUIRE(TestInternals::checkInvariants(e, s).empty());
        REQUIRE(e.metrics().resyncs >= 1);
        REQUIRE(logged(log::Level::Warn, "resync"));
    }

    SECTION("[resync] engine keeps serving after arbitrary store edits") {
        s.eraseRaw(3);
        s.eraseRaw(4);
        s.insertRaw(70);
        for (auto k : arbiter_test::traces::uniform(200, 12, 5)) {
            s.access(e, k);
            REQUIRE(TestInternals::checkInvariants(e, s).empty());
        }
    }

    log::setCallback(nullptr);
}

// =============================================================================
// Invariants and determinism
// =============================================================================

TEST_CASE("EvictionEngine - invariants hold after every access", "[engine][invariants]") {
    auto run = [](const config::EngineConfig& cfg, bool use_admit) {
        Engine e(16, cfg);
        Store s(16);
        s.setUseAdmit(use_admit);
        std::string failure;
        auto trace = arbiter_test::traces::pareto(4000, 200, 1.1, 7);
        auto scan = arbiter_test::traces::scan(300);
        trace.insert(trace.begin() + 2000, scan.begin(), scan.end());
        for (auto k : trace) {
            s.access(e, k);
            failure = TestInternals::checkInvariants(e, s);
            if (!failure.empty()) break;
        }
        return failure;
    };

    SECTION("[invariants] balanced") {
        REQUIRE(run(config::Balanced, true).empty());
    }
    SECTION("[invariants] gate disabled") {
        REQUIRE(run(config::Balanced, false).empty());
    }
    SECTION("[invariants] scan resistant preset") {
        REQUIRE(run(config::ScanResistant, true).empty());
    }
    SECTION("[invariants] frequency biased preset") {
        REQUIRE(run(config::FrequencyBiased, true).empty());
    }
    SECTION("[invariants] opposite-of-last-hit trimming with momentum") {
        REQUIRE(run(config::Balanced
            .with_ghost_trim(config::GhostTrim::OppositeOfLastHit)
            .with_p_momentum(0.6f), true).empty());
    }
}

TEST_CASE("EvictionEngine - determinism", "[engine][determinism]") {
    auto victims = [](uint64_t seed) {
        Engine e(16, config::Balanced.with_seed(seed));
        Store s(16);
        for (auto k : arbiter_test::traces::pareto(5000, 200, 1.1, 7)) s.access(e, k);
        return s.victims();
    };

    SECTION("[determinism] same seed, same victims") {
        REQUIRE(victims(1) == victims(1));
        REQUIRE(victims(99) == victims(99));
    }

    SECTION("[determinism] reset replays identically") {
        Engine e(16);
        Store s1(16);
        auto trace = arbiter_test::traces::pareto(2000, 100, 1.1, 3);
        for (auto k : trace) s1.access(e, k);
        e.reset();
        REQUIRE(e.residentSize() == 0);
        REQUIRE(e.now() == 0);
        Store s2(16);
        for (auto k : trace) s2.access(e, k);
        REQUIRE(s1.victims() == s2.victims());
    }
}

TEST_CASE("EvictionEngine - metrics", "[engine][metrics]") {
    Engine e(8);
    Store s(8);
    for (auto k : arbiter_test::traces::pareto(3000, 64, 1.1, 4)) s.access(e, k);

    auto m = e.metrics();
    REQUIRE(m.hits == s.hits());
    REQUIRE(m.misses == s.misses());
    REQUIRE(m.admissions_rejected == s.rejected());
    REQUIRE(m.recency_evictions + m.frequency_evictions == s.victims().size());
    REQUIRE(m.capacity == 8);
    REQUIRE(m.recency_size + m.frequency_size == s.size());
    REQUIRE(m.target_p == e.targetP());
    REQUIRE(m.hitRatio() > 0.0);

    e.resetMetrics();
    REQUIRE(e.metrics().hits == 0);
}
