/**
 * test_target_controller.cpp
 *
 * Tests for TargetController (ARC target p).
 *
 * Tuning for C = 100 (Balanced): step_cap 12, scan_step_cap 25,
 * baseline 20, idle threshold 100.
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

#include <jcailloux/arbiter/config/EngineConfig.h>
#include <jcailloux/arbiter/policy/TargetController.h>

#include "fixtures/ArbiterTestAccessors.h"

using namespace jcailloux::arbiter;
using policy::Segment;
using policy::TargetController;
using arbiter_test::TestInternals;

namespace {

config::Tuning tuningFor(size_t capacity, const config::EngineConfig& cfg = config::Balanced) {
    auto t = cfg.resolve(capacity);
    REQUIRE(t.has_value());
    return *t;
}

}  // namespace

TEST_CASE("TargetController - ghost hit steps", "[target]") {
    TargetController tc(tuningFor(100));
    REQUIRE(tc.p() == 0);

    SECTION("[step] recency ghost hit grows p by ceil(|Bf|/|Br|)") {
        REQUIRE(tc.onGhostHit(Segment::Recency, 4, 9, false, 1) == 3);
        REQUIRE(tc.p() == 3);
    }

    SECTION("[step] step is at least one") {
        tc.onGhostHit(Segment::Recency, 10, 1, false, 1);
        REQUIRE(tc.p() == 1);
        tc.onGhostHit(Segment::Recency, 10, 0, false, 2);
        REQUIRE(tc.p() == 2);
    }

    SECTION("[step] step is capped at C/8, C/4 while guarded") {
        tc.onGhostHit(Segment::Recency, 1, 80, false, 1);
        REQUIRE(tc.p() == 12);
        tc.onGhostHit(Segment::Recency, 1, 80, true, 2);
        REQUIRE(tc.p() == 37);
    }

    SECTION("[step] frequency ghost hit shrinks p and clamps at zero") {
        TestInternals::setTargetP(tc, 5);
        REQUIRE(tc.onGhostHit(Segment::Frequency, 30, 1, false, 1) == -12);
        REQUIRE(tc.p() == 0);
    }

    SECTION("[step] p never exceeds capacity") {
        for (uint64_t t = 1; t <= 20; ++t)
            tc.onGhostHit(Segment::Recency, 1, 100, false, t);
        REQUIRE(tc.p() == 100);
    }

    SECTION("[step] ghost hit records its time") {
        tc.onGhostHit(Segment::Frequency, 1, 1, false, 42);
        REQUIRE(tc.lastGhostHit() == 42);
    }
}

TEST_CASE("TargetController - idle decay", "[target][decay]") {
    TargetController tc(tuningFor(100));
    tc.onGhostHit(Segment::Recency, 1, 100, false, 1);   // p = 12
    REQUIRE(tc.p() == 12);

    SECTION("[decay] no decay within the idle threshold") {
        REQUIRE_FALSE(tc.tick(101));
        REQUIRE(tc.p() == 12);
    }

    SECTION("[decay] below baseline p rises one step per access") {
        REQUIRE(tc.tick(102));
        REQUIRE(tc.p() == 13);
        for (uint64_t t = 103; t < 200; ++t) tc.tick(t);
        REQUIRE(tc.p() == tc.baseline());
    }

    SECTION("[decay] above baseline p falls toward it") {
        TestInternals::setTargetP(tc, 30);
        tc.tick(102);
        REQUIRE(tc.p() == 29);
        for (uint64_t t = 103; t < 200; ++t) tc.tick(t);
        REQUIRE(tc.p() == 20);
        REQUIRE_FALSE(tc.tick(300));
    }

    SECTION("[decay] reset returns to p = 0") {
        tc.reset();
        REQUIRE(tc.p() == 0);
        REQUIRE(tc.lastGhostHit() == 0);
    }
}

TEST_CASE("TargetController - momentum", "[target][momentum]") {
    TargetController tc(tuningFor(100, config::Balanced.with_p_momentum(0.5f)));

    SECTION("[momentum] step follows the moving average of raw steps") {
        REQUIRE(tc.onGhostHit(Segment::Recency, 1, 4, false, 1) == 2);   // ema 2
        REQUIRE(tc.onGhostHit(Segment::Recency, 1, 4, false, 2) == 3);   // ema 3
        REQUIRE(tc.p() == 5);
    }

    SECTION("[momentum] an opposite hit is damped") {
        tc.onGhostHit(Segment::Recency, 1, 8, false, 1);                 // ema 4
        REQUIRE(tc.onGhostHit(Segment::Frequency, 2, 1, false, 2) == 1); // ema 1
        REQUIRE(tc.p() == 5);
    }
}

TEST_CASE("TargetController - effective target", "[target]") {
    TargetController tc(tuningFor(100));
    TestInternals::setTargetP(tc, 30);
    REQUIRE(tc.effective(false, 12) == 30);
    REQUIRE(tc.effective(true, 12) == 18);
    REQUIRE(tc.effective(true, 40) == 0);
}
