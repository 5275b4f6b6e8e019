#ifndef JCX_ARBITER_POLICY_TARGET_CONTROLLER_H
#define JCX_ARBITER_POLICY_TARGET_CONTROLLER_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include "jcailloux/arbiter/config/EngineConfig.h"
#include "jcailloux/arbiter/policy/Segment.h"

#ifdef ARBITER_BUILDING_TESTS
namespace arbiter_test { struct TestInternals; }
#endif

namespace jcailloux::arbiter::policy {

// =========================================================================
// TargetController: ARC target size p for the recency pool
// =========================================================================
//
// A recency-ghost hit means the recency pool was too small: p grows by
// ceil(|Bf| / |Br|). A frequency-ghost hit shrinks p by ceil(|Br| / |Bf|).
// Steps are at least 1 and at most step_cap (scan_step_cap when the miss
// arrived while guarded). p always stays in [0, C].
//
// Without ghost hits for more than idle_threshold accesses, each access
// moves p by decay_step toward the baseline.

class TargetController {
public:
    TargetController() = default;

    explicit TargetController(const config::Tuning& t)
        : capacity_(t.capacity)
        , step_cap_(t.step_cap)
        , scan_step_cap_(t.scan_step_cap)
        , baseline_(t.baseline)
        , idle_threshold_(t.idle_threshold)
        , decay_step_(t.decay_step)
        , momentum_(t.p_momentum) {}

    [[nodiscard]] size_t p() const { return p_; }
    [[nodiscard]] size_t baseline() const { return baseline_; }
    [[nodiscard]] uint64_t lastGhostHit() const { return last_ghost_hit_; }

    /// Idle decay for the access at time `now`. Returns true if p moved.
    bool tick(uint64_t now) {
        if (now - last_ghost_hit_ <= idle_threshold_ || p_ == baseline_) return false;
        if (p_ > baseline_) p_ -= std::min(decay_step_, p_ - baseline_);
        else p_ += std::min(decay_step_, baseline_ - p_);
        return true;
    }

    /// Adapt p to a ghost hit on `origin`. Ghost sizes are taken before the
    /// hit ghost is consumed. Returns the signed step applied.
    int64_t onGhostHit(Segment origin, size_t recency_ghosts, size_t frequency_ghosts,
                       bool guarded, uint64_t now) {
        last_ghost_hit_ = now;
        auto cap = static_cast<int64_t>(guarded ? scan_step_cap_ : step_cap_);

        int64_t raw;
        if (origin == Segment::Recency) {
            raw = static_cast<int64_t>(ceilRatio(frequency_ghosts, recency_ghosts));
        } else {
            raw = -static_cast<int64_t>(ceilRatio(recency_ghosts, frequency_ghosts));
        }
        raw = std::clamp(raw, -cap, cap);

        int64_t step = raw;
        if (momentum_ > 0.0f) {
            ema_ = static_cast<double>(momentum_) * ema_
                 + (1.0 - static_cast<double>(momentum_)) * static_cast<double>(raw);
            auto rounded = static_cast<int64_t>(std::ceil(std::abs(ema_)));
            step = std::clamp(ema_ < 0 ? -rounded : rounded, -cap, cap);
        }

        auto next = static_cast<int64_t>(p_) + step;
        p_ = static_cast<size_t>(std::clamp<int64_t>(next, 0, static_cast<int64_t>(capacity_)));
        return step;
    }

    /// p biased down by `bias` while a scan guard is active.
    [[nodiscard]] size_t effective(bool guarded, size_t bias) const {
        if (!guarded) return p_;
        return p_ > bias ? p_ - bias : 0;
    }

    void reset() {
        p_ = 0;
        last_ghost_hit_ = 0;
        ema_ = 0.0;
    }

private:
    static size_t ceilRatio(size_t num, size_t den) {
        if (den == 0) den = 1;
        return std::max<size_t>(1, (num + den - 1) / den);
    }

    size_t capacity_ = 0;
    size_t step_cap_ = 1;
    size_t scan_step_cap_ = 1;
    size_t baseline_ = 0;
    size_t idle_threshold_ = 1;
    size_t decay_step_ = 1;
    float momentum_ = 0.0f;

    size_t p_ = 0;
    uint64_t last_ghost_hit_ = 0;
    double ema_ = 0.0;

#ifdef ARBITER_BUILDING_TESTS
    friend struct ::arbiter_test::TestInternals;
#endif
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_TARGET_CONTROLLER_H
