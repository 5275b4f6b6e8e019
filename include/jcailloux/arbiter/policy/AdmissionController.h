#ifndef JCX_ARBITER_POLICY_ADMISSION_CONTROLLER_H
#define JCX_ARBITER_POLICY_ADMISSION_CONTROLLER_H

#include <cstddef>
#include <cstdint>

#include "jcailloux/arbiter/config/EngineConfig.h"
#include "jcailloux/arbiter/policy/Segment.h"

namespace jcailloux::arbiter::policy {

struct Placement {
    Segment segment;
    Position position;
    bool hot_bypass = false;
};

// =========================================================================
// AdmissionController: where a newly inserted key lands, and whether a
// missed key is worth caching at all
// =========================================================================
//
// Placement:
//   ghost hit                    → Frequency MRU
//   cold, guarded                → Recency LRU (first out on the next miss)
//   cold, estimate ≥ threshold   → Frequency MRU (hot bypass, budgeted to
//                                  hot_bypass_budget per C admissions)
//   cold otherwise               → Recency MRU
//
// Gate (TinyLFU): with the store full, a cold key whose estimate is below
// the would-be victim's is not worth an eviction. Ties are admitted.

class AdmissionController {
public:
    AdmissionController() = default;

    explicit AdmissionController(const config::Tuning& t)
        : capacity_(t.capacity)
        , gate_enabled_(t.admission_gate)
        , bypass_enabled_(t.hot_bypass)
        , hot_threshold_(t.hot_threshold)
        , bypass_budget_(t.hot_bypass_budget) {}

    [[nodiscard]] Placement place(bool ghost_hit, uint32_t estimate, bool guarded) {
        if (++admissions_ >= capacity_) {
            admissions_ = 0;
            bypass_used_ = 0;
        }

        if (ghost_hit) return {Segment::Frequency, Position::Mru};
        if (guarded) return {Segment::Recency, Position::Lru};
        if (bypass_enabled_ && estimate >= hot_threshold_ && bypass_used_ < bypass_budget_) {
            ++bypass_used_;
            return {Segment::Frequency, Position::Mru, true};
        }
        return {Segment::Recency, Position::Mru};
    }

    [[nodiscard]] bool gateEnabled() const { return gate_enabled_; }

    /// TinyLFU comparison for a cold key against the previewed victim.
    [[nodiscard]] static bool worthEvicting(uint32_t incoming_estimate, uint32_t victim_estimate) {
        return incoming_estimate >= victim_estimate;
    }

    [[nodiscard]] size_t bypassUsed() const { return bypass_used_; }
    [[nodiscard]] size_t bypassBudget() const { return bypass_budget_; }
    [[nodiscard]] uint8_t hotThreshold() const { return hot_threshold_; }

    void reset() {
        admissions_ = 0;
        bypass_used_ = 0;
    }

private:
    size_t capacity_ = 1;
    bool gate_enabled_ = true;
    bool bypass_enabled_ = true;
    uint8_t hot_threshold_ = 7;
    size_t bypass_budget_ = 1;

    size_t admissions_ = 0;
    size_t bypass_used_ = 0;
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_ADMISSION_CONTROLLER_H
