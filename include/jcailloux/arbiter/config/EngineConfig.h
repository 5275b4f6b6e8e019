#ifndef JCX_ARBITER_CONFIG_ENGINE_CONFIG_H
#define JCX_ARBITER_CONFIG_ENGINE_CONFIG_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <limits>

#include "jcailloux/arbiter/EngineError.h"

namespace jcailloux::arbiter::config {

// =========================================================================
// Ghost trim policy - which side loses a ghost when the bound is exceeded
// =========================================================================
enum class GhostTrim : uint8_t {
    OldestOverall,      // older of the two LRU heads (by eviction time)
    OppositeOfLastHit   // side opposite the most recent ghost hit
};

// =========================================================================
// Tuning - concrete per-capacity parameters, produced by EngineConfig::resolve
// =========================================================================

struct Tuning {
    size_t capacity = 0;

    // Victim selection
    size_t sample_size = 0;

    // Ghost history
    size_t ghost_bound = 0;
    GhostTrim ghost_trim = GhostTrim::OldestOverall;

    // Target controller
    size_t step_cap = 0;
    size_t scan_step_cap = 0;
    size_t baseline = 0;
    size_t idle_threshold = 0;
    size_t decay_step = 0;
    float p_momentum = 0.0f;

    // Scan detector
    size_t cold_streak_threshold = 0;
    size_t guard_window = 0;
    size_t guard_p_bias = 0;

    // Frequency sketch
    size_t sketch_width = 0;
    uint8_t sketch_depth = 0;
    uint8_t counter_max = 0;
    size_t age_period = 0;
    bool doorkeeper = false;

    // Admission
    bool admission_gate = true;
    bool hot_bypass = true;
    uint8_t hot_threshold = 0;
    size_t hot_bypass_budget = 0;

    uint64_t seed = 0;
};

// =========================================================================
// EngineConfig - capacity-relative knobs with fluent modifiers
// =========================================================================
//
// Fractions are applied to the capacity C given to resolve(). Every derived
// size is at least 1 where a zero would disable the mechanism.
//
// Usage:
//   EvictionEngine<uint64_t> engine{1024};                        // Balanced
//   EvictionEngine<uint64_t> engine{1024, config::ScanResistant};  // preset
//   EvictionEngine<uint64_t> engine{1024,
//       config::Balanced.with_ghost_multiple(2).with_doorkeeper()};  // customized
//

struct EngineConfig {
    // Victim selection: k = clamp(C * sample_fraction, sample_min, sample_max)
    float sample_fraction = 1.0f / 16.0f;
    uint16_t sample_min = 4;
    uint16_t sample_max = 12;

    // Ghost history: bound = ghost_multiple * C
    uint8_t ghost_multiple = 1;
    GhostTrim ghost_trim = GhostTrim::OldestOverall;

    // Target controller
    float step_cap_fraction = 1.0f / 8.0f;
    float scan_step_cap_fraction = 1.0f / 4.0f;
    float baseline_fraction = 0.2f;
    float idle_fraction = 1.0f;           // idle after C accesses without ghost hit
    uint32_t decay_step = 1;
    float p_momentum = 0.0f;              // 0 = raw ARC steps

    // Scan detector
    float cold_streak_fraction = 0.5f;
    float guard_window_fraction = 1.0f / 8.0f;
    float guard_bias_fraction = 1.0f / 8.0f;

    // Frequency sketch
    uint8_t sketch_depth = 4;
    uint8_t counter_max = 15;
    uint32_t sketch_width_factor = 4;     // width = pow2 >= max(64, factor * C)
    uint32_t age_period_factor = 8;       // halve every factor * C increments
    bool doorkeeper = false;

    // Admission
    bool admission_gate = true;
    bool hot_bypass = true;
    uint8_t hot_threshold = 0;            // 0 = max(2, counter_max / 2)
    float hot_bypass_fraction = 1.0f / 16.0f;

    uint64_t seed = 0x9E3779B97F4A7C15ull;

    // Fluent chainable modifiers
    constexpr EngineConfig with_sample_fraction(float v) const { auto c = *this; c.sample_fraction = v; return c; }
    constexpr EngineConfig with_sample_bounds(uint16_t lo, uint16_t hi) const { auto c = *this; c.sample_min = lo; c.sample_max = hi; return c; }
    constexpr EngineConfig with_ghost_multiple(uint8_t v) const { auto c = *this; c.ghost_multiple = v; return c; }
    constexpr EngineConfig with_ghost_trim(GhostTrim v) const { auto c = *this; c.ghost_trim = v; return c; }
    constexpr EngineConfig with_step_cap_fraction(float v) const { auto c = *this; c.step_cap_fraction = v; return c; }
    constexpr EngineConfig with_scan_step_cap_fraction(float v) const { auto c = *this; c.scan_step_cap_fraction = v; return c; }
    constexpr EngineConfig with_baseline_fraction(float v) const { auto c = *this; c.baseline_fraction = v; return c; }
    constexpr EngineConfig with_idle_fraction(float v) const { auto c = *this; c.idle_fraction = v; return c; }
    constexpr EngineConfig with_decay_step(uint32_t v) const { auto c = *this; c.decay_step = v; return c; }
    constexpr EngineConfig with_p_momentum(float v) const { auto c = *this; c.p_momentum = v; return c; }
    constexpr EngineConfig with_cold_streak_fraction(float v) const { auto c = *this; c.cold_streak_fraction = v; return c; }
    constexpr EngineConfig with_guard_window_fraction(float v) const { auto c = *this; c.guard_window_fraction = v; return c; }
    constexpr EngineConfig with_guard_bias_fraction(float v) const { auto c = *this; c.guard_bias_fraction = v; return c; }
    constexpr EngineConfig with_sketch_depth(uint8_t v) const { auto c = *this; c.sketch_depth = v; return c; }
    constexpr EngineConfig with_counter_max(uint8_t v) const { auto c = *this; c.counter_max = v; return c; }
    constexpr EngineConfig with_sketch_width_factor(uint32_t v) const { auto c = *this; c.sketch_width_factor = v; return c; }
    constexpr EngineConfig with_age_period_factor(uint32_t v) const { auto c = *this; c.age_period_factor = v; return c; }
    constexpr EngineConfig with_doorkeeper(bool v = true) const { auto c = *this; c.doorkeeper = v; return c; }
    constexpr EngineConfig with_admission_gate(bool v) const { auto c = *this; c.admission_gate = v; return c; }
    constexpr EngineConfig with_hot_bypass(bool v) const { auto c = *this; c.hot_bypass = v; return c; }
    constexpr EngineConfig with_hot_threshold(uint8_t v) const { auto c = *this; c.hot_threshold = v; return c; }
    constexpr EngineConfig with_hot_bypass_fraction(float v) const { auto c = *this; c.hot_bypass_fraction = v; return c; }
    constexpr EngineConfig with_seed(uint64_t v) const { auto c = *this; c.seed = v; return c; }

    constexpr bool operator==(const EngineConfig&) const = default;

    /// Resolve fractions into concrete sizes for capacity C.
    [[nodiscard]] std::expected<Tuning, ConfigError> resolve(size_t capacity) const {
        if (capacity == 0)
            return std::unexpected(ConfigError{ConfigError::Type::ZeroCapacity, "capacity"});
        // Ghost arena holds up to 2C slots plus one in flight; indices are uint32_t.
        if (capacity > (std::numeric_limits<uint32_t>::max() - 2) / 2)
            return std::unexpected(ConfigError{ConfigError::Type::CapacityTooLarge, "capacity"});
        if (ghost_multiple != 1 && ghost_multiple != 2)
            return std::unexpected(ConfigError{ConfigError::Type::InvalidGhostMultiple, "ghost_multiple"});
        if (counter_max == 0)
            return std::unexpected(ConfigError{ConfigError::Type::InvalidCounterMax, "counter_max"});
        if (sketch_depth == 0 || sketch_depth > 8)
            return std::unexpected(ConfigError{ConfigError::Type::InvalidSketchDepth, "sketch_depth"});
        if (!(p_momentum >= 0.0f && p_momentum < 1.0f))
            return std::unexpected(ConfigError{ConfigError::Type::InvalidMomentum, "p_momentum"});

        struct NamedFraction { float value; const char* name; float max; };
        for (const auto& f : {
                NamedFraction{sample_fraction, "sample_fraction", 1.0f},
                NamedFraction{step_cap_fraction, "step_cap_fraction", 1.0f},
                NamedFraction{scan_step_cap_fraction, "scan_step_cap_fraction", 1.0f},
                NamedFraction{baseline_fraction, "baseline_fraction", 1.0f},
                NamedFraction{idle_fraction, "idle_fraction", 64.0f},
                NamedFraction{cold_streak_fraction, "cold_streak_fraction", 16.0f},
                NamedFraction{guard_window_fraction, "guard_window_fraction", 16.0f},
                NamedFraction{guard_bias_fraction, "guard_bias_fraction", 1.0f},
                NamedFraction{hot_bypass_fraction, "hot_bypass_fraction", 1.0f}}) {
            if (!(f.value >= 0.0f && f.value <= f.max))
                return std::unexpected(ConfigError{ConfigError::Type::InvalidFraction, f.name});
        }
        if (sample_min == 0 || sample_min > sample_max)
            return std::unexpected(ConfigError{ConfigError::Type::InvalidFraction, "sample_bounds"});
        if (sketch_width_factor == 0 || age_period_factor == 0)
            return std::unexpected(ConfigError{ConfigError::Type::InvalidFraction, "sketch factors"});

        Tuning t;
        t.capacity = capacity;
        t.sample_size = std::clamp(scaled(capacity, sample_fraction),
                                   size_t{sample_min}, size_t{sample_max});
        t.ghost_bound = capacity * ghost_multiple;
        t.ghost_trim = ghost_trim;

        t.step_cap = atLeastOne(scaled(capacity, step_cap_fraction));
        t.scan_step_cap = std::max(t.step_cap, scaled(capacity, scan_step_cap_fraction));
        t.baseline = std::min(capacity, scaled(capacity, baseline_fraction));
        t.idle_threshold = atLeastOne(scaled(capacity, idle_fraction));
        t.decay_step = decay_step;
        t.p_momentum = p_momentum;

        t.cold_streak_threshold = scaled(capacity, cold_streak_fraction);
        t.guard_window = atLeastOne(scaled(capacity, guard_window_fraction));
        t.guard_p_bias = atLeastOne(scaled(capacity, guard_bias_fraction));

        t.sketch_depth = sketch_depth;
        t.counter_max = counter_max;
        t.sketch_width = nextPow2(std::max<size_t>(64, capacity * sketch_width_factor));
        t.age_period = capacity * age_period_factor;
        t.doorkeeper = doorkeeper;

        t.admission_gate = admission_gate;
        t.hot_bypass = hot_bypass;
        t.hot_threshold = hot_threshold != 0
            ? hot_threshold
            : static_cast<uint8_t>(std::max(2, counter_max / 2));
        t.hot_bypass_budget = atLeastOne(scaled(capacity, hot_bypass_fraction));

        t.seed = seed;
        return t;
    }

    /// Copy of this config with ARBITER_* environment variables applied.
    /// Recognized: ARBITER_SAMPLE_SIZE (fixes k), ARBITER_GHOST_MULTIPLE,
    /// ARBITER_COUNTER_MAX, ARBITER_SEED. Unparseable values are ignored.
    [[nodiscard]] EngineConfig applyEnvOverrides() const {
        auto c = *this;
        if (auto v = readEnv("ARBITER_SAMPLE_SIZE"); v && *v > 0 && *v <= 0xFFFF) {
            c.sample_min = static_cast<uint16_t>(*v);
            c.sample_max = static_cast<uint16_t>(*v);
        }
        if (auto v = readEnv("ARBITER_GHOST_MULTIPLE"); v && *v <= 0xFF)
            c.ghost_multiple = static_cast<uint8_t>(*v);
        if (auto v = readEnv("ARBITER_COUNTER_MAX"); v && *v <= 0xFF)
            c.counter_max = static_cast<uint8_t>(*v);
        if (auto v = readEnv("ARBITER_SEED"))
            c.seed = *v;
        return c;
    }

private:
    static constexpr size_t scaled(size_t capacity, float fraction) {
        return static_cast<size_t>(static_cast<double>(capacity) * static_cast<double>(fraction));
    }

    static constexpr size_t atLeastOne(size_t v) { return v == 0 ? 1 : v; }

    static constexpr size_t nextPow2(size_t v) {
        size_t p = 1;
        while (p < v) p <<= 1;
        return p;
    }

    struct EnvValue {
        bool ok = false;
        uint64_t value = 0;
        explicit operator bool() const { return ok; }
        uint64_t operator*() const { return value; }
    };

    static EnvValue readEnv(const char* name) {
        if (auto* env = std::getenv(name)) {
            char* end = nullptr;
            auto v = std::strtoull(env, &end, 10);
            if (end != env && *end == '\0') return {true, static_cast<uint64_t>(v)};
        }
        return {};
    }
};

// =========================================================================
// Presets
// =========================================================================

/// ARC + TinyLFU defaults: one C of ghosts, guard after C/2 cold misses.
inline constexpr EngineConfig Balanced{};

/// Workloads with long one-time scans: twice the ghost history, earlier and
/// longer scan guards.
inline constexpr EngineConfig ScanResistant = Balanced
    .with_ghost_multiple(2)
    .with_cold_streak_fraction(0.25f)
    .with_guard_window_fraction(0.25f)
    .with_guard_bias_fraction(0.25f);

/// Skewed workloads: small recency baseline, more hot bypasses.
inline constexpr EngineConfig FrequencyBiased = Balanced
    .with_baseline_fraction(0.1f)
    .with_hot_bypass_fraction(1.0f / 8.0f)
    .with_doorkeeper();

}  // namespace jcailloux::arbiter::config

#endif  // JCX_ARBITER_CONFIG_ENGINE_CONFIG_H
