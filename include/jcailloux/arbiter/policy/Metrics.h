#ifndef JCX_ARBITER_POLICY_METRICS_H
#define JCX_ARBITER_POLICY_METRICS_H

#include <cstdint>
#include <initializer_list>

#if ARBITER_ENABLE_METRICS
#define ARBITER_METRICS_INC(counter) (counter).increment()
#else
#define ARBITER_METRICS_INC(counter) ((void)0)
#endif

namespace jcailloux::arbiter::policy {

/// Plain counter. The engine is externally synchronized, so no atomics.
struct Counter {
    uint64_t value = 0;

    void increment() noexcept { ++value; }
    [[nodiscard]] uint64_t load() const noexcept { return value; }
    void reset() noexcept { value = 0; }
};

/// Live counters owned by one engine.
struct EngineCounters {
    Counter hits;
    Counter misses;
    Counter admissions_rejected;
    Counter recency_ghost_hits;
    Counter frequency_ghost_hits;
    Counter hot_bypasses;
    Counter recency_evictions;
    Counter frequency_evictions;
    Counter fallbacks;
    Counter resyncs;
    Counter capacity_resets;
    Counter store_resets;
    Counter scan_guards;
    Counter sketch_agings;

    void reset() noexcept {
        for (auto* c : {&hits, &misses, &admissions_rejected, &recency_ghost_hits,
                        &frequency_ghost_hits, &hot_bypasses, &recency_evictions,
                        &frequency_evictions, &fallbacks, &resyncs, &capacity_resets,
                        &store_resets, &scan_guards, &sketch_agings})
            c->reset();
    }
};

/// Immutable snapshot of engine metrics. Counters stay zero unless the
/// engine was compiled with ARBITER_ENABLE_METRICS; the gauges (p, pool and
/// ghost sizes) are always filled.
struct MetricsSnapshot {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t admissions_rejected = 0;
    uint64_t recency_ghost_hits = 0;
    uint64_t frequency_ghost_hits = 0;
    uint64_t hot_bypasses = 0;
    uint64_t recency_evictions = 0;
    uint64_t frequency_evictions = 0;
    uint64_t fallbacks = 0;
    uint64_t resyncs = 0;
    uint64_t capacity_resets = 0;
    uint64_t store_resets = 0;
    uint64_t scan_guards = 0;
    uint64_t sketch_agings = 0;

    uint64_t capacity = 0;
    uint64_t target_p = 0;
    uint64_t recency_size = 0;
    uint64_t frequency_size = 0;
    uint64_t ghost_size = 0;

    [[nodiscard]] double hitRatio() const noexcept {
        auto total = hits + misses;
        return total ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }

    /// Share of misses that hit a ghost.
    [[nodiscard]] double ghostHitRatio() const noexcept {
        return misses ? static_cast<double>(recency_ghost_hits + frequency_ghost_hits)
                        / static_cast<double>(misses) : 0.0;
    }

    [[nodiscard]] double rejectionRatio() const noexcept {
        return misses ? static_cast<double>(admissions_rejected) / static_cast<double>(misses) : 0.0;
    }

    [[nodiscard]] double targetFraction() const noexcept {
        return capacity ? static_cast<double>(target_p) / static_cast<double>(capacity) : 0.0;
    }

    /// Sum of two snapshots (used to aggregate shards).
    MetricsSnapshot& operator+=(const MetricsSnapshot& o) noexcept {
        hits += o.hits;
        misses += o.misses;
        admissions_rejected += o.admissions_rejected;
        recency_ghost_hits += o.recency_ghost_hits;
        frequency_ghost_hits += o.frequency_ghost_hits;
        hot_bypasses += o.hot_bypasses;
        recency_evictions += o.recency_evictions;
        frequency_evictions += o.frequency_evictions;
        fallbacks += o.fallbacks;
        resyncs += o.resyncs;
        capacity_resets += o.capacity_resets;
        store_resets += o.store_resets;
        scan_guards += o.scan_guards;
        sketch_agings += o.sketch_agings;
        capacity += o.capacity;
        target_p += o.target_p;
        recency_size += o.recency_size;
        frequency_size += o.frequency_size;
        ghost_size += o.ghost_size;
        return *this;
    }
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_METRICS_H
