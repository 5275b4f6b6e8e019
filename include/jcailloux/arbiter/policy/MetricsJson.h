#ifndef JCX_ARBITER_POLICY_METRICS_JSON_H
#define JCX_ARBITER_POLICY_METRICS_JSON_H

#include <optional>
#include <string>
#include <string_view>

#include <glaze/glaze.hpp>

#include "jcailloux/arbiter/policy/Metrics.h"

// =============================================================================
// Glaze metadata for MetricsSnapshot
// =============================================================================

template<>
struct glz::meta<jcailloux::arbiter::policy::MetricsSnapshot> {
    using T = jcailloux::arbiter::policy::MetricsSnapshot;
    static constexpr auto value = glz::object(
        "hits", &T::hits,
        "misses", &T::misses,
        "admissions_rejected", &T::admissions_rejected,
        "recency_ghost_hits", &T::recency_ghost_hits,
        "frequency_ghost_hits", &T::frequency_ghost_hits,
        "hot_bypasses", &T::hot_bypasses,
        "recency_evictions", &T::recency_evictions,
        "frequency_evictions", &T::frequency_evictions,
        "fallbacks", &T::fallbacks,
        "resyncs", &T::resyncs,
        "capacity_resets", &T::capacity_resets,
        "store_resets", &T::store_resets,
        "scan_guards", &T::scan_guards,
        "sketch_agings", &T::sketch_agings,
        "capacity", &T::capacity,
        "target_p", &T::target_p,
        "recency_size", &T::recency_size,
        "frequency_size", &T::frequency_size,
        "ghost_size", &T::ghost_size
    );
};

namespace jcailloux::arbiter::policy {

/// JSON for a snapshot, or "{}" if serialization fails.
[[nodiscard]] inline std::string toJson(const MetricsSnapshot& snapshot) {
    std::string json;
    if (glz::write_json(snapshot, json)) return "{}";
    return json;
}

[[nodiscard]] inline std::optional<MetricsSnapshot> snapshotFromJson(std::string_view json) {
    if (json.empty()) return std::nullopt;
    MetricsSnapshot snapshot;
    if (glz::read_json(snapshot, json)) return std::nullopt;
    return snapshot;
}

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_METRICS_JSON_H
