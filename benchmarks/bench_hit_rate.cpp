/**
 * bench_hit_rate.cpp
 *
 * Hit-rate matrix: EvictionEngine presets against a plain LRU baseline.
 *
 * Matrix: 4 workloads x 3 capacities x 3 configurations (+ LRU baseline)
 *   - Workloads: pareto a=0.8, pareto a=1.2, loop (1.5x capacity),
 *                hot set polluted by periodic scans
 *   - Capacity:  1% / 5% / 10% of the key universe
 *   - Configs:   Balanced, ScanResistant, FrequencyBiased
 *
 * Each cell reports the hit rate and the engine's metrics snapshot as JSON.
 *
 * Run with:
 *   ./bench_hit_rate                  # full matrix
 *   ./bench_hit_rate "[hit_rate]"     # same (single tag)
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "BenchEngine.h"

#include <jcailloux/arbiter/config/EngineConfig.h>
#include <jcailloux/arbiter/policy/EvictionEngine.h>
#include <jcailloux/arbiter/policy/MetricsJson.h>

#include "fixtures/TraceStore.h"
#include "fixtures/Traces.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <list>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace arbiter_bench;
using namespace jcailloux::arbiter;
using namespace jcailloux::arbiter::policy;

namespace {

constexpr uint64_t UNIVERSE = 20'000;
constexpr size_t NUM_OPS = 400'000;

// =============================================================================
// LRU baseline
// =============================================================================

class LruBaseline {
    size_t capacity_;
    std::list<uint64_t> order_;   // front = MRU
    std::unordered_map<uint64_t, std::list<uint64_t>::iterator> index_;

public:
    explicit LruBaseline(size_t capacity) : capacity_(capacity) {}

    bool access(uint64_t key) {
        if (auto it = index_.find(key); it != index_.end()) {
            order_.splice(order_.begin(), order_, it->second);
            return true;
        }
        if (order_.size() >= capacity_) {
            index_.erase(order_.back());
            order_.pop_back();
        }
        order_.push_front(key);
        index_[key] = order_.begin();
        return false;
    }
};

// =============================================================================
// Workloads
// =============================================================================

std::vector<uint64_t> makeWorkload(const std::string& name, size_t capacity) {
    namespace tr = arbiter_test::traces;
    if (name == "pareto-0.8") return tr::pareto(NUM_OPS, UNIVERSE, 0.8, 11);
    if (name == "pareto-1.2") return tr::pareto(NUM_OPS, UNIVERSE, 1.2, 12);
    if (name == "loop") return tr::cyclic(capacity * 3 / 2, NUM_OPS / (capacity * 3 / 2));

    // Skewed traffic, interrupted every 20K accesses by a scan of 2x capacity.
    std::vector<uint64_t> out;
    out.reserve(NUM_OPS * 2);
    auto hot = tr::pareto(NUM_OPS, UNIVERSE, 1.0, 13);
    uint64_t scan_base = tr::kScanBase;
    for (size_t i = 0; i < hot.size(); ++i) {
        out.push_back(hot[i]);
        if (i % 20'000 == 19'999) {
            auto scan = tr::scan(capacity * 2, scan_base);
            scan_base += scan.size();
            out.insert(out.end(), scan.begin(), scan.end());
        }
    }
    return out;
}

} // anonymous namespace


// #############################################################################
//
//  Hit-rate matrix: 4 workloads x 3 capacities, 3 presets vs LRU
//
// #############################################################################

TEST_CASE("Benchmark - hit-rate matrix", "[benchmark][hit_rate]")
{
    auto workload = GENERATE(as<std::string>{}, "pareto-0.8", "pareto-1.2", "loop", "scan-polluted");
    auto fraction = GENERATE(0.01, 0.05, 0.10);

    auto capacity = static_cast<size_t>(static_cast<double>(UNIVERSE) * fraction);
    auto trace = makeWorkload(workload, capacity);

    LruBaseline lru(capacity);
    uint64_t lru_hits = 0;
    for (auto k : trace) lru_hits += lru.access(k) ? 1 : 0;

    struct Variant {
        const char* name;
        config::EngineConfig cfg;
    };
    const std::array<Variant, 3> variants{{
        {"balanced", config::Balanced},
        {"scan-resistant", config::ScanResistant},
        {"frequency-biased", config::FrequencyBiased},
    }};

    std::vector<HitRateRow> rows;
    rows.push_back({"lru", lru_hits, trace.size()});

    for (const auto& v : variants) {
        EvictionEngine<uint64_t> engine(capacity, v.cfg);
        arbiter_test::TraceStore<uint64_t> store(capacity);

        auto t0 = Clock::now();
        for (auto k : trace) store.access(engine, k);
        auto ns = std::chrono::duration<double, std::nano>(Clock::now() - t0).count();

        rows.push_back({v.name, store.hits(), trace.size(),
                        ns / static_cast<double>(trace.size()), toJson(engine.metrics())});
    }

    std::ostringstream title;
    title << workload << "  C=" << capacity << " (" << std::setprecision(0) << std::fixed
          << fraction * 100 << "% of " << UNIVERSE << " keys), " << trace.size() << " accesses";
    WARN(formatHitRates(title.str(), rows));
}
