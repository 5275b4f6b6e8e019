#ifndef JCX_ARBITER_POLICY_EVICTION_ENGINE_H
#define JCX_ARBITER_POLICY_EVICTION_ENGINE_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "jcailloux/arbiter/EngineError.h"
#include "jcailloux/arbiter/Log.h"
#include "jcailloux/arbiter/config/EngineConfig.h"
#include "jcailloux/arbiter/config/KeyTraits.h"
#include "jcailloux/arbiter/policy/AdmissionController.h"
#include "jcailloux/arbiter/policy/FrequencySketch.h"
#include "jcailloux/arbiter/policy/GhostHistory.h"
#include "jcailloux/arbiter/policy/Metrics.h"
#include "jcailloux/arbiter/policy/ScanDetector.h"
#include "jcailloux/arbiter/policy/Segment.h"
#include "jcailloux/arbiter/policy/SegmentManager.h"
#include "jcailloux/arbiter/policy/TargetController.h"
#include "jcailloux/arbiter/policy/VictimSelector.h"

#ifdef ARBITER_BUILDING_TESTS
namespace arbiter_test { struct TestInternals; }
#endif

namespace jcailloux::arbiter::policy {

// =========================================================================
// ResidentStore: what the engine reads from the cache it serves
// =========================================================================
//
// The store owns keys and values and enforces its capacity. The engine only
// queries it: to validate the hook protocol and to heal when its own
// bookkeeping disagrees with the store's key set.

template<typename S, typename K>
concept ResidentStore = requires(const S& s, const K& k) {
    { s.capacity() } -> std::convertible_to<size_t>;
    { s.size() } -> std::convertible_to<size_t>;
    { s.contains(k) } -> std::convertible_to<bool>;
    s.forEachKey([](const K&) {});
};

// =========================================================================
// EvictionEngine: adaptive, scan-resistant replacement policy
// =========================================================================
//
// ARC-style recency/frequency pools with ghost-driven target adaptation,
// a Count-Min frequency sketch for victim scoring and admission, and a
// cold-streak detector that shields the frequency pool from scans.
//
// Hook protocol (called by the store, single-threaded):
//
//   hit:   onHit(store, key)
//   miss:  [admit(store, key) →] selectVictim(store, key) → store erases
//          victim → onEvicted(store, victim) → store inserts key →
//          onInserted(store, key)
//
//   selectVictim only when the store is full. If admit returns false the
//   store skips the insertion and calls nothing else for this miss.
//
// All hooks of one miss share one logical-clock tick and one sketch
// increment. A store whose capacity no longer matches the engine's resets
// the engine (and re-derives the tuning for the new capacity).
//
// Usage:
//   EvictionEngine<std::string> engine{1024};
//   if (store.contains(k)) engine.onHit(store, k);
//   else if (engine.admit(store, k)) {
//       if (store.size() == store.capacity()) {
//           auto victim = engine.selectVictim(store, k);
//           store.erase(victim);
//           engine.onEvicted(store, victim);
//       }
//       store.insert(k, load(k));
//       engine.onInserted(store, k);
//   }

template<typename K, typename Hash = config::AutoHash<K>, typename Prng = std::mt19937_64>
requires config::EngineKey<K, Hash>
class EvictionEngine {
public:
    using Key = K;

    explicit EvictionEngine(size_t capacity, const config::EngineConfig& cfg = config::Balanced)
        : config_(cfg) {
        auto tuning = config_.resolve(capacity);
        if (!tuning) throw ConfigException(tuning.error());
        tuning_ = *tuning;
        rebuild();
    }

    // =====================================================================
    // Hooks
    // =====================================================================

    /// First hook of a miss. Returns false when the key is not worth
    /// evicting a resident for; the store must then not cache it.
    template<ResidentStore<K> S>
    bool admit(const S& store, const K& key) {
        checkStore(store, true);
        if (store.contains(key)) return true;

        beginMiss(key);
        if (!admission_.gateEnabled() || store.size() < tuning_.capacity || miss_ghost_)
            return true;

        ensureTracked(store);
        auto victim = preview(key);
        if (!victim) return true;
        if (AdmissionController::worthEvicting(sketch_.estimate(key), sketch_.estimate(*victim)))
            return true;

        ARBITER_METRICS_INC(counters_.admissions_rejected);
        closeMiss();
        return false;
    }

    /// Pick the resident to evict for `incoming`. Called once per miss with
    /// the store full, before the store mutates.
    template<ResidentStore<K> S>
    K selectVictim(const S& store, const K& incoming) {
        checkStore(store, true);
        if (store.size() == 0 || store.size() < tuning_.capacity) {
            ARBITER_LOG_ERROR << "arbiter: selectVictim with store size " << store.size()
                              << " below capacity " << tuning_.capacity;
            throw ProtocolError("arbiter: selectVictim called while the store is "
                                + std::string(store.size() == 0 ? "empty" : "below capacity"));
        }

        beginMiss(incoming);
        if (segments_.contains(incoming) && !store.contains(incoming))
            segments_.remove(incoming);
        ensureTracked(store);
        adapt();

        auto choice = selector_.select(segments_, ghosts_, sketch_, incoming, effectiveP());
        if (!choice) {
            resync(store);
            choice = selector_.select(segments_, ghosts_, sketch_, incoming, effectiveP());
        }
        if (!choice) {
            std::optional<K> any;
            store.forEachKey([&](const K& k) { if (!any) any.emplace(k); });
            if (!any) throw ProtocolError("arbiter: store reported keys it cannot enumerate");
            ARBITER_METRICS_INC(counters_.fallbacks);
            return *any;
        }
        if (choice->source != VictimSource::Sampled) {
            ARBITER_METRICS_INC(counters_.fallbacks);
        }
        // The victim's ghost may trim the oldest ghost, which can be the
        // incoming key itself; its origin is already held in miss_ghost_.
        ghosts_.consume(incoming);
        return choice->key;
    }

    /// The store removed `victim`. Its entry becomes a ghost.
    template<ResidentStore<K> S>
    void onEvicted(const S& store, const K& victim) {
        checkStore(store, false);

        if (auto removed = segments_.remove(victim)) {
            // Frequency entries that never earned a hit left for recency reasons.
            auto origin = removed->segment == Segment::Frequency && removed->hits > 0
                ? Segment::Frequency : Segment::Recency;
            ghosts_.record(victim, origin, now_);
            if (removed->segment == Segment::Recency) {
                ARBITER_METRICS_INC(counters_.recency_evictions);
            } else {
                ARBITER_METRICS_INC(counters_.frequency_evictions);
            }
        } else {
            ARBITER_LOG_DEBUG << "arbiter: eviction of untracked key ignored";
        }
        ensureTracked(store);
    }

    /// The store inserted `key` after a miss. Places it in a pool.
    template<ResidentStore<K> S>
    void onInserted(const S& store, const K& key) {
        checkStore(store, true);
        beginMiss(key);
        adapt();

        ghosts_.consume(key);
        auto placement = admission_.place(miss_ghost_.has_value(), sketch_.estimate(key),
                                          scan_.guarded(now_));
        segments_.insert(key, placement.segment, now_, placement.position);
        if (placement.hot_bypass) {
            ARBITER_METRICS_INC(counters_.hot_bypasses);
        }

        closeMiss();
        ensureTracked(store);
    }

    /// The store served `key` from cache.
    template<ResidentStore<K> S>
    void onHit(const S& store, const K& key) {
        checkStore(store, true);
        closeMiss();
        advanceClock();
        recordAccess(key);
        scan_.onWarmAccess();
        ARBITER_METRICS_INC(counters_.hits);

        if (!segments_.promote(key, now_)) {
            ghosts_.erase(key);
            segments_.insert(key, Segment::Recency, now_);
            segments_.promote(key, now_);
            ARBITER_LOG_DEBUG << "arbiter: adopted untracked resident on hit";
        }
        ensureTracked(store);
    }

    /// Forget everything: pools, ghosts, sketch, p, scan state and clock.
    /// Metrics counters are kept.
    void reset() { rebuild(); }

    // =====================================================================
    // Introspection
    // =====================================================================

    [[nodiscard]] size_t capacity() const { return tuning_.capacity; }
    [[nodiscard]] size_t targetP() const { return target_.p(); }
    [[nodiscard]] size_t recencySize() const { return segments_.size(Segment::Recency); }
    [[nodiscard]] size_t frequencySize() const { return segments_.size(Segment::Frequency); }
    [[nodiscard]] size_t residentSize() const { return segments_.size(); }
    [[nodiscard]] size_t ghostSize() const { return ghosts_.size(); }
    [[nodiscard]] size_t ghostSize(Segment origin) const { return ghosts_.size(origin); }
    [[nodiscard]] ScanState scanState() const { return scan_.state(now_); }
    [[nodiscard]] uint32_t estimate(const K& key) const { return sketch_.estimate(key); }
    [[nodiscard]] std::optional<Segment> segmentOf(const K& key) const { return segments_.contains(key); }
    [[nodiscard]] std::optional<Segment> ghostOf(const K& key) const { return ghosts_.contains(key); }
    [[nodiscard]] uint64_t now() const { return now_; }
    [[nodiscard]] const config::Tuning& tuning() const { return tuning_; }
    [[nodiscard]] const config::EngineConfig& engineConfig() const { return config_; }

    /// Victim selectVictim would pick for `incoming` right now, without
    /// adapting p or touching any state. nullopt when nothing is tracked.
    [[nodiscard]] std::optional<K> preview(const K& incoming) const {
        auto choice = selector_.select(segments_, ghosts_, sketch_, incoming, effectiveP());
        if (!choice) return std::nullopt;
        return choice->key;
    }

    [[nodiscard]] MetricsSnapshot metrics() const {
        MetricsSnapshot s;
        s.hits = counters_.hits.load();
        s.misses = counters_.misses.load();
        s.admissions_rejected = counters_.admissions_rejected.load();
        s.recency_ghost_hits = counters_.recency_ghost_hits.load();
        s.frequency_ghost_hits = counters_.frequency_ghost_hits.load();
        s.hot_bypasses = counters_.hot_bypasses.load();
        s.recency_evictions = counters_.recency_evictions.load();
        s.frequency_evictions = counters_.frequency_evictions.load();
        s.fallbacks = counters_.fallbacks.load();
        s.resyncs = counters_.resyncs.load();
        s.capacity_resets = counters_.capacity_resets.load();
        s.store_resets = counters_.store_resets.load();
        s.scan_guards = counters_.scan_guards.load();
        s.sketch_agings = counters_.sketch_agings.load();
        s.capacity = tuning_.capacity;
        s.target_p = target_.p();
        s.recency_size = segments_.size(Segment::Recency);
        s.frequency_size = segments_.size(Segment::Frequency);
        s.ghost_size = ghosts_.size();
        return s;
    }

    void resetMetrics() noexcept { counters_.reset(); }

private:
    // =====================================================================
    // Miss bookkeeping
    // =====================================================================

    /// Opens the miss for `key` unless it is already open. Runs the
    /// per-access work exactly once per miss.
    void beginMiss(const K& key) {
        if (miss_key_ && *miss_key_ == key) return;
        miss_key_.emplace(key);
        miss_ghost_ = ghosts_.contains(key);
        adapted_ = false;

        advanceClock();
        recordAccess(key);
        was_guarded_ = scan_.guarded(now_);
        ARBITER_METRICS_INC(counters_.misses);

        if (miss_ghost_) {
            scan_.onWarmAccess();
        } else if (scan_.onColdMiss(now_)) {
            ARBITER_METRICS_INC(counters_.scan_guards);
            ARBITER_LOG_DEBUG << "arbiter: scan guard until t=" << scan_.guardUntil()
                              << " after " << scan_.streak() << " cold misses";
        }
    }

    void closeMiss() {
        miss_key_.reset();
        miss_ghost_.reset();
    }

    /// Target adaptation for a ghost hit, at most once per miss.
    void adapt() {
        if (adapted_ || !miss_ghost_) return;
        adapted_ = true;
        auto origin = miss_ghost_;
        target_.onGhostHit(*origin, ghosts_.size(Segment::Recency),
                           ghosts_.size(Segment::Frequency), was_guarded_, now_);
        if (*origin == Segment::Recency) {
            ARBITER_METRICS_INC(counters_.recency_ghost_hits);
        } else {
            ARBITER_METRICS_INC(counters_.frequency_ghost_hits);
        }
    }

    void advanceClock() {
        ++now_;
        target_.tick(now_);
    }

    void recordAccess(const K& key) {
        sketch_.increment(key);
        if (sketch_.opsSinceAging() == 0) {
            ARBITER_METRICS_INC(counters_.sketch_agings);
        }
    }

    [[nodiscard]] size_t effectiveP() const {
        return target_.effective(scan_.guarded(now_), tuning_.guard_p_bias);
    }

    // =====================================================================
    // Store consistency
    // =====================================================================

    template<ResidentStore<K> S>
    void checkStore(const S& store, bool detect_emptied) {
        size_t cap = store.capacity();
        if (cap != tuning_.capacity) {
            ARBITER_LOG_WARN << "arbiter: store capacity changed " << tuning_.capacity
                             << " -> " << cap << ", resetting engine";
            auto tuning = config_.resolve(cap);
            if (!tuning) throw ConfigException(tuning.error());
            tuning_ = *tuning;
            rebuild();
            ARBITER_METRICS_INC(counters_.capacity_resets);
            return;
        }
        if (detect_emptied && store.size() == 0 && segments_.size() > 0) {
            ARBITER_LOG_DEBUG << "arbiter: store emptied, starting a new run";
            rebuild();
            ARBITER_METRICS_INC(counters_.store_resets);
        }
    }

    template<ResidentStore<K> S>
    void ensureTracked(const S& store) {
        if (segments_.size() != store.size()) resync(store);
    }

    /// Drop entries the store no longer holds; adopt store keys the engine
    /// never saw into the recency pool.
    template<ResidentStore<K> S>
    void resync(const S& store) {
        std::vector<K> stale;
        segments_.forEachKey([&](const K& k) {
            if (!store.contains(k)) stale.push_back(k);
        });
        for (const auto& k : stale) segments_.remove(k);

        size_t adopted = 0;
        store.forEachKey([&](const K& k) {
            if (!segments_.contains(k)) {
                ghosts_.erase(k);
                segments_.insert(k, Segment::Recency, now_, Position::Lru);
                ++adopted;
            }
        });

        ARBITER_METRICS_INC(counters_.resyncs);
        ARBITER_LOG_WARN << "arbiter: resync dropped " << stale.size()
                         << " stale entries, adopted " << adopted;
    }

    void rebuild() {
        const auto& t = tuning_;
        prng_ = Prng(t.seed);
        segments_ = SegmentManager<K, Hash>(t.capacity);
        ghosts_ = GhostHistory<K, Hash>(t.ghost_bound, t.ghost_trim);
        sketch_ = FrequencySketch<K, Hash>(typename FrequencySketch<K, Hash>::Params{
            t.sketch_width, t.sketch_depth, t.counter_max, t.age_period, t.doorkeeper,
            static_cast<uint64_t>(prng_())});
        target_ = TargetController(t);
        scan_ = ScanDetector(t.cold_streak_threshold, t.guard_window);
        admission_ = AdmissionController(t);
        selector_ = VictimSelector<K, Hash>(t.sample_size);
        now_ = 0;
        miss_key_.reset();
        miss_ghost_.reset();
        adapted_ = false;
        was_guarded_ = false;
    }

    config::EngineConfig config_;
    config::Tuning tuning_;
    Prng prng_;

    SegmentManager<K, Hash> segments_;
    GhostHistory<K, Hash> ghosts_;
    FrequencySketch<K, Hash> sketch_;
    TargetController target_;
    ScanDetector scan_;
    AdmissionController admission_;
    VictimSelector<K, Hash> selector_;

    uint64_t now_ = 0;
    std::optional<K> miss_key_;
    std::optional<Segment> miss_ghost_;   // ghost origin of the open miss, if any
    bool adapted_ = false;
    bool was_guarded_ = false;

    EngineCounters counters_;

#ifdef ARBITER_BUILDING_TESTS
    friend struct ::arbiter_test::TestInternals;
#endif
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_EVICTION_ENGINE_H
