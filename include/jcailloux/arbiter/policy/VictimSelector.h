#ifndef JCX_ARBITER_POLICY_VICTIM_SELECTOR_H
#define JCX_ARBITER_POLICY_VICTIM_SELECTOR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <tuple>
#include <vector>

#include "jcailloux/arbiter/config/KeyTraits.h"
#include "jcailloux/arbiter/policy/FrequencySketch.h"
#include "jcailloux/arbiter/policy/GhostHistory.h"
#include "jcailloux/arbiter/policy/Segment.h"
#include "jcailloux/arbiter/policy/SegmentManager.h"

namespace jcailloux::arbiter::policy {

/// How a victim was found.
enum class VictimSource : uint8_t {
    Sampled,        // k-sample of the pool chosen by REPLACE
    OtherPool,      // chosen pool yielded nothing
    GlobalOldest,
    AnyResident,
};

template<typename K>
struct VictimChoice {
    K key;
    Segment segment;
    VictimSource source;
};

// =========================================================================
// VictimSelector: ARC REPLACE + sketch-scored k-sampling
// =========================================================================
//
// REPLACE picks the pool: recency when |R| exceeds the (effective) target,
// or equals it while the incoming key is a frequency ghost. An empty pool
// is never chosen while the other one has entries.
//
// Within the pool the k LRU-most entries are candidates; the one with the
// lowest sketch estimate wins, then the oldest last_access, then the
// smallest key. select() never mutates anything.

template<typename K, typename Hash = config::AutoHash<K>>
class VictimSelector {
public:
    VictimSelector() = default;
    explicit VictimSelector(size_t sample_size) : sample_size_(sample_size) {
        scratch_.reserve(sample_size);
    }

    [[nodiscard]] static bool evictFromRecency(size_t recency, size_t frequency, size_t effective_p,
                                               bool incoming_is_frequency_ghost) {
        if (frequency == 0) return true;
        if (recency == 0) return false;
        return recency > effective_p || (incoming_is_frequency_ghost && recency == effective_p);
    }

    [[nodiscard]] std::optional<VictimChoice<K>> select(const SegmentManager<K, Hash>& segments,
                                                        const GhostHistory<K, Hash>& ghosts,
                                                        const FrequencySketch<K, Hash>& sketch,
                                                        const K& incoming,
                                                        size_t effective_p) const {
        if (segments.size() == 0) return std::nullopt;

        bool in_freq_ghost = ghosts.contains(incoming) == Segment::Frequency;
        auto pool = evictFromRecency(segments.size(Segment::Recency),
                                     segments.size(Segment::Frequency),
                                     effective_p, in_freq_ghost)
            ? Segment::Recency : Segment::Frequency;

        if (auto key = sample(segments, sketch, pool))
            return VictimChoice<K>{*key, pool, VictimSource::Sampled};
        if (auto key = sample(segments, sketch, opposite(pool)))
            return VictimChoice<K>{*key, opposite(pool), VictimSource::OtherPool};
        if (auto key = segments.globalOldest())
            return VictimChoice<K>{*key, *segments.contains(*key), VictimSource::GlobalOldest};
        if (auto key = segments.anyKey())
            return VictimChoice<K>{*key, *segments.contains(*key), VictimSource::AnyResident};
        return std::nullopt;
    }

    [[nodiscard]] size_t sampleSize() const { return sample_size_; }

private:
    std::optional<K> sample(const SegmentManager<K, Hash>& segments,
                            const FrequencySketch<K, Hash>& sketch,
                            Segment pool) const {
        segments.oldest(pool, sample_size_, scratch_);
        std::optional<K> best;
        std::tuple<uint32_t, uint64_t> best_score{};
        for (const auto& key : scratch_) {
            std::tuple<uint32_t, uint64_t> score{sketch.estimate(key),
                                                 segments.lastAccess(key).value_or(0)};
            if (!best || score < best_score || (score == best_score && key < *best)) {
                best.emplace(key);
                best_score = score;
            }
        }
        return best;
    }

    size_t sample_size_ = 4;
    mutable std::vector<K> scratch_;
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_VICTIM_SELECTOR_H
