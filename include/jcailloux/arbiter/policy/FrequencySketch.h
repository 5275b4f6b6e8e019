#ifndef JCX_ARBITER_POLICY_FREQUENCY_SKETCH_H
#define JCX_ARBITER_POLICY_FREQUENCY_SKETCH_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "jcailloux/arbiter/config/KeyTraits.h"

namespace jcailloux::arbiter::policy {

// =========================================================================
// FrequencySketch: Count-Min sketch with conservative update and aging
// =========================================================================
//
// depth rows × width (power of 2) saturating 8-bit counters. One XXH3-128
// hash per key yields (low, high); row i reads column (low + i*high) mod
// width. high is odd, so rows never collapse onto one column stride.
//
// Conservative update: only counters below min(row minima) + weight are
// raised, which keeps overestimation low for skewed traces.
//
// Every age_period increments all counters are halved (and the doorkeeper,
// if enabled, is cleared). Between two aging events estimate() never
// decreases.
//
// Optional doorkeeper: a one-hash bitset absorbing the first occurrence of a
// key so one-hit wonders never reach the counters. estimate() adds 1 for a
// key present in the doorkeeper.

template<typename K, typename Hash = config::AutoHash<K>>
class FrequencySketch {
public:
    struct Params {
        size_t width = 64;          // power of 2
        uint8_t depth = 4;
        uint8_t counter_max = 15;
        size_t age_period = 512;
        bool doorkeeper = false;
        uint64_t seed = 0;
    };

    FrequencySketch() : FrequencySketch(Params{}) {}

    explicit FrequencySketch(const Params& params)
        : width_(params.width)
        , mask_(params.width - 1)
        , depth_(params.depth)
        , counter_max_(params.counter_max)
        , age_period_(params.age_period)
        , seed_(params.seed)
        , use_doorkeeper_(params.doorkeeper)
        , counters_(params.width * params.depth, 0)
        , doorkeeper_(params.doorkeeper ? (params.width + 63) / 64 : 0, 0) {}

    void increment(const K& key, uint32_t weight = 1) {
        auto h = config::mixHash(hash_(key), seed_);

        if (use_doorkeeper_ && weight > 0 && !doorkeeperTestAndSet(h.low)) {
            --weight;
        }

        if (weight > 0) {
            uint32_t row_min = counter_max_;
            for (uint8_t i = 0; i < depth_; ++i)
                row_min = std::min<uint32_t>(row_min, counters_[slot(h, i)]);

            auto target = static_cast<uint8_t>(
                std::min<uint32_t>(counter_max_, row_min + weight));
            for (uint8_t i = 0; i < depth_; ++i) {
                auto& c = counters_[slot(h, i)];
                if (c < target) c = target;
            }
        }

        if (++ops_ >= age_period_) age();
    }

    [[nodiscard]] uint32_t estimate(const K& key) const {
        auto h = config::mixHash(hash_(key), seed_);
        uint32_t row_min = counter_max_;
        for (uint8_t i = 0; i < depth_; ++i)
            row_min = std::min<uint32_t>(row_min, counters_[slot(h, i)]);
        if (use_doorkeeper_ && doorkeeperTest(h.low)) ++row_min;
        return row_min;
    }

    /// Halve every counter and clear the doorkeeper.
    void age() {
        for (auto& c : counters_) c >>= 1;
        std::fill(doorkeeper_.begin(), doorkeeper_.end(), 0);
        ops_ = 0;
        ++agings_;
    }

    void clear() {
        std::fill(counters_.begin(), counters_.end(), 0);
        std::fill(doorkeeper_.begin(), doorkeeper_.end(), 0);
        ops_ = 0;
        agings_ = 0;
    }

    [[nodiscard]] size_t width() const { return width_; }
    [[nodiscard]] uint8_t depth() const { return depth_; }
    [[nodiscard]] uint8_t counterMax() const { return counter_max_; }
    [[nodiscard]] size_t agePeriod() const { return age_period_; }
    [[nodiscard]] size_t opsSinceAging() const { return ops_; }
    [[nodiscard]] uint64_t agings() const { return agings_; }
    [[nodiscard]] bool hasDoorkeeper() const { return use_doorkeeper_; }

private:
    size_t slot(const config::MixedHash& h, uint8_t row) const {
        return static_cast<size_t>(row) * width_ + ((h.low + row * h.high) & mask_);
    }

    size_t doorkeeperBit(uint64_t low) const { return (low >> 32) & mask_; }

    bool doorkeeperTest(uint64_t low) const {
        auto bit = doorkeeperBit(low);
        return (doorkeeper_[bit >> 6] >> (bit & 63)) & 1;
    }

    /// Returns whether the bit was already set.
    bool doorkeeperTestAndSet(uint64_t low) {
        auto bit = doorkeeperBit(low);
        auto& word = doorkeeper_[bit >> 6];
        uint64_t m = uint64_t{1} << (bit & 63);
        bool was = (word & m) != 0;
        word |= m;
        return was;
    }

    size_t width_;
    size_t mask_;
    uint8_t depth_;
    uint8_t counter_max_;
    size_t age_period_;
    uint64_t seed_;
    bool use_doorkeeper_;
    std::vector<uint8_t> counters_;
    std::vector<uint64_t> doorkeeper_;
    size_t ops_ = 0;
    uint64_t agings_ = 0;
    [[no_unique_address]] Hash hash_{};
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_FREQUENCY_SKETCH_H
