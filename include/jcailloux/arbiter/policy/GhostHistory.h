#ifndef JCX_ARBITER_POLICY_GHOST_HISTORY_H
#define JCX_ARBITER_POLICY_GHOST_HISTORY_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "jcailloux/arbiter/config/EngineConfig.h"
#include "jcailloux/arbiter/config/KeyTraits.h"
#include "jcailloux/arbiter/policy/LruArena.h"
#include "jcailloux/arbiter/policy/Segment.h"

namespace jcailloux::arbiter::policy {

// =========================================================================
// GhostHistory: keys recently evicted, split by the pool they left
// =========================================================================
//
// Metadata only: a ghost never holds a value. Both sides share one bound
// (ghost_multiple * C); record() trims until the total fits again.

template<typename K, typename Hash = config::AutoHash<K>>
class GhostHistory {
    struct GhostMeta { uint64_t evicted_at = 0; };
    using Arena = LruArena<K, GhostMeta, Hash>;
    static constexpr uint32_t kNil = Arena::kNil;

public:
    GhostHistory() = default;

    GhostHistory(size_t bound, config::GhostTrim trim)
        : arena_(bound + 1), bound_(bound), trim_(trim) {}

    /// Insert or refresh at MRU of `origin`, then trim to the bound.
    /// Returns the number of ghosts trimmed.
    size_t record(const K& key, Segment origin, uint64_t now) {
        auto idx = arena_.find(key);
        if (idx != kNil) {
            arena_.node(idx).payload.evicted_at = now;
            arena_.move(idx, listIndex(origin));
        } else {
            arena_.insert(listIndex(origin), key, GhostMeta{now});
        }
        size_t trimmed = 0;
        while (arena_.size() > bound_) {
            arena_.erase(arena_.head(listIndex(trimSide())));
            ++trimmed;
        }
        return trimmed;
    }

    [[nodiscard]] std::optional<Segment> contains(const K& key) const {
        auto idx = arena_.find(key);
        if (idx == kNil) return std::nullopt;
        return static_cast<Segment>(arena_.node(idx).list);
    }

    /// Remove a ghost that turned into a hit. Remembers its side.
    std::optional<Segment> consume(const K& key) {
        auto idx = arena_.find(key);
        if (idx == kNil) return std::nullopt;
        auto origin = static_cast<Segment>(arena_.node(idx).list);
        arena_.erase(idx);
        last_hit_ = origin;
        return origin;
    }

    /// Drop a ghost silently (key became resident by other means).
    bool erase(const K& key) {
        auto idx = arena_.find(key);
        if (idx == kNil) return false;
        arena_.erase(idx);
        return true;
    }

    [[nodiscard]] size_t size(Segment s) const { return arena_.size(listIndex(s)); }
    [[nodiscard]] size_t size() const { return arena_.size(); }
    [[nodiscard]] size_t bound() const { return bound_; }
    [[nodiscard]] std::optional<Segment> lastHit() const { return last_hit_; }

    /// Keys of one side from oldest to newest.
    [[nodiscard]] std::vector<K> keys(Segment s) const {
        std::vector<K> out;
        out.reserve(size(s));
        for (auto idx = arena_.head(listIndex(s)); idx != kNil; idx = arena_.next(idx))
            out.push_back(arena_.node(idx).key);
        return out;
    }

    void clear() {
        arena_.clear();
        last_hit_.reset();
    }

private:
    Segment trimSide() const {
        auto r = arena_.head(listIndex(Segment::Recency));
        auto f = arena_.head(listIndex(Segment::Frequency));
        if (f == kNil) return Segment::Recency;
        if (r == kNil) return Segment::Frequency;

        if (trim_ == config::GhostTrim::OppositeOfLastHit && last_hit_)
            return opposite(*last_hit_);

        return arena_.node(r).payload.evicted_at <= arena_.node(f).payload.evicted_at
            ? Segment::Recency : Segment::Frequency;
    }

    Arena arena_;
    size_t bound_ = 0;
    config::GhostTrim trim_ = config::GhostTrim::OldestOverall;
    std::optional<Segment> last_hit_;
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_GHOST_HISTORY_H
