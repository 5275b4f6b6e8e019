#ifndef JCX_ARBITER_POLICY_SEGMENT_MANAGER_H
#define JCX_ARBITER_POLICY_SEGMENT_MANAGER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "jcailloux/arbiter/config/KeyTraits.h"
#include "jcailloux/arbiter/policy/LruArena.h"
#include "jcailloux/arbiter/policy/Segment.h"

namespace jcailloux::arbiter::policy {

/// Per-resident metadata. `hits` counts hits received while in the
/// frequency pool; promotion from recency does not count.
struct ResidentMeta {
    uint64_t last_access = 0;
    uint32_t hits = 0;
};

/// What remove() reports about the departed entry.
struct RemovedEntry {
    Segment segment;
    uint32_t hits;
};

// =========================================================================
// SegmentManager: Recency / Frequency pools over an LruArena
// =========================================================================
//
// Owns one entry per resident key. Every mutating call refreshes the
// entry's last_access stamp. Untracked keys passed to promote/touch/remove
// are reported (false / nullopt), never treated as errors: the engine
// decides how to heal.

template<typename K, typename Hash = config::AutoHash<K>>
class SegmentManager {
    using Arena = LruArena<K, ResidentMeta, Hash>;
    static constexpr uint32_t kNil = Arena::kNil;

public:
    SegmentManager() = default;
    explicit SegmentManager(size_t capacity) : arena_(capacity + 1) {}

    [[nodiscard]] std::optional<Segment> contains(const K& key) const {
        auto idx = arena_.find(key);
        if (idx == kNil) return std::nullopt;
        return static_cast<Segment>(arena_.node(idx).list);
    }

    /// Recency → Frequency MRU (a Frequency entry is touched instead).
    bool promote(const K& key, uint64_t now) {
        auto idx = arena_.find(key);
        if (idx == kNil) return false;
        auto& n = arena_.node(idx);
        if (n.list == listIndex(Segment::Frequency)) {
            ++n.payload.hits;
        } else {
            n.payload.hits = 0;
        }
        n.payload.last_access = now;
        arena_.move(idx, listIndex(Segment::Frequency));
        return true;
    }

    /// Refresh to MRU of its current pool and count a hit.
    bool touch(const K& key, uint64_t now) {
        auto idx = arena_.find(key);
        if (idx == kNil) return false;
        auto& n = arena_.node(idx);
        ++n.payload.hits;
        n.payload.last_access = now;
        arena_.move(idx, n.list);
        return true;
    }

    /// Insert (or re-place) a key with a fresh hit count.
    void insert(const K& key, Segment segment, uint64_t now, Position pos = Position::Mru) {
        bool at_tail = pos == Position::Mru;
        auto idx = arena_.find(key);
        if (idx != kNil) {
            auto& n = arena_.node(idx);
            n.payload = ResidentMeta{now, 0};
            arena_.move(idx, listIndex(segment), at_tail);
            return;
        }
        arena_.insert(listIndex(segment), key, ResidentMeta{now, 0}, at_tail);
    }

    std::optional<RemovedEntry> remove(const K& key) {
        auto idx = arena_.find(key);
        if (idx == kNil) return std::nullopt;
        const auto& n = arena_.node(idx);
        RemovedEntry removed{static_cast<Segment>(n.list), n.payload.hits};
        arena_.erase(idx);
        return removed;
    }

    /// Up to k keys from the LRU end of `segment`, oldest first. Non-mutating.
    void oldest(Segment segment, size_t k, std::vector<K>& out) const {
        out.clear();
        for (auto idx = arena_.head(listIndex(segment)); idx != kNil && out.size() < k;
             idx = arena_.next(idx)) {
            out.push_back(arena_.node(idx).key);
        }
    }

    /// LRU head with the older stamp across both pools.
    [[nodiscard]] std::optional<K> globalOldest() const {
        auto r = arena_.head(listIndex(Segment::Recency));
        auto f = arena_.head(listIndex(Segment::Frequency));
        if (r == kNil && f == kNil) return std::nullopt;
        if (f == kNil) return arena_.node(r).key;
        if (r == kNil) return arena_.node(f).key;
        return arena_.node(r).payload.last_access <= arena_.node(f).payload.last_access
            ? arena_.node(r).key : arena_.node(f).key;
    }

    [[nodiscard]] std::optional<K> anyKey() const {
        for (auto s : {Segment::Recency, Segment::Frequency}) {
            auto idx = arena_.tail(listIndex(s));
            if (idx != kNil) return arena_.node(idx).key;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<uint64_t> lastAccess(const K& key) const {
        auto idx = arena_.find(key);
        if (idx == kNil) return std::nullopt;
        return arena_.node(idx).payload.last_access;
    }

    [[nodiscard]] std::optional<uint32_t> hitsSinceAdmission(const K& key) const {
        auto idx = arena_.find(key);
        if (idx == kNil) return std::nullopt;
        return arena_.node(idx).payload.hits;
    }

    [[nodiscard]] size_t size(Segment s) const { return arena_.size(listIndex(s)); }
    [[nodiscard]] size_t size() const { return arena_.size(); }

    template<typename F>
    void forEachKey(F&& fn) const { arena_.forEachKey(std::forward<F>(fn)); }

    /// Keys of `segment` from LRU to MRU.
    [[nodiscard]] std::vector<K> keys(Segment segment) const {
        std::vector<K> out;
        out.reserve(size(segment));
        for (auto idx = arena_.head(listIndex(segment)); idx != kNil; idx = arena_.next(idx))
            out.push_back(arena_.node(idx).key);
        return out;
    }

    void clear() { arena_.clear(); }

private:
    Arena arena_;
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_SEGMENT_MANAGER_H
