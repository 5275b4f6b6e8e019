#ifndef JCX_ARBITER_POLICY_LRU_ARENA_H
#define JCX_ARBITER_POLICY_LRU_ARENA_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace jcailloux::arbiter::policy {

// =========================================================================
// LruArena: keyed slab of nodes threaded through N intrusive LRU lists
// =========================================================================
//
// Nodes live in a contiguous vector and link to each other by uint32_t
// index, so list surgery never allocates and never invalidates references
// to other nodes. Freed slots are recycled through a free list.
//
// Each list runs from head (least recently used) to tail (most recently
// used). A key belongs to at most one list at a time.
//
// Payload carries per-entry metadata (access stamp, hit count, eviction
// time); the arena itself never reads it.

template<typename K, typename Payload, typename Hash, size_t Lists = 2>
class LruArena {
public:
    static constexpr uint32_t kNil = UINT32_MAX;

    struct Node {
        K key;
        Payload payload;
        uint32_t prev = kNil;   // toward head (LRU)
        uint32_t next = kNil;   // toward tail (MRU)
        uint8_t list = 0;
    };

    LruArena() = default;

    explicit LruArena(size_t expected) {
        nodes_.reserve(expected);
        index_.reserve(expected);
    }

    // =====================================================================
    // Lookup
    // =====================================================================

    [[nodiscard]] uint32_t find(const K& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? kNil : it->second;
    }

    [[nodiscard]] bool contains(const K& key) const { return index_.contains(key); }

    Node& node(uint32_t idx) { return nodes_[idx]; }
    const Node& node(uint32_t idx) const { return nodes_[idx]; }

    // =====================================================================
    // Mutation
    // =====================================================================

    /// Insert a key that is not yet present. Returns its slot.
    uint32_t insert(uint8_t list, const K& key, Payload payload, bool at_tail = true) {
        uint32_t idx;
        if (!free_.empty()) {
            idx = free_.back();
            free_.pop_back();
            nodes_[idx].key = key;
            nodes_[idx].payload = payload;
        } else {
            idx = static_cast<uint32_t>(nodes_.size());
            nodes_.push_back(Node{key, payload});
        }
        index_.emplace(key, idx);
        link(idx, list, at_tail);
        return idx;
    }

    /// Move a present node to the tail (or head) of `list`.
    void move(uint32_t idx, uint8_t list, bool at_tail = true) {
        unlink(idx);
        link(idx, list, at_tail);
    }

    /// Remove a present node, recycling its slot.
    void erase(uint32_t idx) {
        unlink(idx);
        index_.erase(nodes_[idx].key);
        free_.push_back(idx);
    }

    void clear() {
        nodes_.clear();
        free_.clear();
        index_.clear();
        lists_ = {};
    }

    // =====================================================================
    // Traversal
    // =====================================================================

    [[nodiscard]] uint32_t head(uint8_t list) const { return lists_[list].head; }
    [[nodiscard]] uint32_t tail(uint8_t list) const { return lists_[list].tail; }

    /// Next node toward the MRU end.
    [[nodiscard]] uint32_t next(uint32_t idx) const { return nodes_[idx].next; }

    [[nodiscard]] size_t size(uint8_t list) const { return lists_[list].size; }
    [[nodiscard]] size_t size() const { return index_.size(); }
    [[nodiscard]] bool empty() const { return index_.empty(); }

    /// Visit every live key (unspecified order).
    template<typename F>
    void forEachKey(F&& fn) const {
        for (const auto& [key, idx] : index_) fn(key);
    }

private:
    struct ListHead {
        uint32_t head = kNil;
        uint32_t tail = kNil;
        size_t size = 0;
    };

    void link(uint32_t idx, uint8_t list, bool at_tail) {
        auto& n = nodes_[idx];
        auto& l = lists_[list];
        n.list = list;
        if (at_tail) {
            n.prev = l.tail;
            n.next = kNil;
            if (l.tail != kNil) nodes_[l.tail].next = idx;
            else l.head = idx;
            l.tail = idx;
        } else {
            n.prev = kNil;
            n.next = l.head;
            if (l.head != kNil) nodes_[l.head].prev = idx;
            else l.tail = idx;
            l.head = idx;
        }
        ++l.size;
    }

    void unlink(uint32_t idx) {
        auto& n = nodes_[idx];
        auto& l = lists_[n.list];
        if (n.prev != kNil) nodes_[n.prev].next = n.next;
        else l.head = n.next;
        if (n.next != kNil) nodes_[n.next].prev = n.prev;
        else l.tail = n.prev;
        n.prev = n.next = kNil;
        --l.size;
    }

    std::vector<Node> nodes_;
    std::vector<uint32_t> free_;
    std::unordered_map<K, uint32_t, Hash> index_;
    std::array<ListHead, Lists> lists_{};
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_LRU_ARENA_H
