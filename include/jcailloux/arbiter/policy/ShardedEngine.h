#ifndef JCX_ARBITER_POLICY_SHARDED_ENGINE_H
#define JCX_ARBITER_POLICY_SHARDED_ENGINE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "jcailloux/arbiter/config/EngineConfig.h"
#include "jcailloux/arbiter/config/KeyTraits.h"
#include "jcailloux/arbiter/policy/EvictionEngine.h"
#include "jcailloux/arbiter/policy/Metrics.h"

namespace jcailloux::arbiter::policy {

// =========================================================================
// ShardedEngine: N independent engines, one mutex each
// =========================================================================
//
// A key always maps to the same shard (XXH3 of its hash). Each shard serves
// its own store partition of capacity_per_shard entries. The caller runs its
// store operation and the matching hooks inside withShard(), which holds the
// shard's lock for the whole call:
//
//   sharded.withShard(key, [&](auto& engine, size_t shard) {
//       auto& store = stores[shard];
//       if (store.contains(key)) engine.onHit(store, key);
//       else ...
//   });

template<typename K, size_t Shards, typename Hash = config::AutoHash<K>>
requires (Shards > 0)
class ShardedEngine {
public:
    using Engine = EvictionEngine<K, Hash>;

    explicit ShardedEngine(size_t capacity_per_shard,
                           const config::EngineConfig& cfg = config::Balanced) {
        for (size_t i = 0; i < Shards; ++i) {
            // Distinct sketch seeds per shard.
            shards_[i] = std::make_unique<Shard>(capacity_per_shard, cfg.with_seed(cfg.seed + i));
        }
    }

    [[nodiscard]] size_t shardOf(const K& key) const {
        return static_cast<size_t>(config::mixHash64(hash_(key), kShardSeed) % Shards);
    }

    template<typename F>
    decltype(auto) withShard(const K& key, F&& fn) {
        auto idx = shardOf(key);
        auto& shard = *shards_[idx];
        std::lock_guard lock(shard.mutex);
        return std::forward<F>(fn)(shard.engine, idx);
    }

    /// Sum of all shard snapshots, each taken under its lock.
    [[nodiscard]] MetricsSnapshot metrics() const {
        MetricsSnapshot total;
        for (const auto& shard : shards_) {
            std::lock_guard lock(shard->mutex);
            total += shard->engine.metrics();
        }
        return total;
    }

    void reset() {
        for (auto& shard : shards_) {
            std::lock_guard lock(shard->mutex);
            shard->engine.reset();
        }
    }

    static constexpr size_t shardCount() { return Shards; }

private:
    static constexpr uint64_t kShardSeed = 0x5bd1e9955bd1e995ull;

    struct Shard {
        Shard(size_t capacity, const config::EngineConfig& cfg) : engine(capacity, cfg) {}
        mutable std::mutex mutex;
        Engine engine;
    };

    std::array<std::unique_ptr<Shard>, Shards> shards_;
    [[no_unique_address]] Hash hash_{};
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_SHARDED_ENGINE_H
