#ifndef JCX_ARBITER_CONFIG_KEY_TRAITS_H
#define JCX_ARBITER_CONFIG_KEY_TRAITS_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <xxhash.h>

namespace jcailloux::arbiter::config {

// =============================================================================
// Hash support for std::tuple (composite cache keys)
// =============================================================================

namespace detail {

inline size_t hash_combine(size_t seed, size_t h) {
    return seed ^ (h + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

}  // namespace detail

template<typename T>
struct AutoHash : std::hash<T> {};

template<typename... Ts>
struct AutoHash<std::tuple<Ts...>> {
    size_t operator()(const std::tuple<Ts...>& t) const {
        size_t seed = 0;
        std::apply([&](const auto&... args) {
            ((seed = detail::hash_combine(seed, AutoHash<std::decay_t<decltype(args)>>{}(args))), ...);
        }, t);
        return seed;
    }
};

template<typename A, typename B>
struct AutoHash<std::pair<A, B>> {
    size_t operator()(const std::pair<A, B>& p) const {
        return detail::hash_combine(AutoHash<A>{}(p.first), AutoHash<B>{}(p.second));
    }
};

// =============================================================================
// EngineKey: what the engine requires from a cache key
// =============================================================================
//
// Hashable (through Hash), equality-comparable (map lookups) and totally
// ordered (last tie-break in victim selection, keeps victim sequences
// deterministic for a given trace).

template<typename K, typename Hash = AutoHash<K>>
concept EngineKey = std::copy_constructible<K>
    && std::equality_comparable<K>
    && std::totally_ordered<K>
    && requires(const K& k, const Hash& h) {
        { h(k) } -> std::convertible_to<size_t>;
    };

// =============================================================================
// Mixed key hash: spreads a (possibly weak) std::hash value over 128 bits
// =============================================================================
//
// std::hash<integer> is the identity on libstdc++, which would put sequential
// keys in sequential sketch columns. XXH3 re-mixes the value with a per-engine
// seed before the sketch derives its row indices from it.

struct MixedHash {
    uint64_t low;
    uint64_t high;
};

inline MixedHash mixHash(size_t key_hash, uint64_t seed) noexcept {
    uint64_t v = static_cast<uint64_t>(key_hash);
    XXH128_hash_t h = XXH3_128bits_withSeed(&v, sizeof(v), seed);
    return {h.low64, h.high64 | 1};  // odd stride: visits every column of a pow2 row
}

inline uint64_t mixHash64(size_t key_hash, uint64_t seed) noexcept {
    uint64_t v = static_cast<uint64_t>(key_hash);
    return XXH3_64bits_withSeed(&v, sizeof(v), seed);
}

}  // namespace jcailloux::arbiter::config

#endif  // JCX_ARBITER_CONFIG_KEY_TRAITS_H
