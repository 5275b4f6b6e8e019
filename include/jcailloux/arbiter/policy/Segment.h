#ifndef JCX_ARBITER_POLICY_SEGMENT_H
#define JCX_ARBITER_POLICY_SEGMENT_H

#include <cstdint>
#include <string_view>

namespace jcailloux::arbiter::policy {

/// Resident pool (or ghost origin). Values double as arena list indices.
enum class Segment : uint8_t { Recency = 0, Frequency = 1 };

/// Where an insertion lands in its pool's LRU order.
enum class Position : uint8_t { Mru, Lru };

constexpr Segment opposite(Segment s) noexcept {
    return s == Segment::Recency ? Segment::Frequency : Segment::Recency;
}

constexpr uint8_t listIndex(Segment s) noexcept { return static_cast<uint8_t>(s); }

constexpr std::string_view segmentName(Segment s) noexcept {
    return s == Segment::Recency ? "recency" : "frequency";
}

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_SEGMENT_H
