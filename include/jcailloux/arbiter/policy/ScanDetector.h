#ifndef JCX_ARBITER_POLICY_SCAN_DETECTOR_H
#define JCX_ARBITER_POLICY_SCAN_DETECTOR_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace jcailloux::arbiter::policy {

enum class ScanState : uint8_t { Normal, Guarded };

constexpr std::string_view scanStateName(ScanState s) noexcept {
    return s == ScanState::Normal ? "normal" : "guarded";
}

// =========================================================================
// ScanDetector: consecutive cold misses on the logical clock
// =========================================================================
//
// A cold miss is a miss on a key that is neither resident nor a ghost.
// Once the streak exceeds the threshold the detector guards until
// now + window; each further cold miss slides the deadline. A hit or a
// ghost hit ends the streak and the guard at once.

class ScanDetector {
public:
    ScanDetector() = default;

    ScanDetector(size_t cold_streak_threshold, size_t guard_window)
        : threshold_(cold_streak_threshold), window_(guard_window) {}

    /// Returns true when this miss turned a Normal detector Guarded.
    bool onColdMiss(uint64_t now) {
        ++streak_;
        if (streak_ <= threshold_) return false;
        bool entering = !guarded(now);
        guard_until_ = now + window_;
        return entering;
    }

    void onWarmAccess() {
        streak_ = 0;
        guard_until_ = 0;
    }

    /// Guarded through guard_until inclusive. A zero deadline means no
    /// guard was ever raised (or the last one was cleared).
    [[nodiscard]] bool guarded(uint64_t now) const {
        return guard_until_ != 0 && now <= guard_until_;
    }

    [[nodiscard]] ScanState state(uint64_t now) const {
        return guarded(now) ? ScanState::Guarded : ScanState::Normal;
    }

    [[nodiscard]] size_t streak() const { return streak_; }
    [[nodiscard]] uint64_t guardUntil() const { return guard_until_; }

    void reset() { onWarmAccess(); }

private:
    size_t threshold_ = 0;
    size_t window_ = 1;
    size_t streak_ = 0;
    uint64_t guard_until_ = 0;
};

}  // namespace jcailloux::arbiter::policy

#endif  // JCX_ARBITER_POLICY_SCAN_DETECTOR_H
