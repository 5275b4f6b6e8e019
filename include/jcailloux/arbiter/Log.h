#ifndef JCX_ARBITER_LOG_H
#define JCX_ARBITER_LOG_H

#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace jcailloux::arbiter::log {

// =============================================================================
// Log: callback-routed engine diagnostics
// =============================================================================
//
// The engine never prints. The events it absorbs (capacity resets, resync
// passes, scan guards, untracked evictions) go to one process-wide sink:
// a callback plus a minimum level. Messages below the minimum, or with no
// callback installed, are never formatted.
//
//   jcailloux::arbiter::log::setCallback([](Level level, const char* msg, size_t len) {
//       std::fprintf(stderr, "[%s] %.*s\n", levelName(level).data(), int(len), msg);
//   });
//   jcailloux::arbiter::log::setMinLevel(Level::Warn);   // drop per-miss Debug chatter

enum class Level : uint8_t { Debug, Warn, Error };

constexpr std::string_view levelName(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
    }
    return "unknown";
}

using Callback = void(*)(Level level, const char* msg, size_t len);

namespace detail {
    struct Sink {
        Callback callback = nullptr;
        Level min_level = Level::Debug;
    };

    inline Sink& sink() noexcept {
        static Sink s;
        return s;
    }
}  // namespace detail

/// Pass nullptr to silence the engine.
inline void setCallback(Callback cb) noexcept { detail::sink().callback = cb; }
inline Callback getCallback() noexcept { return detail::sink().callback; }

inline void setMinLevel(Level level) noexcept { detail::sink().min_level = level; }
inline Level minLevel() noexcept { return detail::sink().min_level; }

[[nodiscard]] inline bool enabled(Level level) noexcept {
    const auto& s = detail::sink();
    return s.callback != nullptr && level >= s.min_level;
}

// =============================================================================
// LogStream: one message, built with << and delivered on destruction
// =============================================================================

class LogStream {
public:
    explicit LogStream(Level level) noexcept : level_(level), active_(enabled(level)) {}

    ~LogStream() {
        if (active_) {
            if (auto cb = getCallback()) cb(level_, buf_.data(), buf_.size());
        }
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) append(value);
        return *this;
    }

private:
    template<typename T>
    void append(const T& value) {
        if constexpr (std::same_as<T, bool>) {
            buf_ += value ? "true" : "false";
        } else if constexpr (std::same_as<T, char>) {
            buf_ += value;
        } else if constexpr (std::is_arithmetic_v<T>) {
            char tmp[32];
            auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), value);
            if (ec == std::errc{}) buf_.append(tmp, end);
        } else if constexpr (std::is_enum_v<T>) {
            append(static_cast<std::underlying_type_t<T>>(value));
        } else if constexpr (std::is_pointer_v<std::decay_t<T>>) {
            if (value) buf_ += value;
        } else {
            buf_ += std::string_view(value);
        }
    }

    Level level_;
    bool active_;
    std::string buf_;
};

}  // namespace jcailloux::arbiter::log

#define ARBITER_LOG_ERROR ::jcailloux::arbiter::log::LogStream(::jcailloux::arbiter::log::Level::Error)
#define ARBITER_LOG_WARN  ::jcailloux::arbiter::log::LogStream(::jcailloux::arbiter::log::Level::Warn)
#define ARBITER_LOG_DEBUG ::jcailloux::arbiter::log::LogStream(::jcailloux::arbiter::log::Level::Debug)

#endif  // JCX_ARBITER_LOG_H
