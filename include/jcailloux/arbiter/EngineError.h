#ifndef JCX_ARBITER_ENGINE_ERROR_H
#define JCX_ARBITER_ENGINE_ERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace jcailloux::arbiter {

/// Base class for runtime failures raised by the engine.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The cache store broke the hook protocol (e.g. selectVictim while the store
/// is empty or below capacity). This is a programmer error in the integration.
class ProtocolError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// Validation failure of an EngineConfig for a given capacity.
struct ConfigError {
    enum class Type : uint8_t {
        ZeroCapacity,
        CapacityTooLarge,
        InvalidFraction,
        InvalidGhostMultiple,
        InvalidCounterMax,
        InvalidSketchDepth,
        InvalidMomentum,
    };

    Type type;
    std::string field;

    [[nodiscard]] std::string message() const {
        switch (type) {
            case Type::ZeroCapacity:         return "capacity must be > 0";
            case Type::CapacityTooLarge:     return "capacity exceeds the 32-bit slot index";
            case Type::InvalidFraction:      return "fraction out of range: " + field;
            case Type::InvalidGhostMultiple: return "ghost_multiple must be 1 or 2";
            case Type::InvalidCounterMax:    return "counter_max must be in [1, 255]";
            case Type::InvalidSketchDepth:   return "sketch_depth must be in [1, 8]";
            case Type::InvalidMomentum:      return "p_momentum must be in [0, 1)";
        }
        return "invalid configuration: " + field;
    }
};

/// Thrown by the engine constructor when its configuration does not resolve.
class ConfigException : public EngineError {
public:
    explicit ConfigException(ConfigError err)
        : EngineError("arbiter: " + err.message()), error_(std::move(err)) {}

    [[nodiscard]] const ConfigError& error() const noexcept { return error_; }

private:
    ConfigError error_;
};

}  // namespace jcailloux::arbiter

#endif  // JCX_ARBITER_ENGINE_ERROR_H
