#pragma once

#include <stdexcept>
#include <string>

namespace hb::core {

class ConfigError : public std::runtime_error {
public:
    enum class Kind {
        Unreadable,
        Invalid,
    };

    ConfigError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

class LaunchError : public std::runtime_error {
public:
    enum class Kind {
        SpawnFailed,
    };

    LaunchError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

// Tap-disabled notifications are events, not errors; see TapDisabledReason.
class InterceptionError : public std::runtime_error {
public:
    enum class Kind {
        TapCreationFailed,
    };

    InterceptionError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

}  // namespace hb::core
