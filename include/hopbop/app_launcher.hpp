#pragma once

#include <memory>
#include <string>

#include "hopbop/types.hpp"

namespace hb::core {

struct DaemonSettings;

class AppLauncher {
public:
    virtual ~AppLauncher() = default;

    virtual std::string id() const = 0;

    // Starts the application and returns without waiting for it.
    // Throws LaunchError when the spawn itself fails.
    virtual void launch(const LaunchTarget& target) = 0;
};

// Throws ConfigError(Invalid) for an unknown launcher id.
std::unique_ptr<AppLauncher> createLauncher(const DaemonSettings& settings);

}  // namespace hb::core
