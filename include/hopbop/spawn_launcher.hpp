#pragma once

#include <string>
#include <vector>

#include "hopbop/app_launcher.hpp"

namespace hb::core {

// Runs `command... target` detached in its own session.
class SpawnLauncher : public AppLauncher {
public:
    explicit SpawnLauncher(std::vector<std::string> command);

    std::string id() const override;
    void launch(const LaunchTarget& target) override;

    [[nodiscard]] const std::vector<std::string>& command() const noexcept { return command_; }

private:
    std::vector<std::string> command_;
};

}  // namespace hb::core
