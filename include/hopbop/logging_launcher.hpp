#pragma once

#include <mutex>

#include "hopbop/app_launcher.hpp"

namespace hb::core {

class LoggingLauncher : public AppLauncher {
public:
    std::string id() const override;
    void launch(const LaunchTarget& target) override;

private:
    std::mutex mutex_;
};

}  // namespace hb::core
