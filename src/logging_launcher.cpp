#include "hopbop/logging_launcher.hpp"

#include <iostream>

namespace hb::core {

std::string LoggingLauncher::id() const {
    return "logging";
}

void LoggingLauncher::launch(const LaunchTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[LoggingLauncher] Would launch: " << target << '\n';
}

}  // namespace hb::core
