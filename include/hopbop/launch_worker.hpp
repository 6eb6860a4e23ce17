#pragma once

#include <atomic>
#include <cstddef>
#include <thread>

#include "hopbop/app_launcher.hpp"
#include "hopbop/launch_queue.hpp"

namespace hb::core {

// Single consumer of the LaunchQueue. A failed launch is logged and the
// loop moves on to the next request.
class LaunchWorker {
public:
    LaunchWorker(LaunchQueue& queue, AppLauncher& launcher);
    ~LaunchWorker();

    void start();
    void stop();

    [[nodiscard]] std::size_t launchedCount() const noexcept { return launched_.load(); }
    [[nodiscard]] std::size_t failedCount() const noexcept { return failed_.load(); }

private:
    LaunchQueue& queue_;
    AppLauncher& launcher_;
    std::thread thread_;
    std::atomic<std::size_t> launched_{0};
    std::atomic<std::size_t> failed_{0};

    void runLoop();
};

}  // namespace hb::core
