#include "hopbop/launch_worker.hpp"

#include <exception>
#include <iostream>

namespace hb::core {

LaunchWorker::LaunchWorker(LaunchQueue& queue, AppLauncher& launcher)
    : queue_(queue), launcher_(launcher) {}

LaunchWorker::~LaunchWorker() { stop(); }

void LaunchWorker::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread(&LaunchWorker::runLoop, this);
}

void LaunchWorker::stop() {
    queue_.shutdown();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void LaunchWorker::runLoop() {
    while (auto target = queue_.popWait()) {
        try {
            launcher_.launch(*target);
            launched_.fetch_add(1);
        } catch (const std::exception& ex) {
            failed_.fetch_add(1);
            std::cerr << "[LaunchWorker] Failed to launch " << *target << ": " << ex.what() << '\n';
        }
    }
}

}  // namespace hb::core
