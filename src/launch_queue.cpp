#include "hopbop/launch_queue.hpp"

#include <utility>

namespace hb::core {

bool LaunchQueue::push(LaunchTarget target) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        requests_.push_back(std::move(target));
    }
    condition_.notify_one();
    return true;
}

std::optional<LaunchTarget> LaunchQueue::popWait() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return !requests_.empty() || shutdown_; });
    if (shutdown_) {
        return std::nullopt;
    }
    LaunchTarget target = std::move(requests_.front());
    requests_.pop_front();
    return target;
}

std::optional<LaunchTarget> LaunchQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || requests_.empty()) {
        return std::nullopt;
    }
    LaunchTarget target = std::move(requests_.front());
    requests_.pop_front();
    return target;
}

void LaunchQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        requests_.clear();
    }
    condition_.notify_all();
}

bool LaunchQueue::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

std::size_t LaunchQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

bool LaunchQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.empty();
}

}  // namespace hb::core
