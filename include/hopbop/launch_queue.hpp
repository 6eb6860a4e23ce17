#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "hopbop/types.hpp"

namespace hb::core {

// Unbounded FIFO between the interception thread (producer) and the
// launch worker (consumer). push() never waits on the consumer.
class LaunchQueue {
public:
    LaunchQueue() = default;

    LaunchQueue(const LaunchQueue&) = delete;
    LaunchQueue& operator=(const LaunchQueue&) = delete;

    // Returns false only once shutdown() has been called.
    bool push(LaunchTarget target);

    // Blocks until a request is available or the queue is shut down.
    // Returns nullopt only after shutdown.
    [[nodiscard]] std::optional<LaunchTarget> popWait();

    [[nodiscard]] std::optional<LaunchTarget> tryPop();

    // Wakes the consumer; pending requests are discarded.
    void shutdown();

    [[nodiscard]] bool isShutdown() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<LaunchTarget> requests_;
    bool shutdown_{false};
};

}  // namespace hb::core
