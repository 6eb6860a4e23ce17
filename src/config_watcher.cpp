#include "hopbop/config_watcher.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>

namespace hb::core {

namespace {
constexpr std::uint32_t kWatchMask =
    IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_MODIFY | IN_ATTRIB;
constexpr int kPollTimeoutMs = 200;
}

ConfigWatcher::ConfigWatcher(const std::string& config_path,
                             std::chrono::milliseconds settle_delay,
                             ChangeCallback on_change)
    : path_(std::filesystem::absolute(config_path).lexically_normal()),
      dir_(path_.parent_path()),
      base_name_(path_.filename().string()),
      settle_delay_(settle_delay),
      on_change_(std::move(on_change)) {}

ConfigWatcher::~ConfigWatcher() { stop(); }

bool ConfigWatcher::start() {
    if (thread_.joinable()) return true;

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        std::cerr << "[ConfigWatcher] Failed to initialize inotify: " << std::strerror(errno) << '\n';
        return false;
    }
    watch_fd_ = inotify_add_watch(inotify_fd_, dir_.c_str(), kWatchMask);
    if (watch_fd_ < 0) {
        std::cerr << "[ConfigWatcher] Unable to watch " << dir_.string() << ": "
                  << std::strerror(errno) << '\n';
        closeWatch();
        return false;
    }

    stop_.store(false);
    thread_ = std::thread(&ConfigWatcher::runLoop, this);
    return true;
}

void ConfigWatcher::stop() {
    stop_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    closeWatch();
}

void ConfigWatcher::closeWatch() {
    if (inotify_fd_ >= 0) {
        if (watch_fd_ >= 0) {
            inotify_rm_watch(inotify_fd_, watch_fd_);
        }
        ::close(inotify_fd_);
    }
    inotify_fd_ = -1;
    watch_fd_ = -1;
}

bool ConfigWatcher::matches(const std::string& event_name) const {
    if (event_name.empty()) return false;
    if ((dir_ / event_name).lexically_normal() == path_) return true;
    return std::filesystem::path(event_name).filename().string() == base_name_;
}

bool ConfigWatcher::readEvents(bool& watch_lost) {
    bool relevant = false;
    alignas(inotify_event) char buf[4096];
    while (true) {
        ssize_t len = ::read(inotify_fd_, buf, sizeof(buf));
        if (len <= 0) {
            if (len < 0 && errno == EINTR) continue;
            break;  // EAGAIN: nothing left
        }
        std::size_t i = 0;
        while (i < static_cast<std::size_t>(len)) {
            const auto* ev = reinterpret_cast<const inotify_event*>(buf + i);
            if (ev->mask & IN_IGNORED) {
                watch_lost = true;
            } else if (ev->len > 0 && (ev->mask & kWatchMask) && matches(ev->name)) {
                relevant = true;
            }
            i += sizeof(inotify_event) + ev->len;
        }
    }
    return relevant;
}

void ConfigWatcher::runLoop() {
    while (!stop_.load()) {
        pollfd pfd{};
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, kPollTimeoutMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ConfigWatcher] poll failed: " << std::strerror(errno) << '\n';
            break;
        }
        if (rc == 0) continue;

        bool watch_lost = false;
        if (!readEvents(watch_lost)) {
            if (watch_lost) {
                std::cerr << "[ConfigWatcher] Watch on " << dir_.string()
                          << " was removed; hot reload disabled" << '\n';
                break;
            }
            continue;
        }

        // Let multi-step writes settle, then fold whatever queued up meanwhile.
        std::this_thread::sleep_for(settle_delay_);
        readEvents(watch_lost);
        if (stop_.load()) break;

        std::cout << "[ConfigWatcher] Config file changed. Reloading..." << '\n';
        try {
            on_change_();
        } catch (const std::exception& ex) {
            std::cerr << "[ConfigWatcher] Reload failed: " << ex.what() << '\n';
        }

        if (watch_lost) {
            std::cerr << "[ConfigWatcher] Watch on " << dir_.string()
                      << " was removed; hot reload disabled" << '\n';
            break;
        }
    }
}

}  // namespace hb::core
