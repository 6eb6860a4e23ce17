#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace hb::core {

// Watches the directory holding the hotkey file so that editors which
// write a temp file and rename it over the original are noticed too.
class ConfigWatcher {
public:
    using ChangeCallback = std::function<void()>;

    ConfigWatcher(const std::string& config_path,
                  std::chrono::milliseconds settle_delay,
                  ChangeCallback on_change);
    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    // Returns false (and logs) if the watch could not be set up.
    bool start();
    void stop();

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }
    [[nodiscard]] bool matches(const std::string& event_name) const;

private:
    std::filesystem::path path_;
    std::filesystem::path dir_;
    std::string base_name_;
    std::chrono::milliseconds settle_delay_;
    ChangeCallback on_change_;

    int inotify_fd_{-1};
    int watch_fd_{-1};
    std::atomic<bool> stop_{false};
    std::thread thread_;

    void runLoop();
    // Drains queued notifications; true if any concerned the config file.
    bool readEvents(bool& watch_lost);
    void closeWatch();
};

}  // namespace hb::core
