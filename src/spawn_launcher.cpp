#include "hopbop/spawn_launcher.hpp"

#include <spawn.h>
#include <csignal>
#include <cstring>
#include <vector>

#include "hopbop/config_loader.hpp"
#include "hopbop/errors.hpp"
#include "hopbop/logging_launcher.hpp"

extern char** environ;

namespace hb::core {

namespace {

// Owns a posix_spawnattr_t for the duration of one spawn.
class SpawnAttributes {
public:
    SpawnAttributes() {
        if (posix_spawnattr_init(&attr_) != 0) {
            throw LaunchError(LaunchError::Kind::SpawnFailed, "posix_spawnattr_init failed");
        }
        sigset_t defaults;
        sigemptyset(&defaults);
        sigaddset(&defaults, SIGCHLD);
        sigaddset(&defaults, SIGINT);
        sigaddset(&defaults, SIGTERM);
        sigaddset(&defaults, SIGPIPE);
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        if (posix_spawnattr_setsigdefault(&attr_, &defaults) != 0 ||
            posix_spawnattr_setsigmask(&attr_, &empty_mask) != 0 ||
            posix_spawnattr_setflags(&attr_, POSIX_SPAWN_SETSID | POSIX_SPAWN_SETSIGDEF |
                                                 POSIX_SPAWN_SETSIGMASK) != 0) {
            posix_spawnattr_destroy(&attr_);
            throw LaunchError(LaunchError::Kind::SpawnFailed, "Failed to configure spawn attributes");
        }
    }
    ~SpawnAttributes() { posix_spawnattr_destroy(&attr_); }

    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;

    const posix_spawnattr_t* get() const noexcept { return &attr_; }

private:
    posix_spawnattr_t attr_;
};

}  // namespace

SpawnLauncher::SpawnLauncher(std::vector<std::string> command) : command_(std::move(command)) {
    if (command_.empty() || command_.front().empty()) {
        throw ConfigError(ConfigError::Kind::Invalid, "Launch command is empty");
    }
}

std::string SpawnLauncher::id() const {
    return "spawn";
}

void SpawnLauncher::launch(const LaunchTarget& target) {
    if (target.empty()) {
        throw LaunchError(LaunchError::Kind::SpawnFailed, "Refusing to launch an empty target");
    }

    std::vector<std::string> args = command_;
    args.push_back(target);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    SpawnAttributes attr;
    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, argv[0], nullptr, attr.get(), argv.data(), environ);
    if (rc != 0) {
        throw LaunchError(LaunchError::Kind::SpawnFailed,
                          "Failed to launch " + target + " via " + command_.front() + ": " +
                              std::strerror(rc));
    }
}

std::unique_ptr<AppLauncher> createLauncher(const DaemonSettings& settings) {
    if (settings.launcher == "logging") return std::make_unique<LoggingLauncher>();
    if (settings.launcher == "spawn") return std::make_unique<SpawnLauncher>(settings.launch_command);
    throw ConfigError(ConfigError::Kind::Invalid, "Unsupported launcher: " + settings.launcher);
}

}  // namespace hb::core
