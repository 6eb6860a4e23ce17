#pragma once

#include <chrono>
#include <istream>
#include <string>
#include <vector>

#include "hopbop/mapping_store.hpp"
#include "hopbop/types.hpp"

namespace hb::core {

struct DaemonSettings {
    std::string hotkeys_file;
    int modifier{kModAlt};
    std::chrono::milliseconds reload_delay{std::chrono::milliseconds{50}};
    std::string launcher{"spawn"};
    std::vector<std::string> launch_command{"gtk-launch"};
    std::string device_match{"-kbd"};
};

// Default settings location: $XDG_CONFIG_HOME/hopbop/hopbop.toml,
// falling back to ~/.config/hopbop/hopbop.toml.
[[nodiscard]] std::string defaultSettingsPath();

// ~/.hopbop
[[nodiscard]] std::string defaultHotkeysPath();

// Expands a leading "~" or "~/" using $HOME.
[[nodiscard]] std::string expandHome(const std::string& path);

[[nodiscard]] DaemonSettings defaultSettings();

// Throws ConfigError (Unreadable when the file cannot be read,
// Invalid on TOML errors or unsupported values).
[[nodiscard]] DaemonSettings loadSettings(const std::string& path);

// One target per non-blank line, trimmed, in slot order.
[[nodiscard]] MappingSnapshot parseHotkeys(std::istream& in);

// Throws ConfigError(Unreadable) if the file cannot be opened or read.
[[nodiscard]] MappingSnapshot loadHotkeys(const std::string& path);

// Sole writer of a MappingStore.
class ConfigLoader {
public:
    ConfigLoader(MappingStore& store, std::string hotkeys_path);

    // Installs the current file contents. On failure the installed
    // mapping is left as is and false is returned.
    bool reload();

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    MappingStore& store_;
    std::string path_;
};

}  // namespace hb::core
