#include "hopbop/config_loader.hpp"

#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "hopbop/errors.hpp"
#include "hopbop/hotkey_slots.hpp"

namespace hb::core {

namespace {

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string getenvOr(const char* key, const std::string& fallback) {
    const char* v = std::getenv(key);
    if (v && *v) return std::string(v);
    return fallback;
}

// Present-but-wrong-type is an error, absent is nullopt.
std::optional<std::string> stringSetting(const toml::table& tbl, const char* key) {
    const toml::node* node = tbl.get(key);
    if (!node) return std::nullopt;
    if (auto val = node->as_string()) return val->get();
    throw ConfigError(ConfigError::Kind::Invalid,
                      std::string("Setting '") + key + "' must be a string");
}

std::optional<std::int64_t> integerSetting(const toml::table& tbl, const char* key) {
    const toml::node* node = tbl.get(key);
    if (!node) return std::nullopt;
    if (auto val = node->as_integer()) return val->get();
    throw ConfigError(ConfigError::Kind::Invalid,
                      std::string("Setting '") + key + "' must be an integer");
}

std::optional<std::vector<std::string>> stringArraySetting(const toml::table& tbl, const char* key) {
    const toml::node* node = tbl.get(key);
    if (!node) return std::nullopt;
    const auto* arr = node->as_array();
    if (!arr) {
        throw ConfigError(ConfigError::Kind::Invalid,
                          std::string("Setting '") + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        const auto* s = elem.as_string();
        if (!s) {
            throw ConfigError(ConfigError::Kind::Invalid,
                              std::string("Setting '") + key + "' must be an array of strings");
        }
        out.push_back(s->get());
    }
    return out;
}

}  // namespace

std::string expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const std::string home = getenvOr("HOME", "");
    if (home.empty()) return path;
    return home + path.substr(1);
}

std::string defaultSettingsPath() {
    std::string base = getenvOr("XDG_CONFIG_HOME", "");
    if (base.empty()) {
        base = expandHome("~/.config");
    }
    return (std::filesystem::path(base) / "hopbop" / "hopbop.toml").string();
}

std::string defaultHotkeysPath() {
    return expandHome("~/.hopbop");
}

DaemonSettings defaultSettings() {
    DaemonSettings settings;
    settings.hotkeys_file = defaultHotkeysPath();
    return settings;
}

DaemonSettings loadSettings(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ConfigError(ConfigError::Kind::Unreadable, "Failed to open settings file: " + path);
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        throw ConfigError(ConfigError::Kind::Invalid,
                          "TOML Parse Error in " + path + ": " + std::string(err.description()));
    }

    DaemonSettings settings = defaultSettings();

    if (auto file = stringSetting(tbl, "hotkeys_file")) {
        if (trim(*file).empty()) {
            throw ConfigError(ConfigError::Kind::Invalid, "Setting 'hotkeys_file' is empty");
        }
        settings.hotkeys_file = expandHome(trim(*file));
    }

    if (auto mod = stringSetting(tbl, "modifier")) {
        auto bit = modifierFromName(*mod);
        if (!bit) {
            throw ConfigError(ConfigError::Kind::Invalid, "Unsupported modifier: " + *mod);
        }
        settings.modifier = *bit;
    }

    if (auto delay = integerSetting(tbl, "reload_delay_ms")) {
        if (*delay < 0 || *delay > 10000) {
            throw ConfigError(ConfigError::Kind::Invalid,
                              "Setting 'reload_delay_ms' out of range: " + std::to_string(*delay));
        }
        settings.reload_delay = std::chrono::milliseconds(*delay);
    }

    if (auto launcher = stringSetting(tbl, "launcher")) {
        settings.launcher = *launcher;
    }

    if (auto command = stringArraySetting(tbl, "launch_command")) {
        if (command->empty() || command->front().empty()) {
            throw ConfigError(ConfigError::Kind::Invalid, "Setting 'launch_command' is empty");
        }
        settings.launch_command = std::move(*command);
    }

    if (auto match = stringSetting(tbl, "device_match")) {
        settings.device_match = *match;
    }

    return settings;
}

MappingSnapshot parseHotkeys(std::istream& in) {
    std::vector<LaunchTarget> targets;
    std::string line;
    while (targets.size() < kHotkeySlotCount && std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;
        targets.push_back(std::move(line));
    }
    return MappingSnapshot(targets);
}

MappingSnapshot loadHotkeys(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw ConfigError(ConfigError::Kind::Unreadable, "Hotkey file is a directory: " + path);
    }
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(ConfigError::Kind::Unreadable, "Failed to open hotkey file: " + path);
    }
    MappingSnapshot snapshot = parseHotkeys(in);
    if (in.bad()) {
        throw ConfigError(ConfigError::Kind::Unreadable, "Failed to read hotkey file: " + path);
    }
    return snapshot;
}

ConfigLoader::ConfigLoader(MappingStore& store, std::string hotkeys_path)
    : store_(store), path_(std::move(hotkeys_path)) {}

bool ConfigLoader::reload() {
    MappingSnapshotPtr snapshot;
    try {
        snapshot = std::make_shared<const MappingSnapshot>(loadHotkeys(path_));
    } catch (const std::exception& ex) {
        std::cerr << "[ConfigLoader] Failed to load config: " << ex.what() << '\n';
        return false;
    }

    store_.replace(snapshot);

    if (snapshot->empty()) {
        std::cout << "[ConfigLoader] No hotkeys configured in " << path_ << '\n';
    }
    for (const auto& [slot, target] : snapshot->entries()) {
        std::cout << "[" << slot << "] -> " << target << '\n';
    }
    return true;
}

}  // namespace hb::core
