#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "hopbop/app_launcher.hpp"
#include "hopbop/config_loader.hpp"
#include "hopbop/config_watcher.hpp"
#include "hopbop/errors.hpp"
#include "hopbop/evdev_interceptor.hpp"
#include "hopbop/hotkey_dispatcher.hpp"
#include "hopbop/launch_queue.hpp"
#include "hopbop/launch_worker.hpp"
#include "hopbop/mapping_store.hpp"

using hb::core::ConfigLoader;
using hb::core::ConfigWatcher;
using hb::core::DaemonSettings;
using hb::core::EvdevInterceptor;
using hb::core::HotkeyDispatcher;
using hb::core::InterceptionError;
using hb::core::LaunchQueue;
using hb::core::LaunchWorker;
using hb::core::MappingStore;

namespace {

EvdevInterceptor* g_interceptor = nullptr;

void handleSignal(int) {
    if (g_interceptor) g_interceptor->stop();
}

DaemonSettings resolveSettings(int argc, char** argv) {
    if (argc > 1) {
        return hb::core::loadSettings(argv[1]);
    }
    const std::string path = hb::core::defaultSettingsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return hb::core::defaultSettings();
    }
    return hb::core::loadSettings(path);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::cout << "[HopBop] Starting..." << '\n';

        const DaemonSettings settings = resolveSettings(argc, argv);
        auto launcher = hb::core::createLauncher(settings);

        // Launched applications are never waited for.
        std::signal(SIGCHLD, SIG_IGN);

        MappingStore mappings;
        ConfigLoader loader(mappings, settings.hotkeys_file);
        if (!loader.reload()) {
            std::cerr << "[HopBop] Starting without hotkeys until " << loader.path() << " can be read" << '\n';
        }

        ConfigWatcher watcher(settings.hotkeys_file, settings.reload_delay, [&loader] {
            if (!loader.reload()) {
                std::cerr << "[HopBop] Keeping the previous hotkeys" << '\n';
            }
        });
        if (!watcher.start()) {
            std::cerr << "[HopBop] Config hot reload unavailable; using the mapping loaded at startup" << '\n';
        }

        LaunchQueue queue;
        LaunchWorker worker(queue, *launcher);
        worker.start();

        HotkeyDispatcher dispatcher(mappings, queue, settings.modifier);
        EvdevInterceptor interceptor(dispatcher, settings.device_match);
        try {
            interceptor.open();
        } catch (const InterceptionError& ex) {
            std::cerr << "[HopBop] ERROR: " << ex.what() << '\n';
            return 1;
        }

        g_interceptor = &interceptor;
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        std::cout << "[HopBop] Listening for " << hb::core::modifierName(settings.modifier)
                  << "+1..9 hotkeys. Ctrl+C to quit." << '\n';
        interceptor.run();

        g_interceptor = nullptr;
        watcher.stop();
        worker.stop();
        std::cout << "[HopBop] Exiting" << '\n';
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
