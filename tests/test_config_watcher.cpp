#include <gtest/gtest.h>
#include "hopbop/config_loader.hpp"
#include "hopbop/config_watcher.hpp"
#include "hopbop/hotkey_slots.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace hb::core;

namespace {

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

}  // namespace

class ConfigWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "hopbop_config_watcher_test";
        std::filesystem::remove_all(tempDir);
        std::filesystem::create_directories(tempDir);
        configPath = tempDir / "hotkeys";
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    void writeFile(const std::filesystem::path& path, const std::string& text) {
        std::ofstream file(path);
        file << text;
    }

    std::filesystem::path tempDir;
    std::filesystem::path configPath;
};

TEST_F(ConfigWatcherTest, MatchesConfigNameOnly) {
    ConfigWatcher watcher(configPath.string(), std::chrono::milliseconds(0), [] {});
    EXPECT_TRUE(watcher.matches("hotkeys"));
    EXPECT_FALSE(watcher.matches("hotkeys.swp"));
    EXPECT_FALSE(watcher.matches("other"));
    EXPECT_FALSE(watcher.matches(""));
}

TEST_F(ConfigWatcherTest, MissingDirectoryFailsToStart) {
    ConfigWatcher watcher((tempDir / "nope" / "hotkeys").string(), std::chrono::milliseconds(0), [] {});
    EXPECT_FALSE(watcher.start());
    EXPECT_FALSE(watcher.running());
}

TEST_F(ConfigWatcherTest, InPlaceWriteTriggersReload) {
    writeFile(configPath, "first\n");

    MappingStore store;
    ConfigLoader loader(store, configPath.string());
    ASSERT_TRUE(loader.reload());

    ConfigWatcher watcher(configPath.string(), std::chrono::milliseconds(20), [&] { loader.reload(); });
    ASSERT_TRUE(watcher.start());

    writeFile(configPath, "second\n");
    EXPECT_TRUE(waitFor([&] { return store.lookup(KEY_1) == std::optional<LaunchTarget>("second"); }));
    watcher.stop();
}

TEST_F(ConfigWatcherTest, WriteThenRenameTriggersReload) {
    writeFile(configPath, "first\n");

    MappingStore store;
    ConfigLoader loader(store, configPath.string());
    ASSERT_TRUE(loader.reload());

    ConfigWatcher watcher(configPath.string(), std::chrono::milliseconds(20), [&] { loader.reload(); });
    ASSERT_TRUE(watcher.start());

    auto temp = tempDir / ".hotkeys.tmp";
    writeFile(temp, "renamed.one\nrenamed.two\n");
    std::filesystem::rename(temp, configPath);

    EXPECT_TRUE(waitFor([&] { return store.lookup(KEY_2) == std::optional<LaunchTarget>("renamed.two"); }));
    EXPECT_EQ(store.lookup(KEY_1), "renamed.one");
    watcher.stop();
}

TEST_F(ConfigWatcherTest, UnrelatedFilesIgnored) {
    writeFile(configPath, "first\n");
    std::atomic<int> calls{0};

    ConfigWatcher watcher(configPath.string(), std::chrono::milliseconds(0), [&] { calls.fetch_add(1); });
    ASSERT_TRUE(watcher.start());

    writeFile(tempDir / "unrelated", "noise\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(calls.load(), 0);
    watcher.stop();
}

TEST_F(ConfigWatcherTest, BurstOfWritesCoalesces) {
    writeFile(configPath, "first\n");
    std::atomic<int> calls{0};

    ConfigWatcher watcher(configPath.string(), std::chrono::milliseconds(150), [&] { calls.fetch_add(1); });
    ASSERT_TRUE(watcher.start());

    for (int i = 0; i < 5; ++i) {
        writeFile(configPath, "value" + std::to_string(i) + "\n");
    }

    EXPECT_TRUE(waitFor([&] { return calls.load() >= 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    // Five writes inside one settle window fold into a single reload.
    EXPECT_EQ(calls.load(), 1);
    watcher.stop();
}

TEST_F(ConfigWatcherTest, CreatedAfterStartIsPickedUp) {
    MappingStore store;
    ConfigLoader loader(store, configPath.string());
    EXPECT_FALSE(loader.reload());

    ConfigWatcher watcher(configPath.string(), std::chrono::milliseconds(20), [&] { loader.reload(); });
    ASSERT_TRUE(watcher.start());

    writeFile(configPath, "late.app\n");
    EXPECT_TRUE(waitFor([&] { return store.lookup(KEY_1).has_value(); }));
    watcher.stop();
}

TEST_F(ConfigWatcherTest, ThrowingCallbackDoesNotStopWatching) {
    writeFile(configPath, "first\n");
    std::atomic<int> calls{0};

    ConfigWatcher watcher(configPath.string(), std::chrono::milliseconds(10), [&] {
        if (calls.fetch_add(1) == 0) {
            throw std::runtime_error("boom");
        }
    });
    ASSERT_TRUE(watcher.start());

    writeFile(configPath, "second\n");
    ASSERT_TRUE(waitFor([&] { return calls.load() >= 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    writeFile(configPath, "third\n");
    EXPECT_TRUE(waitFor([&] { return calls.load() >= 2; }));
    watcher.stop();
}
