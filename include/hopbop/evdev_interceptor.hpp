#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// Forward declarations for the input library structs
struct libevdev;
struct libevdev_uinput;
struct input_event;

#include "hopbop/event_handler.hpp"
#include "hopbop/types.hpp"

namespace hb::core {

// Modifier bit for a modifier keycode (either side), 0 for other keys.
[[nodiscard]] int modifierBitForKeycode(KeyCode code) noexcept;

// Modifier bits currently held according to the device state.
[[nodiscard]] int modifierFlags(const libevdev* dev);

// Read state of one grabbed keyboard.
struct DeviceSyncState {
    bool dropped{false};     // SYN_DROPPED seen, not yet resynced
    bool needs_sync{false};  // reading LIBEVDEV_READ_FLAG_SYNC
    bool lost{false};
};

// One grabbed keyboard as drainEvents sees it.
class EventChannel {
public:
    virtual ~EventChannel() = default;

    // Same contract as libevdev_next_event: a LIBEVDEV_READ_STATUS_* value
    // or a negative errno.
    virtual int nextEvent(unsigned int read_flag, input_event& ev) = 0;

    // Re-emits an event the handler let through.
    virtual void forward(const input_event& ev) = 0;

    // Modifier bits held across every grabbed keyboard.
    [[nodiscard]] virtual int heldModifiers() const = 0;

    [[nodiscard]] virtual std::string label() const = 0;
};

// Classifies one event and hands it to the handler. Non-key events and
// modifier autorepeat are forwarded without a handler call.
[[nodiscard]] EventVerdict routeKeyEvent(KeyEventHandler& handler, const input_event& ev, int flags);

// Reads the channel until it has nothing pending, is lost, or stop is set.
// SYN_DROPPED reports onTapDisabled(Overflow); once the tap marks the
// state for resync, the sync events are routed like live ones. -ENODEV
// marks the state lost and reports onTapDisabled(DeviceLost).
void drainEvents(EventChannel& channel,
                 DeviceSyncState& state,
                 KeyEventHandler& handler,
                 TapControl& tap,
                 const std::atomic<bool>& stop);

// Grabs every matching keyboard and re-emits the events it lets through
// on a uinput clone. Events the handler suppresses never reach the clone.
// All handler calls happen on the thread that calls run().
class EvdevInterceptor : public TapControl {
public:
    EvdevInterceptor(KeyEventHandler& handler,
                     std::string device_match,
                     std::filesystem::path by_path_dir = "/dev/input/by-path");
    ~EvdevInterceptor() override;

    EvdevInterceptor(const EvdevInterceptor&) = delete;
    EvdevInterceptor& operator=(const EvdevInterceptor&) = delete;

    // Throws InterceptionError(TapCreationFailed) if no keyboard could be
    // grabbed and mirrored.
    void open();

    // Blocks until stop() is called. Keyboards that appear later are
    // picked up between poll rounds.
    void run();

    // Safe to call from another thread or a signal handler.
    void stop() noexcept { stop_.store(true); }

    // Re-grabs and marks overflowed keyboards for resync. Never opens
    // devices itself; a lost keyboard schedules a rescan in run().
    void reenable() override;

    [[nodiscard]] std::size_t deviceCount() const noexcept { return devices_.size(); }

private:
    struct Device : EventChannel {
        explicit Device(const EvdevInterceptor& owner) : owner(owner) {}

        int nextEvent(unsigned int read_flag, input_event& ev) override;
        void forward(const input_event& ev) override;
        int heldModifiers() const override { return owner.combinedFlags(); }
        std::string label() const override { return node; }

        const EvdevInterceptor& owner;
        int fd{-1};
        libevdev* dev{nullptr};
        libevdev_uinput* uinput{nullptr};
        std::string node;
        DeviceSyncState state;
    };

    struct ScanResult {
        std::size_t opened{0};
        std::size_t held{0};  // skipped until their keys are released
    };

    KeyEventHandler& handler_;
    std::string device_match_;
    std::filesystem::path by_path_dir_;
    std::atomic<bool> stop_{false};
    std::vector<std::unique_ptr<Device>> devices_;
    bool rescan_pending_{false};
    std::chrono::steady_clock::time_point next_rescan_{};

    enum class OpenResult { Opened, KeysHeld, Failed };

    ScanResult openDevices();
    OpenResult openDevice(const std::filesystem::path& node);
    void closeDevice(Device& d);
    void closeDevices();
    void pruneLostDevices();
    void rescanIfDue();

    [[nodiscard]] int combinedFlags() const;
};

}  // namespace hb::core
