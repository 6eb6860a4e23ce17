#include "hopbop/evdev_interceptor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <thread>

#include <libevdev/libevdev.h>
#include <libevdev/libevdev-uinput.h>

#include "hopbop/errors.hpp"

namespace hb::core {

namespace {
static inline bool is_ctrl(int code) { return code == KEY_LEFTCTRL || code == KEY_RIGHTCTRL; }
static inline bool is_shift(int code) { return code == KEY_LEFTSHIFT || code == KEY_RIGHTSHIFT; }
static inline bool is_alt(int code) { return code == KEY_LEFTALT || code == KEY_RIGHTALT; }
static inline bool is_super(int code) { return code == KEY_LEFTMETA || code == KEY_RIGHTMETA; }

constexpr int kPollTimeoutMs = 200;
constexpr auto kReleaseWait = std::chrono::milliseconds(1500);
constexpr auto kReleasePoll = std::chrono::milliseconds(10);
constexpr auto kRescanInterval = std::chrono::milliseconds(1000);

constexpr int kModifierKeys[] = {
    KEY_LEFTCTRL, KEY_RIGHTCTRL, KEY_LEFTSHIFT, KEY_RIGHTSHIFT,
    KEY_LEFTALT, KEY_RIGHTALT, KEY_LEFTMETA, KEY_RIGHTMETA,
};

bool anyKeyDown(const libevdev* dev) {
    for (unsigned int code = 0; code <= KEY_MAX; ++code) {
        if (libevdev_has_event_code(dev, EV_KEY, code) &&
            libevdev_get_event_value(dev, EV_KEY, code) != 0) {
            return true;
        }
    }
    return false;
}
}  // namespace

int modifierBitForKeycode(KeyCode code) noexcept {
    if (is_ctrl(code)) return kModCtrl;
    if (is_shift(code)) return kModShift;
    if (is_alt(code)) return kModAlt;
    if (is_super(code)) return kModSuper;
    return 0;
}

int modifierFlags(const libevdev* dev) {
    if (dev == nullptr) return 0;
    int mask = 0;
    for (int code : kModifierKeys) {
        if (libevdev_has_event_code(dev, EV_KEY, static_cast<unsigned int>(code)) &&
            libevdev_get_event_value(dev, EV_KEY, static_cast<unsigned int>(code)) != 0) {
            mask |= modifierBitForKeycode(code);
        }
    }
    return mask;
}

EventVerdict routeKeyEvent(KeyEventHandler& handler, const input_event& ev, int flags) {
    if (ev.type != EV_KEY) return EventVerdict::Forward;

    if (modifierBitForKeycode(ev.code) != 0) {
        // Autorepeat of a held modifier is not a state change.
        if (ev.value == 2) return EventVerdict::Forward;
        return handler.onModifierChanged(flags);
    }
    if (ev.value == 0) {
        return handler.onKeyUp(ev.code);
    }
    return handler.onKeyDown(ev.code, flags);
}

namespace {
void routeAndForward(EventChannel& channel, KeyEventHandler& handler, const input_event& ev) {
    const int flags = ev.type == EV_KEY ? channel.heldModifiers() : 0;
    if (routeKeyEvent(handler, ev, flags) == EventVerdict::Forward) {
        channel.forward(ev);
    }
}
}  // namespace

void drainEvents(EventChannel& channel,
                 DeviceSyncState& state,
                 KeyEventHandler& handler,
                 TapControl& tap,
                 const std::atomic<bool>& stop) {
    while (!state.lost && !stop.load()) {
        input_event ev{};
        const unsigned int flag = state.needs_sync ? LIBEVDEV_READ_FLAG_SYNC : LIBEVDEV_READ_FLAG_NORMAL;
        int rc = channel.nextEvent(flag, ev);
        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
            routeAndForward(channel, handler, ev);
        } else if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            if (state.needs_sync) {
                routeAndForward(channel, handler, ev);
            } else {
                state.dropped = true;
                handler.onTapDisabled(TapDisabledReason::Overflow, tap);
            }
        } else if (rc == -EAGAIN) {
            if (state.needs_sync) {
                state.needs_sync = false;
                continue;
            }
            break;
        } else if (rc == -EINTR) {
            continue;
        } else if (rc == -ENODEV) {
            state.lost = true;
            handler.onTapDisabled(TapDisabledReason::DeviceLost, tap);
        } else {
            std::cerr << "[EvdevInterceptor] Read from " << channel.label() << " failed: "
                      << std::strerror(-rc) << '\n';
            break;
        }
    }
}

int EvdevInterceptor::Device::nextEvent(unsigned int read_flag, input_event& ev) {
    return libevdev_next_event(dev, read_flag, &ev);
}

void EvdevInterceptor::Device::forward(const input_event& ev) {
    if (!uinput) return;
    int rc = libevdev_uinput_write_event(uinput, ev.type, ev.code, ev.value);
    if (rc != 0) {
        std::cerr << "[EvdevInterceptor] Forwarding to " << node << " failed: "
                  << std::strerror(-rc) << '\n';
    }
}

EvdevInterceptor::EvdevInterceptor(KeyEventHandler& handler,
                                   std::string device_match,
                                   std::filesystem::path by_path_dir)
    : handler_(handler), device_match_(std::move(device_match)), by_path_dir_(std::move(by_path_dir)) {}

EvdevInterceptor::~EvdevInterceptor() { closeDevices(); }

void EvdevInterceptor::open() {
    // Keys held at startup, such as the Enter that started us, get a short
    // grace period before giving up.
    const auto deadline = std::chrono::steady_clock::now() + kReleaseWait;
    ScanResult scan = openDevices();
    while (devices_.empty() && scan.held > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kReleasePoll);
        scan = openDevices();
    }
    next_rescan_ = std::chrono::steady_clock::now() + kRescanInterval;

    if (devices_.empty()) {
        throw InterceptionError(
            InterceptionError::Kind::TapCreationFailed,
            "Couldn't grab any keyboard matching '" + device_match_ + "' under " +
                by_path_dir_.string() +
                ". Check that this user may read /dev/input/event* and write /dev/uinput "
                "(usually the 'input' group plus a udev rule for uinput).");
    }
}

EvdevInterceptor::ScanResult EvdevInterceptor::openDevices() {
    ScanResult result;
    std::error_code ec;
    if (!std::filesystem::exists(by_path_dir_, ec)) return result;

    for (auto& entry : std::filesystem::directory_iterator(by_path_dir_, ec)) {
        if (ec) break;
        if (!entry.is_symlink(ec) && !entry.is_character_file(ec)) continue;
        const auto name = entry.path().filename().string();
        if (name.find(device_match_) == std::string::npos) continue;

        std::filesystem::path node = std::filesystem::canonical(entry.path(), ec);
        if (ec) {
            ec.clear();
            continue;
        }

        bool already_open = false;
        for (const auto& d : devices_) {
            if (!d->state.lost && d->node == node.string()) {
                already_open = true;
                break;
            }
        }
        if (already_open) continue;

        switch (openDevice(node)) {
            case OpenResult::Opened: ++result.opened; break;
            case OpenResult::KeysHeld: ++result.held; break;
            case OpenResult::Failed: break;
        }
    }
    return result;
}

EvdevInterceptor::OpenResult EvdevInterceptor::openDevice(const std::filesystem::path& node) {
    int fd = ::open(node.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        std::cerr << "[EvdevInterceptor] Cannot open " << node.string() << ": "
                  << std::strerror(errno) << '\n';
        return OpenResult::Failed;
    }

    auto d = std::make_unique<Device>(*this);
    d->fd = fd;
    d->node = node.string();
    if (libevdev_new_from_fd(fd, &d->dev) != 0) {
        closeDevice(*d);
        return OpenResult::Failed;
    }

    // Grabbing while a key is held would strand its release on the real
    // device. Retried on a later scan.
    if (anyKeyDown(d->dev)) {
        d->state.lost = true;  // not grabbed, nothing to ungrab
        closeDevice(*d);
        return OpenResult::KeysHeld;
    }

    int rc = libevdev_grab(d->dev, LIBEVDEV_GRAB);
    if (rc != 0) {
        std::cerr << "[EvdevInterceptor] Cannot grab " << d->node << ": " << std::strerror(-rc) << '\n';
        d->state.lost = true;
        closeDevice(*d);
        return OpenResult::Failed;
    }

    const std::string original_name = libevdev_get_name(d->dev) ? libevdev_get_name(d->dev) : "keyboard";
    libevdev_set_name(d->dev, ("hopbop " + original_name).c_str());
    rc = libevdev_uinput_create_from_device(d->dev, LIBEVDEV_UINPUT_OPEN_MANAGED, &d->uinput);
    if (rc != 0) {
        std::cerr << "[EvdevInterceptor] Cannot create uinput clone of " << d->node << ": "
                  << std::strerror(-rc) << '\n';
        closeDevice(*d);
        return OpenResult::Failed;
    }

    std::cout << "[EvdevInterceptor] Grabbed " << original_name << " (" << d->node << ")" << '\n';
    devices_.push_back(std::move(d));
    return OpenResult::Opened;
}

void EvdevInterceptor::closeDevice(Device& d) {
    if (d.uinput) {
        libevdev_uinput_destroy(d.uinput);
        d.uinput = nullptr;
    }
    if (d.dev) {
        if (!d.state.lost) {
            libevdev_grab(d.dev, LIBEVDEV_UNGRAB);
        }
        libevdev_free(d.dev);
        d.dev = nullptr;
    }
    if (d.fd >= 0) {
        ::close(d.fd);
        d.fd = -1;
    }
}

void EvdevInterceptor::closeDevices() {
    for (auto& d : devices_) {
        closeDevice(*d);
    }
    devices_.clear();
}

void EvdevInterceptor::pruneLostDevices() {
    for (auto it = devices_.begin(); it != devices_.end();) {
        if ((*it)->state.lost) {
            std::cerr << "[EvdevInterceptor] Lost keyboard " << (*it)->node << '\n';
            closeDevice(**it);
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
}

void EvdevInterceptor::rescanIfDue() {
    const auto now = std::chrono::steady_clock::now();
    if (!rescan_pending_ && now < next_rescan_) return;
    rescan_pending_ = false;
    next_rescan_ = now + kRescanInterval;
    openDevices();
}

void EvdevInterceptor::reenable() {
    for (auto& d : devices_) {
        if (d->state.lost) {
            rescan_pending_ = true;
            continue;
        }
        if (d->state.dropped) {
            d->state.dropped = false;
            d->state.needs_sync = true;
        }
        int rc = libevdev_grab(d->dev, LIBEVDEV_GRAB);
        if (rc != 0) {
            std::cerr << "[EvdevInterceptor] Re-grab of " << d->node << " failed: "
                      << std::strerror(-rc) << '\n';
        }
    }
}

int EvdevInterceptor::combinedFlags() const {
    int combined = 0;
    for (const auto& d : devices_) {
        if (!d->state.lost) combined |= modifierFlags(d->dev);
    }
    return combined;
}

void EvdevInterceptor::run() {
    bool reported_empty = false;
    std::vector<pollfd> fds;
    while (!stop_.load()) {
        pruneLostDevices();
        rescanIfDue();

        if (devices_.empty()) {
            if (!reported_empty) {
                std::cerr << "[EvdevInterceptor] No keyboards grabbed; waiting for one to appear" << '\n';
                reported_empty = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollTimeoutMs));
            continue;
        }
        reported_empty = false;

        fds.clear();
        for (const auto& d : devices_) {
            pollfd pfd{};
            pfd.fd = d->fd;
            pfd.events = POLLIN;
            fds.push_back(pfd);
        }

        int rc = ::poll(fds.data(), fds.size(), kPollTimeoutMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[EvdevInterceptor] poll failed: " << std::strerror(errno) << '\n';
            break;
        }
        if (rc == 0) continue;

        // Devices only come and go at the top of the loop, so fds and
        // devices_ line up here.
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents & (POLLIN | POLLERR | POLLHUP)) {
                Device& d = *devices_[i];
                drainEvents(d, d.state, handler_, *this, stop_);
            }
        }
    }
}

}  // namespace hb::core
