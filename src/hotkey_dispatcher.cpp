#include "hopbop/hotkey_dispatcher.hpp"

#include <exception>
#include <iostream>
#include <optional>

namespace hb::core {

HotkeyDispatcher::HotkeyDispatcher(const MappingStore& mappings, LaunchQueue& queue, int modifier_bit)
    : mappings_(mappings), queue_(queue), modifier_bit_(modifier_bit) {}

bool HotkeyDispatcher::onOwnerThread() noexcept {
    const std::thread::id self = std::this_thread::get_id();
    std::thread::id expected{};
    if (owner_.compare_exchange_strong(expected, self)) {
        return true;
    }
    if (expected == self) {
        return true;
    }
    if (!foreign_call_reported_.exchange(true)) {
        std::cerr << "[HotkeyDispatcher] Event delivered from a foreign thread; forwarding untouched" << '\n';
    }
    return false;
}

EventVerdict HotkeyDispatcher::onModifierChanged(int flags) {
    if (!onOwnerThread()) return EventVerdict::Forward;

    const bool down = (flags & modifier_bit_) != 0;
    if (down != modifier_down_) {
        // Either edge starts a fresh held interval.
        debounced_.clear();
        modifier_down_ = down;
    }
    return EventVerdict::Forward;
}

EventVerdict HotkeyDispatcher::onKeyDown(KeyCode code, int flags) {
    if (!onOwnerThread()) return EventVerdict::Forward;

    // The flags delivered with the key event decide, not modifier_down_.
    if ((flags & modifier_bit_) == 0) {
        return EventVerdict::Forward;
    }
    if (debounced_.count(code) != 0) {
        return EventVerdict::Forward;
    }

    try {
        std::optional<LaunchTarget> target = mappings_.lookup(code);
        if (!target) {
            return EventVerdict::Forward;
        }
        debounced_.insert(code);
        if (!queue_.push(std::move(*target))) {
            debounced_.erase(code);
            return EventVerdict::Forward;
        }
        return EventVerdict::Suppress;
    } catch (const std::exception& ex) {
        debounced_.erase(code);
        std::cerr << "[HotkeyDispatcher] Ignoring key " << code << ": " << ex.what() << '\n';
        return EventVerdict::Forward;
    }
}

EventVerdict HotkeyDispatcher::onKeyUp(KeyCode code) {
    if (!onOwnerThread()) return EventVerdict::Forward;

    debounced_.erase(code);
    return EventVerdict::Forward;
}

EventVerdict HotkeyDispatcher::onTapDisabled(TapDisabledReason reason, TapControl& tap) {
    if (!onOwnerThread()) return EventVerdict::Forward;

    try {
        tap.reenable();
        std::cout << "[HotkeyDispatcher] Interception re-enabled after " << toString(reason) << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "[HotkeyDispatcher] Failed to re-enable interception after " << toString(reason)
                  << ": " << ex.what() << '\n';
    }
    return EventVerdict::Forward;
}

}  // namespace hb::core
