#include "hopbop/hotkey_slots.hpp"

#include <libevdev/libevdev.h>

namespace hb::core {

std::optional<std::size_t> slotForKeycode(KeyCode code) noexcept {
    for (std::size_t i = 0; i < kHotkeyKeycodes.size(); ++i) {
        if (kHotkeyKeycodes[i] == code) {
            return i + 1;
        }
    }
    return std::nullopt;
}

std::optional<KeyCode> keycodeForSlot(std::size_t slot) noexcept {
    if (slot == 0 || slot > kHotkeyKeycodes.size()) {
        return std::nullopt;
    }
    return kHotkeyKeycodes[slot - 1];
}

std::string keycodeLabel(KeyCode code) {
    const char* name = libevdev_event_code_get_name(EV_KEY, static_cast<unsigned int>(code));
    if (name == nullptr) {
        return "KEY(" + std::to_string(code) + ")";
    }
    return name;
}

}  // namespace hb::core
