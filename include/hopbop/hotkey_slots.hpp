#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include <linux/input-event-codes.h>

#include "hopbop/types.hpp"

namespace hb::core {

constexpr std::size_t kHotkeySlotCount = 9;

// Slot 1 is kHotkeyKeycodes[0], slot 9 is kHotkeyKeycodes[8].
constexpr std::array<KeyCode, kHotkeySlotCount> kHotkeyKeycodes = {
    KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9,
};

// 1-based slot for a keycode, nullopt if the key is not a hotkey key.
[[nodiscard]] std::optional<std::size_t> slotForKeycode(KeyCode code) noexcept;

// Keycode of a 1-based slot, nullopt when out of range.
[[nodiscard]] std::optional<KeyCode> keycodeForSlot(std::size_t slot) noexcept;

[[nodiscard]] std::string keycodeLabel(KeyCode code);

}  // namespace hb::core
