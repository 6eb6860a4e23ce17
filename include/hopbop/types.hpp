#pragma once

#include <optional>
#include <string>

namespace hb::core {

// evdev EV_KEY code
using KeyCode = int;
using LaunchTarget = std::string;

// Modifier bits: 1=CTRL, 2=SHIFT, 4=ALT, 8=SUPER
constexpr int kModCtrl = 1;
constexpr int kModShift = 2;
constexpr int kModAlt = 4;
constexpr int kModSuper = 8;

enum class EventVerdict {
    Forward,
    Suppress,
};

enum class TapDisabledReason {
    Overflow,    // kernel reported SYN_DROPPED, we fell behind
    DeviceLost,  // keyboard vanished or the grab was revoked
};

[[nodiscard]] std::optional<int> modifierFromName(const std::string& name);
[[nodiscard]] std::string modifierName(int modifier_bit);
[[nodiscard]] const char* toString(TapDisabledReason reason) noexcept;

}  // namespace hb::core
