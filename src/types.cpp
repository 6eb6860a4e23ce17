#include "hopbop/types.hpp"

#include <algorithm>
#include <cctype>

namespace hb::core {

std::optional<int> modifierFromName(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char ch : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lower == "ctrl" || lower == "control") return kModCtrl;
    if (lower == "shift") return kModShift;
    if (lower == "alt" || lower == "option") return kModAlt;
    if (lower == "super" || lower == "meta") return kModSuper;
    return std::nullopt;
}

std::string modifierName(int modifier_bit) {
    switch (modifier_bit) {
        case kModCtrl: return "Ctrl";
        case kModShift: return "Shift";
        case kModAlt: return "Alt";
        case kModSuper: return "Super";
        default: return "Mod(" + std::to_string(modifier_bit) + ")";
    }
}

const char* toString(TapDisabledReason reason) noexcept {
    switch (reason) {
        case TapDisabledReason::Overflow: return "overflow";
        case TapDisabledReason::DeviceLost: return "device lost";
    }
    return "unknown";
}

}  // namespace hb::core
