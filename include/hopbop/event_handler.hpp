#pragma once

#include "hopbop/types.hpp"

namespace hb::core {

// Implemented by the interception adapter.
class TapControl {
public:
    virtual ~TapControl() = default;

    // Restores interception after the tap was disabled.
    virtual void reenable() = 0;
};

// Receives every relevant keyboard event from the interception adapter,
// in the order the events physically occurred, on a single thread.
// Implementations must not throw.
class KeyEventHandler {
public:
    virtual ~KeyEventHandler() = default;

    virtual EventVerdict onModifierChanged(int flags) = 0;
    virtual EventVerdict onKeyDown(KeyCode code, int flags) = 0;
    virtual EventVerdict onKeyUp(KeyCode code) = 0;
    virtual EventVerdict onTapDisabled(TapDisabledReason reason, TapControl& tap) = 0;
};

}  // namespace hb::core
