#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <unordered_set>

#include "hopbop/event_handler.hpp"
#include "hopbop/launch_queue.hpp"
#include "hopbop/mapping_store.hpp"

namespace hb::core {

// Turns modifier+digit key-downs into launch requests.
//
// The debounce set and the modifier state belong to the thread that
// delivers events. The first event binds the dispatcher to its calling
// thread; events arriving from any other thread are forwarded untouched.
class HotkeyDispatcher : public KeyEventHandler {
public:
    HotkeyDispatcher(const MappingStore& mappings, LaunchQueue& queue, int modifier_bit = kModAlt);

    EventVerdict onModifierChanged(int flags) override;
    EventVerdict onKeyDown(KeyCode code, int flags) override;
    EventVerdict onKeyUp(KeyCode code) override;
    EventVerdict onTapDisabled(TapDisabledReason reason, TapControl& tap) override;

    [[nodiscard]] int modifierBit() const noexcept { return modifier_bit_; }

    // Owning thread only.
    [[nodiscard]] bool modifierHeld() const noexcept { return modifier_down_; }
    [[nodiscard]] std::size_t debouncedCount() const noexcept { return debounced_.size(); }
    [[nodiscard]] bool isDebounced(KeyCode code) const { return debounced_.count(code) != 0; }

private:
    const MappingStore& mappings_;
    LaunchQueue& queue_;
    const int modifier_bit_;

    std::atomic<std::thread::id> owner_{};
    std::atomic<bool> foreign_call_reported_{false};

    bool modifier_down_{false};
    std::unordered_set<KeyCode> debounced_;

    bool onOwnerThread() noexcept;
};

}  // namespace hb::core
