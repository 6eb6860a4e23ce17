#include "hopbop/mapping_store.hpp"

#include <algorithm>

#include "hopbop/hotkey_slots.hpp"

namespace hb::core {

MappingSnapshot::MappingSnapshot(const std::vector<LaunchTarget>& targets) {
    const std::size_t count = std::min(targets.size(), kHotkeyKeycodes.size());
    for (std::size_t i = 0; i < count; ++i) {
        if (targets[i].empty()) {
            continue;
        }
        by_keycode_.emplace(kHotkeyKeycodes[i], targets[i]);
        entries_.emplace_back(i + 1, targets[i]);
    }
}

std::optional<LaunchTarget> MappingSnapshot::lookup(KeyCode code) const {
    auto it = by_keycode_.find(code);
    if (it == by_keycode_.end()) {
        return std::nullopt;
    }
    return it->second;
}

MappingStore::MappingStore() : snapshot_(std::make_shared<const MappingSnapshot>()) {}

void MappingStore::replace(MappingSnapshotPtr snapshot) {
    if (!snapshot) {
        snapshot = std::make_shared<const MappingSnapshot>();
    }
    MappingSnapshotPtr old;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old = std::exchange(snapshot_, std::move(snapshot));
    }
    // old is released outside the lock
}

std::optional<LaunchTarget> MappingStore::lookup(KeyCode code) const {
    return current()->lookup(code);
}

MappingSnapshotPtr MappingStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

}  // namespace hb::core
