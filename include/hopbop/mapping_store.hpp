#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "hopbop/types.hpp"

namespace hb::core {

// Immutable keycode -> target table. Built once, never modified after.
class MappingSnapshot {
public:
    MappingSnapshot() = default;

    // Assigns targets positionally to the hotkey slots. Targets past the
    // last slot are ignored, empty targets leave their slot unmapped.
    explicit MappingSnapshot(const std::vector<LaunchTarget>& targets);

    [[nodiscard]] std::optional<LaunchTarget> lookup(KeyCode code) const;
    [[nodiscard]] std::size_t size() const noexcept { return by_keycode_.size(); }
    [[nodiscard]] bool empty() const noexcept { return by_keycode_.empty(); }

    // (slot, target) pairs in slot order
    [[nodiscard]] const std::vector<std::pair<std::size_t, LaunchTarget>>& entries() const noexcept {
        return entries_;
    }

private:
    std::unordered_map<KeyCode, LaunchTarget> by_keycode_;
    std::vector<std::pair<std::size_t, LaunchTarget>> entries_;
};

using MappingSnapshotPtr = std::shared_ptr<const MappingSnapshot>;

// Owns the globally visible mapping. The mutex guards the pointer only;
// snapshots are built off to the side and installed in one step.
class MappingStore {
public:
    MappingStore();

    MappingStore(const MappingStore&) = delete;
    MappingStore& operator=(const MappingStore&) = delete;

    void replace(MappingSnapshotPtr snapshot);
    [[nodiscard]] std::optional<LaunchTarget> lookup(KeyCode code) const;
    [[nodiscard]] MappingSnapshotPtr current() const;

private:
    mutable std::mutex mutex_;
    MappingSnapshotPtr snapshot_;
};

}  // namespace hb::core
