// Copyright © 2026 The Tickwork Authors
//
// This file is part of Tickwork.
//
// Tickwork is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Tickwork is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Tickwork.
// If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace tickwork {

// Sixteen-key input register set.
//
// Keys 0x0-0xF map to the conventional hexadecimal keypad. The frontend
// injects key events from its input thread while the backend reads them
// during steps.
//
// Besides the current mask, every change is queued as the mask it produced,
// so a press and release landing between two steps is still seen as two
// edges. The queue is bounded; when full the oldest change is dropped,
// which loses an intermediate edge but never the final state.
//
// Thread Safety:
// This class is thread-safe. Changes are recorded under a mutex; mask()
// is a lock-free atomic read.
//
class Keypad {
public:
    static constexpr uint8_t NUM_KEYS = 16;
    static constexpr size_t CHANGE_CAPACITY = 64;

    Keypad() = default;

    Keypad(const Keypad&) = delete;
    Keypad& operator=(const Keypad&) = delete;

    // Set a key as pressed (thread-safe)
    void key_down(uint8_t key) {
        if (key < NUM_KEYS) {
            std::lock_guard<std::mutex> lock(mutex_);
            change_locked(static_cast<uint16_t>(mask_.load(std::memory_order_relaxed) | (1u << key)));
        }
    }

    // Set a key as released (thread-safe)
    void key_up(uint8_t key) {
        if (key < NUM_KEYS) {
            std::lock_guard<std::mutex> lock(mutex_);
            change_locked(static_cast<uint16_t>(mask_.load(std::memory_order_relaxed) & ~(1u << key)));
        }
    }

    bool is_pressed(uint8_t key) const {
        if (key < NUM_KEYS) {
            return (mask_.load(std::memory_order_acquire) & (1u << key)) != 0;
        }
        return false;
    }

    // Bit N set means key N is held
    uint16_t mask() const { return mask_.load(std::memory_order_acquire); }

    // Replace the whole mask, recording the change like a key event
    void set_mask(uint16_t mask) {
        std::lock_guard<std::mutex> lock(mutex_);
        change_locked(mask);
    }

    // --- Backend interface ---

    // Oldest unconsumed change, as the mask after that change
    std::optional<uint16_t> peek_change() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (changes_.empty()) {
            return std::nullopt;
        }
        return changes_.front();
    }

    void pop_change() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!changes_.empty()) {
            changes_.pop_front();
        }
    }

    void discard_changes() {
        std::lock_guard<std::mutex> lock(mutex_);
        changes_.clear();
    }

    size_t pending_changes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return changes_.size();
    }

    uint64_t dropped_changes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    // Set the mask without recording a change, discarding pending changes.
    // Used when loading saved state.
    void restore(uint16_t mask) {
        std::lock_guard<std::mutex> lock(mutex_);
        changes_.clear();
        mask_.store(mask, std::memory_order_release);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        changes_.clear();
        dropped_ = 0;
        mask_.store(0, std::memory_order_release);
    }

private:
    void change_locked(uint16_t mask) {
        if (mask == mask_.load(std::memory_order_relaxed)) {
            return;
        }
        if (changes_.size() == CHANGE_CAPACITY) {
            changes_.pop_front();
            ++dropped_;
        }
        changes_.push_back(mask);
        mask_.store(mask, std::memory_order_release);
    }

    mutable std::mutex mutex_;
    std::atomic<uint16_t> mask_{0};
    std::deque<uint16_t> changes_;
    uint64_t dropped_ = 0;
};

} // namespace tickwork
