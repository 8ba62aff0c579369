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

#ifndef TICKWORK_AUDIO_SAMPLE_QUEUE_HPP
#define TICKWORK_AUDIO_SAMPLE_QUEUE_HPP

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>

namespace tickwork {

// An audio sample stamped with the virtual time at which it was produced.
struct TimedSample {
    int64_t time_ns = 0;
    float value = 0.0f;
};

// Bounded circular buffer that drops the oldest item when full.
//
// Audio favours latency over completeness: if the consumer falls behind, the
// oldest unconsumed items are discarded and overflow_count() increments once
// per discarded item. The buffer never grows beyond its capacity.
//
// Thread safety: every operation takes the internal mutex, so one producer
// thread and one consumer thread may operate concurrently.
template <typename T>
class BoundedQueue {
public:
    static constexpr size_t DEFAULT_CAPACITY = 8192;

    explicit BoundedQueue(size_t capacity = DEFAULT_CAPACITY)
        : capacity_(capacity)
        , buffer_(std::make_unique<T[]>(capacity)) {
        if (capacity == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be non-zero");
        }
    }

    // Non-copyable, non-movable (mutex member)
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    // --- Producer interface ---

    // Append an item. Returns true if the oldest item was dropped to make room.
    bool push(const T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        return push_locked(item);
    }

    // Append items in order. Returns the number of items dropped.
    size_t push_many(std::span<const T> items) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t dropped = 0;
        for (const auto& item : items) {
            if (push_locked(item)) {
                ++dropped;
            }
        }
        return dropped;
    }

    // --- Consumer interface ---

    std::optional<T> front() const {
        return peek(0);
    }

    std::optional<T> back() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (write_pos_ == read_pos_) {
            return std::nullopt;
        }
        return buffer_[(write_pos_ - 1) % capacity_];
    }

    // Item at `index` places from the front, if present
    std::optional<T> peek(size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= used_locked()) {
            return std::nullopt;
        }
        return buffer_[(read_pos_ + index) % capacity_];
    }

    std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (read_pos_ == write_pos_) {
            return std::nullopt;
        }
        T item = buffer_[read_pos_ % capacity_];
        ++read_pos_;
        return item;
    }

    // Pop the front item only if it satisfies `pred`
    template <typename Pred>
    std::optional<T> pop_front_if(Pred&& pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (read_pos_ == write_pos_) {
            return std::nullopt;
        }
        const T& item = buffer_[read_pos_ % capacity_];
        if (!pred(item)) {
            return std::nullopt;
        }
        T result = item;
        ++read_pos_;
        return result;
    }

    // Move up to out.size() items from the front into out. Returns the count.
    size_t pop_into(std::span<T> out) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = std::min(out.size(), used_locked());
        for (size_t i = 0; i < count; ++i) {
            out[i] = buffer_[(read_pos_ + i) % capacity_];
        }
        read_pos_ += count;
        return count;
    }

    // --- Query interface ---

    size_t capacity() const { return capacity_; }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_locked();
    }

    size_t available() const { return capacity_ - size(); }
    bool empty() const { return size() == 0; }
    bool full() const { return size() == capacity_; }

    uint64_t overflow_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return overflow_;
    }

    // Discard all items. Counters are kept unless reset_counters is set.
    void clear(bool reset_counters = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_pos_ = 0;
        write_pos_ = 0;
        if (reset_counters) {
            overflow_ = 0;
        }
    }

private:
    size_t used_locked() const {
        assert(write_pos_ >= read_pos_);
        return static_cast<size_t>(write_pos_ - read_pos_);
    }

    bool push_locked(const T& item) {
        bool dropped = false;
        if (used_locked() == capacity_) {
            ++read_pos_;
            ++overflow_;
            dropped = true;
        }
        buffer_[write_pos_ % capacity_] = item;
        ++write_pos_;
        return dropped;
    }

    const size_t capacity_;
    std::unique_ptr<T[]> buffer_;

    mutable std::mutex mutex_;
    uint64_t read_pos_ = 0;
    uint64_t write_pos_ = 0;
    uint64_t overflow_ = 0;
};

// Backend samples awaiting resampling, at the backend's native rate
using AudioSampleQueue = BoundedQueue<TimedSample>;

// Host-rate samples ready for the audio sink
using ResampledBuffer = BoundedQueue<float>;

} // namespace tickwork

#endif // TICKWORK_AUDIO_SAMPLE_QUEUE_HPP
