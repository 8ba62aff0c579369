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

#ifndef TICKWORK_FRAME_BUFFER_HPP
#define TICKWORK_FRAME_BUFFER_HPP

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace tickwork {

// A copy of the most recently published frame, handed to frontends.
// Pixels are packed RGBA (see rgba() in Types.hpp), row-major.
struct DisplayFrame {
    size_t width = 0;
    size_t height = 0;
    std::vector<uint32_t> pixels;
    uint64_t version = 0;

    uint32_t pixel(size_t x, size_t y) const { return pixels[y * width + x]; }
};

// Double-buffered frame buffer for display output.
//
// The backend renders into the front buffer on the tick thread. swap()
// publishes the completed frame. Clients copy from the back buffer, which is
// immutable between swaps.
//
// Thread safety:
// - write_ptr(), write_pixel(), clear(): tick thread only, no lock needed
// - resize(), swap(): tick thread, acquire lock briefly
// - copy_frame(), read_frame(): any thread, acquire lock briefly
// - version(): lock-free read of atomic counter
//
class FrameBuffer {
public:
    FrameBuffer() = default;

    // Non-copyable, non-movable
    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;
    FrameBuffer(FrameBuffer&&) = delete;
    FrameBuffer& operator=(FrameBuffer&&) = delete;

    // Reallocate both buffers to a new geometry, cleared to black.
    void resize(size_t width, size_t height) {
        std::lock_guard<std::mutex> lock(mutex_);
        width_ = width;
        height_ = height;
        front_.assign(width * height, 0);
        back_.assign(width * height, 0);
        version_.fetch_add(1, std::memory_order_release);
    }

    // --- Core interface (called during rendering) ---

    uint32_t* write_ptr() { return front_.data(); }

    void write_pixel(size_t x, size_t y, uint32_t color) {
        if (x < width_ && y < height_) {
            front_[y * width_ + x] = color;
        }
    }

    void clear(uint32_t color = 0) {
        std::fill(front_.begin(), front_.end(), color);
    }

    // Publish the front buffer. Increments the version counter so clients
    // can detect new frames without locking.
    void swap() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(front_, back_);
        version_.fetch_add(1, std::memory_order_release);
    }

    // --- Client interface ---

    DisplayFrame read_frame() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return DisplayFrame{width_, height_, back_, version_.load(std::memory_order_acquire)};
    }

    // Copy the last published frame into dest. Returns pixels copied.
    size_t copy_frame(std::span<uint32_t> dest) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = std::min(dest.size(), back_.size());
        std::copy(back_.begin(), back_.begin() + static_cast<std::ptrdiff_t>(count), dest.begin());
        return count;
    }

    uint64_t version() const {
        return version_.load(std::memory_order_acquire);
    }

    // --- Query interface ---

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    size_t pixel_count() const { return width_ * height_; }

private:
    size_t width_ = 0;
    size_t height_ = 0;

    std::vector<uint32_t> front_;  // Backend renders here
    std::vector<uint32_t> back_;   // Clients read here (immutable between swaps)

    mutable std::mutex mutex_;
    std::atomic<uint64_t> version_{0};
};

} // namespace tickwork

#endif // TICKWORK_FRAME_BUFFER_HPP
