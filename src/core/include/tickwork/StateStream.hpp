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

#ifndef TICKWORK_STATE_STREAM_HPP
#define TICKWORK_STATE_STREAM_HPP

#include "Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tickwork {

// Little-endian writer for save-state payloads.
class StateWriter {
public:
    void u8(uint8_t value) { bytes_.push_back(value); }

    void u16(uint16_t value) {
        for (int i = 0; i < 2; ++i) bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }

    void u32(uint32_t value) {
        for (int i = 0; i < 4; ++i) bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }

    void u64(uint64_t value) {
        for (int i = 0; i < 8; ++i) bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }

    void boolean(bool value) { u8(value ? 1 : 0); }

    void raw(std::span<const uint8_t> data) {
        bytes_.insert(bytes_.end(), data.begin(), data.end());
    }

    // Length-prefixed (u32) byte block.
    void blob(std::span<const uint8_t> data) {
        u32(static_cast<uint32_t>(data.size()));
        raw(data);
    }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::vector<uint8_t> take() { return std::move(bytes_); }

private:
    std::vector<uint8_t> bytes_;
};

// Little-endian reader. Truncated or malformed input raises IncompatibleState.
class StateReader {
public:
    explicit StateReader(std::span<const uint8_t> bytes)
        : bytes_(bytes) {}

    uint8_t u8() {
        need(1);
        return bytes_[pos_++];
    }

    uint16_t u16() {
        need(2);
        uint16_t value = 0;
        for (int i = 0; i < 2; ++i) value |= static_cast<uint16_t>(bytes_[pos_++] << (8 * i));
        return value;
    }

    uint32_t u32() {
        need(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) value |= static_cast<uint32_t>(bytes_[pos_++]) << (8 * i);
        return value;
    }

    uint64_t u64() {
        need(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) value |= static_cast<uint64_t>(bytes_[pos_++]) << (8 * i);
        return value;
    }

    bool boolean() {
        uint8_t value = u8();
        if (value > 1) {
            throw IncompatibleState("Invalid boolean in state");
        }
        return value == 1;
    }

    std::span<const uint8_t> raw(size_t length) {
        need(length);
        auto result = bytes_.subspan(pos_, length);
        pos_ += length;
        return result;
    }

    std::span<const uint8_t> blob() {
        uint32_t length = u32();
        return raw(length);
    }

    size_t remaining() const { return bytes_.size() - pos_; }

    void expect_end() const {
        if (remaining() != 0) {
            throw IncompatibleState("Trailing bytes in state: " + std::to_string(remaining()));
        }
    }

private:
    void need(size_t length) const {
        if (length > remaining()) {
            throw IncompatibleState("State truncated: need " + std::to_string(length)
                                    + " bytes, have " + std::to_string(remaining()));
        }
    }

    std::span<const uint8_t> bytes_;
    size_t pos_ = 0;
};

} // namespace tickwork

#endif // TICKWORK_STATE_STREAM_HPP
