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

#ifndef TICKWORK_BUS_HPP
#define TICKWORK_BUS_HPP

#include "BusRegion.hpp"
#include "FrameBuffer.hpp"
#include "Keypad.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tickwork {

// Addressable storage shared between the backend and host-facing devices.
//
// The backend sizes the bus when a program is loaded and declares named
// regions and device registers. Every access is bounds-checked; out of range
// accesses throw BusError rather than touching memory. Backends are expected
// to pre-check with contains() so that faults are detected before any state
// is mutated.
//
// Memory is only touched from the tick thread. The keypad and display
// devices are the parts of the bus shared with frontend threads, and carry
// their own synchronization.
class Bus {
public:
    Bus() = default;

    Bus(const Bus&) = delete;
    Bus& operator=(const Bus&) = delete;

    // Resize to `size` bytes of zeroed memory and forget the region and
    // register maps. Clears the keypad.
    void configure(size_t size);

    size_t size() const { return memory_.size(); }

    // --- Address map ---

    void add_region(BusRegion region);
    std::span<const BusRegion> regions() const { return regions_; }
    const BusRegion* region_at(uint32_t address) const;

    void define_register(std::string name, uint32_t address);
    uint32_t register_address(std::string_view name) const;
    const std::map<std::string, uint32_t, std::less<>>& registers() const { return registers_; }

    // --- Access ---

    bool contains(uint32_t address, size_t length = 1) const {
        return length <= memory_.size() && address <= memory_.size() - length;
    }

    uint8_t read8(uint32_t address) const;
    uint16_t read16_be(uint32_t address) const;
    uint16_t read16_le(uint32_t address) const;

    // Program-visible writes; rejected for regions not flagged Writable.
    void write8(uint32_t address, uint8_t value);
    void write16_be(uint32_t address, uint16_t value);
    void write16_le(uint32_t address, uint16_t value);
    void write_block(uint32_t address, std::span<const uint8_t> data);

    // Backend-side writes (loading fonts, program images, updating device
    // registers); ignore region write protection but not bounds.
    void poke(uint32_t address, uint8_t value);
    void load(uint32_t address, std::span<const uint8_t> data);

    // Side-effect-free copy of a range, for frontends and inspection.
    std::vector<uint8_t> peek(uint32_t address, size_t length) const;

    // Zero memory without changing the map.
    void clear();

    // --- Save-state support ---

    std::vector<uint8_t> snapshot() const { return memory_; }
    void restore(std::span<const uint8_t> bytes);

    // --- Devices ---

    Keypad& keypad() { return keypad_; }
    const Keypad& keypad() const { return keypad_; }

    FrameBuffer& display() { return display_; }
    const FrameBuffer& display() const { return display_; }

private:
    void check_range(uint32_t address, size_t length) const;
    void check_writable(uint32_t address, size_t length) const;

    std::vector<uint8_t> memory_;
    std::vector<BusRegion> regions_;
    std::map<std::string, uint32_t, std::less<>> registers_;

    Keypad keypad_;
    FrameBuffer display_;
};

} // namespace tickwork

#endif // TICKWORK_BUS_HPP
