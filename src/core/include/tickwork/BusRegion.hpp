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

#include <cstdint>
#include <string>

namespace tickwork {

// Flags describing bus region capabilities.
// Frontends and the inspector use these to discover what is safe to touch.
enum class RegionFlags : uint8_t {
    None      = 0,
    Readable  = 1 << 0,  // Region can be read
    Writable  = 1 << 1,  // Region can be written by program stores
    Registers = 1 << 2,  // Region holds memory-mapped device registers
};

inline RegionFlags operator|(RegionFlags a, RegionFlags b) {
    return static_cast<RegionFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline RegionFlags operator&(RegionFlags a, RegionFlags b) {
    return static_cast<RegionFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool has_flag(RegionFlags flags, RegionFlags flag) {
    return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(flag)) != 0;
}

constexpr RegionFlags kReadWrite = static_cast<RegionFlags>(
    static_cast<uint8_t>(RegionFlags::Readable) | static_cast<uint8_t>(RegionFlags::Writable));

// A named span of the bus address space declared by the backend.
struct BusRegion {
    std::string name;       // Region identifier (e.g., "font", "program")
    uint32_t base_address;
    uint32_t size;          // Size in bytes
    RegionFlags flags;

    bool contains(uint32_t address) const {
        return address >= base_address && address - base_address < size;
    }
};

} // namespace tickwork
