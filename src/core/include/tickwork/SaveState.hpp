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

#ifndef TICKWORK_SAVE_STATE_HPP
#define TICKWORK_SAVE_STATE_HPP

#include "Types.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace tickwork {

// Immutable, versioned snapshot of a session.
//
// Layout (little-endian):
//   magic "TKWS" | format version u16 | backend kind u8 | reserved u8
//   clock cycles u64 | clock remainder u64 | cycle debt u64 | keypad u16
//   bus size u32 + bytes | backend state size u32 + bytes
//
// Backend state is opaque to the session; each backend versions its own
// payload. Blobs are not portable across format versions.
class SaveState {
public:
    static constexpr uint16_t FORMAT_VERSION = 1;
    static constexpr std::array<uint8_t, 4> MAGIC = {'T', 'K', 'W', 'S'};

    struct Contents {
        BackendKind backend_kind = BackendKind::Chip8;
        uint64_t clock_cycles = 0;
        uint64_t clock_remainder = 0;
        uint64_t cycle_debt = 0;
        uint16_t keypad_mask = 0;
        std::vector<uint8_t> bus;
        std::vector<uint8_t> backend;
    };

    explicit SaveState(Contents contents);

    // Parse a persisted blob. Throws IncompatibleState if it is corrupt or
    // from another format version.
    static SaveState from_bytes(std::span<const uint8_t> bytes);

    BackendKind backend_kind() const { return contents_.backend_kind; }
    uint64_t clock_cycles() const { return contents_.clock_cycles; }
    uint64_t clock_remainder() const { return contents_.clock_remainder; }
    uint64_t cycle_debt() const { return contents_.cycle_debt; }
    uint16_t keypad_mask() const { return contents_.keypad_mask; }
    std::span<const uint8_t> bus_contents() const { return contents_.bus; }
    std::span<const uint8_t> backend_state() const { return contents_.backend; }

    // The encoded blob, for persistence
    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    Contents contents_;
    std::vector<uint8_t> bytes_;
};

} // namespace tickwork

#endif // TICKWORK_SAVE_STATE_HPP
