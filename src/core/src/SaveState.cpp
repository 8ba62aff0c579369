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

#include "tickwork/SaveState.hpp"
#include "tickwork/Errors.hpp"
#include "tickwork/StateStream.hpp"

#include <algorithm>
#include <string>

namespace tickwork {

namespace {

std::vector<uint8_t> encode(const SaveState::Contents& c) {
    StateWriter w;
    w.raw(SaveState::MAGIC);
    w.u16(SaveState::FORMAT_VERSION);
    w.u8(static_cast<uint8_t>(c.backend_kind));
    w.u8(0);
    w.u64(c.clock_cycles);
    w.u64(c.clock_remainder);
    w.u64(c.cycle_debt);
    w.u16(c.keypad_mask);
    w.blob(c.bus);
    w.blob(c.backend);
    return w.take();
}

} // anonymous namespace

SaveState::SaveState(Contents contents)
    : contents_(std::move(contents))
    , bytes_(encode(contents_))
{
}

SaveState SaveState::from_bytes(std::span<const uint8_t> bytes) {
    StateReader rd(bytes);

    auto magic = rd.raw(MAGIC.size());
    if (!std::equal(magic.begin(), magic.end(), MAGIC.begin())) {
        throw IncompatibleState("Not a save-state (bad magic)");
    }

    const uint16_t version = rd.u16();
    if (version != FORMAT_VERSION) {
        throw IncompatibleState("Unsupported save-state format version " + std::to_string(version)
                                + " (expected " + std::to_string(FORMAT_VERSION) + ")");
    }

    const uint8_t tag = rd.u8();
    auto kind = backend_kind_from_tag(tag);
    if (!kind) {
        throw IncompatibleState("Unknown backend tag " + std::to_string(tag));
    }
    if (rd.u8() != 0) {
        throw IncompatibleState("Reserved save-state byte is non-zero");
    }

    Contents c;
    c.backend_kind = *kind;
    c.clock_cycles = rd.u64();
    c.clock_remainder = rd.u64();
    if (c.clock_remainder >= static_cast<uint64_t>(kNanosPerSecond)) {
        throw IncompatibleState("Clock remainder out of range");
    }
    c.cycle_debt = rd.u64();
    c.keypad_mask = rd.u16();

    auto bus = rd.blob();
    c.bus.assign(bus.begin(), bus.end());
    auto backend = rd.blob();
    c.backend.assign(backend.begin(), backend.end());
    rd.expect_end();

    return SaveState(std::move(c));
}

} // namespace tickwork
