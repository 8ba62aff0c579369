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

#ifndef TICKWORK_BACKENDS_SIMPLE_BACKEND_HPP
#define TICKWORK_BACKENDS_SIMPLE_BACKEND_HPP

#include "tickwork/BackendConcepts.hpp"
#include "tickwork/Bus.hpp"
#include "tickwork/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tickwork {

namespace simple {

constexpr uint64_t CYCLE_RATE = 50;            // One step every 20ms
constexpr size_t MEMORY_SIZE = 0x200;
constexpr uint32_t SEED_BASE = 0x000;
constexpr size_t MAX_SEED_SIZE = 0x100;
constexpr uint32_t COUNTER_ADDR = 0x100;       // 32-bit little-endian step counter
constexpr size_t DISPLAY_WIDTH = 100;
constexpr size_t DISPLAY_HEIGHT = 100;

} // namespace simple

// Minimal reference machine.
//
// Each step increments a counter, publishes it in a read-only register block
// and redraws a flat colour that cycles with the counter. It exists to
// exercise the session plumbing with a backend whose behaviour is trivial
// to predict.
class SimpleBackend {
public:
    SimpleBackend() = default;

    BackendKind kind() const { return BackendKind::Simple; }

    // The program image is optional seed data copied to SEED_BASE.
    void load(std::span<const uint8_t> program, Bus& bus);
    void reset(Bus& bus);
    StepOutcome step(Bus& bus);

    uint64_t native_cycle_rate() const { return simple::CYCLE_RATE; }

    std::vector<uint8_t> snapshot() const;
    void restore(std::span<const uint8_t> bytes);

    void render(FrameBuffer& frame) const;
    size_t display_width() const { return simple::DISPLAY_WIDTH; }
    size_t display_height() const { return simple::DISPLAY_HEIGHT; }

    std::vector<RegisterView> inspect() const;

    uint64_t counter() const { return counter_; }

    // Colour shown for a given counter value
    static uint32_t colour_for(uint64_t counter);

private:
    void publish_counter(Bus& bus) const;

    uint64_t counter_ = 0;
};

static_assert(MachineBackend<SimpleBackend>);

} // namespace tickwork

#endif // TICKWORK_BACKENDS_SIMPLE_BACKEND_HPP
