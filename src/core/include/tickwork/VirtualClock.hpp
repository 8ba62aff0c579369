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

#ifndef TICKWORK_VIRTUAL_CLOCK_HPP
#define TICKWORK_VIRTUAL_CLOCK_HPP

#include "Types.hpp"

#include <cstdint>

namespace tickwork {

// Elapsed emulated time, counted in backend cycles.
//
// advance() converts a wall-clock interval into the number of cycles owed at
// the backend's rate. Fractional cycles are carried in an integer remainder
// (units of cycle-nanoseconds), so over any partition of a total interval the
// owed cycles sum to exactly floor(total_ns * rate / 1e9).
//
// Owed cycles are not counted as elapsed until the scheduler commits the
// cycles it actually executed.
class VirtualClock {
public:
    static constexpr uint64_t MAX_RATE = 1'000'000'000;

    explicit VirtualClock(uint64_t cycles_per_second = 1);

    // Cycles owed for a wall-clock interval. Negative intervals owe nothing.
    uint64_t advance(Duration wall_clock_delta);

    // Record cycles executed by the backend.
    void commit(uint64_t cycles) { cycles_ += cycles; }

    void reset();

    // Change the rate; the fractional remainder is discarded.
    void set_rate(uint64_t cycles_per_second);

    // Used when loading a save-state.
    void restore(uint64_t cycles, uint64_t remainder);

    uint64_t rate() const { return rate_; }
    uint64_t cycles() const { return cycles_; }
    uint64_t remainder() const { return remainder_; }

    Duration elapsed_virtual_time() const { return cycles_to_duration(cycles_); }

    Duration cycles_to_duration(uint64_t cycles) const;
    uint64_t duration_to_cycles(Duration duration) const;

private:
    uint64_t rate_;
    uint64_t cycles_ = 0;
    uint64_t remainder_ = 0;    // Always < kNanosPerSecond
};

} // namespace tickwork

#endif // TICKWORK_VIRTUAL_CLOCK_HPP
