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

#include "tickwork/VirtualClock.hpp"
#include "tickwork/Errors.hpp"

#include <stdexcept>
#include <string>

namespace tickwork {

namespace {

constexpr uint64_t kNanos = static_cast<uint64_t>(kNanosPerSecond);

void check_rate(uint64_t rate) {
    if (rate == 0 || rate > VirtualClock::MAX_RATE) {
        throw std::invalid_argument("Invalid cycle rate: " + std::to_string(rate));
    }
}

} // anonymous namespace

VirtualClock::VirtualClock(uint64_t cycles_per_second)
    : rate_(cycles_per_second)
{
    check_rate(rate_);
}

uint64_t VirtualClock::advance(Duration wall_clock_delta) {
    const int64_t ns = wall_clock_delta.count();
    if (ns <= 0) {
        return 0;
    }

    // Split so that neither product can overflow 64 bits:
    // sub_ns < 1e9 and rate <= 1e9.
    const uint64_t whole_seconds = static_cast<uint64_t>(ns) / kNanos;
    const uint64_t sub_ns = static_cast<uint64_t>(ns) % kNanos;

    uint64_t due = whole_seconds * rate_;
    const uint64_t numerator = sub_ns * rate_ + remainder_;
    due += numerator / kNanos;
    remainder_ = numerator % kNanos;
    return due;
}

void VirtualClock::reset() {
    cycles_ = 0;
    remainder_ = 0;
}

void VirtualClock::set_rate(uint64_t cycles_per_second) {
    check_rate(cycles_per_second);
    rate_ = cycles_per_second;
    remainder_ = 0;
}

void VirtualClock::restore(uint64_t cycles, uint64_t remainder) {
    if (remainder >= kNanos) {
        throw IncompatibleState("Clock remainder out of range: " + std::to_string(remainder));
    }
    cycles_ = cycles;
    remainder_ = remainder;
}

Duration VirtualClock::cycles_to_duration(uint64_t cycles) const {
    const uint64_t whole_seconds = cycles / rate_;
    const uint64_t sub_cycles = cycles % rate_;
    return Duration(static_cast<int64_t>(whole_seconds * kNanos + sub_cycles * kNanos / rate_));
}

uint64_t VirtualClock::duration_to_cycles(Duration duration) const {
    const int64_t ns = duration.count();
    if (ns <= 0) {
        return 0;
    }
    const uint64_t whole_seconds = static_cast<uint64_t>(ns) / kNanos;
    const uint64_t sub_ns = static_cast<uint64_t>(ns) % kNanos;
    return whole_seconds * rate_ + sub_ns * rate_ / kNanos;
}

} // namespace tickwork
