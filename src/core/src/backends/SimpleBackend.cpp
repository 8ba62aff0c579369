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

#include "tickwork/backends/SimpleBackend.hpp"
#include "tickwork/StateStream.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

namespace tickwork {

using namespace simple;

namespace {

constexpr uint8_t kSnapshotVersion = 1;
constexpr double kPhaseStep = std::numbers::pi / 40.0;

uint8_t channel(double phase) {
    return static_cast<uint8_t>((std::sin(phase) + 1.0) * 127.5);
}

} // anonymous namespace

void SimpleBackend::load(std::span<const uint8_t> program, Bus& bus) {
    if (program.size() > MAX_SEED_SIZE) {
        throw InvalidProgram("Seed image is " + std::to_string(program.size())
                             + " bytes, at most " + std::to_string(MAX_SEED_SIZE) + " allowed");
    }

    bus.configure(MEMORY_SIZE);
    bus.add_region({"seed", SEED_BASE, static_cast<uint32_t>(MAX_SEED_SIZE), kReadWrite});
    bus.add_region({"status", COUNTER_ADDR, 4, RegionFlags::Readable | RegionFlags::Registers});
    bus.define_register("counter", COUNTER_ADDR);
    bus.load(SEED_BASE, program);
    bus.display().resize(DISPLAY_WIDTH, DISPLAY_HEIGHT);

    reset(bus);
}

void SimpleBackend::reset(Bus& bus) {
    counter_ = 0;
    publish_counter(bus);
}

StepOutcome SimpleBackend::step(Bus& bus) {
    ++counter_;
    publish_counter(bus);

    StepOutcome outcome;
    outcome.cycles = 1;
    outcome.add_sample(static_cast<float>(0.5 * std::sin(static_cast<double>(counter_) * kPhaseStep)));
    outcome.display_dirty = true;
    return outcome;
}

void SimpleBackend::publish_counter(Bus& bus) const {
    const auto value = static_cast<uint32_t>(counter_);
    for (uint32_t k = 0; k < 4; ++k) {
        bus.poke(COUNTER_ADDR + k, static_cast<uint8_t>(value >> (8 * k)));
    }
}

uint32_t SimpleBackend::colour_for(uint64_t counter) {
    const double c = static_cast<double>(counter);
    return rgba(channel(c * kPhaseStep),
                channel((c + 0.5) * kPhaseStep),
                channel((c + 1.0) * kPhaseStep));
}

void SimpleBackend::render(FrameBuffer& frame) const {
    if (frame.width() != DISPLAY_WIDTH || frame.height() != DISPLAY_HEIGHT) {
        frame.resize(DISPLAY_WIDTH, DISPLAY_HEIGHT);
    }
    frame.clear(colour_for(counter_));
}

std::vector<uint8_t> SimpleBackend::snapshot() const {
    StateWriter w;
    w.u8(kSnapshotVersion);
    w.u64(counter_);
    return w.take();
}

void SimpleBackend::restore(std::span<const uint8_t> bytes) {
    StateReader rd(bytes);
    if (rd.u8() != kSnapshotVersion) {
        throw IncompatibleState("Unsupported simple backend state version");
    }
    const uint64_t counter = rd.u64();
    rd.expect_end();
    counter_ = counter;
}

std::vector<RegisterView> SimpleBackend::inspect() const {
    return {{"counter", static_cast<uint32_t>(counter_), 32}};
}

} // namespace tickwork
