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

#include "Bus.hpp"
#include "Errors.hpp"
#include "FrameBuffer.hpp"
#include "Types.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tickwork {

// Result of one atomic backend step.
// A faulted step consumed no cycles and left backend and bus untouched.
struct StepOutcome {
    static constexpr size_t MAX_SAMPLES = 16;

    uint32_t cycles = 0;
    bool display_dirty = false;
    std::optional<FaultInfo> fault;

    // Audio produced by the step, spread evenly over its cycles with the
    // first sample at the virtual time the step began.
    std::array<float, MAX_SAMPLES> samples{};
    uint8_t sample_count = 0;

    void add_sample(float value) {
        if (sample_count < MAX_SAMPLES) {
            samples[sample_count++] = value;
        }
    }

    std::span<const float> audio() const { return {samples.data(), sample_count}; }

    static StepOutcome faulted(FaultInfo info) {
        StepOutcome outcome;
        outcome.fault = std::move(info);
        return outcome;
    }
};

// One named value in a backend's register dump.
struct RegisterView {
    std::string name;
    uint32_t value;
    uint8_t bits;   // Display width

    bool operator==(const RegisterView&) const = default;
};

// Concept: backend can be loaded with a program image and reset
template<typename T>
concept LoadableBackend = requires(T& backend, Bus& bus, std::span<const uint8_t> program) {
    { backend.load(program, bus) } -> std::same_as<void>;
    { backend.reset(bus) } -> std::same_as<void>;
};

// Concept: backend executes atomic steps against the bus
template<typename T>
concept SteppableBackend = requires(T& backend, const T& cbackend, Bus& bus) {
    { backend.step(bus) } -> std::same_as<StepOutcome>;
    { cbackend.native_cycle_rate() } -> std::convertible_to<uint64_t>;
};

// Concept: backend state can be captured opaquely and restored
template<typename T>
concept SnapshotableBackend = requires(T& backend, const T& cbackend, std::span<const uint8_t> bytes) {
    { cbackend.snapshot() } -> std::same_as<std::vector<uint8_t>>;
    { backend.restore(bytes) } -> std::same_as<void>;
};

// Concept: backend produces a display image
template<typename T>
concept DisplayBackend = requires(const T& backend, FrameBuffer& frame) {
    { backend.render(frame) } -> std::same_as<void>;
    { backend.display_width() } -> std::convertible_to<size_t>;
    { backend.display_height() } -> std::convertible_to<size_t>;
};

// Main concept: the full capability set every machine variant provides
template<typename T>
concept MachineBackend = LoadableBackend<T> && SteppableBackend<T> &&
    SnapshotableBackend<T> && DisplayBackend<T> &&
    requires(const T& backend) {
        { backend.kind() } -> std::same_as<BackendKind>;
        { backend.inspect() } -> std::same_as<std::vector<RegisterView>>;
    };

} // namespace tickwork
