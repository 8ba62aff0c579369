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

#ifndef TICKWORK_BACKEND_HPP
#define TICKWORK_BACKEND_HPP

#include "BackendConcepts.hpp"
#include "backends/Chip8.hpp"
#include "backends/SimpleBackend.hpp"

#include <variant>

namespace tickwork {

// The closed set of machine variants. Adding a machine means adding an
// alternative here and a case in Backend::make().
using BackendVariant = std::variant<Chip8Backend, SimpleBackend>;

// Type-erased handle over BackendVariant.
// Satisfies MachineBackend itself, so the scheduler treats it like any
// concrete backend.
class Backend {
public:
    explicit Backend(BackendVariant impl)
        : impl_(std::move(impl)) {}

    static Backend make(BackendKind kind, const Chip8Options& chip8_options = {}) {
        switch (kind) {
            case BackendKind::Chip8:
            case BackendKind::SuperChip:
                return Backend(Chip8Backend(kind, chip8_options));
            case BackendKind::Simple:
                return Backend(SimpleBackend());
        }
        throw std::invalid_argument("Unknown backend kind");
    }

    BackendKind kind() const {
        return std::visit([](const auto& b) { return b.kind(); }, impl_);
    }

    void load(std::span<const uint8_t> program, Bus& bus) {
        std::visit([&](auto& b) { b.load(program, bus); }, impl_);
    }

    void reset(Bus& bus) {
        std::visit([&](auto& b) { b.reset(bus); }, impl_);
    }

    StepOutcome step(Bus& bus) {
        return std::visit([&](auto& b) { return b.step(bus); }, impl_);
    }

    uint64_t native_cycle_rate() const {
        return std::visit([](const auto& b) { return b.native_cycle_rate(); }, impl_);
    }

    std::vector<uint8_t> snapshot() const {
        return std::visit([](const auto& b) { return b.snapshot(); }, impl_);
    }

    void restore(std::span<const uint8_t> bytes) {
        std::visit([&](auto& b) { b.restore(bytes); }, impl_);
    }

    void render(FrameBuffer& frame) const {
        std::visit([&](const auto& b) { b.render(frame); }, impl_);
    }

    size_t display_width() const {
        return std::visit([](const auto& b) { return b.display_width(); }, impl_);
    }

    size_t display_height() const {
        return std::visit([](const auto& b) { return b.display_height(); }, impl_);
    }

    std::vector<RegisterView> inspect() const {
        return std::visit([](const auto& b) { return b.inspect(); }, impl_);
    }

    // Access the concrete machine, for diagnostics and tests
    template<typename T>
    T* get_if() { return std::get_if<T>(&impl_); }

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&impl_); }

private:
    BackendVariant impl_;
};

static_assert(MachineBackend<Backend>);

} // namespace tickwork

#endif // TICKWORK_BACKEND_HPP
