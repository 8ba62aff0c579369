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

#ifndef TICKWORK_TYPES_HPP
#define TICKWORK_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tickwork {

// Wall-clock and virtual time are both measured in nanoseconds.
using Duration = std::chrono::nanoseconds;

constexpr int64_t kNanosPerSecond = 1'000'000'000;

// Closed set of machine variants a Session can host.
// The numeric values are persisted in save-states and must not change.
enum class BackendKind : uint8_t {
    Chip8 = 1,
    SuperChip = 2,
    Simple = 3,
};

enum class SessionState : uint8_t {
    Uninitialized,
    Ready,
    Running,
    Paused,
    Faulted,
};

constexpr std::string_view to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Chip8: return "chip8";
        case BackendKind::SuperChip: return "superchip";
        case BackendKind::Simple: return "simple";
    }
    return "unknown";
}

constexpr std::optional<BackendKind> parse_backend_kind(std::string_view name) {
    if (name == "chip8") return BackendKind::Chip8;
    if (name == "superchip" || name == "schip") return BackendKind::SuperChip;
    if (name == "simple") return BackendKind::Simple;
    return std::nullopt;
}

constexpr std::optional<BackendKind> backend_kind_from_tag(uint8_t tag) {
    switch (tag) {
        case static_cast<uint8_t>(BackendKind::Chip8): return BackendKind::Chip8;
        case static_cast<uint8_t>(BackendKind::SuperChip): return BackendKind::SuperChip;
        case static_cast<uint8_t>(BackendKind::Simple): return BackendKind::Simple;
        default: return std::nullopt;
    }
}

constexpr std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Ready: return "ready";
        case SessionState::Running: return "running";
        case SessionState::Paused: return "paused";
        case SessionState::Faulted: return "faulted";
    }
    return "unknown";
}

// Pack an RGBA colour into the frame buffer pixel format (R in the low byte).
constexpr uint32_t rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
    return static_cast<uint32_t>(r)
         | (static_cast<uint32_t>(g) << 8)
         | (static_cast<uint32_t>(b) << 16)
         | (static_cast<uint32_t>(a) << 24);
}

} // namespace tickwork

#endif // TICKWORK_TYPES_HPP
