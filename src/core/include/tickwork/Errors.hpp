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

#ifndef TICKWORK_ERRORS_HPP
#define TICKWORK_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tickwork {

// Base class for every error the core reports to its caller.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or oversized program image. Raised before any state is touched.
class InvalidProgram : public Error {
public:
    using Error::Error;
};

// Save-state blob that is corrupt, from another format version, or for a
// different backend variant than the one loaded.
class IncompatibleState : public Error {
public:
    using Error::Error;
};

// Operation not permitted in the session's current run state.
class StateError : public Error {
public:
    using Error::Error;
};

// Access outside the bus's declared address space, or a write to a
// read-only region. Backends pre-check their accesses, so reaching this
// from a step indicates a backend bug.
class BusError : public Error {
public:
    BusError(const std::string& message, uint32_t address)
        : Error(message)
        , address_(address) {}

    uint32_t address() const { return address_; }

private:
    uint32_t address_;
};

enum class FaultKind : uint8_t {
    UnknownOpcode,
    StackOverflow,
    StackUnderflow,
    MemoryOutOfBounds,
    BusViolation,
};

constexpr std::string_view to_string(FaultKind kind) {
    switch (kind) {
        case FaultKind::UnknownOpcode: return "unknown opcode";
        case FaultKind::StackOverflow: return "stack overflow";
        case FaultKind::StackUnderflow: return "stack underflow";
        case FaultKind::MemoryOutOfBounds: return "memory out of bounds";
        case FaultKind::BusViolation: return "bus violation";
    }
    return "unknown fault";
}

// A backend fault is a value, not an exception: it is captured in the
// TickReport and in the session so the frontend can display it.
struct FaultInfo {
    FaultKind kind = FaultKind::UnknownOpcode;
    uint32_t pc = 0;        // Program counter of the faulting instruction
    uint32_t detail = 0;    // Opcode or offending address, depending on kind
    uint64_t cycle = 0;     // Virtual clock cycle at which the fault occurred
    std::string message;

    std::string describe() const;
};

} // namespace tickwork

#endif // TICKWORK_ERRORS_HPP
