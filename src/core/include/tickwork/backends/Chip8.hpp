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

#ifndef TICKWORK_BACKENDS_CHIP8_HPP
#define TICKWORK_BACKENDS_CHIP8_HPP

#include "tickwork/BackendConcepts.hpp"
#include "tickwork/Bus.hpp"
#include "tickwork/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace tickwork {

namespace chip8 {

constexpr size_t MEMORY_SIZE = 4096;
constexpr uint32_t FONT_BASE = 0x050;
constexpr uint32_t FONT_GLYPH_SIZE = 5;
constexpr uint32_t DELAY_TIMER_ADDR = 0x100;
constexpr uint32_t SOUND_TIMER_ADDR = 0x101;
constexpr uint32_t PROGRAM_START = 0x200;
constexpr size_t MAX_PROGRAM_SIZE = MEMORY_SIZE - PROGRAM_START;

constexpr size_t DISPLAY_WIDTH = 64;
constexpr size_t DISPLAY_HEIGHT = 32;
constexpr size_t STACK_DEPTH = 16;
constexpr uint8_t NUM_REGISTERS = 16;

constexpr uint64_t DEFAULT_CYCLE_RATE = 700;   // Instructions per second
constexpr uint64_t TIMER_RATE = 60;            // Delay/sound timer and vblank rate
constexpr uint64_t TONE_FREQUENCY = 440;       // Buzzer pitch
constexpr uint64_t TONE_SAMPLE_RATE = 8000;    // Buzzer samples per second of virtual time

constexpr uint32_t PIXEL_ON = rgba(0xFF, 0xFF, 0xFF);
constexpr uint32_t PIXEL_OFF = rgba(0x00, 0x00, 0x00);

extern const std::array<uint8_t, 80> FONT_SET;

} // namespace chip8

// Behavioural differences between the CHIP-8 and SUPER-CHIP interpreters.
struct Chip8Quirks {
    bool shift_uses_vx = false;             // 8xy6/8xyE shift VX in place instead of VY
    bool load_store_leaves_i = false;       // Fx55/Fx65 leave I unmodified
    bool load_store_increments_i_by_x = false;  // ...or advance I by X rather than X+1
    bool jump_uses_vx = false;              // Bnnn adds VX (X = high nibble) instead of V0
    bool draw_without_vblank_wait = false;  // Dxyn does not stall until the next vblank
    bool logic_leaves_vf = false;           // 8xy1/2/3 leave VF unmodified

    static Chip8Quirks for_kind(BackendKind kind);
};

struct Chip8Options {
    uint64_t cycle_rate = chip8::DEFAULT_CYCLE_RATE;
    uint32_t random_seed = 0x2545F491;
    float tone_amplitude = 0.25f;
    std::optional<Chip8Quirks> quirks;      // Overrides the platform defaults
};

struct Chip8Registers {
    std::array<uint8_t, chip8::NUM_REGISTERS> v{};
    uint16_t i = 0;
    uint16_t pc = chip8::PROGRAM_START;
    uint8_t sp = 0;
    std::array<uint16_t, chip8::STACK_DEPTH> stack{};
};

// CHIP-8 / SUPER-CHIP interpreter.
//
// Every step executes one instruction (or idles while waiting for a key
// release or for vblank) and consumes one cycle. The delay and sound timers
// live on the bus at DELAY_TIMER_ADDR/SOUND_TIMER_ADDR and are decremented at
// 60Hz of the backend's own cycle count.
//
// Steps are atomic: every precondition (fetch address, stack depth, memory
// range) is checked before any register, display or bus byte changes.
class Chip8Backend {
public:
    explicit Chip8Backend(BackendKind kind = BackendKind::Chip8, Chip8Options options = {});

    BackendKind kind() const { return kind_; }

    void load(std::span<const uint8_t> program, Bus& bus);
    void reset(Bus& bus);
    StepOutcome step(Bus& bus);

    uint64_t native_cycle_rate() const { return options_.cycle_rate; }

    std::vector<uint8_t> snapshot() const;
    void restore(std::span<const uint8_t> bytes);

    void render(FrameBuffer& frame) const;
    size_t display_width() const { return chip8::DISPLAY_WIDTH; }
    size_t display_height() const { return chip8::DISPLAY_HEIGHT; }

    std::vector<RegisterView> inspect() const;

    // --- Diagnostics ---

    const Chip8Registers& registers() const { return regs_; }
    const Chip8Quirks& quirks() const { return quirks_; }
    bool pixel(size_t x, size_t y) const { return display_[y * chip8::DISPLAY_WIDTH + x] != 0; }
    bool waiting_for_key() const { return waiting_key_ >= 0; }
    bool waiting_for_vblank() const { return waiting_vblank_; }
    uint16_t keys() const { return keys_; }
    uint64_t cycles() const { return cycles_; }
    uint64_t tone_sample_rate() const { return tone_rate_; }

private:
    struct Execution {
        bool display_dirty = false;
        std::optional<FaultInfo> fault;
    };

    Execution execute(uint16_t opcode, Chip8Registers& regs, Bus& bus);
    StepOutcome finish_step(Bus& bus, bool display_dirty);
    int poll_keys(Keypad& keypad);
    uint8_t next_random();
    uint64_t tone_index(uint64_t cycle) const;

    BackendKind kind_;
    Chip8Options options_;
    Chip8Quirks quirks_;

    Chip8Registers regs_;
    std::array<uint8_t, chip8::DISPLAY_WIDTH * chip8::DISPLAY_HEIGHT> display_{};
    uint64_t cycles_ = 0;
    uint64_t timer_accumulator_ = 0;
    bool waiting_vblank_ = false;
    int8_t waiting_key_ = -1;       // Register awaiting a key release, or -1
    uint16_t keys_ = 0;             // Keypad state as seen by the program
    uint32_t rng_state_;
    uint64_t tone_rate_;            // Lowered for slow step rates to fit StepOutcome
};

static_assert(MachineBackend<Chip8Backend>);

} // namespace tickwork

#endif // TICKWORK_BACKENDS_CHIP8_HPP
