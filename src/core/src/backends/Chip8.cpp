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

#include "tickwork/backends/Chip8.hpp"
#include "tickwork/Log.hpp"
#include "tickwork/StateStream.hpp"
#include "tickwork/VirtualClock.hpp"

#include <algorithm>
#include <bit>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tickwork {

namespace chip8 {

// Standard 4x5 hexadecimal glyphs
const std::array<uint8_t, 80> FONT_SET = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

} // namespace chip8

using namespace chip8;

namespace {

constexpr uint8_t kSnapshotVersion = 2;
constexpr uint8_t kNotWaiting = 0xFF;

std::string hex16(uint32_t value) {
    std::ostringstream out;
    out << "0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << value;
    return out.str();
}

FaultInfo make_fault(FaultKind kind, uint16_t pc, uint32_t detail, std::string message) {
    FaultInfo info;
    info.kind = kind;
    info.pc = pc;
    info.detail = detail;
    info.message = std::move(message);
    return info;
}

} // anonymous namespace

Chip8Quirks Chip8Quirks::for_kind(BackendKind kind) {
    Chip8Quirks quirks;
    if (kind == BackendKind::SuperChip) {
        quirks.shift_uses_vx = true;
        quirks.load_store_leaves_i = true;
        quirks.jump_uses_vx = true;
        quirks.draw_without_vblank_wait = true;
        quirks.logic_leaves_vf = true;
    }
    return quirks;
}

Chip8Backend::Chip8Backend(BackendKind kind, Chip8Options options)
    : kind_(kind)
    , options_(std::move(options))
    , quirks_(options_.quirks.value_or(Chip8Quirks::for_kind(kind)))
    , rng_state_(options_.random_seed != 0 ? options_.random_seed : 1)
    , tone_rate_(std::min(TONE_SAMPLE_RATE, options_.cycle_rate * StepOutcome::MAX_SAMPLES))
{
    if (kind != BackendKind::Chip8 && kind != BackendKind::SuperChip) {
        throw std::invalid_argument("Chip8Backend cannot emulate " + std::string(to_string(kind)));
    }
    if (options_.cycle_rate == 0 || options_.cycle_rate > VirtualClock::MAX_RATE) {
        throw std::invalid_argument("Invalid CHIP-8 cycle rate: " + std::to_string(options_.cycle_rate));
    }
}

void Chip8Backend::load(std::span<const uint8_t> program, Bus& bus) {
    if (program.empty()) {
        throw InvalidProgram("Program image is empty");
    }
    if (program.size() > MAX_PROGRAM_SIZE) {
        throw InvalidProgram("Program image is " + std::to_string(program.size())
                             + " bytes, at most " + std::to_string(MAX_PROGRAM_SIZE)
                             + " fit above " + hex16(PROGRAM_START));
    }

    bus.configure(MEMORY_SIZE);
    bus.add_region({"interpreter", 0x000, PROGRAM_START, kReadWrite});
    bus.add_region({"font", FONT_BASE, static_cast<uint32_t>(FONT_SET.size()), kReadWrite});
    bus.add_region({"timers", DELAY_TIMER_ADDR, 2, kReadWrite | RegionFlags::Registers});
    bus.add_region({"program", PROGRAM_START, static_cast<uint32_t>(MAX_PROGRAM_SIZE), kReadWrite});
    bus.define_register("DT", DELAY_TIMER_ADDR);
    bus.define_register("ST", SOUND_TIMER_ADDR);

    bus.load(FONT_BASE, FONT_SET);
    bus.load(PROGRAM_START, program);
    bus.display().resize(DISPLAY_WIDTH, DISPLAY_HEIGHT);

    reset(bus);

    TICKWORK_LOG_DEBUG("chip8", "Loaded " << program.size() << " byte program for "
                       << to_string(kind_) << " at " << options_.cycle_rate << "Hz");
}

void Chip8Backend::reset(Bus& bus) {
    regs_ = Chip8Registers{};
    display_.fill(0);
    cycles_ = 0;
    timer_accumulator_ = 0;
    waiting_vblank_ = false;
    waiting_key_ = -1;
    bus.keypad().discard_changes();
    keys_ = bus.keypad().mask();
    rng_state_ = options_.random_seed != 0 ? options_.random_seed : 1;

    bus.poke(DELAY_TIMER_ADDR, 0);
    bus.poke(SOUND_TIMER_ADDR, 0);
}

// Apply queued keypad changes in order. A release of a key pressed on this
// step is left queued for the next one, so every press is visible to at
// least one instruction. Returns the first key released, or -1.
int Chip8Backend::poll_keys(Keypad& keypad) {
    int first_released = -1;
    uint16_t pressed_now = 0;
    bool drained = true;
    while (auto next = keypad.peek_change()) {
        const auto released = static_cast<uint16_t>(keys_ & ~*next);
        if ((released & pressed_now) != 0) {
            drained = false;
            break;
        }
        keypad.pop_change();
        pressed_now |= static_cast<uint16_t>(*next & ~keys_);
        if (released != 0 && first_released < 0) {
            first_released = std::countr_zero(released);
        }
        keys_ = *next;
    }

    // Catch up with a mask set without a queued change
    if (drained) {
        const uint16_t held = keypad.mask();
        const auto released = static_cast<uint16_t>(keys_ & ~held);
        if (released != 0 && first_released < 0) {
            first_released = std::countr_zero(released);
        }
        keys_ = held;
    }
    return first_released;
}

StepOutcome Chip8Backend::step(Bus& bus) {
    const int released = poll_keys(bus.keypad());

    // Fx0A completes on the release of a key
    if (waiting_key_ >= 0) {
        if (released >= 0) {
            regs_.v[static_cast<size_t>(waiting_key_)] = static_cast<uint8_t>(released);
            waiting_key_ = -1;
        }
        return finish_step(bus, false);
    }

    if (waiting_vblank_) {
        return finish_step(bus, false);
    }

    const uint16_t pc = regs_.pc;
    if (!bus.contains(pc, 2)) {
        return StepOutcome::faulted(make_fault(FaultKind::MemoryOutOfBounds, pc, pc,
                                               "Instruction fetch outside memory"));
    }
    const uint16_t opcode = bus.read16_be(pc);

    // Execute against a working copy so a fault leaves registers untouched
    Chip8Registers working = regs_;
    working.pc = static_cast<uint16_t>(pc + 2);
    auto result = execute(opcode, working, bus);
    if (result.fault) {
        return StepOutcome::faulted(std::move(*result.fault));
    }

    regs_ = working;
    return finish_step(bus, result.display_dirty);
}

StepOutcome Chip8Backend::finish_step(Bus& bus, bool display_dirty) {
    const uint64_t cycle = cycles_++;

    // 60Hz timers derived from the cycle count
    timer_accumulator_ += TIMER_RATE;
    while (timer_accumulator_ >= options_.cycle_rate) {
        timer_accumulator_ -= options_.cycle_rate;
        const uint8_t dt = bus.read8(DELAY_TIMER_ADDR);
        if (dt > 0) {
            bus.poke(DELAY_TIMER_ADDR, static_cast<uint8_t>(dt - 1));
        }
        const uint8_t st = bus.read8(SOUND_TIMER_ADDR);
        if (st > 0) {
            bus.poke(SOUND_TIMER_ADDR, static_cast<uint8_t>(st - 1));
        }
        waiting_vblank_ = false;
    }

    // Fixed-pitch square wave at tone_rate_ while the sound timer runs.
    // Sample k falls at k / tone_rate_ seconds of virtual time.
    StepOutcome outcome;
    outcome.cycles = 1;
    const bool sounding = bus.read8(SOUND_TIMER_ADDR) > 0;
    const uint64_t last = tone_index(cycle + 1);
    for (uint64_t k = tone_index(cycle); k < last; ++k) {
        float sample = 0.0f;
        if (sounding) {
            const uint64_t half_period = k * 2 * TONE_FREQUENCY / tone_rate_;
            sample = half_period % 2 == 0 ? options_.tone_amplitude : -options_.tone_amplitude;
        }
        outcome.add_sample(sample);
    }
    outcome.display_dirty = display_dirty;
    return outcome;
}

// First tone sample at or after the start of the given cycle
uint64_t Chip8Backend::tone_index(uint64_t cycle) const {
    return (cycle * tone_rate_ + options_.cycle_rate - 1) / options_.cycle_rate;
}

uint8_t Chip8Backend::next_random() {
    // xorshift32
    uint32_t x = rng_state_;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    rng_state_ = x;
    return static_cast<uint8_t>(x >> 24);
}

Chip8Backend::Execution Chip8Backend::execute(uint16_t opcode, Chip8Registers& r, Bus& bus) {
    const auto pc = static_cast<uint16_t>(r.pc - 2);
    const uint8_t x = (opcode >> 8) & 0xF;
    const uint8_t y = (opcode >> 4) & 0xF;
    const uint8_t n = opcode & 0xF;
    const uint8_t kk = opcode & 0xFF;
    const uint16_t nnn = opcode & 0x0FFF;

    Execution result;
    auto fault = [&](FaultKind kind, uint32_t detail, std::string message) {
        result.fault = make_fault(kind, pc, detail, std::move(message));
        return result;
    };
    auto unknown = [&]() {
        return fault(FaultKind::UnknownOpcode, opcode, "Unknown opcode " + hex16(opcode));
    };

    switch (opcode >> 12) {
        case 0x0:
            if (opcode == 0x00E0) {
                display_.fill(0);
                result.display_dirty = true;
            } else if (opcode == 0x00EE) {
                if (r.sp == 0) {
                    return fault(FaultKind::StackUnderflow, opcode, "Return with empty stack");
                }
                --r.sp;
                r.pc = r.stack[r.sp];
            } else {
                // 0nnn: machine code routine, treated as a jump
                r.pc = nnn;
            }
            break;

        case 0x1:
            r.pc = nnn;
            break;

        case 0x2:
            if (r.sp >= STACK_DEPTH) {
                return fault(FaultKind::StackOverflow, opcode, "Call with full stack");
            }
            r.stack[r.sp++] = r.pc;
            r.pc = nnn;
            break;

        case 0x3:
            if (r.v[x] == kk) r.pc += 2;
            break;

        case 0x4:
            if (r.v[x] != kk) r.pc += 2;
            break;

        case 0x5:
            if (n != 0) return unknown();
            if (r.v[x] == r.v[y]) r.pc += 2;
            break;

        case 0x6:
            r.v[x] = kk;
            break;

        case 0x7:
            r.v[x] = static_cast<uint8_t>(r.v[x] + kk);
            break;

        case 0x8: {
            const uint8_t vx = r.v[x];
            const uint8_t vy = r.v[y];
            switch (n) {
                case 0x0:
                    r.v[x] = vy;
                    break;
                case 0x1:
                    r.v[x] = vx | vy;
                    if (!quirks_.logic_leaves_vf) r.v[0xF] = 0;
                    break;
                case 0x2:
                    r.v[x] = vx & vy;
                    if (!quirks_.logic_leaves_vf) r.v[0xF] = 0;
                    break;
                case 0x3:
                    r.v[x] = vx ^ vy;
                    if (!quirks_.logic_leaves_vf) r.v[0xF] = 0;
                    break;
                case 0x4: {
                    const unsigned sum = static_cast<unsigned>(vx) + vy;
                    r.v[x] = static_cast<uint8_t>(sum);
                    r.v[0xF] = sum > 0xFF ? 1 : 0;
                    break;
                }
                case 0x5:
                    r.v[x] = static_cast<uint8_t>(vx - vy);
                    r.v[0xF] = vx >= vy ? 1 : 0;
                    break;
                case 0x6: {
                    const uint8_t src = quirks_.shift_uses_vx ? vx : vy;
                    r.v[x] = static_cast<uint8_t>(src >> 1);
                    r.v[0xF] = src & 0x1;
                    break;
                }
                case 0x7:
                    r.v[x] = static_cast<uint8_t>(vy - vx);
                    r.v[0xF] = vy >= vx ? 1 : 0;
                    break;
                case 0xE: {
                    const uint8_t src = quirks_.shift_uses_vx ? vx : vy;
                    r.v[x] = static_cast<uint8_t>(src << 1);
                    r.v[0xF] = src >> 7;
                    break;
                }
                default:
                    return unknown();
            }
            break;
        }

        case 0x9:
            if (n != 0) return unknown();
            if (r.v[x] != r.v[y]) r.pc += 2;
            break;

        case 0xA:
            r.i = nnn;
            break;

        case 0xB: {
            const uint8_t reg = quirks_.jump_uses_vx ? x : 0;
            r.pc = static_cast<uint16_t>(nnn + r.v[reg]);
            break;
        }

        case 0xC:
            r.v[x] = next_random() & kk;
            break;

        case 0xD: {
            const size_t start_x = r.v[x] % DISPLAY_WIDTH;
            const size_t start_y = r.v[y] % DISPLAY_HEIGHT;
            const size_t rows = std::min<size_t>(n, DISPLAY_HEIGHT - start_y);
            if (rows > 0 && !bus.contains(r.i, rows)) {
                return fault(FaultKind::MemoryOutOfBounds, r.i, "Sprite data outside memory");
            }

            uint8_t collision = 0;
            for (size_t row = 0; row < rows; ++row) {
                const uint8_t bits = bus.read8(static_cast<uint32_t>(r.i + row));
                for (size_t col = 0; col < 8; ++col) {
                    const size_t px = start_x + col;
                    if (px >= DISPLAY_WIDTH) {
                        break;  // Clipped at the right edge
                    }
                    if ((bits >> (7 - col)) & 0x1) {
                        auto& cell = display_[(start_y + row) * DISPLAY_WIDTH + px];
                        if (cell) collision = 1;
                        cell ^= 1;
                    }
                }
            }
            r.v[0xF] = collision;
            result.display_dirty = true;
            if (!quirks_.draw_without_vblank_wait) {
                waiting_vblank_ = true;
            }
            break;
        }

        case 0xE: {
            const bool pressed = (keys_ & (1u << (r.v[x] & 0xF))) != 0;
            if (kk == 0x9E) {
                if (pressed) r.pc += 2;
            } else if (kk == 0xA1) {
                if (!pressed) r.pc += 2;
            } else {
                return unknown();
            }
            break;
        }

        case 0xF:
            switch (kk) {
                case 0x07:
                    r.v[x] = bus.read8(DELAY_TIMER_ADDR);
                    break;
                case 0x0A:
                    waiting_key_ = static_cast<int8_t>(x);
                    break;
                case 0x15:
                    bus.write8(DELAY_TIMER_ADDR, r.v[x]);
                    break;
                case 0x18:
                    bus.write8(SOUND_TIMER_ADDR, r.v[x]);
                    break;
                case 0x1E:
                    r.i = static_cast<uint16_t>(r.i + r.v[x]);
                    break;
                case 0x29:
                    r.i = static_cast<uint16_t>(FONT_BASE + (r.v[x] & 0xF) * FONT_GLYPH_SIZE);
                    break;
                case 0x33: {
                    if (!bus.contains(r.i, 3)) {
                        return fault(FaultKind::MemoryOutOfBounds, r.i, "BCD store outside memory");
                    }
                    const uint8_t value = r.v[x];
                    bus.write8(r.i, value / 100);
                    bus.write8(r.i + 1u, (value / 10) % 10);
                    bus.write8(r.i + 2u, value % 10);
                    break;
                }
                case 0x55:
                case 0x65: {
                    const size_t count = static_cast<size_t>(x) + 1;
                    if (!bus.contains(r.i, count)) {
                        return fault(FaultKind::MemoryOutOfBounds, r.i,
                                     kk == 0x55 ? "Register store outside memory"
                                                : "Register load outside memory");
                    }
                    for (size_t k = 0; k < count; ++k) {
                        const auto address = static_cast<uint32_t>(r.i + k);
                        if (kk == 0x55) {
                            bus.write8(address, r.v[k]);
                        } else {
                            r.v[k] = bus.read8(address);
                        }
                    }
                    if (!quirks_.load_store_leaves_i) {
                        r.i = static_cast<uint16_t>(r.i + x + (quirks_.load_store_increments_i_by_x ? 0 : 1));
                    }
                    break;
                }
                default:
                    return unknown();
            }
            break;
    }

    return result;
}

void Chip8Backend::render(FrameBuffer& frame) const {
    if (frame.width() != DISPLAY_WIDTH || frame.height() != DISPLAY_HEIGHT) {
        frame.resize(DISPLAY_WIDTH, DISPLAY_HEIGHT);
    }
    uint32_t* out = frame.write_ptr();
    for (size_t i = 0; i < display_.size(); ++i) {
        out[i] = display_[i] ? PIXEL_ON : PIXEL_OFF;
    }
}

std::vector<uint8_t> Chip8Backend::snapshot() const {
    StateWriter w;
    w.u8(kSnapshotVersion);
    for (uint8_t v : regs_.v) w.u8(v);
    w.u16(regs_.i);
    w.u16(regs_.pc);
    w.u8(regs_.sp);
    for (uint16_t s : regs_.stack) w.u16(s);

    w.u64(cycles_);
    w.u64(timer_accumulator_);
    w.boolean(waiting_vblank_);
    w.u8(waiting_key_ >= 0 ? static_cast<uint8_t>(waiting_key_) : kNotWaiting);
    w.u16(keys_);
    w.u32(rng_state_);

    // Display packed one bit per pixel, MSB first
    for (size_t i = 0; i < display_.size(); i += 8) {
        uint8_t packed = 0;
        for (size_t b = 0; b < 8; ++b) {
            packed = static_cast<uint8_t>((packed << 1) | (display_[i + b] & 0x1));
        }
        w.u8(packed);
    }
    return w.take();
}

void Chip8Backend::restore(std::span<const uint8_t> bytes) {
    StateReader rd(bytes);
    if (rd.u8() != kSnapshotVersion) {
        throw IncompatibleState("Unsupported CHIP-8 state version");
    }

    Chip8Registers regs;
    for (auto& v : regs.v) v = rd.u8();
    regs.i = rd.u16();
    regs.pc = rd.u16();
    regs.sp = rd.u8();
    for (auto& s : regs.stack) s = rd.u16();
    if (regs.sp > STACK_DEPTH) {
        throw IncompatibleState("CHIP-8 stack pointer out of range: " + std::to_string(regs.sp));
    }

    const uint64_t cycles = rd.u64();
    const uint64_t accumulator = rd.u64();
    if (accumulator >= options_.cycle_rate) {
        throw IncompatibleState("CHIP-8 timer phase does not match the configured cycle rate");
    }
    const bool waiting_vblank = rd.boolean();
    const uint8_t waiting_key = rd.u8();
    if (waiting_key != kNotWaiting && waiting_key >= NUM_REGISTERS) {
        throw IncompatibleState("CHIP-8 key wait register out of range");
    }
    const uint16_t keys = rd.u16();
    const uint32_t rng_state = rd.u32();

    decltype(display_) display{};
    for (size_t i = 0; i < display.size(); i += 8) {
        const uint8_t packed = rd.u8();
        for (size_t b = 0; b < 8; ++b) {
            display[i + b] = (packed >> (7 - b)) & 0x1;
        }
    }
    rd.expect_end();

    regs_ = regs;
    cycles_ = cycles;
    timer_accumulator_ = accumulator;
    waiting_vblank_ = waiting_vblank;
    waiting_key_ = waiting_key == kNotWaiting ? int8_t{-1} : static_cast<int8_t>(waiting_key);
    keys_ = keys;
    rng_state_ = rng_state;
    display_ = display;
}

std::vector<RegisterView> Chip8Backend::inspect() const {
    std::vector<RegisterView> view;
    view.push_back({"PC", regs_.pc, 16});
    view.push_back({"I", regs_.i, 16});
    view.push_back({"SP", regs_.sp, 8});
    for (size_t k = 0; k < regs_.v.size(); ++k) {
        std::ostringstream name;
        name << "V" << std::hex << std::uppercase << k;
        view.push_back({name.str(), regs_.v[k], 8});
    }
    for (size_t k = 0; k < regs_.sp; ++k) {
        view.push_back({"S" + std::to_string(k), regs_.stack[k], 16});
    }
    return view;
}

} // namespace tickwork
