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

#ifndef TICKWORK_SESSION_HPP
#define TICKWORK_SESSION_HPP

#include "AudioPipeline.hpp"
#include "Backend.hpp"
#include "Bus.hpp"
#include "SaveState.hpp"
#include "Scheduler.hpp"
#include "Types.hpp"
#include "VirtualClock.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace tickwork {

struct SessionConfig {
    Chip8Options chip8;

    // Defaults to one second of the backend's native rate
    std::optional<uint64_t> max_cycles_per_tick;

    AudioConfig audio;
};

struct SessionStats {
    uint64_t ticks = 0;             // Ticks that ran while Running
    uint64_t total_steps = 0;
    uint64_t total_cycles = 0;
    uint64_t cycles_discarded = 0;
    uint64_t faults = 0;
    Duration last_tick_duration{0};
    Duration average_tick_duration{0};
    AudioStats audio;
};

// Owns one machine and everything needed to run it against wall-clock time.
//
// Run states:
//   Uninitialized -> Ready (load_program)
//   Ready/Paused  -> Running (run), Running -> Paused (pause)
//   Running       -> Faulted (backend fault during tick)
//   any           -> Ready (load_program), Ready/Paused/Faulted -> Ready (reset)
//   any but Uninitialized -> Paused (load_state)
//
// Thread safety:
// - tick(), step_once(), reset(), load_program(), save_state() and
//   load_state() serialize on the session mutex, so a save or load never
//   overlaps an in-flight tick.
// - pause() is lock-free and takes effect at the next step boundary of an
//   in-flight tick.
// - display_buffer(), audio_pull() and the key injection calls never take
//   the session mutex and may be called from render, audio and input
//   threads.
class Session {
public:
    explicit Session(BackendKind kind, SessionConfig config = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // --- Lifecycle ---

    // Create a fresh backend for the session's machine and load the image.
    // Throws InvalidProgram (state unchanged) on a malformed image.
    void load_program(std::span<const uint8_t> program);

    // As above, switching to another machine variant.
    void load_program(BackendKind kind, std::span<const uint8_t> program);

    void run();

    // Returns false if the session was not Running.
    bool pause();

    TickReport step_once();
    TickReport tick(Duration wall_clock_delta);
    void reset();

    SaveState save_state() const;
    void load_state(const SaveState& state);

    // --- Frontend boundary ---

    DisplayFrame display_buffer() const { return bus_.display().read_frame(); }
    uint64_t display_version() const { return bus_.display().version(); }

    std::vector<float> audio_pull(size_t count) { return audio_.pull(count); }
    size_t audio_pull_into(std::span<float> out) { return audio_.pull_into(out); }

    void key_down(uint8_t key) { bus_.keypad().key_down(key); }
    void key_up(uint8_t key) { bus_.keypad().key_up(key); }
    void set_keys(uint16_t mask) { bus_.keypad().set_mask(mask); }
    uint16_t keys() const { return bus_.keypad().mask(); }

    // --- Inspection ---

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    BackendKind backend_kind() const;
    uint64_t native_cycle_rate() const;
    uint64_t cycles() const;
    Duration elapsed_virtual_time() const;
    std::optional<FaultInfo> last_fault() const;
    SessionStats stats() const;

    std::vector<RegisterView> inspect() const;
    std::vector<uint8_t> peek(uint32_t address, size_t length) const;
    std::vector<BusRegion> regions() const;

    std::vector<uint8_t> backend_snapshot() const;
    std::vector<uint8_t> bus_snapshot() const;

    const SessionConfig& config() const { return config_; }

private:
    void load_program_locked(BackendKind kind, std::span<const uint8_t> program);
    void require_backend(const char* operation) const;
    void record_tick(const TickReport& report, Duration elapsed);
    void enter_faulted(const FaultInfo& fault);

    SessionConfig config_;

    mutable std::mutex mutex_;
    std::atomic<SessionState> state_{SessionState::Uninitialized};

    BackendKind kind_;
    std::optional<Backend> backend_;
    Bus bus_;
    VirtualClock clock_;
    Scheduler scheduler_;
    AudioPipeline audio_;

    std::optional<FaultInfo> last_fault_;
    SessionStats stats_;
    Duration total_tick_time_{0};
};

} // namespace tickwork

#endif // TICKWORK_SESSION_HPP
