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

#include "tickwork/Session.hpp"
#include "tickwork/Errors.hpp"
#include "tickwork/Log.hpp"

#include <chrono>
#include <string>

namespace tickwork {

namespace {

std::string state_error(const char* operation, SessionState state) {
    return std::string("Cannot ") + operation + " while " + std::string(to_string(state));
}

} // anonymous namespace

Session::Session(BackendKind kind, SessionConfig config)
    : config_(std::move(config))
    , kind_(kind)
    , clock_(1)
    , audio_(config_.audio)
{
}

void Session::require_backend(const char* operation) const {
    if (!backend_) {
        throw StateError(std::string("Cannot ") + operation + ": no program loaded");
    }
}

void Session::load_program(std::span<const uint8_t> program) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_program_locked(kind_, program);
}

void Session::load_program(BackendKind kind, std::span<const uint8_t> program) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_program_locked(kind, program);
}

void Session::load_program_locked(BackendKind kind, std::span<const uint8_t> program) {
    // The backend validates the image before it touches the bus, so a
    // rejected program leaves the session exactly as it was.
    Backend candidate = Backend::make(kind, config_.chip8);
    candidate.load(program, bus_);

    backend_.emplace(std::move(candidate));
    kind_ = kind;

    const uint64_t rate = backend_->native_cycle_rate();
    clock_.set_rate(rate);
    clock_.reset();
    scheduler_.set_config(SchedulerConfig{config_.max_cycles_per_tick.value_or(rate)});
    scheduler_.reset();
    audio_.reset();
    last_fault_.reset();
    stats_ = SessionStats{};
    total_tick_time_ = Duration{0};

    Scheduler::publish_display(*backend_, bus_);
    state_.store(SessionState::Ready, std::memory_order_release);

    TICKWORK_LOG_INFO("session", "Loaded " << program.size() << " byte program on "
                      << to_string(kind) << " backend at " << rate << "Hz");
}

void Session::run() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_backend("run");
    const auto current = state();
    if (current != SessionState::Ready && current != SessionState::Paused) {
        throw StateError(state_error("run", current));
    }
    state_.store(SessionState::Running, std::memory_order_release);
}

bool Session::pause() {
    auto expected = SessionState::Running;
    const bool paused = state_.compare_exchange_strong(expected, SessionState::Paused,
                                                       std::memory_order_acq_rel);
    if (paused) {
        TICKWORK_LOG_DEBUG("session", "Paused");
    }
    return paused;
}

TickReport Session::tick(Duration wall_clock_delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state() != SessionState::Running || !backend_) {
        return TickReport{};
    }

    const auto started = std::chrono::steady_clock::now();
    auto report = scheduler_.tick(wall_clock_delta, *backend_, bus_, clock_, audio_, [this] {
        return state_.load(std::memory_order_acquire) == SessionState::Running;
    });
    record_tick(report, std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started));

    if (report.fault) {
        enter_faulted(*report.fault);
    }
    return report;
}

TickReport Session::step_once() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_backend("step");
    const auto current = state();
    if (current != SessionState::Ready && current != SessionState::Paused) {
        throw StateError(state_error("step", current));
    }

    auto report = scheduler_.step_once(*backend_, bus_, clock_, audio_);
    stats_.total_steps += report.steps_executed;
    if (report.fault) {
        enter_faulted(*report.fault);
    }
    return report;
}

void Session::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_backend("reset");
    const auto current = state();
    if (current == SessionState::Running) {
        throw StateError(state_error("reset", current));
    }

    backend_->reset(bus_);
    clock_.reset();
    scheduler_.reset();
    audio_.reset();
    last_fault_.reset();

    Scheduler::publish_display(*backend_, bus_);
    state_.store(SessionState::Ready, std::memory_order_release);
    TICKWORK_LOG_DEBUG("session", "Reset");
}

SaveState Session::save_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = state();
    if (current == SessionState::Uninitialized || current == SessionState::Faulted) {
        throw StateError(state_error("save state", current));
    }

    SaveState::Contents contents;
    contents.backend_kind = kind_;
    contents.clock_cycles = clock_.cycles();
    contents.clock_remainder = clock_.remainder();
    contents.cycle_debt = scheduler_.cycle_debt();
    contents.keypad_mask = bus_.keypad().mask();
    contents.bus = bus_.snapshot();
    contents.backend = backend_->snapshot();
    return SaveState(std::move(contents));
}

void Session::load_state(const SaveState& saved) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!backend_) {
        throw IncompatibleState("Cannot load state: no program loaded");
    }
    if (saved.backend_kind() != kind_) {
        throw IncompatibleState("Save-state is for the " + std::string(to_string(saved.backend_kind()))
                                + " backend but " + std::string(to_string(kind_)) + " is loaded");
    }
    if (saved.bus_contents().size() != bus_.size()) {
        throw IncompatibleState("Save-state bus size " + std::to_string(saved.bus_contents().size())
                                + " does not match " + std::to_string(bus_.size()));
    }
    if (saved.clock_remainder() >= static_cast<uint64_t>(kNanosPerSecond)) {
        throw IncompatibleState("Save-state clock remainder out of range");
    }

    // Backend restore validates its payload before committing anything
    backend_->restore(saved.backend_state());
    bus_.restore(saved.bus_contents());
    bus_.keypad().restore(saved.keypad_mask());
    clock_.restore(saved.clock_cycles(), saved.clock_remainder());
    scheduler_.set_cycle_debt(saved.cycle_debt());
    audio_.reset();
    last_fault_.reset();

    Scheduler::publish_display(*backend_, bus_);
    state_.store(SessionState::Paused, std::memory_order_release);
    TICKWORK_LOG_DEBUG("session", "Loaded state at cycle " << saved.clock_cycles());
}

void Session::record_tick(const TickReport& report, Duration elapsed) {
    ++stats_.ticks;
    stats_.total_steps += report.steps_executed;
    stats_.total_cycles += report.cycles_executed;
    stats_.cycles_discarded += report.cycles_discarded;
    stats_.last_tick_duration = elapsed;
    total_tick_time_ += elapsed;
    stats_.average_tick_duration = total_tick_time_ / static_cast<int64_t>(stats_.ticks);
}

void Session::enter_faulted(const FaultInfo& fault) {
    last_fault_ = fault;
    ++stats_.faults;
    state_.store(SessionState::Faulted, std::memory_order_release);
    TICKWORK_LOG_WARN("session", "Faulted: " << fault.describe());
}

BackendKind Session::backend_kind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kind_;
}

uint64_t Session::native_cycle_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_ ? backend_->native_cycle_rate() : 0;
}

uint64_t Session::cycles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_.cycles();
}

Duration Session::elapsed_virtual_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_.elapsed_virtual_time();
}

std::optional<FaultInfo> Session::last_fault() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_fault_;
}

SessionStats Session::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionStats stats = stats_;
    stats.audio = audio_.stats();
    return stats;
}

std::vector<RegisterView> Session::inspect() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_ ? backend_->inspect() : std::vector<RegisterView>{};
}

std::vector<uint8_t> Session::peek(uint32_t address, size_t length) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bus_.peek(address, length);
}

std::vector<BusRegion> Session::regions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto map = bus_.regions();
    return std::vector<BusRegion>(map.begin(), map.end());
}

std::vector<uint8_t> Session::backend_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    require_backend("snapshot backend");
    return backend_->snapshot();
}

std::vector<uint8_t> Session::bus_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bus_.snapshot();
}

} // namespace tickwork
