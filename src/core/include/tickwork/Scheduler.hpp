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

#ifndef TICKWORK_SCHEDULER_HPP
#define TICKWORK_SCHEDULER_HPP

#include "AudioPipeline.hpp"
#include "BackendConcepts.hpp"
#include "Bus.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "VirtualClock.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>

namespace tickwork {

struct SchedulerConfig {
    // Anti-runaway clamp. Cycles owed beyond this in a single tick are
    // discarded. Zero disables the clamp.
    uint64_t max_cycles_per_tick = 0;
};

struct TickReport {
    std::optional<FaultInfo> fault;
    uint64_t cycles_due = 0;        // Owed this tick, after debt and clamp
    uint64_t cycles_executed = 0;
    uint64_t steps_executed = 0;
    uint64_t cycles_discarded = 0;  // Dropped by the clamp
    uint64_t cycle_debt = 0;        // Overshoot carried into the next tick
    bool display_updated = false;
    bool interrupted = false;       // Stopped early at a step boundary (pause)
};

// Catches virtual time up to wall-clock time by stepping a backend.
//
// A tick asks the clock how many cycles are owed, clamps that to the
// configured maximum, and executes backend steps strictly in order until
// the budget is spent. An instruction that overshoots the budget puts the
// scheduler in cycle debt, which is repaid from the next tick's budget.
//
// Each step's audio samples are time-stamped from the virtual time at which
// the step began, spread evenly over the cycles it took. If any step dirtied the display, the frame is rendered
// and published once at the end of the tick.
class Scheduler {
public:
    explicit Scheduler(SchedulerConfig config = {})
        : config_(config) {}

    template<MachineBackend B, typename ContinuePredicate>
    TickReport tick(Duration wall_clock_delta, B& backend, Bus& bus,
                    VirtualClock& clock, AudioPipeline& audio,
                    ContinuePredicate&& should_continue);

    template<MachineBackend B>
    TickReport tick(Duration wall_clock_delta, B& backend, Bus& bus,
                    VirtualClock& clock, AudioPipeline& audio) {
        return tick(wall_clock_delta, backend, bus, clock, audio, [] { return true; });
    }

    // Execute exactly one step outside the wall-clock path. The clock is
    // not advanced; samples are stamped with the current virtual time.
    template<MachineBackend B>
    TickReport step_once(B& backend, Bus& bus, const VirtualClock& clock, AudioPipeline& audio);

    // Run one step, converting a BusError escaping the backend into a
    // fault. Exposed for callers that drive stepping themselves.
    template<MachineBackend B>
    static StepOutcome run_step(B& backend, Bus& bus, const VirtualClock& clock,
                                AudioPipeline& audio);

    template<MachineBackend B>
    static void publish_display(const B& backend, Bus& bus) {
        backend.render(bus.display());
        bus.display().swap();
    }

    void reset() { debt_ = 0; }

    uint64_t cycle_debt() const { return debt_; }
    void set_cycle_debt(uint64_t debt) { debt_ = debt; }

    const SchedulerConfig& config() const { return config_; }
    void set_config(SchedulerConfig config) { config_ = config; }

private:
    SchedulerConfig config_;
    uint64_t debt_ = 0;
};

template<MachineBackend B>
StepOutcome Scheduler::run_step(B& backend, Bus& bus, const VirtualClock& clock,
                                AudioPipeline& audio) {
    const uint64_t cycle = clock.cycles();
    StepOutcome outcome;
    try {
        outcome = backend.step(bus);
    } catch (const BusError& e) {
        TICKWORK_LOG_ERROR("scheduler", "Backend bus violation at cycle " << cycle << ": " << e.what());
        FaultInfo info;
        info.kind = FaultKind::BusViolation;
        info.detail = e.address();
        info.message = e.what();
        outcome = StepOutcome::faulted(std::move(info));
    }

    if (outcome.fault) {
        outcome.fault->cycle = cycle;
        return outcome;
    }

    if (outcome.sample_count != 0) {
        const int64_t start = clock.cycles_to_duration(cycle).count();
        const int64_t span = clock.cycles_to_duration(cycle + std::max<uint32_t>(outcome.cycles, 1)).count()
                             - start;
        const auto count = static_cast<int64_t>(outcome.sample_count);
        for (int64_t k = 0; k < count; ++k) {
            audio.push(TimedSample{start + span * k / count, outcome.samples[static_cast<size_t>(k)]});
        }
    }
    return outcome;
}

template<MachineBackend B, typename ContinuePredicate>
TickReport Scheduler::tick(Duration wall_clock_delta, B& backend, Bus& bus,
                           VirtualClock& clock, AudioPipeline& audio,
                           ContinuePredicate&& should_continue) {
    TickReport report;

    uint64_t due = clock.advance(wall_clock_delta);

    // Repay overshoot from the previous tick
    const uint64_t repaid = std::min(debt_, due);
    debt_ -= repaid;
    due -= repaid;

    if (config_.max_cycles_per_tick != 0 && due > config_.max_cycles_per_tick) {
        report.cycles_discarded = due - config_.max_cycles_per_tick;
        due = config_.max_cycles_per_tick;
        TICKWORK_LOG_WARN("scheduler", "Host stalled, discarding " << report.cycles_discarded
                          << " owed cycles");
    }
    report.cycles_due = due;

    bool display_dirty = false;
    uint64_t executed = 0;
    while (executed < due) {
        if (!should_continue()) {
            report.interrupted = true;
            break;
        }

        auto outcome = run_step(backend, bus, clock, audio);
        if (outcome.fault) {
            TICKWORK_LOG_WARN("scheduler", "Backend fault: " << outcome.fault->describe());
            report.fault = std::move(outcome.fault);
            break;
        }

        // Every completed step takes at least one cycle
        const uint64_t cycles = std::max<uint64_t>(outcome.cycles, 1);
        clock.commit(cycles);
        executed += cycles;
        ++report.steps_executed;
        display_dirty = display_dirty || outcome.display_dirty;
    }

    if (executed > due) {
        debt_ += executed - due;
    }
    report.cycles_executed = executed;
    report.cycle_debt = debt_;

    if (display_dirty) {
        publish_display(backend, bus);
        report.display_updated = true;
    }
    audio.refill();

    TICKWORK_LOG_TRACE("scheduler", "Tick executed " << report.steps_executed << " steps, "
                       << executed << " cycles");
    return report;
}

template<MachineBackend B>
TickReport Scheduler::step_once(B& backend, Bus& bus, const VirtualClock& clock,
                                AudioPipeline& audio) {
    TickReport report;
    auto outcome = run_step(backend, bus, clock, audio);
    if (outcome.fault) {
        report.fault = std::move(outcome.fault);
        return report;
    }

    report.steps_executed = 1;
    report.cycles_executed = outcome.cycles;
    report.cycle_debt = debt_;
    if (outcome.display_dirty) {
        publish_display(backend, bus);
        report.display_updated = true;
    }
    audio.refill();
    return report;
}

} // namespace tickwork

#endif // TICKWORK_SCHEDULER_HPP
