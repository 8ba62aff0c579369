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

#include <catch2/catch_test_macros.hpp>
#include <tickwork/Errors.hpp>
#include <tickwork/Session.hpp>

#include "TestHelpers.hpp"

#include <chrono>
#include <cmath>
#include <vector>

using namespace tickwork;
using namespace std::chrono_literals;
using tickwork::test::chip8_program;
using tickwork::test::register_value;

namespace {

SessionConfig chip8_at(uint64_t rate) {
    SessionConfig config;
    config.chip8.cycle_rate = rate;
    return config;
}

} // anonymous namespace

TEST_CASE("Session starts uninitialized", "[session][lifecycle]") {
    Session session(BackendKind::Chip8);

    CHECK(session.state() == SessionState::Uninitialized);
    CHECK(session.cycles() == 0);
    CHECK(session.native_cycle_rate() == 0);
    CHECK(session.inspect().empty());
    CHECK_FALSE(session.last_fault());

    CHECK_THROWS_AS(session.run(), StateError);
    CHECK_THROWS_AS(session.step_once(), StateError);
    CHECK_THROWS_AS(session.reset(), StateError);
    CHECK_THROWS_AS(session.save_state(), StateError);
    CHECK_FALSE(session.pause());

    auto report = session.tick(1s);
    CHECK(report.steps_executed == 0);
    CHECK(session.stats().ticks == 0);
}

TEST_CASE("Session rejects invalid programs without side effects", "[session][load]") {
    Session session(BackendKind::Chip8);

    SECTION("from uninitialized") {
        CHECK_THROWS_AS(session.load_program(std::vector<uint8_t>{}), InvalidProgram);
        CHECK(session.state() == SessionState::Uninitialized);
    }

    SECTION("while running") {
        session.load_program(chip8_program({0x7001, 0x1200}));
        session.run();
        session.tick(100ms);
        const auto cycles = session.cycles();
        const auto bus = session.bus_snapshot();

        std::vector<uint8_t> oversize(chip8::MAX_PROGRAM_SIZE + 2, 0);
        CHECK_THROWS_AS(session.load_program(oversize), InvalidProgram);
        CHECK(session.state() == SessionState::Running);
        CHECK(session.cycles() == cycles);
        CHECK(session.bus_snapshot() == bus);
    }
}

TEST_CASE("Session runs a program in wall-clock time", "[session][tick]") {
    Session session(BackendKind::Chip8, chip8_at(500));
    session.load_program(chip8_program({0x6001, 0x6102}));
    CHECK(session.state() == SessionState::Ready);
    CHECK(session.native_cycle_rate() == 500);

    // Ready does not tick
    CHECK(session.tick(4ms).steps_executed == 0);

    session.run();
    CHECK(session.state() == SessionState::Running);

    auto report = session.tick(4ms);
    CHECK_FALSE(report.fault);
    CHECK(report.steps_executed == 2);
    CHECK(session.cycles() == 2);
    CHECK(session.elapsed_virtual_time() == 4ms);

    auto view = session.inspect();
    CHECK(register_value(view, "V0") == 1);
    CHECK(register_value(view, "V1") == 2);
    CHECK(register_value(view, "PC") == 0x204);
    CHECK(session.state() == SessionState::Running);
}

TEST_CASE("Session faults on an illegal instruction", "[session][fault]") {
    Session session(BackendKind::Chip8, chip8_at(500));
    session.load_program(chip8_program({0xFFFF}));
    const auto backend_before = session.backend_snapshot();
    const auto bus_before = session.bus_snapshot();
    session.run();

    auto report = session.tick(4ms);
    REQUIRE(report.fault);
    CHECK(report.fault->kind == FaultKind::UnknownOpcode);
    CHECK(report.steps_executed == 0);
    CHECK(session.state() == SessionState::Faulted);
    CHECK(session.backend_snapshot() == backend_before);
    CHECK(session.bus_snapshot() == bus_before);
    CHECK(session.cycles() == 0);

    auto fault = session.last_fault();
    REQUIRE(fault);
    CHECK(fault->pc == 0x200);
    CHECK(session.stats().faults == 1);

    SECTION("a faulted session stays stopped") {
        CHECK(session.tick(1s).steps_executed == 0);
        CHECK_THROWS_AS(session.run(), StateError);
        CHECK_THROWS_AS(session.step_once(), StateError);
        CHECK_THROWS_AS(session.save_state(), StateError);
        CHECK_FALSE(session.pause());
    }

    SECTION("reset recovers") {
        session.reset();
        CHECK(session.state() == SessionState::Ready);
        CHECK_FALSE(session.last_fault());
    }

    SECTION("loading a new program recovers") {
        session.load_program(chip8_program({0x1200}));
        CHECK(session.state() == SessionState::Ready);
        CHECK_FALSE(session.last_fault());
        CHECK(session.stats().faults == 0);
    }
}

TEST_CASE("Session tick granularity does not change virtual time", "[session][clock]") {
    const auto loop = chip8_program({0x1200});

    SECTION("one second against sixty frames") {
        Session once(BackendKind::Chip8);
        Session framed(BackendKind::Chip8);
        once.load_program(loop);
        framed.load_program(loop);
        once.run();
        framed.run();

        once.tick(1s);
        const auto frame = std::chrono::duration_cast<Duration>(1s) / 60;
        for (int k = 0; k < 60; ++k) {
            framed.tick(frame);
        }

        CHECK(once.cycles() == 700);
        CHECK(once.cycles() - framed.cycles() <= 1);
    }

    SECTION("any split of an interval") {
        const Duration total = 123'456'789ns;
        Session whole(BackendKind::Chip8);
        whole.load_program(loop);
        whole.run();
        whole.tick(total);

        for (Duration split : {1ns, 1ms, 16'666'667ns, 100'000'000ns}) {
            Session parts(BackendKind::Chip8);
            parts.load_program(loop);
            parts.run();
            parts.tick(split);
            parts.tick(total - split);
            INFO("split " << split.count());
            CHECK(parts.cycles() == whole.cycles());
        }
    }
}

TEST_CASE("Session clamps catch-up after a stall", "[session][clock]") {
    SessionConfig config;
    config.max_cycles_per_tick = 10;
    Session session(BackendKind::Chip8, config);
    session.load_program(chip8_program({0x1200}));
    session.run();

    auto report = session.tick(1s);
    CHECK(report.cycles_executed == 10);
    CHECK(report.cycles_discarded == 690);
    CHECK(session.cycles() == 10);
    CHECK(session.stats().cycles_discarded == 690);
}

TEST_CASE("Session save and load state", "[session][state]") {
    Session session(BackendKind::Chip8);
    session.load_program(chip8_program({0x7001, 0x1200}));
    session.run();
    session.tick(123ms);
    session.key_down(0x3);

    const SaveState saved = session.save_state();
    const auto cycles = session.cycles();
    const auto bus = session.bus_snapshot();

    session.tick(77ms);
    session.key_up(0x3);
    const auto later = session.inspect();
    REQUIRE(session.cycles() != cycles);

    SECTION("restores every part of the machine") {
        session.load_state(saved);
        CHECK(session.state() == SessionState::Paused);
        CHECK(session.cycles() == cycles);
        CHECK(session.bus_snapshot() == bus);
        CHECK(session.keys() == 0x0008);
    }

    SECTION("replaying the same intervals is deterministic") {
        session.load_state(saved);
        session.run();
        session.tick(77ms);
        CHECK(session.inspect() == later);
    }

    SECTION("restores into a fresh session from persisted bytes") {
        Session other(BackendKind::Chip8);
        other.load_program(chip8_program({0x0000}));
        other.load_state(SaveState::from_bytes(saved.bytes()));
        CHECK(other.cycles() == cycles);
        CHECK(other.bus_snapshot() == bus);
        CHECK(other.backend_snapshot() == std::vector<uint8_t>(saved.backend_state().begin(),
                                                               saved.backend_state().end()));
    }

    SECTION("a state from another backend is refused") {
        Session other(BackendKind::Simple);
        other.load_program(std::vector<uint8_t>{});
        CHECK_THROWS_AS(other.load_state(saved), IncompatibleState);
        CHECK(other.state() == SessionState::Ready);
        CHECK(other.cycles() == 0);
    }

    SECTION("a session without a program cannot load state") {
        Session other(BackendKind::Chip8);
        CHECK_THROWS_AS(other.load_state(saved), IncompatibleState);
        CHECK(other.state() == SessionState::Uninitialized);
    }
}

TEST_CASE("Session reloading resets everything", "[session][load]") {
    Session session(BackendKind::Chip8);
    session.load_program(chip8_program({0x7001, 0x1200}));
    session.run();
    session.tick(50ms);
    REQUIRE(session.cycles() > 0);

    session.load_program(chip8_program({0x6505, 0x1202}));
    CHECK(session.state() == SessionState::Ready);
    CHECK(session.cycles() == 0);
    CHECK(register_value(session.inspect(), "PC") == 0x200);
    CHECK(session.stats().ticks == 0);

    SECTION("a different backend kind can be loaded") {
        session.load_program(BackendKind::Simple, std::vector<uint8_t>{});
        CHECK(session.backend_kind() == BackendKind::Simple);
        CHECK(session.native_cycle_rate() == simple::CYCLE_RATE);
        CHECK(session.display_buffer().width == simple::DISPLAY_WIDTH);
    }
}

TEST_CASE("Session single stepping", "[session][step]") {
    Session session(BackendKind::Chip8);
    session.load_program(chip8_program({0x6001, 0x6102, 0x1204}));

    auto report = session.step_once();
    CHECK(report.steps_executed == 1);
    CHECK(register_value(session.inspect(), "V0") == 1);
    CHECK(session.state() == SessionState::Ready);
    // Stepping does not advance wall-clock driven time
    CHECK(session.cycles() == 0);

    session.run();
    CHECK_THROWS_AS(session.step_once(), StateError);

    REQUIRE(session.pause());
    CHECK(session.state() == SessionState::Paused);
    session.step_once();
    CHECK(register_value(session.inspect(), "V1") == 2);
    CHECK(session.stats().total_steps == 2);
}

TEST_CASE("Session pause and reset rules", "[session][lifecycle]") {
    Session session(BackendKind::Chip8);
    session.load_program(chip8_program({0x7001, 0x1200}));

    CHECK_FALSE(session.pause());
    session.run();
    CHECK_THROWS_AS(session.run(), StateError);
    CHECK_THROWS_AS(session.reset(), StateError);

    session.tick(20ms);
    CHECK(session.pause());
    CHECK_FALSE(session.pause());

    const auto cycles = session.cycles();
    CHECK(session.tick(1s).steps_executed == 0);
    CHECK(session.cycles() == cycles);

    session.reset();
    CHECK(session.state() == SessionState::Ready);
    CHECK(session.cycles() == 0);
    CHECK(register_value(session.inspect(), "V0") == 0);

    session.run();
    CHECK(session.state() == SessionState::Running);
}

TEST_CASE("Session publishes the display", "[session][display]") {
    Session session(BackendKind::Chip8);
    session.load_program(chip8_program({0xA050, 0xD005, 0x1204}));

    auto blank = session.display_buffer();
    CHECK(blank.width == chip8::DISPLAY_WIDTH);
    CHECK(blank.height == chip8::DISPLAY_HEIGHT);
    CHECK(blank.pixel(0, 0) == chip8::PIXEL_OFF);
    const auto version = session.display_version();

    session.run();
    session.tick(10ms);

    auto frame = session.display_buffer();
    CHECK(frame.pixel(0, 0) == chip8::PIXEL_ON);
    CHECK(frame.pixel(4, 0) == chip8::PIXEL_OFF);
    CHECK(session.display_version() > version);
}

TEST_CASE("Session produces host-rate audio", "[session][audio]") {
    Session session(BackendKind::Chip8);
    session.load_program(chip8_program({0x60FF, 0xF018, 0x1204}));
    session.run();
    session.tick(100ms);

    auto samples = session.audio_pull(256);
    REQUIRE(samples.size() == 256);
    bool any_tone = false;
    for (float s : samples) {
        CHECK(std::fabs(s) <= 0.25f + 1e-6f);
        any_tone = any_tone || std::fabs(s) > 0.01f;
    }
    CHECK(any_tone);

    auto stats = session.stats();
    CHECK(stats.audio.buffered > 0);
    CHECK(stats.audio.overflow == 0);
}

TEST_CASE("Session with the simple backend", "[session][simple]") {
    Session session(BackendKind::Simple);
    session.load_program(std::vector<uint8_t>{});
    CHECK(session.native_cycle_rate() == 50);
    session.run();

    session.tick(1s);
    CHECK(session.cycles() == 50);
    CHECK(register_value(session.inspect(), "counter") == 50);
    CHECK(session.peek(simple::COUNTER_ADDR, 1)[0] == 50);
    CHECK(session.display_buffer().pixel(0, 0) == SimpleBackend::colour_for(50));

    auto regions = session.regions();
    REQUIRE(regions.size() == 2);
    CHECK(regions[1].name == "status");
}

TEST_CASE("Session statistics", "[session][stats]") {
    Session session(BackendKind::Chip8);
    session.load_program(chip8_program({0x1200}));
    session.run();
    for (int k = 0; k < 5; ++k) {
        session.tick(10ms);
    }

    auto stats = session.stats();
    CHECK(stats.ticks == 5);
    CHECK(stats.total_cycles == session.cycles());
    CHECK(stats.total_steps == session.cycles());
    CHECK(stats.average_tick_duration.count() >= 0);
    CHECK(stats.faults == 0);
}

TEST_CASE("Session audio latency recovers after a host stall", "[session][audio][latency]") {
    Session session(BackendKind::Simple);
    session.load_program(std::vector<uint8_t>{});
    session.run();
    const size_t cap = SessionConfig{}.audio.max_latency_samples;
    REQUIRE(cap > 0);

    constexpr auto frame = std::chrono::microseconds(16667);
    constexpr size_t samples_per_frame = 800;
    auto steady = [&](int frames) {
        for (int i = 0; i < frames; ++i) {
            session.tick(frame);
            session.audio_pull(samples_per_frame);
            INFO("frame " << i);
            CHECK(session.stats().audio.latency <= cap);
        }
    };

    steady(60);

    // The sink keeps pulling for half a second while no ticks arrive
    for (int i = 0; i < 30; ++i) {
        session.audio_pull(samples_per_frame);
    }
    session.tick(500ms);
    auto stats = session.stats();
    CHECK(stats.audio.skipped > 0);
    CHECK(stats.audio.latency <= cap);

    steady(120);
}

TEST_CASE("Session sees a key tapped between ticks", "[session][input]") {
    Session session(BackendKind::Chip8);
    session.load_program(chip8_program({0xF00A, 0x1202}));
    session.run();

    session.tick(std::chrono::microseconds(16700));
    REQUIRE(register_value(session.inspect(), "PC") == 0x202);

    session.key_down(5);
    session.key_up(5);
    session.tick(std::chrono::microseconds(16700));
    session.tick(std::chrono::microseconds(16700));

    CHECK(register_value(session.inspect(), "PC") == 0x202);
    CHECK(register_value(session.inspect(), "V0") == 5);
    CHECK(session.keys() == 0);
}
