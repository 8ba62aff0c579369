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
#include <tickwork/host/HostMain.hpp>

#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tickwork;
using namespace tickwork::host;

namespace {

// Owns mutable argv storage for parse_arguments
class Args {
public:
    Args(std::initializer_list<std::string> args)
        : storage_{"tickwork-run"} {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
    }

    int argc() { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

HostOptions parse(std::initializer_list<std::string> args) {
    Args a(args);
    return parse_arguments(a.argc(), a.argv());
}

} // anonymous namespace

TEST_CASE("Host defaults", "[host][options]") {
    auto options = parse({});
    CHECK(options.backend == BackendKind::Chip8);
    CHECK(options.rom_filepath.empty());
    CHECK(options.seconds == DEFAULT_RUN_SECONDS);
    CHECK(options.fps == DEFAULT_HOST_FPS);
    CHECK_FALSE(options.cycle_rate);
    CHECK_FALSE(options.log_level);
    CHECK_FALSE(options.show_help);
}

TEST_CASE("Host parses every option", "[host][options]") {
    auto options = parse({"--backend", "schip", "--rom", "game.ch8", "--seconds", "2.5",
                          "--fps", "30", "--rate", "1000", "--host-rate", "44100",
                          "--save", "out.tkws", "--load", "in.tkws", "--log-level", "debug",
                          "--dump-display"});
    CHECK(options.backend == BackendKind::SuperChip);
    CHECK(options.rom_filepath == "game.ch8");
    CHECK(options.seconds == 2.5);
    CHECK(options.fps == 30);
    CHECK(options.cycle_rate == 1000u);
    CHECK(options.host_sample_rate == 44100);
    CHECK(options.save_filepath == "out.tkws");
    CHECK(options.load_filepath == "in.tkws");
    CHECK(options.log_level == log::Level::Debug);
    CHECK(options.dump_display);

    auto config = make_session_config(options);
    CHECK(config.chip8.cycle_rate == 1000);
    CHECK(config.audio.host_sample_rate == 44100);
    CHECK(config.audio.drift_correction);
}

TEST_CASE("Host rejects malformed arguments", "[host][options]") {
    CHECK_THROWS_AS(parse({"--bogus"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--backend", "nes"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--fps", "0"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--fps", "sixty"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--seconds", "-1"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--rate", "12abc"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--log-level", "loud"}), std::invalid_argument);
    // Flag missing its value
    CHECK_THROWS_AS(parse({"--rom"}), std::invalid_argument);
}

TEST_CASE("Host renders a monochrome display as text", "[host][display]") {
    DisplayFrame frame;
    frame.width = 3;
    frame.height = 2;
    frame.pixels = {chip8::PIXEL_ON, chip8::PIXEL_OFF, chip8::PIXEL_ON,
                    chip8::PIXEL_OFF, chip8::PIXEL_ON, chip8::PIXEL_OFF};

    std::ostringstream out;
    print_display(out, frame);
    CHECK(out.str() == "+---+\n|# #|\n| # |\n+---+\n");
}

TEST_CASE("Host summarizes a colour display", "[host][display]") {
    DisplayFrame frame;
    frame.width = 2;
    frame.height = 1;
    frame.pixels = {rgba(0x12, 0x34, 0x56), rgba(0x12, 0x34, 0x56)};

    std::ostringstream out;
    print_display(out, frame);
    CHECK(out.str() == "Display 2x1, colour 0xff563412\n");
}

TEST_CASE("Host report describes the session", "[host][report]") {
    Session session(BackendKind::Simple);
    session.load_program(std::vector<uint8_t>{});
    session.run();
    session.tick(std::chrono::milliseconds(100));

    std::ostringstream out;
    print_report(out, session, std::chrono::milliseconds(100));
    const auto text = out.str();
    CHECK(text.find("State:           running") != std::string::npos);
    CHECK(text.find("Backend:         simple (50Hz)") != std::string::npos);
    CHECK(text.find("Cycles:          5") != std::string::npos);
    CHECK(text.find("Fault:") == std::string::npos);
}
