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

#ifndef TICKWORK_HOST_HOST_MAIN_HPP
#define TICKWORK_HOST_HOST_MAIN_HPP

#include "tickwork/Log.hpp"
#include "tickwork/Session.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace tickwork::host {

constexpr double DEFAULT_RUN_SECONDS = 5.0;
constexpr uint32_t DEFAULT_HOST_FPS = 60;
constexpr size_t AUDIO_CHUNK = 512;

struct HostOptions {
    BackendKind backend = BackendKind::Chip8;
    std::string rom_filepath;
    double seconds = DEFAULT_RUN_SECONDS;   // 0 runs until interrupted
    uint32_t fps = DEFAULT_HOST_FPS;
    std::optional<uint64_t> cycle_rate;
    uint32_t host_sample_rate = 48000;
    std::string save_filepath;
    std::string load_filepath;
    std::optional<log::Level> log_level;
    bool dump_display = false;
    bool show_info = false;
    bool show_help = false;
};

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int /*signal*/) {
    g_running = false;
}

std::vector<uint8_t> load_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw std::runtime_error("Cannot read file: " + filepath.string());
    }

    return data;
}

void save_file(const std::filesystem::path& filepath, const std::vector<uint8_t>& data) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot create file: " + filepath.string());
    }
    if (!file.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()))) {
        throw std::runtime_error("Cannot write file: " + filepath.string());
    }
}

template<typename T>
T parse_number(const std::string& flag, const std::string& text) {
    try {
        size_t consumed = 0;
        T value{};
        if constexpr (std::is_floating_point_v<T>) {
            value = static_cast<T>(std::stod(text, &consumed));
        } else {
            value = static_cast<T>(std::stoull(text, &consumed));
        }
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    }
}

} // anonymous namespace

inline void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]\n"
              << "\n"
              << "Runs a machine headlessly against the wall clock and reports what it did.\n"
              << "\n"
              << "Optional:\n"
              << "  --backend <name>        chip8, superchip or simple (default: chip8)\n"
              << "  --rom <filepath>        Program image (required for chip8/superchip)\n"
              << "  --seconds <n>           Wall-clock run time, 0 runs until Ctrl+C (default: "
              << DEFAULT_RUN_SECONDS << ")\n"
              << "  --fps <n>               Host frames per second (default: " << DEFAULT_HOST_FPS << ")\n"
              << "  --rate <hz>             CHIP-8 instruction rate (default: "
              << chip8::DEFAULT_CYCLE_RATE << ")\n"
              << "  --host-rate <hz>        Audio output sample rate (default: 48000)\n"
              << "  --load <filepath>       Resume from a save-state after loading the program\n"
              << "  --save <filepath>       Write a save-state when the run ends\n"
              << "  --dump-display          Print the final display\n"
              << "  --log-level <level>     error, warn, info, debug or trace\n"
              << "  --info                  Show build information and exit\n"
              << "  --help                  Show this help message\n"
              << "\n"
              << "Environment:\n"
              << "  TICKWORK_LOG_LEVEL      Default log level\n";
}

inline void print_info(const char* program_name) {
    // JSON output for tool discovery
    std::cout << "{\n"
              << "  \"executable\": \"" << program_name << "\",\n"
              << "  \"version\": \"" << TICKWORK_VERSION << "\",\n"
              << "  \"backends\": [\"" << to_string(BackendKind::Chip8) << "\", \""
              << to_string(BackendKind::SuperChip) << "\", \"" << to_string(BackendKind::Simple) << "\"],\n"
              << "  \"save_state_version\": " << SaveState::FORMAT_VERSION << "\n"
              << "}\n";
}

// Throws std::invalid_argument on unknown flags or malformed values.
inline HostOptions parse_arguments(int argc, char* argv[]) {
    HostOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--info") {
            options.show_info = true;
        } else if (arg == "--dump-display") {
            options.dump_display = true;
        } else if (arg == "--backend" && has_value) {
            std::string name = argv[++i];
            auto kind = parse_backend_kind(name);
            if (!kind) {
                throw std::invalid_argument("Unknown backend: " + name);
            }
            options.backend = *kind;
        } else if (arg == "--rom" && has_value) {
            options.rom_filepath = argv[++i];
        } else if (arg == "--seconds" && has_value) {
            options.seconds = parse_number<double>(arg, argv[++i]);
            if (options.seconds < 0.0) {
                throw std::invalid_argument("--seconds must not be negative");
            }
        } else if (arg == "--fps" && has_value) {
            options.fps = parse_number<uint32_t>(arg, argv[++i]);
            if (options.fps == 0) {
                throw std::invalid_argument("--fps must be positive");
            }
        } else if (arg == "--rate" && has_value) {
            options.cycle_rate = parse_number<uint64_t>(arg, argv[++i]);
        } else if (arg == "--host-rate" && has_value) {
            options.host_sample_rate = parse_number<uint32_t>(arg, argv[++i]);
        } else if (arg == "--save" && has_value) {
            options.save_filepath = argv[++i];
        } else if (arg == "--load" && has_value) {
            options.load_filepath = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            std::string name = argv[++i];
            options.log_level = log::parse_level(name);
            if (!options.log_level) {
                throw std::invalid_argument("Unknown log level: " + name);
            }
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    return options;
}

inline SessionConfig make_session_config(const HostOptions& options) {
    SessionConfig config;
    if (options.cycle_rate) {
        config.chip8.cycle_rate = *options.cycle_rate;
    }
    config.audio.host_sample_rate = options.host_sample_rate;
    config.audio.drift_correction = true;
    return config;
}

// Text rendering of a frame: '#' for lit pixels on monochrome displays,
// otherwise the hex colour of the top-left pixel.
inline void print_display(std::ostream& out, const DisplayFrame& frame) {
    const bool monochrome = std::all_of(frame.pixels.begin(), frame.pixels.end(), [](uint32_t p) {
        return p == chip8::PIXEL_ON || p == chip8::PIXEL_OFF;
    });

    if (!monochrome) {
        out << "Display " << frame.width << "x" << frame.height << ", colour 0x"
            << std::hex << std::setw(8) << std::setfill('0')
            << (frame.pixels.empty() ? 0u : frame.pixels.front()) << std::dec << "\n";
        return;
    }

    out << "+" << std::string(frame.width, '-') << "+\n";
    for (size_t y = 0; y < frame.height; ++y) {
        out << "|";
        for (size_t x = 0; x < frame.width; ++x) {
            out << (frame.pixel(x, y) == chip8::PIXEL_ON ? '#' : ' ');
        }
        out << "|\n";
    }
    out << "+" << std::string(frame.width, '-') << "+\n";
}

inline void print_report(std::ostream& out, const Session& session, Duration wall_time) {
    const auto stats = session.stats();
    const auto virtual_time = session.elapsed_virtual_time();
    const auto to_ms = [](Duration d) {
        return std::chrono::duration<double, std::milli>(d).count();
    };

    out << "State:           " << to_string(session.state()) << "\n"
        << "Backend:         " << to_string(session.backend_kind())
        << " (" << session.native_cycle_rate() << "Hz)\n"
        << "Wall time:       " << to_ms(wall_time) << " ms\n"
        << "Virtual time:    " << to_ms(virtual_time) << " ms\n"
        << "Cycles:          " << session.cycles() << "\n"
        << "Ticks:           " << stats.ticks << " (avg " << to_ms(stats.average_tick_duration)
        << " ms, last " << to_ms(stats.last_tick_duration) << " ms)\n"
        << "Steps:           " << stats.total_steps << "\n"
        << "Discarded:       " << stats.cycles_discarded << " cycles\n"
        << "Audio overflow:  " << stats.audio.overflow << "\n"
        << "Audio underrun:  " << stats.audio.underrun << "\n"
        << "Audio skipped:   " << stats.audio.skipped << "\n";

    if (auto fault = session.last_fault()) {
        out << "Fault:           " << fault->describe() << "\n";
    }
}

inline int host_main(int argc, char* argv[]) {
    HostOptions options;
    try {
        options = parse_arguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (options.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (options.show_info) {
        print_info(argv[0]);
        return 0;
    }

    if (const char* env_level = std::getenv("TICKWORK_LOG_LEVEL")) {
        if (auto level = log::parse_level(env_level)) {
            log::set_level(*level);
        }
    }
    if (options.log_level) {
        log::set_level(*options.log_level);
    }

    if (options.rom_filepath.empty() && options.backend != BackendKind::Simple) {
        std::cerr << "Error: --rom is required for the " << to_string(options.backend) << " backend\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        Session session(options.backend, make_session_config(options));

        std::vector<uint8_t> program;
        if (!options.rom_filepath.empty()) {
            std::cout << "Loading program: " << options.rom_filepath << "\n";
            program = load_file(options.rom_filepath);
        }
        session.load_program(program);

        if (!options.load_filepath.empty()) {
            std::cout << "Loading state: " << options.load_filepath << "\n";
            session.load_state(SaveState::from_bytes(load_file(options.load_filepath)));
        }

        session.run();
        std::cout << to_string(options.backend) << " running. Press Ctrl+C to stop.\n";

        // Audio sink: pulls fixed-size chunks at the host output cadence
        std::atomic<bool> audio_running{true};
        std::atomic<uint64_t> audio_chunks{0};
        std::thread audio_thread([&] {
            std::vector<float> chunk(AUDIO_CHUNK);
            const auto chunk_period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(static_cast<double>(AUDIO_CHUNK) / options.host_sample_rate));
            auto next = std::chrono::steady_clock::now();
            while (audio_running.load()) {
                next += chunk_period;
                std::this_thread::sleep_until(next);
                session.audio_pull_into(chunk);
                audio_chunks.fetch_add(1);
            }
        });

        // Main emulation loop, one tick per host frame
        const auto frame_period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / options.fps));
        const auto run_limit = std::chrono::duration<double>(options.seconds);
        const auto start = std::chrono::steady_clock::now();
        auto last = start;
        auto next_frame = start;
        bool faulted = false;

        while (g_running) {
            next_frame += frame_period;
            std::this_thread::sleep_until(next_frame);

            const auto now = std::chrono::steady_clock::now();
            auto report = session.tick(std::chrono::duration_cast<Duration>(now - last));
            last = now;

            if (report.fault) {
                std::cerr << "Backend fault: " << report.fault->describe() << "\n";
                faulted = true;
                break;
            }
            if (options.seconds > 0.0 && now - start >= run_limit) {
                break;
            }
        }

        session.pause();
        audio_running = false;
        audio_thread.join();

        const auto wall_time = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
        std::cout << "\n";
        print_report(std::cout, session, wall_time);
        std::cout << "Audio chunks:    " << audio_chunks.load() << "\n";

        if (options.dump_display) {
            print_display(std::cout, session.display_buffer());
        }

        if (!options.save_filepath.empty()) {
            if (faulted) {
                std::cerr << "Warning: not saving state of a faulted session\n";
            } else {
                std::cout << "Saving state: " << options.save_filepath << "\n";
                save_file(options.save_filepath, session.save_state().bytes());
            }
        }

        return faulted ? 2 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace tickwork::host

#endif // TICKWORK_HOST_HOST_MAIN_HPP
