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

#include "tickwork/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace tickwork::log {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(Level::Info)};

std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
}

Sink& current_sink() {
    static Sink sink;
    return sink;
}

void default_sink(Level l, std::string_view subsystem, std::string_view message) {
    std::cerr << "[" << to_string(l) << "] " << subsystem << ": " << message << "\n";
}

} // anonymous namespace

void set_level(Level l) {
    g_level.store(static_cast<uint8_t>(l), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_sink() = std::move(sink);
}

void reset_sink() {
    set_sink({});
}

void write(Level l, std::string_view subsystem, std::string_view message) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    auto& sink = current_sink();
    if (sink) {
        sink(l, subsystem, message);
    } else {
        default_sink(l, subsystem, message);
    }
}

std::string_view to_string(Level l) {
    switch (l) {
        case Level::Error: return "ERROR";
        case Level::Warn: return "WARN";
        case Level::Info: return "INFO";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?";
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "error") return Level::Error;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "info") return Level::Info;
    if (name == "debug") return Level::Debug;
    if (name == "trace") return Level::Trace;
    return std::nullopt;
}

} // namespace tickwork::log
