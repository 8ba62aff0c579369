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

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>
#include <string_view>

namespace tickwork::log {

enum class Level : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4,
};

// Receives every message that passes the level filter.
// Calls are serialized; a sink never runs concurrently with itself.
using Sink = std::function<void(Level, std::string_view subsystem, std::string_view message)>;

void set_level(Level level);
Level level();

inline bool enabled(Level l) {
    return static_cast<uint8_t>(l) <= static_cast<uint8_t>(level());
}

// Replace the output sink. An empty function restores the default
// stderr sink.
void set_sink(Sink sink);
void reset_sink();

void write(Level level, std::string_view subsystem, std::string_view message);

std::string_view to_string(Level level);
std::optional<Level> parse_level(std::string_view name);

} // namespace tickwork::log

// The stream expression is only evaluated when the level is enabled.
#define TICKWORK_LOG(lvl, subsystem, expr)                                          \
    do {                                                                            \
        if (::tickwork::log::enabled(lvl)) {                                        \
            std::ostringstream tickwork_log_stream_;                                \
            tickwork_log_stream_ << expr;                                           \
            ::tickwork::log::write(lvl, subsystem, tickwork_log_stream_.str());     \
        }                                                                           \
    } while (0)

#define TICKWORK_LOG_ERROR(subsystem, expr) TICKWORK_LOG(::tickwork::log::Level::Error, subsystem, expr)
#define TICKWORK_LOG_WARN(subsystem, expr)  TICKWORK_LOG(::tickwork::log::Level::Warn, subsystem, expr)
#define TICKWORK_LOG_INFO(subsystem, expr)  TICKWORK_LOG(::tickwork::log::Level::Info, subsystem, expr)
#define TICKWORK_LOG_DEBUG(subsystem, expr) TICKWORK_LOG(::tickwork::log::Level::Debug, subsystem, expr)
#define TICKWORK_LOG_TRACE(subsystem, expr) TICKWORK_LOG(::tickwork::log::Level::Trace, subsystem, expr)
