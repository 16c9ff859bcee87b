// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

/**
 * @file logging_init.h
 * @brief spdlog setup for applications embedding the caches
 *
 * Every pixcache component logs through the spdlog default logger with a
 * `[Component]` prefix. init() replaces that logger with one writing to the
 * console plus an optional system sink, and mirrors the level onto libhv's
 * own logger (used by the HTTP downloader and the worker pool).
 */

namespace pixcache {
namespace logging {

/// Where log output goes besides the console
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux); console elsewhere
    Journal, ///< systemd journal
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Console;
    bool enable_console = true;
    std::string file_path; ///< Only for LogTarget::File; empty = default location
};

/**
 * @brief Build and install the default logger
 *
 * Safe to call more than once; the last call wins.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn"/"warning",
 *        "error", "critical", "off")
 *
 * Case sensitive. Unknown or empty strings return default_level.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::info);

/// Map a spdlog level onto libhv's log levels (VERBOSE=0 ... SILENT=6)
int to_hv_level(spdlog::level::level_enum level);

/// Parse a target name; unknown strings return LogTarget::Auto
LogTarget parse_log_target(const std::string& str);

/// Name of a target, as accepted by parse_log_target()
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace pixcache
