// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "hv/hlog.h"

#include <catch2/catch_test_macros.hpp>

using namespace pixcache;
using namespace pixcache::logging;

// ============================================================================
// parse_level() tests
// ============================================================================

TEST_CASE("parse_level: valid level strings", "[logging][config]") {
    REQUIRE(parse_level("trace") == spdlog::level::trace);
    REQUIRE(parse_level("debug") == spdlog::level::debug);
    REQUIRE(parse_level("info") == spdlog::level::info);
    REQUIRE(parse_level("warn") == spdlog::level::warn);
    REQUIRE(parse_level("warning") == spdlog::level::warn);
    REQUIRE(parse_level("error") == spdlog::level::err);
    REQUIRE(parse_level("critical") == spdlog::level::critical);
    REQUIRE(parse_level("off") == spdlog::level::off);
}

TEST_CASE("parse_level: returns default for invalid input", "[logging][config]") {
    REQUIRE(parse_level("", spdlog::level::warn) == spdlog::level::warn);
    REQUIRE(parse_level("verbose", spdlog::level::debug) == spdlog::level::debug);
    REQUIRE(parse_level("TRACE") == spdlog::level::info); // case sensitive
}

// ============================================================================
// Log targets
// ============================================================================

TEST_CASE("parse_log_target: names and fallback", "[logging][config]") {
    REQUIRE(parse_log_target("journal") == LogTarget::Journal);
    REQUIRE(parse_log_target("syslog") == LogTarget::Syslog);
    REQUIRE(parse_log_target("file") == LogTarget::File);
    REQUIRE(parse_log_target("console") == LogTarget::Console);
    REQUIRE(parse_log_target("auto") == LogTarget::Auto);
    REQUIRE(parse_log_target("nonsense") == LogTarget::Auto);
}

TEST_CASE("log_target_name: round-trips through parse_log_target", "[logging][config]") {
    for (LogTarget target : {LogTarget::Auto, LogTarget::Journal, LogTarget::Syslog,
                             LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
}

// ============================================================================
// libhv level mapping
// ============================================================================

TEST_CASE("to_hv_level: maps onto libhv levels", "[logging]") {
    REQUIRE(to_hv_level(spdlog::level::trace) == LOG_LEVEL_DEBUG);
    REQUIRE(to_hv_level(spdlog::level::debug) == LOG_LEVEL_DEBUG);
    REQUIRE(to_hv_level(spdlog::level::info) == LOG_LEVEL_INFO);
    REQUIRE(to_hv_level(spdlog::level::warn) == LOG_LEVEL_WARN);
    REQUIRE(to_hv_level(spdlog::level::err) == LOG_LEVEL_ERROR);
    REQUIRE(to_hv_level(spdlog::level::critical) == LOG_LEVEL_FATAL);
    REQUIRE(to_hv_level(spdlog::level::off) == LOG_LEVEL_SILENT);
}

TEST_CASE("logging::init: installs the default logger", "[logging]") {
    LogConfig config;
    config.level = spdlog::level::warn;
    config.target = LogTarget::Console;
    init(config);

    REQUIRE(spdlog::default_logger()->name() == "pixcache");
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::warn);

    // Restore a quiet default for the other tests
    config.level = spdlog::level::err;
    init(config);
}
