// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <limits>

namespace pixcache {

/// Expiry value meaning "never expires"
constexpr int64_t NO_EXPIRY = std::numeric_limits<int64_t>::max();

/// Wall clock in milliseconds since the Unix epoch (expiry timestamps use this scale)
inline int64_t current_time_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace pixcache
