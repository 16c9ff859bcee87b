// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "display_config.h"

#include <cstdio>

namespace pixcache {

std::string DisplayConfig::to_string() const {
    char buf[96];
    if (decodes_full_size()) {
        std::snprintf(buf, sizeof(buf), "original_%s%s", pixel_format_name(pixel_format),
                      auto_rotate ? "_rot" : "");
    } else {
        std::snprintf(buf, sizeof(buf), "%dx%d_%s%s", max_size.width, max_size.height,
                      pixel_format_name(pixel_format), auto_rotate ? "_rot" : "");
    }
    return buf;
}

} // namespace pixcache
