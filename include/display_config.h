// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bitmap.h"

#include <string>

namespace pixcache {

/**
 * @brief Requested bounding box for a sampled decode
 *
 * A non-positive dimension means "unbounded".
 */
struct BitmapSize {
    int width = 0;
    int height = 0;

    bool is_set() const {
        return width > 0 && height > 0;
    }

    bool operator==(const BitmapSize& other) const {
        return width == other.width && height == other.height;
    }
};

/**
 * @brief How a bitmap should be decoded for display
 *
 * Its string form is the variant component of a CacheKey: two configs that
 * decode to different pixels must produce different strings.
 */
struct DisplayConfig {
    BitmapSize max_size;                         ///< Sampled-decode bounds
    PixelFormat pixel_format = PixelFormat::ARGB8888;
    bool show_original = false;                  ///< Decode at full size, ignore max_size
    bool auto_rotate = false;                    ///< Apply EXIF orientation

    /// True when this config requests a full-size decode
    bool decodes_full_size() const {
        return show_original || !max_size.is_set();
    }

    /**
     * @brief Variant string
     *
     * Format: `{w}x{h}_{format}` or `original_{format}`, suffixed with `_rot`
     * when auto-rotation is on. Example: `400x300_RGB565_rot`.
     */
    std::string to_string() const;
};

} // namespace pixcache
