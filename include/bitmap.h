// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * @file bitmap.h
 * @brief Decoded, display-ready image held by the caches
 */

namespace pixcache {

/**
 * @brief In-memory pixel layout of a decoded bitmap
 */
enum class PixelFormat {
    ARGB8888, ///< 4 bytes per pixel, stored B,G,R,A (0xAARRGGBB little-endian)
    RGB565,   ///< 2 bytes per pixel, no alpha
    ALPHA8    ///< 1 byte per pixel, alpha only
};

/// Bytes per pixel for a format
[[nodiscard]] int bytes_per_pixel(PixelFormat format);

/// Short name used in variant strings and logs ("ARGB8888", "RGB565", "ALPHA8")
[[nodiscard]] const char* pixel_format_name(PixelFormat format);

/**
 * @brief Parse a pixel format name, returning fallback for unknown names
 */
[[nodiscard]] PixelFormat parse_pixel_format(const std::string& name,
                                             PixelFormat fallback = PixelFormat::ARGB8888);

/**
 * @brief A decoded image
 *
 * Owns its pixel rows. A bitmap is solely owned by whoever decoded it until it is
 * handed to the memory cache, which holds it as `std::shared_ptr<const Bitmap>`.
 * Transformations (rotation) always produce a new bitmap.
 */
class Bitmap {
  public:
    /**
     * @brief Allocate a zero-filled bitmap
     *
     * Row stride is width * bytes_per_pixel(format), no padding.
     */
    Bitmap(int width, int height, PixelFormat format);

    /**
     * @brief Build from RGBA8888 pixels (as produced by stb_image)
     *
     * Converts each pixel to the requested format.
     */
    static std::unique_ptr<Bitmap> from_rgba(const uint8_t* rgba, int width, int height,
                                             PixelFormat format);

    int width() const {
        return width_;
    }
    int height() const {
        return height_;
    }
    PixelFormat format() const {
        return format_;
    }
    size_t row_bytes() const {
        return row_bytes_;
    }

    /// Real memory footprint: row_bytes * height
    size_t byte_count() const {
        return row_bytes_ * static_cast<size_t>(height_);
    }

    const uint8_t* pixels() const {
        return pixels_.data();
    }
    uint8_t* pixels() {
        return pixels_.data();
    }

    /// Pointer to the first byte of pixel (x, y)
    const uint8_t* pixel_at(int x, int y) const {
        return pixels_.data() + static_cast<size_t>(y) * row_bytes_ +
               static_cast<size_t>(x) * bytes_per_pixel(format_);
    }

    /**
     * @brief Produce a copy rotated clockwise
     *
     * @param degrees 90, 180 or 270; any other value returns an unrotated copy
     */
    [[nodiscard]] std::unique_ptr<Bitmap> rotated(int degrees) const;

  private:
    int width_;
    int height_;
    PixelFormat format_;
    size_t row_bytes_;
    std::vector<uint8_t> pixels_;
};

using BitmapPtr = std::shared_ptr<const Bitmap>;

} // namespace pixcache
