// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bitmap.h"
#include "display_config.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

/**
 * @file bitmap_decoder.h
 * @brief Full-size and sampled image decoding (stb_image)
 *
 * Every decode entry point takes a `max_size`. If it is unset the image is
 * decoded at full size; otherwise an integer sample size is chosen with
 * calculate_sample_size() and the output is ceil(w/ratio) x ceil(h/ratio).
 *
 * Failures (corrupt data, unsupported format, I/O error, oversized image)
 * are logged and return nullptr / std::nullopt. Nothing here throws.
 */

namespace pixcache {

class BitmapDecoder {
  public:
    /// Largest accepted source dimension; bigger images are rejected
    static constexpr int MAX_SOURCE_DIMENSION = 16384;

    /**
     * @brief Image dimensions from the header only
     *
     * The stream is left positioned where it was on entry.
     */
    static std::optional<BitmapSize> read_bounds(std::istream& in);
    static std::optional<BitmapSize> read_bounds(const std::string& path);
    static std::optional<BitmapSize> read_bounds(const uint8_t* data, size_t size);

    /**
     * @brief Decode from a seekable stream (e.g. a disk snapshot)
     *
     * Reads from the current position; the stream is rewound there between the
     * header read and the decode.
     */
    static std::unique_ptr<Bitmap> decode(std::istream& in, const BitmapSize& max_size,
                                          PixelFormat format);
    static std::unique_ptr<Bitmap> decode(const std::string& path, const BitmapSize& max_size,
                                          PixelFormat format);
    static std::unique_ptr<Bitmap> decode(const uint8_t* data, size_t size,
                                          const BitmapSize& max_size, PixelFormat format);

    /**
     * @brief Largest sample size keeping both output dimensions near the request
     *
     * ratio = min(round(h / req_h), round(w / req_w)) when the image exceeds the
     * request, then increased while (w * h) / ratio^2 > 2 * req_w * req_h.
     * Non-positive requests or ratios yield 1.
     *
     * Example: 4000x2000 into 400x400 gives 5 (output 800x400).
     */
    static int calculate_sample_size(int width, int height, int req_width, int req_height);

    /// Decode bounds for a display config (unset when it decodes full size)
    static BitmapSize max_size_for(const DisplayConfig& config) {
        return config.decodes_full_size() ? BitmapSize{} : config.max_size;
    }
};

} // namespace pixcache
