// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

// Define STB implementations in this compilation unit only
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "bitmap_decoder.h"

#include <spdlog/spdlog.h>

#include <climits>
#include <cmath>
#include <new>
#include <vector>

// stb headers - single-file libraries for image processing
#include "stb_image.h"
#include "stb_image_resize.h"

namespace pixcache {

namespace {

// ============================================================================
// std::istream adapter for stb_image
// ============================================================================

int stream_read(void* user, char* data, int size) {
    auto* in = static_cast<std::istream*>(user);
    in->read(data, size);
    return static_cast<int>(in->gcount());
}

// stb may skip backwards (negative n) to un-read bytes
void stream_skip(void* user, int n) {
    auto* in = static_cast<std::istream*>(user);
    in->clear();
    in->seekg(n, std::ios::cur);
}

int stream_eof(void* user) {
    auto* in = static_cast<std::istream*>(user);
    return in->eof() || in->peek() == std::char_traits<char>::eof() ? 1 : 0;
}

const stbi_io_callbacks STREAM_CALLBACKS = {stream_read, stream_skip, stream_eof};

bool dimensions_ok(int width, int height) {
    if (width <= 0 || height <= 0 || width > BitmapDecoder::MAX_SOURCE_DIMENSION ||
        height > BitmapDecoder::MAX_SOURCE_DIMENSION) {
        spdlog::warn("[BitmapDecoder] Rejecting {}x{} image (max {})", width, height,
                     BitmapDecoder::MAX_SOURCE_DIMENSION);
        return false;
    }
    return true;
}

/**
 * @brief Sample and convert stb RGBA output, then free it
 *
 * Takes ownership of `rgba` (freed with stbi_image_free on every path).
 */
std::unique_ptr<Bitmap> finish_decode(unsigned char* rgba, int width, int height,
                                      const BitmapSize& max_size, PixelFormat format) {
    int ratio = 1;
    if (max_size.is_set()) {
        ratio = BitmapDecoder::calculate_sample_size(width, height, max_size.width,
                                                     max_size.height);
    }

    try {
        if (ratio == 1) {
            auto bitmap = Bitmap::from_rgba(rgba, width, height, format);
            stbi_image_free(rgba);
            return bitmap;
        }

        int out_width = (width + ratio - 1) / ratio;
        int out_height = (height + ratio - 1) / ratio;
        std::vector<unsigned char> sampled(static_cast<size_t>(out_width) *
                                           static_cast<size_t>(out_height) * 4);

        int resize_result = stbir_resize_uint8(rgba, width, height, 0,             // input
                                               sampled.data(), out_width, out_height, 0, // output
                                               4 // RGBA channels
        );
        stbi_image_free(rgba);
        rgba = nullptr;

        if (!resize_result) {
            spdlog::warn("[BitmapDecoder] Failed to sample {}x{} -> {}x{}", width, height,
                         out_width, out_height);
            return nullptr;
        }

        spdlog::trace("[BitmapDecoder] Sampled {}x{} -> {}x{} (ratio {})", width, height,
                      out_width, out_height, ratio);
        return Bitmap::from_rgba(sampled.data(), out_width, out_height, format);
    } catch (const std::bad_alloc&) {
        if (rgba) {
            stbi_image_free(rgba);
        }
        spdlog::error("[BitmapDecoder] Out of memory decoding {}x{} image", width, height);
        return nullptr;
    }
}

} // namespace

int BitmapDecoder::calculate_sample_size(int width, int height, int req_width,
                                         int req_height) {
    if (req_width <= 0 || req_height <= 0) {
        return 1;
    }

    int ratio = 1;
    if (height > req_height || width > req_width) {
        const int height_ratio = static_cast<int>(
            std::lround(static_cast<double>(height) / static_cast<double>(req_height)));
        const int width_ratio = static_cast<int>(
            std::lround(static_cast<double>(width) / static_cast<double>(req_width)));
        ratio = height_ratio < width_ratio ? height_ratio : width_ratio;
        if (ratio <= 0) {
            ratio = 1;
        }

        // Very wide or tall images: keep the pixel count within twice the request
        const double total_pixels = static_cast<double>(width) * static_cast<double>(height);
        const double total_req_pixels_cap =
            static_cast<double>(req_width) * static_cast<double>(req_height) * 2.0;
        while (total_pixels / (static_cast<double>(ratio) * ratio) > total_req_pixels_cap) {
            ++ratio;
        }
    }
    return ratio;
}

// ============================================================================
// Bounds
// ============================================================================

std::optional<BitmapSize> BitmapDecoder::read_bounds(std::istream& in) {
    const std::streampos start = in.tellg();
    int w = 0, h = 0, channels = 0;
    int ok = stbi_info_from_callbacks(&STREAM_CALLBACKS, &in, &w, &h, &channels);
    in.clear();
    in.seekg(start);
    if (!ok) {
        spdlog::debug("[BitmapDecoder] Cannot read bounds: {}", stbi_failure_reason());
        return std::nullopt;
    }
    return BitmapSize{w, h};
}

std::optional<BitmapSize> BitmapDecoder::read_bounds(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    if (!stbi_info(path.c_str(), &w, &h, &channels)) {
        spdlog::debug("[BitmapDecoder] Cannot read bounds of {}: {}", path,
                      stbi_failure_reason());
        return std::nullopt;
    }
    return BitmapSize{w, h};
}

std::optional<BitmapSize> BitmapDecoder::read_bounds(const uint8_t* data, size_t size) {
    if (!data || size == 0 || size > static_cast<size_t>(INT_MAX)) {
        return std::nullopt;
    }
    int w = 0, h = 0, channels = 0;
    if (!stbi_info_from_memory(data, static_cast<int>(size), &w, &h, &channels)) {
        spdlog::debug("[BitmapDecoder] Cannot read bounds: {}", stbi_failure_reason());
        return std::nullopt;
    }
    return BitmapSize{w, h};
}

// ============================================================================
// Decode
// ============================================================================

std::unique_ptr<Bitmap> BitmapDecoder::decode(std::istream& in, const BitmapSize& max_size,
                                              PixelFormat format) {
    auto bounds = read_bounds(in);
    if (!bounds || !dimensions_ok(bounds->width, bounds->height)) {
        return nullptr;
    }

    int w = 0, h = 0, channels = 0;
    // Request RGBA output regardless of source format
    unsigned char* rgba = stbi_load_from_callbacks(&STREAM_CALLBACKS, &in, &w, &h, &channels, 4);
    if (!rgba) {
        spdlog::warn("[BitmapDecoder] Failed to decode stream: {}", stbi_failure_reason());
        return nullptr;
    }
    return finish_decode(rgba, w, h, max_size, format);
}

std::unique_ptr<Bitmap> BitmapDecoder::decode(const std::string& path,
                                              const BitmapSize& max_size, PixelFormat format) {
    auto bounds = read_bounds(path);
    if (!bounds || !dimensions_ok(bounds->width, bounds->height)) {
        return nullptr;
    }

    int w = 0, h = 0, channels = 0;
    unsigned char* rgba = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!rgba) {
        spdlog::warn("[BitmapDecoder] Failed to decode {}: {}", path, stbi_failure_reason());
        return nullptr;
    }
    return finish_decode(rgba, w, h, max_size, format);
}

std::unique_ptr<Bitmap> BitmapDecoder::decode(const uint8_t* data, size_t size,
                                              const BitmapSize& max_size, PixelFormat format) {
    auto bounds = read_bounds(data, size);
    if (!bounds || !dimensions_ok(bounds->width, bounds->height)) {
        return nullptr;
    }

    int w = 0, h = 0, channels = 0;
    unsigned char* rgba =
        stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &channels, 4);
    if (!rgba) {
        spdlog::warn("[BitmapDecoder] Failed to decode buffer: {}", stbi_failure_reason());
        return nullptr;
    }
    return finish_decode(rgba, w, h, max_size, format);
}

} // namespace pixcache
