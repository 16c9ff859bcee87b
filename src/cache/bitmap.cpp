// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bitmap.h"

#include <cstring>

namespace pixcache {

int bytes_per_pixel(PixelFormat format) {
    switch (format) {
    case PixelFormat::ARGB8888:
        return 4;
    case PixelFormat::RGB565:
        return 2;
    case PixelFormat::ALPHA8:
        return 1;
    }
    return 4;
}

const char* pixel_format_name(PixelFormat format) {
    switch (format) {
    case PixelFormat::ARGB8888:
        return "ARGB8888";
    case PixelFormat::RGB565:
        return "RGB565";
    case PixelFormat::ALPHA8:
        return "ALPHA8";
    }
    return "unknown";
}

PixelFormat parse_pixel_format(const std::string& name, PixelFormat fallback) {
    if (name == "ARGB8888")
        return PixelFormat::ARGB8888;
    if (name == "RGB565")
        return PixelFormat::RGB565;
    if (name == "ALPHA8")
        return PixelFormat::ALPHA8;
    return fallback;
}

Bitmap::Bitmap(int width, int height, PixelFormat format)
    : width_(width), height_(height), format_(format),
      row_bytes_(static_cast<size_t>(width) * bytes_per_pixel(format)),
      pixels_(row_bytes_ * static_cast<size_t>(height), 0) {}

std::unique_ptr<Bitmap> Bitmap::from_rgba(const uint8_t* rgba, int width, int height,
                                          PixelFormat format) {
    auto bitmap = std::make_unique<Bitmap>(width, height, format);
    const size_t count = static_cast<size_t>(width) * static_cast<size_t>(height);
    uint8_t* out = bitmap->pixels();

    switch (format) {
    case PixelFormat::ARGB8888:
        // RGBA -> BGRA in memory (0xAARRGGBB when read as little-endian uint32)
        for (size_t i = 0; i < count; ++i) {
            out[i * 4] = rgba[i * 4 + 2];
            out[i * 4 + 1] = rgba[i * 4 + 1];
            out[i * 4 + 2] = rgba[i * 4];
            out[i * 4 + 3] = rgba[i * 4 + 3];
        }
        break;
    case PixelFormat::RGB565:
        for (size_t i = 0; i < count; ++i) {
            uint16_t r = rgba[i * 4] >> 3;
            uint16_t g = rgba[i * 4 + 1] >> 2;
            uint16_t b = rgba[i * 4 + 2] >> 3;
            uint16_t packed = static_cast<uint16_t>((r << 11) | (g << 5) | b);
            out[i * 2] = static_cast<uint8_t>(packed & 0xFF);
            out[i * 2 + 1] = static_cast<uint8_t>(packed >> 8);
        }
        break;
    case PixelFormat::ALPHA8:
        for (size_t i = 0; i < count; ++i) {
            out[i] = rgba[i * 4 + 3];
        }
        break;
    }
    return bitmap;
}

std::unique_ptr<Bitmap> Bitmap::rotated(int degrees) const {
    const int bpp = bytes_per_pixel(format_);
    const bool swap_axes = (degrees == 90 || degrees == 270);
    auto out = std::make_unique<Bitmap>(swap_axes ? height_ : width_,
                                        swap_axes ? width_ : height_, format_);

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            int dx = x;
            int dy = y;
            switch (degrees) {
            case 90:
                dx = height_ - 1 - y;
                dy = x;
                break;
            case 180:
                dx = width_ - 1 - x;
                dy = height_ - 1 - y;
                break;
            case 270:
                dx = y;
                dy = width_ - 1 - x;
                break;
            default:
                break;
            }
            std::memcpy(out->pixels() + static_cast<size_t>(dy) * out->row_bytes() +
                            static_cast<size_t>(dx) * bpp,
                        pixel_at(x, y), bpp);
        }
    }
    return out;
}

} // namespace pixcache
