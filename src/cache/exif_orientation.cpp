// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "exif_orientation.h"

#include <spdlog/spdlog.h>

#include <cstring>
#include <fstream>
#include <vector>

namespace pixcache {

namespace {

constexpr uint16_t TAG_ORIENTATION = 0x0112;
constexpr uint16_t TYPE_SHORT = 3;

constexpr uint8_t MARKER_SOI = 0xD8;
constexpr uint8_t MARKER_APP1 = 0xE1;
constexpr uint8_t MARKER_SOS = 0xDA;
constexpr uint8_t MARKER_EOI = 0xD9;

} // namespace

int parse_tiff_orientation(const uint8_t* tiff, size_t size) {
    if (!tiff || size < 8) {
        return exif_orientation::UNDEFINED;
    }
    const bool big_endian = (tiff[0] == 'M' && tiff[1] == 'M');
    if (!big_endian && !(tiff[0] == 'I' && tiff[1] == 'I')) {
        return exif_orientation::UNDEFINED;
    }

    const auto read16 = [big_endian, tiff, size](size_t offset) -> uint16_t {
        if (offset + 2 > size)
            return 0;
        if (big_endian)
            return static_cast<uint16_t>((tiff[offset] << 8) | tiff[offset + 1]);
        return static_cast<uint16_t>(tiff[offset] | (tiff[offset + 1] << 8));
    };
    const auto read32 = [big_endian, tiff, size](size_t offset) -> uint32_t {
        if (offset + 4 > size)
            return 0;
        if (big_endian)
            return (static_cast<uint32_t>(tiff[offset]) << 24) |
                   (static_cast<uint32_t>(tiff[offset + 1]) << 16) |
                   (static_cast<uint32_t>(tiff[offset + 2]) << 8) | tiff[offset + 3];
        return tiff[offset] | (static_cast<uint32_t>(tiff[offset + 1]) << 8) |
               (static_cast<uint32_t>(tiff[offset + 2]) << 16) |
               (static_cast<uint32_t>(tiff[offset + 3]) << 24);
    };

    if (read16(2) != 42) {
        return exif_orientation::UNDEFINED;
    }

    const size_t ifd0 = read32(4);
    const uint16_t entry_count = read16(ifd0);
    for (uint16_t i = 0; i < entry_count; ++i) {
        const size_t entry = ifd0 + 2 + static_cast<size_t>(i) * 12;
        if (entry + 12 > size) {
            break;
        }
        if (read16(entry) != TAG_ORIENTATION) {
            continue;
        }
        if (read16(entry + 2) != TYPE_SHORT) {
            return exif_orientation::UNDEFINED;
        }
        const uint16_t value = read16(entry + 8);
        return (value >= 1 && value <= 8) ? value : exif_orientation::UNDEFINED;
    }
    return exif_orientation::UNDEFINED;
}

int read_exif_orientation(const std::string& path) {
    if (path.empty()) {
        return exif_orientation::UNDEFINED;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return exif_orientation::UNDEFINED;
    }

    uint8_t buf[2] = {0, 0};
    file.read(reinterpret_cast<char*>(buf), 2);
    if (!file || buf[0] != 0xFF || buf[1] != MARKER_SOI) {
        return exif_orientation::UNDEFINED;
    }

    while (file) {
        file.read(reinterpret_cast<char*>(buf), 2);
        if (!file || buf[0] != 0xFF) {
            break;
        }
        // Fill bytes before a marker
        while (buf[1] == 0xFF && file) {
            file.read(reinterpret_cast<char*>(&buf[1]), 1);
        }
        if (buf[1] == MARKER_SOS || buf[1] == MARKER_EOI) {
            break;
        }

        uint8_t len_buf[2];
        file.read(reinterpret_cast<char*>(len_buf), 2);
        if (!file) {
            break;
        }
        const uint16_t segment_len = static_cast<uint16_t>((len_buf[0] << 8) | len_buf[1]);
        if (segment_len < 2) {
            break;
        }

        if (buf[1] != MARKER_APP1) {
            file.seekg(segment_len - 2, std::ios::cur);
            continue;
        }

        std::vector<uint8_t> segment(segment_len - 2);
        file.read(reinterpret_cast<char*>(segment.data()),
                  static_cast<std::streamsize>(segment.size()));
        if (!file) {
            break;
        }
        if (segment.size() < 14 || std::memcmp(segment.data(), "Exif\0\0", 6) != 0) {
            // XMP and other APP1 payloads
            continue;
        }
        return parse_tiff_orientation(segment.data() + 6, segment.size() - 6);
    }
    return exif_orientation::UNDEFINED;
}

int orientation_to_degrees(int orientation) {
    switch (orientation) {
    case exif_orientation::ROTATE_90:
        return 90;
    case exif_orientation::ROTATE_180:
        return 180;
    case exif_orientation::ROTATE_270:
        return 270;
    default:
        return 0;
    }
}

int read_orientation_degrees(const std::string& path) {
    return orientation_to_degrees(read_exif_orientation(path));
}

std::unique_ptr<Bitmap> normalize_orientation(const std::string& blob_path,
                                              std::unique_ptr<Bitmap> bitmap, bool auto_rotate) {
    if (!bitmap || !auto_rotate || blob_path.empty()) {
        return bitmap;
    }
    const int degrees = read_orientation_degrees(blob_path);
    if (degrees == 0) {
        return bitmap;
    }
    spdlog::trace("[Orientation] Rotating {}x{} bitmap by {} degrees", bitmap->width(),
                  bitmap->height(), degrees);
    return bitmap->rotated(degrees);
}

} // namespace pixcache
