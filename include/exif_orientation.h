// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bitmap.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

/**
 * @file exif_orientation.h
 * @brief EXIF orientation lookup and rotation of decoded bitmaps
 *
 * Only JPEG files carry EXIF here: the APP1 "Exif" segment is located and the
 * Orientation tag (0x0112) is read from IFD0. Anything else reads as
 * "undefined" (0).
 */

namespace pixcache {

/// EXIF Orientation tag values that map to a pure rotation
namespace exif_orientation {
constexpr int UNDEFINED = 0;
constexpr int NORMAL = 1;
constexpr int ROTATE_180 = 3;
constexpr int ROTATE_90 = 6;
constexpr int ROTATE_270 = 8;
} // namespace exif_orientation

/**
 * @brief Raw Orientation tag of a JPEG file
 * @return 1-8, or 0 if the file is missing, not a JPEG or has no tag
 */
int read_exif_orientation(const std::string& path);

/**
 * @brief Orientation tag from a TIFF block (the APP1 payload after "Exif\0\0")
 * @return 1-8, or 0 if malformed or absent
 */
int parse_tiff_orientation(const uint8_t* tiff, size_t size);

/// Clockwise rotation for a tag value: 90, 180, 270, or 0 for anything else
int orientation_to_degrees(int orientation);

/// read_exif_orientation() mapped through orientation_to_degrees()
int read_orientation_degrees(const std::string& path);

/**
 * @brief Apply EXIF rotation to a freshly decoded bitmap
 *
 * Returns the input unchanged when auto_rotate is false, blob_path is empty
 * or unreadable, or the orientation is not a pure rotation. Otherwise the
 * input is released and a rotated copy returned.
 */
std::unique_ptr<Bitmap> normalize_orientation(const std::string& blob_path,
                                              std::unique_ptr<Bitmap> bitmap, bool auto_rotate);

} // namespace pixcache
