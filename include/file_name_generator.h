// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <memory>
#include <string>

namespace pixcache {

/**
 * @brief Maps a cache identifier (usually a URI) to an on-disk file name
 *
 * Implementations must be deterministic and collision-resistant: two
 * identifiers that map to the same name share one disk record.
 */
class DiskCacheFileNameGenerator {
  public:
    virtual ~DiskCacheFileNameGenerator() = default;

    /// File name (no directory, no slot suffix) for an identifier
    virtual std::string generate(const std::string& identifier) const = 0;
};

/**
 * @brief Default generator: lowercase hex SHA-256 of the identifier
 */
class Sha256FileNameGenerator : public DiskCacheFileNameGenerator {
  public:
    std::string generate(const std::string& identifier) const override;
};

/**
 * @brief std::hash based names
 *
 * Short names, but only 64 bits of hash. Suitable for small caches and tests.
 */
class HashFileNameGenerator : public DiskCacheFileNameGenerator {
  public:
    std::string generate(const std::string& identifier) const override;
};

/// Lowercase hex SHA-256 digest of a string
std::string sha256_hex(const std::string& input);

} // namespace pixcache
