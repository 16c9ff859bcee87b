// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "downloader.h"
#include "file_name_generator.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace pixcache {

class Config;

/**
 * @brief Settings shared by the memory tier, disk tier and loader
 *
 * Plain values plus the two pluggable collaborators. A null downloader or
 * name generator is replaced by the defaults when the cache is built.
 */
struct CacheSettings {
    static constexpr size_t MIN_MEMORY_CACHE_SIZE = 2 * 1024 * 1024;
    static constexpr uint64_t MIN_DISK_CACHE_SIZE = 10 * 1024 * 1024;

    bool memory_cache_enabled = true;
    size_t memory_cache_size = 8 * 1024 * 1024; ///< Bytes of decoded pixels

    bool disk_cache_enabled = true;
    std::string disk_cache_path;                  ///< Empty = default_disk_directory()
    uint64_t disk_cache_size = 50 * 1024 * 1024; ///< Bytes on disk

    int64_t default_expiry_ms = 3LL * 24 * 60 * 60 * 1000;
    int http_timeout_sec = 15;
    int worker_threads = 3;

    std::shared_ptr<Downloader> downloader;
    std::shared_ptr<const DiskCacheFileNameGenerator> file_name_generator;

    /**
     * @brief Per-user cache directory
     *
     * `$XDG_CACHE_HOME/pixcache`, else `$HOME/.cache/pixcache`, else `/tmp/pixcache`.
     */
    static std::string default_disk_directory();

    /**
     * @brief Read the /cache section of a Config
     *
     * Sizes below the minimums are raised to them. A DefaultDownloader is
     * created with the configured expiry and timeout.
     */
    static CacheSettings from_config(Config& config);

    /// disk_cache_path, or the default directory if unset
    std::string effective_disk_path() const;
};

} // namespace pixcache
