// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bitmap.h"
#include "cache_settings.h"
#include "disk_lru_cache.h"
#include "display_config.h"
#include "load_context.h"
#include "lru_memory_cache.h"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

/**
 * @file bitmap_cache.h
 * @brief Two-tier (memory + disk) cache of decoded bitmaps
 *
 * A request for (identifier, DisplayConfig) goes:
 *
 * 1. Memory tier, keyed by identifier + DisplayConfig::to_string()
 * 2. Disk tier, keyed by identifier (the raw fetched bytes)
 * 3. Downloader, writing straight into a disk record which is then decoded
 *
 * The disk tier is opened by init_disk_cache(), usually on a worker thread.
 * Disk operations issued before that block until it has finished, whether the
 * open succeeded or not. If the disk tier is disabled or failed to open, the
 * cache keeps working from memory and fetches into a transient buffer.
 *
 * ## Concurrency
 * All disk-tier structural operations (open, edit, commit, remove, clear,
 * flush, close) run under one mutex. The fetch for a missing record happens
 * under that mutex, so concurrent requests for the same identifier trigger a
 * single fetch and the others decode the committed record. Decoding runs
 * after the mutex is released.
 *
 * ## Usage Example
 * ```cpp
 * pixcache::BitmapCache cache(pixcache::CacheSettings::from_config(*Config::get_instance()));
 * cache.init_memory_cache();
 * cache.init_disk_cache();
 *
 * DisplayConfig config;
 * config.max_size = {400, 300};
 * BitmapPtr bmp = cache.get_bitmap_from_memory(uri, config);
 * if (!bmp) bmp = cache.get_bitmap_from_disk(uri, config);
 * if (!bmp) bmp = cache.download_bitmap(uri, config, LoadContext{});
 * ```
 */

namespace pixcache {

class BitmapCache {
  public:
    /// Disk record slot holding the fetched bytes
    static constexpr int DISK_CACHE_INDEX = 0;
    static constexpr int DISK_CACHE_APP_VERSION = 1;

    using MemoryCache = LruMemoryCache<BitmapPtr>;

    /**
     * @param settings Tier configuration; a null downloader or name generator
     *                 is replaced by the defaults
     */
    explicit BitmapCache(CacheSettings settings);
    ~BitmapCache();

    BitmapCache(const BitmapCache&) = delete;
    BitmapCache& operator=(const BitmapCache&) = delete;

    /**
     * @brief (Re)create the memory tier
     *
     * No-op when memory caching is disabled. An existing tier is cleared and
     * replaced. Entries are weighed by their pixel footprint.
     */
    void init_memory_cache();

    /**
     * @brief Open the disk tier and release waiting readers
     *
     * No-op when disk caching is disabled. The capacity is the configured size
     * clamped to the space available in the directory. An open failure leaves
     * the cache without a disk tier. Blocking: call from a worker thread.
     */
    void init_disk_cache();

    /// Memory tier lookup only; never touches disk
    BitmapPtr get_bitmap_from_memory(const std::string& identifier, const DisplayConfig& config);

    /**
     * @brief Decode a bitmap from its disk record
     *
     * Waits for init_disk_cache(). A hit is orientation-normalized and added to
     * the memory tier with the record's expiry. A record that no longer decodes
     * is removed.
     *
     * @return nullptr on miss, disabled disk tier or error
     */
    BitmapPtr get_bitmap_from_disk(const std::string& identifier, const DisplayConfig& config);

    /// Path of the disk record's blob, or empty string if not on disk
    std::string get_bitmap_file_from_disk(const std::string& identifier);

    /**
     * @brief Fetch, store and decode a bitmap
     *
     * With a disk tier: reuses an existing record, else fetches into a new
     * record and commits it. If another edit of the record is in progress this
     * returns nullptr without fetching. If the disk tier is unavailable or the
     * disk path fails, the bytes are fetched into memory and decoded without
     * being persisted.
     *
     * A failed or cancelled fetch returns nullptr and leaves no record behind.
     * Blocking: call from a worker thread.
     */
    BitmapPtr download_bitmap(const std::string& identifier, const DisplayConfig& config,
                              const LoadContext& ctx);

    /// clear_memory_cache() + clear_disk_cache()
    void clear_cache();

    /// Drop every memory entry
    void clear_memory_cache();

    /**
     * @brief Delete the disk tier's directory and reopen it empty
     *
     * Readers block on the readiness gate while the tier is recreated.
     */
    void clear_disk_cache();

    /// Remove an identifier from both tiers
    void clear_cache(const std::string& identifier);

    /// Remove every variant of an identifier from memory
    void clear_memory_cache(const std::string& identifier);

    /// Remove an identifier's disk record
    void clear_disk_cache(const std::string& identifier);

    /// Flush the disk journal
    void flush();

    /// Close the disk tier. Later disk lookups miss until init_disk_cache().
    void close();

    void set_memory_cache_size(size_t max_size);
    void set_disk_cache_size(uint64_t max_size);
    void set_disk_cache_file_name_generator(
        std::shared_ptr<const DiskCacheFileNameGenerator> generator);

    /// True once init_disk_cache() has completed (successfully or not)
    bool is_disk_cache_ready() const;

    /// True if a disk tier is open
    bool has_disk_cache() const;

    /// Number of bitmaps in the memory tier (0 if none)
    size_t memory_cache_count() const;

    /// Bytes of bitmaps in the memory tier (0 if none)
    size_t memory_cache_bytes() const;

    const CacheSettings& settings() const {
        return settings_;
    }

  private:
    /// Allow tests to reach the disk tier directly
    friend class BitmapCacheTestAccess;

    std::shared_ptr<MemoryCache> memory_tier() const;
    void add_bitmap_to_memory_cache(const std::string& identifier, const DisplayConfig& config,
                                    const BitmapPtr& bitmap, int64_t expiry_timestamp);
    void wait_for_disk_cache(std::unique_lock<std::mutex>& lock);
    void remove_disk_record(const std::string& identifier);

    CacheSettings settings_;

    mutable std::mutex memory_mutex_; // guards the memory_cache_ pointer only
    std::shared_ptr<MemoryCache> memory_cache_;

    mutable std::mutex disk_mutex_;
    std::condition_variable disk_ready_cv_;
    bool disk_cache_ready_ = false;
    std::unique_ptr<DiskLruCache> disk_cache_;
};

} // namespace pixcache
