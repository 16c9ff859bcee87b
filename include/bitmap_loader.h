// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bitmap_cache.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

class HThreadPool;

namespace pixcache {

using LoadSuccessCallback = std::function<void(BitmapPtr bitmap)>;
using LoadErrorCallback = std::function<void(const std::string& error)>;

/**
 * @brief Runs the blocking parts of a BitmapCache on a worker pool
 *
 * Memory hits are answered on the calling thread. Everything else (disk
 * lookup, fetch, decode) runs on a libhv HThreadPool and the callbacks are
 * invoked on that worker thread; callers that own a UI thread must marshal
 * the result themselves.
 *
 * A load whose LoadContext is cancelled by the time it finishes invokes
 * neither callback.
 *
 * ## Usage Example
 * ```cpp
 * auto cache = std::make_shared<BitmapCache>(settings);
 * BitmapLoader loader(cache, settings.worker_threads);
 * loader.init();
 *
 * loader.load(uri, config, ctx,
 *     [](BitmapPtr bmp) { show(bmp); },
 *     [](const std::string& err) { spdlog::warn("Failed: {}", err); });
 * ```
 */
class BitmapLoader {
  public:
    BitmapLoader(std::shared_ptr<BitmapCache> cache, int worker_threads);
    ~BitmapLoader();

    BitmapLoader(const BitmapLoader&) = delete;
    BitmapLoader& operator=(const BitmapLoader&) = delete;

    /**
     * @brief Create the memory tier now and open the disk tier on a worker
     *
     * Disk lookups queued before the disk tier is open wait for it.
     */
    void init();

    /**
     * @brief Load a bitmap: memory, then disk, then fetch
     *
     * @param on_success Called with the bitmap (memory hits: before returning)
     * @param on_error Called with a reason when nothing could be produced
     */
    void load(const std::string& identifier, const DisplayConfig& config, const LoadContext& ctx,
              LoadSuccessCallback on_success, LoadErrorCallback on_error = nullptr);

    /**
     * @brief Same lookup chain, blocking the caller
     * @return nullptr on failure or cancellation
     */
    BitmapPtr load_sync(const std::string& identifier, const DisplayConfig& config,
                        const LoadContext& ctx);

    /// Clear both tiers on a worker
    void clear_cache_async();

    /// Number of queued + running tasks
    size_t pending_tasks() const;

    /// Block until the queue is drained
    void wait_for_completion();

    /**
     * @brief Stop the pool; queued loads are dropped. Idempotent.
     *
     * If init() queued the disk tier open and no worker ran it yet, it runs on
     * the calling thread so disk lookups on the cache do not block forever.
     */
    void shutdown();

    BitmapCache& cache() {
        return *cache_;
    }

  private:
    std::shared_ptr<BitmapCache> cache_;
    std::shared_ptr<HThreadPool> thread_pool_;
    bool shutdown_ = false;
    bool disk_init_queued_ = false;
    mutable std::mutex mutex_;
};

} // namespace pixcache
