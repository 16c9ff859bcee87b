// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bitmap_loader.h"

#include <hv/hthreadpool.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace pixcache {

// Thread pool configuration
static constexpr int MIN_WORKER_THREADS = 1;
static constexpr int MAX_WORKER_THREADS = 16;

BitmapLoader::BitmapLoader(std::shared_ptr<BitmapCache> cache, int worker_threads)
    : cache_(std::move(cache)) {
    const int max_threads = std::clamp(worker_threads, MIN_WORKER_THREADS, MAX_WORKER_THREADS);
    thread_pool_ = std::make_shared<HThreadPool>(MIN_WORKER_THREADS, max_threads);
    thread_pool_->start(MIN_WORKER_THREADS);
    spdlog::debug("[BitmapLoader] Initialized with up to {} worker threads", max_threads);
}

BitmapLoader::~BitmapLoader() {
    shutdown();
}

void BitmapLoader::shutdown() {
    bool disk_init_queued = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        disk_init_queued = disk_init_queued_;
    }

    // stop() drops queued tasks, including a disk tier open that never started,
    // and joins workers that may be waiting for that open
    if (disk_init_queued && !cache_->is_disk_cache_ready()) {
        spdlog::debug("[BitmapLoader] Disk cache init still pending, running it inline");
        cache_->init_disk_cache();
    }

    std::shared_ptr<HThreadPool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = std::move(thread_pool_);
    }
    if (pool) {
        pool->stop();
    }
}

void BitmapLoader::init() {
    cache_->init_memory_cache();

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || !thread_pool_) {
        return;
    }
    disk_init_queued_ = true;
    auto cache = cache_;
    thread_pool_->commit([cache]() { cache->init_disk_cache(); });
}

BitmapPtr BitmapLoader::load_sync(const std::string& identifier, const DisplayConfig& config,
                                  const LoadContext& ctx) {
    BitmapPtr bitmap = cache_->get_bitmap_from_memory(identifier, config);
    if (bitmap) {
        return bitmap;
    }
    if (ctx.is_cancelled()) {
        return nullptr;
    }
    bitmap = cache_->get_bitmap_from_disk(identifier, config);
    if (bitmap) {
        return bitmap;
    }
    if (ctx.is_cancelled()) {
        return nullptr;
    }
    return cache_->download_bitmap(identifier, config, ctx);
}

void BitmapLoader::load(const std::string& identifier, const DisplayConfig& config,
                        const LoadContext& ctx, LoadSuccessCallback on_success,
                        LoadErrorCallback on_error) {
    if (identifier.empty()) {
        if (on_error) {
            on_error("Empty identifier");
        }
        return;
    }

    BitmapPtr hit = cache_->get_bitmap_from_memory(identifier, config);
    if (hit) {
        spdlog::trace("[BitmapLoader] Memory hit for {}", identifier);
        if (on_success) {
            on_success(hit);
        }
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || !thread_pool_) {
        if (on_error) {
            on_error("BitmapLoader is shutdown");
        }
        return;
    }

    // Capture by value for thread safety
    thread_pool_->commit([this, identifier, config, ctx, on_success, on_error]() {
        BitmapPtr bitmap = load_sync(identifier, config, ctx);
        if (ctx.is_cancelled()) {
            spdlog::trace("[BitmapLoader] Load of {} cancelled", identifier);
            return;
        }
        if (bitmap) {
            spdlog::debug("[BitmapLoader] Loaded {} ({}x{})", identifier, bitmap->width(),
                          bitmap->height());
            if (on_success) {
                on_success(bitmap);
            }
        } else {
            spdlog::warn("[BitmapLoader] Failed to load {}", identifier);
            if (on_error) {
                on_error("Failed to load " + identifier);
            }
        }
    });
}

void BitmapLoader::clear_cache_async() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || !thread_pool_) {
        return;
    }
    auto cache = cache_;
    thread_pool_->commit([cache]() { cache->clear_cache(); });
}

size_t BitmapLoader::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!thread_pool_) {
        return 0;
    }
    return static_cast<size_t>(thread_pool_->taskNum());
}

void BitmapLoader::wait_for_completion() {
    std::shared_ptr<HThreadPool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = thread_pool_;
    }
    if (pool) {
        pool->wait();
    }
}

} // namespace pixcache
