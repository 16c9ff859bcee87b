// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

/**
 * @file load_context.h
 * @brief Cancellation handle for a bitmap load
 *
 * A LoadContext combines three independent ways for a caller to say "this
 * result is no longer wanted":
 * 1. An explicit cancel() shared by every copy of the context
 * 2. An optional `alive` flag owned by the requester (cleared on destruction)
 * 3. An optional generation counter (a newer request supersedes older ones)
 *
 * Downloaders poll is_cancelled() between chunks; the cache treats a context
 * cancelled after a fetch as a failed fetch and discards the written data.
 *
 * ## Usage Example
 * ```cpp
 * std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(true);
 * std::atomic<uint32_t> request_gen_{0};
 *
 * void show(const std::string& uri) {
 *     auto ctx = LoadContext::create(alive_, &request_gen_);
 *     loader.load(uri, config, ctx, [ctx](BitmapPtr bmp) { ... });
 * }
 * ```
 */

namespace pixcache {

struct LoadContext {
    /// Shared by all copies; set by cancel()
    std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);

    /// Owner-alive flag (nullptr if not tracked)
    std::shared_ptr<std::atomic<bool>> alive;

    /// Owner's generation counter (nullptr if not tracked)
    std::atomic<uint32_t>* generation = nullptr;

    /// Generation value captured at creation
    uint32_t captured_gen = 0;

    /// Request cancellation for every copy of this context
    void cancel() const {
        cancelled->store(true);
    }

    /**
     * @brief True if the result of this load is no longer wanted
     *
     * Cancelled explicitly, owner destroyed, or superseded by a newer generation.
     */
    [[nodiscard]] bool is_cancelled() const {
        if (cancelled->load()) {
            return true;
        }
        if (alive && !alive->load()) {
            return true;
        }
        return generation != nullptr && captured_gen != generation->load();
    }

    /**
     * @brief Create a context, incrementing the generation counter
     *
     * Any earlier context created from the same counter becomes cancelled.
     */
    static LoadContext create(std::shared_ptr<std::atomic<bool>> alive_flag,
                              std::atomic<uint32_t>* gen = nullptr) {
        LoadContext ctx;
        ctx.alive = std::move(alive_flag);
        ctx.generation = gen;
        ctx.captured_gen = gen ? ++(*gen) : 0;
        return ctx;
    }
};

} // namespace pixcache
