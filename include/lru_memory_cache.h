// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cache_clock.h"
#include "cache_key.h"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @file lru_memory_cache.h
 * @brief Size-weighted LRU cache keyed by CacheKey
 *
 * Entries are weighed by a pluggable size function (default: 1 per entry).
 * After every put the total weight is trimmed to max_size by dropping the
 * least recently used entries. An entry larger than the whole budget is still
 * inserted and then immediately evicted by the trim, so put() never fails.
 *
 * Lookups go through a per-identifier index and scan variants with
 * CacheKey::matches(), so identifier-wide operations (remove_all) never depend
 * on hash-map equality.
 *
 * Thread-safe: every public method takes the internal mutex.
 */

namespace pixcache {

template <typename Value> class LruMemoryCache {
  public:
    using SizeOf = std::function<size_t(const CacheKey&, const Value&)>;

    /**
     * @param max_size Budget in size-function units (bytes for the bitmap cache)
     * @param size_of Weight of an entry; nullptr counts every entry as 1
     */
    explicit LruMemoryCache(size_t max_size, SizeOf size_of = nullptr)
        : max_size_(max_size), size_of_(std::move(size_of)) {}

    LruMemoryCache(const LruMemoryCache&) = delete;
    LruMemoryCache& operator=(const LruMemoryCache&) = delete;

    /**
     * @brief Look up a value and mark it most recently used
     *
     * An expired entry is removed and reported as a miss.
     */
    std::optional<Value> get(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = find_locked(key);
        if (it == entries_.end()) {
            ++miss_count_;
            return std::nullopt;
        }
        if (it->expiry_ms < current_time_millis()) {
            spdlog::trace("[LruMemoryCache] Expired entry for {}", it->key.identifier);
            erase_locked(it);
            ++miss_count_;
            return std::nullopt;
        }
        entries_.splice(entries_.end(), entries_, it);
        ++hit_count_;
        return it->value;
    }

    /**
     * @brief Insert or replace a value, then trim to max_size
     *
     * Replaces the first existing entry that matches key.
     */
    void put(const CacheKey& key, Value value, int64_t expiry_ms = NO_EXPIRY) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = find_locked(key);
        if (existing != entries_.end()) {
            erase_locked(existing);
        }

        size_t weight = size_of_ ? size_of_(key, value) : 1;
        entries_.push_back(Node{key, std::move(value), weight, expiry_ms});
        index_[key.identifier].push_back(std::prev(entries_.end()));
        size_ += weight;

        trim_to_size_locked(max_size_);
    }

    /**
     * @brief Remove the first entry matching key
     * @return The removed value, if any
     */
    std::optional<Value> remove(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = find_locked(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        Value value = it->value;
        erase_locked(it);
        return value;
    }

    /**
     * @brief Remove every entry for an identifier, whatever its variant
     * @return Number of entries removed
     */
    size_t remove_all(const std::string& identifier) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto idx = index_.find(identifier);
        if (idx == index_.end()) {
            return 0;
        }
        size_t removed = 0;
        for (auto it : idx->second) {
            size_ -= it->weight;
            entries_.erase(it);
            ++removed;
        }
        index_.erase(idx);
        return removed;
    }

    bool contains_key(const CacheKey& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto idx = index_.find(key.identifier);
        if (idx == index_.end()) {
            return false;
        }
        for (auto it : idx->second) {
            if (it->key.matches(key)) {
                return true;
            }
        }
        return false;
    }

    /// Drop every entry
    void evict_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        eviction_count_ += entries_.size();
        entries_.clear();
        index_.clear();
        size_ = 0;
    }

    /// Change the budget; evicts immediately if the cache is now over it
    void set_max_size(size_t max_size) {
        std::lock_guard<std::mutex> lock(mutex_);
        max_size_ = max_size;
        trim_to_size_locked(max_size_);
    }

    /// Total weight of all entries
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    size_t max_size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_size_;
    }

    /// Number of entries
    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    uint64_t hit_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hit_count_;
    }

    uint64_t miss_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return miss_count_;
    }

    uint64_t eviction_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return eviction_count_;
    }

  private:
    struct Node {
        CacheKey key;
        Value value;
        size_t weight;
        int64_t expiry_ms;
    };
    using NodeList = std::list<Node>;
    using NodeIter = typename NodeList::iterator;

    // Caller must hold mutex_
    NodeIter find_locked(const CacheKey& key) {
        auto idx = index_.find(key.identifier);
        if (idx == index_.end()) {
            return entries_.end();
        }
        for (auto it : idx->second) {
            if (it->key.matches(key)) {
                return it;
            }
        }
        return entries_.end();
    }

    // Caller must hold mutex_
    void erase_locked(NodeIter it) {
        auto idx = index_.find(it->key.identifier);
        if (idx != index_.end()) {
            auto& bucket = idx->second;
            for (auto b = bucket.begin(); b != bucket.end(); ++b) {
                if (*b == it) {
                    bucket.erase(b);
                    break;
                }
            }
            if (bucket.empty()) {
                index_.erase(idx);
            }
        }
        size_ -= it->weight;
        entries_.erase(it);
    }

    // Caller must hold mutex_. Front of entries_ is least recently used.
    void trim_to_size_locked(size_t limit) {
        while (size_ > limit && !entries_.empty()) {
            erase_locked(entries_.begin());
            ++eviction_count_;
        }
    }

    mutable std::mutex mutex_;
    NodeList entries_;
    std::unordered_map<std::string, std::vector<NodeIter>> index_;
    size_t size_ = 0;
    size_t max_size_;
    SizeOf size_of_;
    uint64_t hit_count_ = 0;
    uint64_t miss_count_ = 0;
    uint64_t eviction_count_ = 0;
};

} // namespace pixcache
