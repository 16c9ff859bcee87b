// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <optional>
#include <string>

namespace pixcache {

/**
 * @brief Memory cache key: identifier plus optional display variant
 *
 * Matching is partial: identifiers must be equal, and variants must be equal
 * only when both sides carry one. A key without a variant therefore matches
 * every variant of its identifier, which is what identifier-scoped removal
 * relies on. The hash covers the identifier only.
 */
struct CacheKey {
    std::string identifier;
    std::optional<std::string> variant;

    CacheKey() = default;
    explicit CacheKey(std::string id, std::optional<std::string> var = std::nullopt)
        : identifier(std::move(id)), variant(std::move(var)) {}

    bool matches(const CacheKey& other) const {
        if (identifier != other.identifier) {
            return false;
        }
        if (variant && other.variant) {
            return *variant == *other.variant;
        }
        return true;
    }

    bool operator==(const CacheKey& other) const {
        return matches(other);
    }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const {
        return std::hash<std::string>()(key.identifier);
    }
};

} // namespace pixcache
