// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "load_context.h"

#include <cstdint>
#include <ostream>
#include <string>

namespace pixcache {

/**
 * @brief Fetches the raw bytes behind an identifier
 *
 * The cache hands the downloader either a disk-record sink or an in-memory
 * buffer. Implementations must be callable from several threads at once.
 */
class Downloader {
  public:
    virtual ~Downloader() = default;

    /**
     * @brief Write the content of `uri` to `out`
     *
     * @param uri Identifier to fetch
     * @param out Sink for the bytes
     * @param ctx Cancellation handle, checked between chunks
     * @return Expiry timestamp (epoch ms) on success, NO_EXPIRY for content
     *         that never goes stale, or a negative value on failure/cancel
     */
    virtual int64_t download_to_stream(const std::string& uri, std::ostream& out,
                                       const LoadContext& ctx) = 0;
};

/**
 * @brief Local files and http(s) URLs
 *
 * - Absolute paths and `file://` URIs are copied from disk and never expire.
 * - `http://` and `https://` are fetched with libhv. The expiry comes from
 *   the Cache-Control header, see expiry_from_cache_control().
 */
class DefaultDownloader : public Downloader {
  public:
    static constexpr size_t CHUNK_SIZE = 8 * 1024;

    /**
     * @param default_expiry_ms Lifetime of HTTP content without cache headers
     * @param timeout_sec HTTP request timeout
     */
    DefaultDownloader(int64_t default_expiry_ms, int timeout_sec);

    int64_t download_to_stream(const std::string& uri, std::ostream& out,
                               const LoadContext& ctx) override;

    int64_t default_expiry_ms() const {
        return default_expiry_ms_;
    }

  private:
    int64_t copy_local_file(const std::string& path, std::ostream& out, const LoadContext& ctx);
    int64_t fetch_http(const std::string& url, std::ostream& out, const LoadContext& ctx);

    int64_t default_expiry_ms_;
    int timeout_sec_;
};

/**
 * @brief Parse the max-age directive of a Cache-Control header
 * @return Seconds, or -1 if absent, malformed or the response is no-store
 */
int64_t parse_max_age(const std::string& cache_control);

/**
 * @brief Expiry timestamp (epoch ms) for a response fetched at `now`
 *
 * - `no-store`: already expired, so the record is dropped on its first read
 * - `max-age=N` with N > 0: now + N seconds
 * - otherwise: now + default_expiry_ms
 */
int64_t expiry_from_cache_control(const std::string& cache_control, int64_t now,
                                  int64_t default_expiry_ms);

} // namespace pixcache
