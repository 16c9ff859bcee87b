// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "downloader.h"

#include "cache_clock.h"
#include "hv/requests.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

namespace pixcache {

namespace {

constexpr const char* FILE_SCHEME = "file://";

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

int64_t parse_max_age(const std::string& cache_control) {
    std::string value = to_lower(cache_control);
    if (value.find("no-store") != std::string::npos) {
        return -1;
    }
    size_t pos = value.find("max-age");
    if (pos == std::string::npos) {
        return -1;
    }
    pos += 7;
    while (pos < value.size() && value[pos] == ' ') {
        ++pos;
    }
    if (pos >= value.size() || value[pos] != '=') {
        return -1;
    }
    ++pos;
    while (pos < value.size() && value[pos] == ' ') {
        ++pos;
    }
    size_t end = pos;
    while (end < value.size() && std::isdigit(static_cast<unsigned char>(value[end]))) {
        ++end;
    }
    if (end == pos || end - pos > 12) {
        return -1;
    }
    return std::stoll(value.substr(pos, end - pos));
}

int64_t expiry_from_cache_control(const std::string& cache_control, int64_t now,
                                  int64_t default_expiry_ms) {
    if (to_lower(cache_control).find("no-store") != std::string::npos) {
        return now - 1;
    }
    int64_t max_age = parse_max_age(cache_control);
    return max_age > 0 ? now + max_age * 1000 : now + default_expiry_ms;
}

DefaultDownloader::DefaultDownloader(int64_t default_expiry_ms, int timeout_sec)
    : default_expiry_ms_(default_expiry_ms), timeout_sec_(timeout_sec) {}

int64_t DefaultDownloader::download_to_stream(const std::string& uri, std::ostream& out,
                                              const LoadContext& ctx) {
    if (uri.empty()) {
        return -1;
    }
    if (starts_with(uri, "/")) {
        return copy_local_file(uri, out, ctx);
    }
    if (starts_with(uri, FILE_SCHEME)) {
        return copy_local_file(uri.substr(std::string(FILE_SCHEME).size()), out, ctx);
    }
    std::string lower = to_lower(uri.substr(0, 8));
    if (starts_with(lower, "http://") || starts_with(lower, "https://")) {
        return fetch_http(uri, out, ctx);
    }
    spdlog::warn("[Downloader] Unsupported URI: {}", uri);
    return -1;
}

int64_t DefaultDownloader::copy_local_file(const std::string& path, std::ostream& out,
                                           const LoadContext& ctx) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        spdlog::debug("[Downloader] Cannot open {}", path);
        return -1;
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (in) {
        if (ctx.is_cancelled()) {
            spdlog::trace("[Downloader] Cancelled while copying {}", path);
            return -1;
        }
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            out.write(buffer.data(), got);
            if (!out.good()) {
                spdlog::warn("[Downloader] Write failed while copying {}", path);
                return -1;
            }
        }
    }
    if (in.bad()) {
        spdlog::warn("[Downloader] Read error on {}", path);
        return -1;
    }
    return NO_EXPIRY;
}

int64_t DefaultDownloader::fetch_http(const std::string& url, std::ostream& out,
                                      const LoadContext& ctx) {
    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    req->timeout = timeout_sec_;

    // Stream the body into the sink instead of buffering the whole response
    bool write_failed = false;
    bool cancelled = false;
    size_t received_bytes = 0;
    req->http_cb = [&out, &ctx, &write_failed, &cancelled,
                    &received_bytes](HttpMessage*, http_parser_state state, const char* data,
                                     size_t size) {
        if (state != HP_BODY || !data || size == 0 || write_failed || cancelled) {
            return;
        }
        if (ctx.is_cancelled()) {
            cancelled = true;
            return;
        }
        out.write(data, static_cast<std::streamsize>(size));
        if (!out.good()) {
            write_failed = true;
            return;
        }
        received_bytes += size;
    };

    spdlog::trace("[Downloader] GET {}", url);
    auto resp = requests::request(req);

    if (!resp) {
        spdlog::error("[Downloader] HTTP request failed for: {}", url);
        return -1;
    }
    if (resp->status_code != HTTP_STATUS_OK) {
        spdlog::warn("[Downloader] HTTP {} fetching {}", static_cast<int>(resp->status_code),
                     url);
        return -1;
    }
    if (cancelled) {
        spdlog::trace("[Downloader] Cancelled while fetching {}", url);
        return -1;
    }
    if (write_failed) {
        spdlog::warn("[Downloader] Write failed while fetching {}", url);
        return -1;
    }

    int64_t expiry = expiry_from_cache_control(resp->GetHeader("Cache-Control"),
                                               current_time_millis(), default_expiry_ms_);
    spdlog::debug("[Downloader] Fetched {} bytes from {}", received_bytes, url);
    return expiry;
}

} // namespace pixcache
