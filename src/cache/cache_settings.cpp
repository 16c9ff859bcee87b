// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cache_settings.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>

namespace pixcache {

std::string CacheSettings::default_disk_directory() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/pixcache";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.cache/pixcache";
    }

    return "/tmp/pixcache"; // Last resort fallback
}

std::string CacheSettings::effective_disk_path() const {
    return disk_cache_path.empty() ? default_disk_directory() : disk_cache_path;
}

CacheSettings CacheSettings::from_config(Config& config) {
    CacheSettings settings;

    settings.memory_cache_enabled = config.get<bool>("/cache/memory_enabled", true);
    const int memory_mb = config.get<int>("/cache/memory_size_mb", 8);
    settings.memory_cache_size =
        std::max(static_cast<size_t>(std::max(memory_mb, 0)) * 1024 * 1024, MIN_MEMORY_CACHE_SIZE);

    settings.disk_cache_enabled = config.get<bool>("/cache/disk_enabled", true);
    settings.disk_cache_path = config.get<std::string>("/cache/disk_directory", "");
    const int disk_mb = config.get<int>("/cache/disk_size_mb", 50);
    settings.disk_cache_size =
        std::max(static_cast<uint64_t>(std::max(disk_mb, 0)) * 1024 * 1024, MIN_DISK_CACHE_SIZE);

    const int64_t expiry_sec = config.get<int64_t>("/cache/default_expiry_sec", 259200);
    settings.default_expiry_ms = std::max<int64_t>(expiry_sec, 0) * 1000;
    settings.http_timeout_sec = std::max(config.get<int>("/cache/http_timeout_sec", 15), 1);
    settings.worker_threads = std::max(config.get<int>("/cache/worker_threads", 3), 1);

    settings.downloader =
        std::make_shared<DefaultDownloader>(settings.default_expiry_ms, settings.http_timeout_sec);
    settings.file_name_generator = std::make_shared<Sha256FileNameGenerator>();

    spdlog::debug("[CacheSettings] memory={} ({} bytes), disk={} ({} bytes at {})",
                  settings.memory_cache_enabled, settings.memory_cache_size,
                  settings.disk_cache_enabled, settings.disk_cache_size,
                  settings.effective_disk_path());
    return settings;
}

} // namespace pixcache
