// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace pixcache {

Config* Config::instance{NULL};

namespace {

/// Default cache section; disk_directory is left out so it resolves per user
json get_default_cache_config() {
    return {{"memory_enabled", true}, {"memory_size_mb", 8},
            {"disk_enabled", true},   {"disk_size_mb", 50},
            {"default_expiry_sec", 259200}, {"http_timeout_sec", 15},
            {"worker_threads", 3}};
}

/// Fill keys missing from `target` with values from `defaults` (one level deep)
bool merge_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::default_config() {
    return {{"log_level", "info"}, {"cache", get_default_cache_config()}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            data = json::parse(std::fstream(config_path));
            if (!data.is_object()) {
                parse_error = "root is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }
        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            std::rename(config_path.c_str(), backup_path.c_str());
            spdlog::info("[Config] Corrupt config backed up to {}", backup_path);

            data = default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = default_config();
        config_modified = true;
    }

    // Ensure the cache section exists with every key
    if (!data.contains("log_level")) {
        data["log_level"] = "info";
        config_modified = true;
    }
    if (!data.contains("cache") || !data["cache"].is_object()) {
        data["cache"] = get_default_cache_config();
        config_modified = true;
    } else if (merge_missing(data["cache"], get_default_cache_config())) {
        config_modified = true;
    }

    if (config_modified) {
        try {
            fs::path config_dir = fs::path(config_path).parent_path();
            if (!config_dir.empty() && !fs::exists(config_dir)) {
                fs::create_directories(config_dir);
            }
        } catch (const fs::filesystem_error& e) {
            spdlog::warn("[Config] Cannot create config directory: {}", e.what());
        }
        std::ofstream o(config_path);
        o << std::setw(2) << data << std::endl;
        spdlog::debug("[Config] Saved updated config to {}", config_path);
    }

    spdlog::debug("[Config] initialized: memory={}MB disk={}MB",
                  get<int>("/cache/memory_size_mb", 0), get<int>("/cache/disk_size_mb", 0));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = default_config();
}

} // namespace pixcache
