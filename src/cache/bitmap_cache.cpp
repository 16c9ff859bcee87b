// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bitmap_cache.h"

#include "bitmap_decoder.h"
#include "exif_orientation.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace pixcache {

namespace {

std::unique_ptr<Bitmap> decode_for(std::istream& in, const DisplayConfig& config) {
    return BitmapDecoder::decode(in, BitmapDecoder::max_size_for(config), config.pixel_format);
}

std::unique_ptr<Bitmap> decode_for(const std::string& data, const DisplayConfig& config) {
    return BitmapDecoder::decode(reinterpret_cast<const uint8_t*>(data.data()), data.size(),
                                 BitmapDecoder::max_size_for(config), config.pixel_format);
}

} // namespace

BitmapCache::BitmapCache(CacheSettings settings) : settings_(std::move(settings)) {
    if (!settings_.downloader) {
        settings_.downloader = std::make_shared<DefaultDownloader>(settings_.default_expiry_ms,
                                                                   settings_.http_timeout_sec);
    }
    if (!settings_.file_name_generator) {
        settings_.file_name_generator = std::make_shared<Sha256FileNameGenerator>();
    }
}

BitmapCache::~BitmapCache() {
    close();
}

// ============================================================================
// Initialization
// ============================================================================

void BitmapCache::init_memory_cache() {
    if (!settings_.memory_cache_enabled) {
        return;
    }

    std::lock_guard<std::mutex> lock(memory_mutex_);
    if (memory_cache_) {
        try {
            memory_cache_->evict_all();
        } catch (const std::exception& e) {
            spdlog::warn("[BitmapCache] Failed to clear previous memory cache: {}", e.what());
        }
    }
    memory_cache_ = std::make_shared<MemoryCache>(
        settings_.memory_cache_size, [](const CacheKey&, const BitmapPtr& bitmap) -> size_t {
            return bitmap ? bitmap->byte_count() : 0;
        });
    spdlog::debug("[BitmapCache] Memory cache: {} bytes", settings_.memory_cache_size);
}

void BitmapCache::init_disk_cache() {
    if (!settings_.disk_cache_enabled) {
        return;
    }

    std::lock_guard<std::mutex> lock(disk_mutex_);
    if (!disk_cache_ || disk_cache_->is_closed()) {
        const std::string dir = settings_.effective_disk_path();
        std::error_code ec;
        fs::create_directories(dir, ec);

        uint64_t disk_cache_size = settings_.disk_cache_size;
        fs::space_info space = fs::space(dir, ec);
        if (!ec && space.available < disk_cache_size) {
            spdlog::info("[BitmapCache] Only {} bytes free in {}, shrinking disk cache",
                         space.available, dir);
            disk_cache_size = space.available;
        }

        std::string err;
        disk_cache_ = DiskLruCache::open(dir, DISK_CACHE_APP_VERSION, 1, disk_cache_size, &err);
        if (disk_cache_) {
            disk_cache_->set_file_name_generator(settings_.file_name_generator);
            spdlog::info("[BitmapCache] Disk cache ready at {} ({} bytes max)", dir,
                         disk_cache_size);
        } else {
            spdlog::error("[BitmapCache] Disk cache disabled, cannot open {}: {}", dir, err);
        }
    }
    disk_cache_ready_ = true;
    disk_ready_cv_.notify_all();
}

void BitmapCache::wait_for_disk_cache(std::unique_lock<std::mutex>& lock) {
    disk_ready_cv_.wait(lock, [this] { return disk_cache_ready_; });
}

// ============================================================================
// Lookups
// ============================================================================

std::shared_ptr<BitmapCache::MemoryCache> BitmapCache::memory_tier() const {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    return memory_cache_;
}

void BitmapCache::add_bitmap_to_memory_cache(const std::string& identifier,
                                             const DisplayConfig& config, const BitmapPtr& bitmap,
                                             int64_t expiry_timestamp) {
    if (!bitmap || !settings_.memory_cache_enabled) {
        return;
    }
    auto memory = memory_tier();
    if (memory) {
        memory->put(CacheKey(identifier, config.to_string()), bitmap, expiry_timestamp);
    }
}

BitmapPtr BitmapCache::get_bitmap_from_memory(const std::string& identifier,
                                              const DisplayConfig& config) {
    if (!settings_.memory_cache_enabled) {
        return nullptr;
    }
    auto memory = memory_tier();
    if (!memory) {
        return nullptr;
    }
    auto hit = memory->get(CacheKey(identifier, config.to_string()));
    return hit ? *hit : nullptr;
}

std::string BitmapCache::get_bitmap_file_from_disk(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(disk_mutex_);
    if (!disk_cache_) {
        return "";
    }
    return disk_cache_->get_cache_file(identifier, DISK_CACHE_INDEX);
}

BitmapPtr BitmapCache::get_bitmap_from_disk(const std::string& identifier,
                                            const DisplayConfig& config) {
    if (identifier.empty() || !settings_.disk_cache_enabled) {
        return nullptr;
    }

    std::unique_ptr<DiskLruCache::Snapshot> snapshot;
    std::string blob_path;
    {
        std::unique_lock<std::mutex> lock(disk_mutex_);
        wait_for_disk_cache(lock);
        if (!disk_cache_) {
            return nullptr;
        }
        snapshot = disk_cache_->get(identifier);
        if (!snapshot) {
            return nullptr;
        }
        blob_path = disk_cache_->get_cache_file(identifier, DISK_CACHE_INDEX);
    }

    try {
        auto decoded = decode_for(snapshot->input_stream(DISK_CACHE_INDEX), config);
        if (!decoded) {
            spdlog::warn("[BitmapCache] Disk record for {} does not decode, removing", identifier);
            remove_disk_record(identifier);
            return nullptr;
        }
        decoded = normalize_orientation(blob_path, std::move(decoded), config.auto_rotate);
        BitmapPtr bitmap(std::move(decoded));
        add_bitmap_to_memory_cache(identifier, config, bitmap, snapshot->expiry_timestamp());
        return bitmap;
    } catch (const std::exception& e) {
        spdlog::error("[BitmapCache] Failed to load {} from disk: {}", identifier, e.what());
        return nullptr;
    }
}

// ============================================================================
// Fetch
// ============================================================================

BitmapPtr BitmapCache::download_bitmap(const std::string& identifier,
                                       const DisplayConfig& config, const LoadContext& ctx) {
    if (identifier.empty()) {
        return nullptr;
    }

    std::unique_ptr<Bitmap> decoded;
    std::string blob_path;
    int64_t expiry_timestamp = NO_EXPIRY;

    try {
        // Fetch into a disk record
        if (settings_.disk_cache_enabled) {
            std::unique_ptr<DiskLruCache::Snapshot> snapshot;
            std::unique_ptr<std::ifstream> fetched;
            {
                std::unique_lock<std::mutex> lock(disk_mutex_);
                wait_for_disk_cache(lock);

                if (disk_cache_) {
                    snapshot = disk_cache_->get(identifier);
                    if (!snapshot) {
                        auto editor = disk_cache_->edit(identifier);
                        if (!editor) {
                            spdlog::debug("[BitmapCache] {} is already being written", identifier);
                            return nullptr;
                        }

                        std::ostream* out = editor->new_output_stream(DISK_CACHE_INDEX);
                        if (out) {
                            int64_t expiry =
                                settings_.downloader->download_to_stream(identifier, *out, ctx);
                            if (expiry < 0 || ctx.is_cancelled()) {
                                spdlog::debug("[BitmapCache] Fetch of {} failed or was cancelled",
                                              identifier);
                                editor->abort();
                                return nullptr;
                            }
                            editor->set_entry_expiry_timestamp(expiry);
                            expiry_timestamp = expiry;
                            fetched = editor->new_input_stream(DISK_CACHE_INDEX);
                            if (editor->commit()) {
                                snapshot = disk_cache_->get(identifier);
                                if (!snapshot) {
                                    spdlog::debug("[BitmapCache] {} was not kept on disk, "
                                                  "decoding the fetched bytes",
                                                  identifier);
                                }
                            } else {
                                spdlog::warn("[BitmapCache] Commit of {} failed", identifier);
                                fetched.reset();
                            }
                        } else {
                            editor->abort();
                        }
                    }
                    if (snapshot) {
                        blob_path = disk_cache_->get_cache_file(identifier, DISK_CACHE_INDEX);
                        expiry_timestamp = snapshot->expiry_timestamp();
                    }
                }
            }

            if (snapshot) {
                decoded = decode_for(snapshot->input_stream(DISK_CACHE_INDEX), config);
                if (!decoded) {
                    spdlog::warn("[BitmapCache] Fetched data for {} does not decode", identifier);
                    remove_disk_record(identifier);
                    blob_path.clear();
                }
            } else if (fetched) {
                decoded = decode_for(*fetched, config);
            }
        }

        // No usable disk record: fetch into memory without persisting
        if (!decoded) {
            std::ostringstream buffer;
            int64_t expiry = settings_.downloader->download_to_stream(identifier, buffer, ctx);
            if (expiry < 0 || ctx.is_cancelled()) {
                return nullptr;
            }
            expiry_timestamp = expiry;
            decoded = decode_for(buffer.str(), config);
            if (!decoded) {
                return nullptr;
            }
        }

        decoded = normalize_orientation(blob_path, std::move(decoded), config.auto_rotate);
        BitmapPtr bitmap(std::move(decoded));
        add_bitmap_to_memory_cache(identifier, config, bitmap, expiry_timestamp);
        return bitmap;
    } catch (const std::exception& e) {
        spdlog::error("[BitmapCache] Failed to load {}: {}", identifier, e.what());
        return nullptr;
    }
}

void BitmapCache::remove_disk_record(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(disk_mutex_);
    if (disk_cache_ && !disk_cache_->is_closed()) {
        disk_cache_->remove(identifier);
    }
}

// ============================================================================
// Maintenance
// ============================================================================

void BitmapCache::clear_cache() {
    clear_memory_cache();
    clear_disk_cache();
}

void BitmapCache::clear_memory_cache() {
    auto memory = memory_tier();
    if (memory) {
        memory->evict_all();
    }
}

void BitmapCache::clear_disk_cache() {
    {
        std::lock_guard<std::mutex> lock(disk_mutex_);
        if (disk_cache_ && !disk_cache_->is_closed()) {
            if (!disk_cache_->delete_cache()) {
                spdlog::error("[BitmapCache] Failed to delete disk cache in {}",
                              disk_cache_->directory());
            }
            disk_cache_.reset();
            disk_cache_ready_ = false;
        }
    }
    init_disk_cache();
}

void BitmapCache::clear_cache(const std::string& identifier) {
    clear_memory_cache(identifier);
    clear_disk_cache(identifier);
}

void BitmapCache::clear_memory_cache(const std::string& identifier) {
    auto memory = memory_tier();
    if (memory) {
        size_t removed = memory->remove_all(identifier);
        spdlog::trace("[BitmapCache] Removed {} memory entries for {}", removed, identifier);
    }
}

void BitmapCache::clear_disk_cache(const std::string& identifier) {
    remove_disk_record(identifier);
}

void BitmapCache::flush() {
    std::lock_guard<std::mutex> lock(disk_mutex_);
    if (disk_cache_ && !disk_cache_->flush()) {
        spdlog::warn("[BitmapCache] Disk cache flush failed");
    }
}

void BitmapCache::close() {
    std::lock_guard<std::mutex> lock(disk_mutex_);
    if (disk_cache_ && !disk_cache_->is_closed()) {
        disk_cache_->close();
        disk_cache_.reset();
        spdlog::debug("[BitmapCache] Disk cache closed");
    }
}

// ============================================================================
// Tuning
// ============================================================================

void BitmapCache::set_memory_cache_size(size_t max_size) {
    auto memory = memory_tier();
    if (memory) {
        memory->set_max_size(max_size);
    }
}

void BitmapCache::set_disk_cache_size(uint64_t max_size) {
    std::lock_guard<std::mutex> lock(disk_mutex_);
    if (disk_cache_) {
        disk_cache_->set_max_size(max_size);
    }
}

void BitmapCache::set_disk_cache_file_name_generator(
    std::shared_ptr<const DiskCacheFileNameGenerator> generator) {
    if (!generator) {
        return;
    }
    std::lock_guard<std::mutex> lock(disk_mutex_);
    settings_.file_name_generator = generator;
    if (disk_cache_) {
        disk_cache_->set_file_name_generator(std::move(generator));
    }
}

bool BitmapCache::is_disk_cache_ready() const {
    std::lock_guard<std::mutex> lock(disk_mutex_);
    return disk_cache_ready_;
}

bool BitmapCache::has_disk_cache() const {
    std::lock_guard<std::mutex> lock(disk_mutex_);
    return disk_cache_ && !disk_cache_->is_closed();
}

size_t BitmapCache::memory_cache_count() const {
    auto memory = memory_tier();
    return memory ? memory->count() : 0;
}

size_t BitmapCache::memory_cache_bytes() const {
    auto memory = memory_tier();
    return memory ? memory->size() : 0;
}

} // namespace pixcache
