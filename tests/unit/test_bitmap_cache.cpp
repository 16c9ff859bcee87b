// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bitmap_cache.h"
#include "exif_orientation.h"

#include "../test_helpers/bitmap_cache_test_access.h"
#include "../test_helpers/cache_test_utils.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

using namespace pixcache;
using pixcache::test::FakeDownloader;
using pixcache::test::TempDir;

namespace fs = std::filesystem;

namespace {

const std::string IMAGE_URI = "http://example.com/image.ppm";

DisplayConfig full_size() {
    return DisplayConfig{};
}

DisplayConfig thumbnail(int w, int h) {
    DisplayConfig config;
    config.max_size = {w, h};
    return config;
}

} // namespace

class BitmapCacheFixture {
  protected:
    TempDir dir_{"pixcache_bitmap_cache"};
    std::shared_ptr<FakeDownloader> downloader_ = std::make_shared<FakeDownloader>();

    CacheSettings make_settings() {
        CacheSettings settings;
        settings.disk_cache_path = (dir_.path() / "cache").string();
        settings.memory_cache_size = 4 * 1024 * 1024;
        settings.disk_cache_size = 4 * 1024 * 1024;
        settings.downloader = downloader_;
        settings.file_name_generator = std::make_shared<HashFileNameGenerator>();
        return settings;
    }

    std::unique_ptr<BitmapCache> make_cache(bool init_disk = true) {
        return make_cache(make_settings(), init_disk);
    }

    std::unique_ptr<BitmapCache> make_cache(CacheSettings settings, bool init_disk = true) {
        auto cache = std::make_unique<BitmapCache>(std::move(settings));
        cache->init_memory_cache();
        if (init_disk) {
            cache->init_disk_cache();
        }
        return cache;
    }
};

// ============================================================================
// Tier lookups
// ============================================================================

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: download fills both tiers",
                 "[cache][bitmap]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(64, 32));
    auto cache = make_cache();

    REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, full_size()) == nullptr);
    REQUIRE(cache->get_bitmap_from_disk(IMAGE_URI, full_size()) == nullptr);

    BitmapPtr bitmap = cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{});
    REQUIRE(bitmap != nullptr);
    REQUIRE(bitmap->width() == 64);
    REQUIRE(bitmap->height() == 32);
    REQUIRE(downloader_->calls() == 1);

    SECTION("memory hit returns the same bitmap") {
        REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, full_size()) == bitmap);
        REQUIRE(cache->memory_cache_count() == 1);
        REQUIRE(cache->memory_cache_bytes() == bitmap->byte_count());
    }

    SECTION("blob is on disk") {
        std::string blob = cache->get_bitmap_file_from_disk(IMAGE_URI);
        REQUIRE_FALSE(blob.empty());
        REQUIRE(test::read_file(blob) == test::make_ppm(64, 32));
    }

    SECTION("other variants decode from disk without fetching") {
        REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, thumbnail(16, 16)) == nullptr);
        BitmapPtr thumb = cache->get_bitmap_from_disk(IMAGE_URI, thumbnail(16, 16));
        REQUIRE(thumb != nullptr);
        REQUIRE(thumb->width() == 32);
        REQUIRE(thumb->height() == 16);
        REQUIRE(downloader_->calls() == 1);
        REQUIRE(cache->memory_cache_count() == 2);
        REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, thumbnail(16, 16)) == thumb);
    }

    SECTION("second download reuses the disk record") {
        cache->clear_memory_cache();
        REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);
        REQUIRE(downloader_->calls() == 1);
    }
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: disk record survives a new cache instance",
                 "[cache][bitmap]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    {
        auto cache = make_cache();
        REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);
    }

    auto cache = make_cache();
    BitmapPtr bitmap = cache->get_bitmap_from_disk(IMAGE_URI, full_size());
    REQUIRE(bitmap != nullptr);
    REQUIRE(bitmap->width() == 8);
    REQUIRE(downloader_->calls() == 1);
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: empty identifier is a miss",
                 "[cache][bitmap]") {
    auto cache = make_cache();
    REQUIRE(cache->get_bitmap_from_disk("", full_size()) == nullptr);
    REQUIRE(cache->download_bitmap("", full_size(), LoadContext{}) == nullptr);
    REQUIRE(downloader_->calls() == 0);
}

// ============================================================================
// Fetch failures
// ============================================================================

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: failed fetch leaves no record",
                 "[cache][bitmap][errors]") {
    auto cache = make_cache();

    REQUIRE(cache->download_bitmap("http://example.com/404.png", full_size(), LoadContext{}) ==
            nullptr);
    // No retry through the memory path
    REQUIRE(downloader_->calls() == 1);
    REQUIRE(cache->get_bitmap_file_from_disk("http://example.com/404.png").empty());
    REQUIRE(BitmapCacheTestAccess::disk(*cache)->entry_count() == 0);
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: cancelled fetch is discarded",
                 "[cache][bitmap][errors]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    auto cache = make_cache();

    LoadContext ctx;
    ctx.cancel();
    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), ctx) == nullptr);
    REQUIRE(cache->get_bitmap_file_from_disk(IMAGE_URI).empty());
    REQUIRE(cache->memory_cache_count() == 0);
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: undecodable content is not kept",
                 "[cache][bitmap][errors]") {
    downloader_->serve(IMAGE_URI, "this is not an image");
    auto cache = make_cache();

    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) == nullptr);
    // Disk attempt, then the in-memory fallback
    REQUIRE(downloader_->calls() == 2);
    REQUIRE(cache->get_bitmap_file_from_disk(IMAGE_URI).empty());
    REQUIRE(cache->memory_cache_count() == 0);
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: corrupt disk record is removed on read",
                 "[cache][bitmap][errors]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    auto cache = make_cache();
    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);
    cache->clear_memory_cache();

    std::string blob = cache->get_bitmap_file_from_disk(IMAGE_URI);
    test::write_file(blob, "garbage");

    REQUIRE(cache->get_bitmap_from_disk(IMAGE_URI, full_size()) == nullptr);
    REQUIRE(cache->get_bitmap_file_from_disk(IMAGE_URI).empty());
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: busy record returns nullptr without fetching",
                 "[cache][bitmap][concurrency]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    auto cache = make_cache();

    auto editor = BitmapCacheTestAccess::disk(*cache)->edit(IMAGE_URI);
    REQUIRE(editor != nullptr);

    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) == nullptr);
    REQUIRE(downloader_->calls() == 0);

    editor->abort();
    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: concurrent requests fetch once",
                 "[cache][bitmap][concurrency]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(16, 16));
    auto cache = make_cache();
    downloader_->close_gate();

    BitmapPtr first;
    BitmapPtr second;
    std::thread a([&] { first = cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}); });
    REQUIRE(downloader_->wait_for_calls(1));

    std::thread b([&] { second = cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    downloader_->open_gate();
    a.join();
    b.join();

    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);
    REQUIRE(downloader_->calls() == 1);
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: disk lookups wait for init_disk_cache",
                 "[cache][bitmap][concurrency]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    {
        auto seed = make_cache();
        REQUIRE(seed->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);
    }

    auto cache = make_cache(false);
    REQUIRE_FALSE(cache->is_disk_cache_ready());

    std::atomic<bool> finished{false};
    BitmapPtr result;
    std::thread reader([&] {
        result = cache->get_bitmap_from_disk(IMAGE_URI, full_size());
        finished = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(finished.load());

    cache->init_disk_cache();
    reader.join();
    REQUIRE(finished.load());
    REQUIRE(result != nullptr);
    REQUIRE(cache->is_disk_cache_ready());
}

// ============================================================================
// Degraded modes
// ============================================================================

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: unusable disk directory falls back to memory",
                 "[cache][bitmap][errors]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    fs::path blocker = dir_.path() / "blocker";
    test::write_file(blocker, "a file where a directory should be");

    CacheSettings settings = make_settings();
    settings.disk_cache_path = (blocker / "cache").string();
    auto cache = make_cache(settings);

    REQUIRE(cache->is_disk_cache_ready());
    REQUIRE_FALSE(cache->has_disk_cache());

    BitmapPtr bitmap = cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{});
    REQUIRE(bitmap != nullptr);
    REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, full_size()) == bitmap);
    REQUIRE(cache->get_bitmap_from_disk(IMAGE_URI, full_size()) == nullptr);
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: tiers can be disabled",
                 "[cache][bitmap][config]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));

    SECTION("memory disabled") {
        CacheSettings settings = make_settings();
        settings.memory_cache_enabled = false;
        auto cache = make_cache(settings);

        REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);
        REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, full_size()) == nullptr);
        REQUIRE(cache->get_bitmap_from_disk(IMAGE_URI, full_size()) != nullptr);
    }

    SECTION("disk disabled") {
        CacheSettings settings = make_settings();
        settings.disk_cache_enabled = false;
        auto cache = make_cache(settings);

        REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);
        REQUIRE_FALSE(cache->has_disk_cache());
        REQUIRE(cache->get_bitmap_from_disk(IMAGE_URI, full_size()) == nullptr);
        REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, full_size()) != nullptr);
        REQUIRE_FALSE(fs::exists(dir_.path() / "cache"));
    }
}

// ============================================================================
// Orientation
// ============================================================================

TEST_CASE_METHOD(BitmapCacheFixture,
                 "BitmapCache: EXIF orientation is applied from the disk blob",
                 "[cache][bitmap][orientation]") {
    const std::string photo = "http://example.com/photo.jpg";
    downloader_->serve(photo, test::make_oriented_jpeg(exif_orientation::ROTATE_90));
    auto cache = make_cache();

    DisplayConfig rotated;
    rotated.auto_rotate = true;

    BitmapPtr bitmap = cache->download_bitmap(photo, rotated, LoadContext{});
    REQUIRE(bitmap != nullptr);
    REQUIRE(bitmap->width() == 8);
    REQUIRE(bitmap->height() == 16);

    SECTION("rotated bitmap is stored under the rotated variant") {
        REQUIRE(cache->get_bitmap_from_memory(photo, rotated) == bitmap);
        REQUIRE(cache->get_bitmap_from_memory(photo, full_size()) == nullptr);
    }

    SECTION("auto_rotate off keeps the stored orientation") {
        BitmapPtr upright = cache->get_bitmap_from_disk(photo, full_size());
        REQUIRE(upright != nullptr);
        REQUIRE(upright->width() == 16);
        REQUIRE(upright->height() == 8);
    }

    SECTION("disk lookup rotates too") {
        cache->clear_memory_cache();
        BitmapPtr from_disk = cache->get_bitmap_from_disk(photo, rotated);
        REQUIRE(from_disk != nullptr);
        REQUIRE(from_disk->width() == 8);
        REQUIRE(from_disk->height() == 16);
        REQUIRE(downloader_->calls() == 1);
    }
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: memory-only fetch is not rotated",
                 "[cache][bitmap][orientation]") {
    const std::string photo = "http://example.com/photo.jpg";
    downloader_->serve(photo, test::make_oriented_jpeg(exif_orientation::ROTATE_90));
    CacheSettings settings = make_settings();
    settings.disk_cache_enabled = false;
    auto cache = make_cache(settings);

    DisplayConfig rotated;
    rotated.auto_rotate = true;

    BitmapPtr bitmap = cache->download_bitmap(photo, rotated, LoadContext{});
    REQUIRE(bitmap != nullptr);
    REQUIRE(bitmap->width() == 16);
    REQUIRE(bitmap->height() == 8);
}

// ============================================================================
// Clearing
// ============================================================================

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: clear_cache(identifier) is scoped",
                 "[cache][bitmap][clear]") {
    const std::string other = "http://example.com/other.ppm";
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    downloader_->serve(other, test::make_ppm(4, 4));
    auto cache = make_cache();

    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);
    REQUIRE(cache->get_bitmap_from_disk(IMAGE_URI, thumbnail(4, 4)) != nullptr);
    REQUIRE(cache->download_bitmap(other, full_size(), LoadContext{}) != nullptr);
    REQUIRE(cache->memory_cache_count() == 3);

    SECTION("both tiers") {
        cache->clear_cache(IMAGE_URI);
        REQUIRE(cache->memory_cache_count() == 1);
        REQUIRE(cache->get_bitmap_file_from_disk(IMAGE_URI).empty());
        REQUIRE(cache->get_bitmap_from_memory(other, full_size()) != nullptr);
        REQUIRE_FALSE(cache->get_bitmap_file_from_disk(other).empty());
    }

    SECTION("memory only") {
        cache->clear_memory_cache(IMAGE_URI);
        REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, full_size()) == nullptr);
        REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, thumbnail(4, 4)) == nullptr);
        REQUIRE_FALSE(cache->get_bitmap_file_from_disk(IMAGE_URI).empty());
    }

    SECTION("disk only") {
        cache->clear_disk_cache(IMAGE_URI);
        REQUIRE(cache->get_bitmap_file_from_disk(IMAGE_URI).empty());
        REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, full_size()) != nullptr);
    }
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: clear_disk_cache recreates the store",
                 "[cache][bitmap][clear]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    auto cache = make_cache();
    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);

    cache->clear_disk_cache();
    REQUIRE(cache->is_disk_cache_ready());
    REQUIRE(cache->has_disk_cache());
    REQUIRE(cache->get_bitmap_file_from_disk(IMAGE_URI).empty());
    REQUIRE(fs::exists(dir_.path() / "cache" / DiskLruCache::JOURNAL_FILE));

    // Memory tier is untouched
    REQUIRE(cache->get_bitmap_from_memory(IMAGE_URI, full_size()) != nullptr);

    cache->clear_cache();
    REQUIRE(cache->memory_cache_count() == 0);
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: close makes disk lookups miss",
                 "[cache][bitmap]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8));
    auto cache = make_cache();
    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);

    cache->flush();
    cache->close();
    REQUIRE_FALSE(cache->has_disk_cache());
    REQUIRE(cache->get_bitmap_from_disk(IMAGE_URI, full_size()) == nullptr);

    cache->init_disk_cache();
    REQUIRE(cache->get_bitmap_from_disk(IMAGE_URI, full_size()) != nullptr);
}

// ============================================================================
// Tuning
// ============================================================================

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: memory budget is in pixel bytes",
                 "[cache][bitmap][eviction]") {
    downloader_->serve("a", test::make_ppm(16, 16));
    downloader_->serve("b", test::make_ppm(16, 16));
    auto cache = make_cache();

    // One 16x16 ARGB8888 bitmap is 1024 bytes
    cache->set_memory_cache_size(1500);
    REQUIRE(cache->download_bitmap("a", full_size(), LoadContext{}) != nullptr);
    REQUIRE(cache->download_bitmap("b", full_size(), LoadContext{}) != nullptr);

    REQUIRE(cache->memory_cache_count() == 1);
    REQUIRE(cache->memory_cache_bytes() == 1024);
    REQUIRE(cache->get_bitmap_from_memory("b", full_size()) != nullptr);
}

TEST_CASE_METHOD(BitmapCacheFixture, "BitmapCache: fetch expiry is stored with the disk record",
                 "[cache][bitmap][expiry]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8), current_time_millis() + 3600 * 1000);
    auto cache = make_cache();
    REQUIRE(cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{}) != nullptr);

    std::string blob = cache->get_bitmap_file_from_disk(IMAGE_URI);
    REQUIRE(BitmapCacheTestAccess::disk(*cache)->get_expiry_timestamp(IMAGE_URI) >
            current_time_millis());
    REQUIRE_FALSE(blob.empty());
}

TEST_CASE_METHOD(BitmapCacheFixture,
                 "BitmapCache: already expired fetch is decoded without refetching",
                 "[cache][bitmap][expiry]") {
    downloader_->serve(IMAGE_URI, test::make_ppm(8, 8), current_time_millis() - 1000);
    auto cache = make_cache();

    BitmapPtr bitmap = cache->download_bitmap(IMAGE_URI, full_size(), LoadContext{});
    REQUIRE(bitmap != nullptr);
    REQUIRE(bitmap->width() == 8);
    REQUIRE(downloader_->calls() == 1);
    REQUIRE(cache->get_bitmap_file_from_disk(IMAGE_URI).empty());
}
