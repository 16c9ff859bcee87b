// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "disk_lru_cache.h"

#include "../test_helpers/cache_test_utils.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace pixcache;
using pixcache::test::TempDir;

namespace fs = std::filesystem;

namespace {

constexpr int APP_VERSION = 1;
constexpr uint64_t MAX_SIZE = 1024 * 1024;

} // namespace

class DiskLruCacheFixture {
  protected:
    TempDir dir_{"pixcache_disk"};
    std::unique_ptr<DiskLruCache> cache_;

    DiskLruCacheFixture() {
        reopen();
    }

    void reopen(int value_count = 1, uint64_t max_size = MAX_SIZE) {
        cache_.reset();
        cache_ = DiskLruCache::open(dir_.str(), APP_VERSION, value_count, max_size);
        REQUIRE(cache_ != nullptr);
        cache_->set_file_name_generator(std::make_shared<HashFileNameGenerator>());
    }

    bool put(const std::string& key, const std::string& value, int64_t expiry = NO_EXPIRY) {
        auto editor = cache_->edit(key);
        if (!editor || !editor->set(0, value)) {
            return false;
        }
        editor->set_entry_expiry_timestamp(expiry);
        return editor->commit();
    }

    std::string journal() const {
        return test::read_file(dir_.path() / DiskLruCache::JOURNAL_FILE);
    }

    std::string name_of(const std::string& key) const {
        return HashFileNameGenerator().generate(key);
    }
};

// ============================================================================
// Open
// ============================================================================

TEST_CASE("DiskLruCache: open rejects bad arguments", "[cache][disk]") {
    TempDir dir("pixcache_disk_args");
    std::string err;

    REQUIRE(DiskLruCache::open(dir.str(), APP_VERSION, 0, MAX_SIZE, &err) == nullptr);
    REQUIRE_FALSE(err.empty());

    err.clear();
    REQUIRE(DiskLruCache::open(dir.str(), APP_VERSION, 1, 0, &err) == nullptr);
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("DiskLruCache: open fails when the directory is a file", "[cache][disk]") {
    TempDir dir("pixcache_disk_file");
    fs::path file = dir.path() / "plain_file";
    test::write_file(file, "not a directory");

    std::string err;
    auto cache = DiskLruCache::open((file / "cache").string(), APP_VERSION, 1, MAX_SIZE, &err);
    REQUIRE(cache == nullptr);
    REQUIRE_FALSE(err.empty());
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: new cache writes a journal header",
                 "[cache][disk][journal]") {
    std::string expected = std::string(DiskLruCache::MAGIC) + "\n1\n1\n1\n\n";
    REQUIRE(journal() == expected);
    REQUIRE(cache_->size() == 0);
    REQUIRE(cache_->entry_count() == 0);
}

// ============================================================================
// Edit / commit / get
// ============================================================================

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: committed value is readable",
                 "[cache][disk]") {
    REQUIRE(put("http://example.com/a.png", "hello world"));

    auto snapshot = cache_->get("http://example.com/a.png");
    REQUIRE(snapshot != nullptr);
    REQUIRE(snapshot->get_string(0) == "hello world");
    REQUIRE(snapshot->length(0) == 11);
    REQUIRE(snapshot->key() == "http://example.com/a.png");
    REQUIRE(snapshot->expiry_timestamp() == NO_EXPIRY);
    REQUIRE(cache_->size() == 11);

    std::string path = cache_->get_cache_file("http://example.com/a.png", 0);
    REQUIRE_FALSE(path.empty());
    REQUIRE(test::read_file(path) == "hello world");
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: missing keys", "[cache][disk]") {
    REQUIRE(cache_->get("nothing") == nullptr);
    REQUIRE(cache_->get_cache_file("nothing", 0).empty());
    REQUIRE(cache_->get_expiry_timestamp("nothing") == 0);
    REQUIRE_FALSE(cache_->remove("nothing"));
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: uncommitted data is invisible",
                 "[cache][disk]") {
    auto editor = cache_->edit("k");
    REQUIRE(editor != nullptr);
    REQUIRE(editor->set(0, "partial"));

    REQUIRE(cache_->get("k") == nullptr);
    REQUIRE(cache_->get_cache_file("k", 0).empty());
    REQUIRE(fs::exists(dir_.path() / (name_of("k") + ".0.tmp")));

    REQUIRE(editor->commit());
    REQUIRE_FALSE(fs::exists(dir_.path() / (name_of("k") + ".0.tmp")));
    REQUIRE(fs::exists(dir_.path() / (name_of("k") + ".0")));
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: abort discards a new record",
                 "[cache][disk]") {
    auto editor = cache_->edit("k");
    REQUIRE(editor->set(0, "data"));
    editor->abort();

    REQUIRE(cache_->get("k") == nullptr);
    REQUIRE(cache_->entry_count() == 0);
    REQUIRE_FALSE(fs::exists(dir_.path() / (name_of("k") + ".0.tmp")));
    REQUIRE(journal().find("REMOVE " + name_of("k")) != std::string::npos);
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: abort keeps the previous value",
                 "[cache][disk]") {
    REQUIRE(put("k", "first"));

    auto editor = cache_->edit("k");
    REQUIRE(editor->set(0, "second"));
    editor->abort();

    auto snapshot = cache_->get("k");
    REQUIRE(snapshot != nullptr);
    REQUIRE(snapshot->get_string(0) == "first");
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: editor destroyed without commit aborts",
                 "[cache][disk]") {
    {
        auto editor = cache_->edit("k");
        REQUIRE(editor->set(0, "lost"));
    }
    REQUIRE(cache_->get("k") == nullptr);
    REQUIRE(cache_->edit("k") != nullptr);
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: commit without writing a new record fails",
                 "[cache][disk]") {
    auto editor = cache_->edit("k");
    REQUIRE_FALSE(editor->commit());
    REQUIRE(cache_->get("k") == nullptr);
    REQUIRE(cache_->entry_count() == 0);
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: second edit of a record is refused",
                 "[cache][disk]") {
    auto first = cache_->edit("k");
    REQUIRE(first != nullptr);
    REQUIRE(cache_->edit("k") == nullptr);
    REQUIRE(cache_->edit("other") != nullptr);

    first->abort();
    REQUIRE(cache_->edit("k") != nullptr);
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: replacing a value updates the size",
                 "[cache][disk]") {
    REQUIRE(put("k", "12345"));
    REQUIRE(put("k", "123"));

    REQUIRE(cache_->size() == 3);
    REQUIRE(cache_->get("k")->get_string(0) == "123");
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: snapshot outlives removal",
                 "[cache][disk]") {
    REQUIRE(put("k", "still here"));
    auto snapshot = cache_->get("k");
    REQUIRE(cache_->remove("k"));

    REQUIRE(cache_->get("k") == nullptr);
    REQUIRE(snapshot->get_string(0) == "still here");
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: multiple slots per record",
                 "[cache][disk]") {
    reopen(2);
    auto editor = cache_->edit("k");
    REQUIRE(editor->set(0, "zero"));

    SECTION("all slots written") {
        REQUIRE(editor->set(1, "one!"));
        REQUIRE(editor->commit());
        auto snapshot = cache_->get("k");
        REQUIRE(snapshot->get_string(0) == "zero");
        REQUIRE(snapshot->get_string(1) == "one!");
        REQUIRE(cache_->size() == 8);
    }

    SECTION("missing slot aborts a new record") {
        REQUIRE_FALSE(editor->commit());
        REQUIRE(cache_->get("k") == nullptr);
    }
}

// ============================================================================
// Expiry
// ============================================================================

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: expired record is removed on access",
                 "[cache][disk][expiry]") {
    const int64_t past = current_time_millis() - 1000;
    REQUIRE(put("k", "stale", past));
    REQUIRE(cache_->get_expiry_timestamp("k") == past);

    REQUIRE(cache_->get("k") == nullptr);
    REQUIRE(cache_->entry_count() == 0);
    REQUIRE(cache_->size() == 0);
    REQUIRE_FALSE(fs::exists(dir_.path() / (name_of("k") + ".0")));
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: expiry survives reopen",
                 "[cache][disk][expiry]") {
    const int64_t future = current_time_millis() + 3600 * 1000;
    REQUIRE(put("k", "fresh", future));
    REQUIRE(journal().find("t_" + std::to_string(future)) != std::string::npos);

    reopen();
    REQUIRE(cache_->get_expiry_timestamp("k") == future);
    auto snapshot = cache_->get("k");
    REQUIRE(snapshot != nullptr);
    REQUIRE(snapshot->expiry_timestamp() == future);
}

// ============================================================================
// Capacity
// ============================================================================

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: least recently used records are evicted",
                 "[cache][disk][eviction]") {
    reopen(1, 10);
    REQUIRE(put("a", "aaaa"));
    REQUIRE(put("b", "bbbb"));

    // Touch a so b becomes the oldest
    REQUIRE(cache_->get("a") != nullptr);
    REQUIRE(put("c", "cccc"));

    REQUIRE(cache_->size() == 8);
    REQUIRE(cache_->get("a") != nullptr);
    REQUIRE(cache_->get("b") == nullptr);
    REQUIRE(cache_->get("c") != nullptr);
    REQUIRE_FALSE(fs::exists(dir_.path() / (name_of("b") + ".0")));
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: shrinking max_size trims",
                 "[cache][disk][eviction]") {
    REQUIRE(put("a", "aaaa"));
    REQUIRE(put("b", "bbbb"));
    REQUIRE(put("c", "cccc"));

    cache_->set_max_size(5);
    REQUIRE(cache_->max_size() == 5);
    REQUIRE(cache_->size() == 4);
    REQUIRE(cache_->get("c") != nullptr);
    REQUIRE(cache_->get("a") == nullptr);
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: records being edited are not evicted",
                 "[cache][disk][eviction]") {
    reopen(1, 10);
    REQUIRE(put("a", "aaaa"));
    auto editor = cache_->edit("a");
    REQUIRE(editor != nullptr);

    REQUIRE(put("b", "bbbbbbbb"));
    // a is locked by its editor, so b itself is the only candidate
    REQUIRE(cache_->get_cache_file("a", 0) != "");
    editor->abort();
    REQUIRE(cache_->get("a") != nullptr);
}

// ============================================================================
// Persistence and recovery
// ============================================================================

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: records survive reopen",
                 "[cache][disk][journal]") {
    REQUIRE(put("a", "alpha"));
    REQUIRE(put("b", "beta"));
    REQUIRE(cache_->remove("a"));

    reopen();
    REQUIRE(cache_->entry_count() == 1);
    REQUIRE(cache_->size() == 4);
    REQUIRE(cache_->get("a") == nullptr);
    REQUIRE(cache_->get("b")->get_string(0) == "beta");
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: interrupted edit is dropped on reopen",
                 "[cache][disk][journal]") {
    REQUIRE(put("done", "complete"));
    cache_.reset();

    // Simulate a crash mid-write: DIRTY without CLEAN plus a leftover tmp file
    const std::string name = name_of("crashed");
    {
        std::ofstream out(dir_.path() / DiskLruCache::JOURNAL_FILE, std::ios::app);
        out << "DIRTY " << name << "\n";
    }
    test::write_file(dir_.path() / (name + ".0.tmp"), "half");

    reopen();
    REQUIRE(cache_->get("crashed") == nullptr);
    REQUIRE_FALSE(fs::exists(dir_.path() / (name + ".0.tmp")));
    REQUIRE(cache_->get("done")->get_string(0) == "complete");
    REQUIRE(cache_->edit("crashed") != nullptr);
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: truncated last journal line is ignored",
                 "[cache][disk][journal]") {
    REQUIRE(put("a", "alpha"));
    cache_.reset();
    {
        std::ofstream out(dir_.path() / DiskLruCache::JOURNAL_FILE, std::ios::app);
        out << "CLEAN " << name_of("b") << " t_1"; // no newline
    }

    reopen();
    REQUIRE(cache_->entry_count() == 1);
    REQUIRE(cache_->get("a") != nullptr);
    // Rebuilt journal ends with a complete line
    std::string j = journal();
    REQUIRE(j.back() == '\n');
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: corrupt journal wipes the cache",
                 "[cache][disk][journal]") {
    REQUIRE(put("a", "alpha"));
    std::string blob = cache_->get_cache_file("a", 0);
    cache_.reset();

    SECTION("garbage line") {
        std::ofstream out(dir_.path() / DiskLruCache::JOURNAL_FILE, std::ios::app);
        out << "BOGUS line here\n";
    }

    SECTION("wrong header") {
        test::write_file(dir_.path() / DiskLruCache::JOURNAL_FILE, "not a journal\n");
    }

    reopen();
    REQUIRE(cache_->entry_count() == 0);
    REQUIRE(cache_->get("a") == nullptr);
    REQUIRE_FALSE(fs::exists(blob));
    REQUIRE(journal() == std::string(DiskLruCache::MAGIC) + "\n1\n1\n1\n\n");
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: app version mismatch discards records",
                 "[cache][disk][journal]") {
    REQUIRE(put("a", "alpha"));
    cache_.reset();

    auto cache = DiskLruCache::open(dir_.str(), APP_VERSION + 1, 1, MAX_SIZE);
    REQUIRE(cache != nullptr);
    cache->set_file_name_generator(std::make_shared<HashFileNameGenerator>());
    REQUIRE(cache->get("a") == nullptr);
    REQUIRE(cache->entry_count() == 0);
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: backup journal is restored",
                 "[cache][disk][journal]") {
    REQUIRE(put("a", "alpha"));
    cache_.reset();
    fs::rename(dir_.path() / DiskLruCache::JOURNAL_FILE,
               dir_.path() / DiskLruCache::JOURNAL_FILE_BACKUP);

    reopen();
    REQUIRE(cache_->get("a")->get_string(0) == "alpha");
    REQUIRE_FALSE(fs::exists(dir_.path() / DiskLruCache::JOURNAL_FILE_BACKUP));
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: journal is compacted",
                 "[cache][disk][journal]") {
    REQUIRE(put("a", "alpha"));
    for (int i = 0; i < DiskLruCache::REDUNDANT_OP_COMPACT_THRESHOLD + 10; ++i) {
        REQUIRE(cache_->get("a") != nullptr);
    }

    // Far fewer lines than the READ operations performed
    std::string j = journal();
    size_t lines = static_cast<size_t>(std::count(j.begin(), j.end(), '\n'));
    REQUIRE(lines < 100);

    reopen();
    REQUIRE(cache_->get("a")->get_string(0) == "alpha");
}

// ============================================================================
// Close / delete
// ============================================================================

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: closed cache refuses operations",
                 "[cache][disk]") {
    REQUIRE(put("a", "alpha"));
    auto editor = cache_->edit("b");
    REQUIRE(editor->set(0, "beta"));

    cache_->close();
    REQUIRE(cache_->is_closed());
    REQUIRE(cache_->get("a") == nullptr);
    REQUIRE(cache_->edit("c") == nullptr);
    REQUIRE_FALSE(cache_->flush());

    // The detached editor can no longer publish
    REQUIRE_FALSE(editor->commit());
    REQUIRE_FALSE(fs::exists(dir_.path() / (name_of("b") + ".0.tmp")));
}

TEST_CASE_METHOD(DiskLruCacheFixture, "DiskLruCache: delete_cache removes the directory",
                 "[cache][disk]") {
    REQUIRE(put("a", "alpha"));
    REQUIRE(cache_->delete_cache());
    REQUIRE(cache_->is_closed());
    REQUIRE_FALSE(fs::exists(dir_.path()));
}
