// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cache_clock.h"
#include "file_name_generator.h"

#include <cstdint>
#include <fstream>
#include <istream>
#include <list>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file disk_lru_cache.h
 * @brief Journaled, size-bounded key -> file store
 *
 * Each record has `value_count` slots stored as `{dir}/{name}.{slot}`, where
 * name comes from the DiskCacheFileNameGenerator. Writes go to
 * `{name}.{slot}.tmp` and are published by renaming on commit, so a crash
 * never exposes a half-written value.
 *
 * ## Journal
 * ```
 * libcore.io.DiskLruCache
 * 1
 * <app_version>
 * <value_count>
 *
 * DIRTY 3400330d1dfc7f3f7f4b8d4d803dfcf6
 * CLEAN 3400330d1dfc7f3f7f4b8d4d803dfcf6 t_1760000000000 832
 * READ 3400330d1dfc7f3f7f4b8d4d803dfcf6
 * REMOVE 3400330d1dfc7f3f7f4b8d4d803dfcf6
 * ```
 * DIRTY marks an edit in progress; it must be followed by CLEAN (published,
 * with expiry timestamp and slot lengths) or REMOVE. Entries still DIRTY when
 * the journal is replayed are deleted. The journal is rewritten once redundant
 * lines pile up.
 *
 * Thread-safe: all methods take an internal mutex. An edit in progress locks
 * its record: a second edit() for the same key returns nullptr immediately.
 */

namespace pixcache {

class DiskLruCache {
  public:
    static constexpr const char* JOURNAL_FILE = "journal";
    static constexpr const char* JOURNAL_FILE_TEMP = "journal.tmp";
    static constexpr const char* JOURNAL_FILE_BACKUP = "journal.bkp";
    static constexpr const char* MAGIC = "libcore.io.DiskLruCache";
    static constexpr const char* VERSION_1 = "1";

    /// Rewrite the journal once this many redundant lines have accumulated
    static constexpr int REDUNDANT_OP_COMPACT_THRESHOLD = 2000;

    class Editor;

    /**
     * @brief Read handle on a published record
     *
     * Streams are opened when the snapshot is taken, so the data stays readable
     * even if the record is replaced or evicted meanwhile. Destroying the
     * snapshot closes them.
     */
    class Snapshot {
      public:
        Snapshot(std::string key, std::vector<std::unique_ptr<std::ifstream>> streams,
                 std::vector<uint64_t> lengths, int64_t expiry_timestamp);

        Snapshot(const Snapshot&) = delete;
        Snapshot& operator=(const Snapshot&) = delete;

        /// Seekable stream positioned at the start of a slot
        std::istream& input_stream(int index) {
            return *streams_.at(static_cast<size_t>(index));
        }

        /// Read a whole slot into a string
        std::string get_string(int index);

        uint64_t length(int index) const {
            return lengths_.at(static_cast<size_t>(index));
        }

        int64_t expiry_timestamp() const {
            return expiry_timestamp_;
        }

        const std::string& key() const {
            return key_;
        }

      private:
        std::string key_;
        std::vector<std::unique_ptr<std::ifstream>> streams_;
        std::vector<uint64_t> lengths_;
        int64_t expiry_timestamp_;
    };

    /**
     * @brief Write handle on a record
     *
     * Exactly one of commit() or abort() should be called. An editor destroyed
     * without either aborts.
     */
    class Editor {
      public:
        ~Editor();

        Editor(const Editor&) = delete;
        Editor& operator=(const Editor&) = delete;

        /**
         * @brief Sink writing to the slot's dirty file
         *
         * The stream stays owned by the editor and is closed on commit/abort.
         * Repeated calls for the same slot return the same stream.
         *
         * @return nullptr if the editor is finished or the file cannot be created
         */
        std::ostream* new_output_stream(int index);

        /// Convenience: write a whole slot
        bool set(int index, const std::string& value);

        /**
         * @brief Reader on the bytes written to a slot so far
         *
         * The stream holds the file open, so it stays readable after commit()
         * even if the record is then evicted or dropped as expired.
         *
         * @return nullptr if the editor is finished or the slot was not written
         */
        std::unique_ptr<std::ifstream> new_input_stream(int index);

        /// Expiry recorded with the record on commit (epoch ms)
        void set_entry_expiry_timestamp(int64_t timestamp) {
            expiry_timestamp_ = timestamp;
        }

        /**
         * @brief Publish the written slots
         *
         * Replaces any previous record for the key. If a slot was never written
         * on a new record, or a write failed, the edit is aborted instead.
         *
         * @return true if the record was published
         */
        bool commit();

        /// Discard written data; any previous record is left untouched
        void abort();

        const std::string& key() const {
            return key_;
        }

      private:
        friend class DiskLruCache;
        Editor(DiskLruCache* cache, std::string key, std::string name, int value_count);

        DiskLruCache* cache_;
        std::string key_;
        std::string name_;
        std::vector<std::unique_ptr<std::ofstream>> streams_;
        int64_t expiry_timestamp_ = NO_EXPIRY;
        bool done_ = false;
    };

    /**
     * @brief Open (or create) a cache in a directory
     *
     * Creates the directory, replays an existing journal and deletes any
     * half-written records. A journal that does not parse is discarded along
     * with the directory contents and a fresh cache is created.
     *
     * @param directory Cache directory (exclusive to this cache)
     * @param app_version Stored in the journal; a mismatch discards the cache
     * @param value_count Slots per record (>= 1)
     * @param max_size Byte budget (> 0)
     * @param err Optional error description on failure
     * @return The cache, or nullptr if the directory or journal cannot be used
     */
    static std::unique_ptr<DiskLruCache> open(const std::string& directory, int app_version,
                                              int value_count, uint64_t max_size,
                                              std::string* err = nullptr);

    ~DiskLruCache();

    DiskLruCache(const DiskLruCache&) = delete;
    DiskLruCache& operator=(const DiskLruCache&) = delete;

    /**
     * @brief Snapshot of a published record
     *
     * Records whose expiry has passed are removed and reported as absent.
     *
     * @return nullptr if absent, expired, unreadable or the cache is closed
     */
    std::unique_ptr<Snapshot> get(const std::string& key);

    /**
     * @brief Start editing a record
     *
     * @return nullptr if another edit for the same key is in progress or the
     *         cache is closed
     */
    std::unique_ptr<Editor> edit(const std::string& key);

    /**
     * @brief Drop a published record
     * @return true if a record was removed (false if absent or being edited)
     */
    bool remove(const std::string& key);

    /// Path of a slot's published file, or empty string if no such record
    std::string get_cache_file(const std::string& key, int index) const;

    /// Expiry of a published record (epoch ms), or 0 if absent
    int64_t get_expiry_timestamp(const std::string& key) const;

    /// Change the byte budget, trimming immediately if needed
    void set_max_size(uint64_t max_size);
    uint64_t max_size() const;

    /// Bytes currently used by published records
    uint64_t size() const;

    /// Number of records (published or being written)
    size_t entry_count() const;

    /// Force buffered journal lines to disk
    bool flush();

    /// Close the journal; subsequent operations fail. In-progress edits are aborted.
    void close();
    bool is_closed() const;

    /**
     * @brief Close the cache and delete its directory with everything in it
     * @return false if the directory could not be removed
     */
    bool delete_cache();

    const std::string& directory() const {
        return directory_;
    }

    void set_file_name_generator(std::shared_ptr<const DiskCacheFileNameGenerator> generator);

  private:
    struct Entry {
        std::string name;
        std::vector<uint64_t> lengths;
        int64_t expiry_timestamp = NO_EXPIRY;
        bool readable = false;
        bool dirty_on_replay = false;
        Editor* current_editor = nullptr;
    };
    using EntryList = std::list<Entry>;

    DiskLruCache(std::string directory, int app_version, int value_count, uint64_t max_size);

    // All *_locked helpers require mutex_
    bool read_journal_locked(std::string* err, bool* truncated);
    bool read_journal_line_locked(const std::string& line, std::string* err);
    void process_journal_locked();
    bool rebuild_journal_locked(std::string* err);
    bool open_journal_writer_locked(std::string* err);
    void append_journal_line_locked(const std::string& line);
    bool journal_rebuild_required_locked() const;
    void maybe_compact_locked();
    void trim_to_size_locked();
    bool remove_locked(const std::string& name);
    bool complete_edit(Editor& editor, bool success);
    EntryList::iterator find_locked(const std::string& name);
    EntryList::const_iterator find_locked(const std::string& name) const;
    std::string name_for_locked(const std::string& key) const;
    void close_locked();

    std::string clean_file(const std::string& name, int index) const;
    std::string dirty_file(const std::string& name, int index) const;

    const std::string directory_;
    const int app_version_;
    const int value_count_;
    uint64_t max_size_;
    uint64_t size_ = 0;
    int redundant_op_count_ = 0;
    bool closed_ = false;

    // Front = least recently used
    EntryList entries_;
    std::unordered_map<std::string, EntryList::iterator> index_;
    std::ofstream journal_writer_;
    std::shared_ptr<const DiskCacheFileNameGenerator> name_generator_;
    mutable std::mutex mutex_;
};

} // namespace pixcache
