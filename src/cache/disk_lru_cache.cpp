// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "disk_lru_cache.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace pixcache {

namespace {

constexpr const char* CLEAN = "CLEAN";
constexpr const char* DIRTY = "DIRTY";
constexpr const char* REMOVE = "REMOVE";
constexpr const char* READ = "READ";
constexpr const char* EXPIRY_PREFIX = "t_";
constexpr size_t MAX_NAME_LENGTH = 120;

std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        parts.push_back(token);
    }
    return parts;
}

bool is_valid_name(const std::string& name) {
    if (name.empty() || name.size() > MAX_NAME_LENGTH) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_' || c == '-';
    });
}

void set_error(std::string* err, const std::string& message) {
    if (err) {
        *err = message;
    }
}

// Removes a file that may not exist; only a real failure is reported
bool delete_if_exists(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("[DiskLruCache] Failed to delete {}: {}", path, ec.message());
        return false;
    }
    return true;
}

} // namespace

// =============================================================================
// Snapshot
// =============================================================================

DiskLruCache::Snapshot::Snapshot(std::string key,
                                 std::vector<std::unique_ptr<std::ifstream>> streams,
                                 std::vector<uint64_t> lengths, int64_t expiry_timestamp)
    : key_(std::move(key)), streams_(std::move(streams)), lengths_(std::move(lengths)),
      expiry_timestamp_(expiry_timestamp) {}

std::string DiskLruCache::Snapshot::get_string(int index) {
    std::istream& in = input_stream(index);
    in.clear();
    in.seekg(0, std::ios::beg);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// =============================================================================
// Editor
// =============================================================================

DiskLruCache::Editor::Editor(DiskLruCache* cache, std::string key, std::string name,
                             int value_count)
    : cache_(cache), key_(std::move(key)), name_(std::move(name)),
      streams_(static_cast<size_t>(value_count)) {}

DiskLruCache::Editor::~Editor() {
    if (!done_) {
        abort();
    }
}

std::ostream* DiskLruCache::Editor::new_output_stream(int index) {
    if (done_ || index < 0 || static_cast<size_t>(index) >= streams_.size()) {
        return nullptr;
    }
    auto& slot = streams_[static_cast<size_t>(index)];
    if (!slot) {
        std::string path = cache_->dirty_file(name_, index);
        auto stream =
            std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
        if (!stream->is_open()) {
            spdlog::warn("[DiskLruCache] Cannot create {}", path);
            return nullptr;
        }
        slot = std::move(stream);
    }
    return slot.get();
}

bool DiskLruCache::Editor::set(int index, const std::string& value) {
    std::ostream* out = new_output_stream(index);
    if (!out) {
        return false;
    }
    out->write(value.data(), static_cast<std::streamsize>(value.size()));
    return out->good();
}

std::unique_ptr<std::ifstream> DiskLruCache::Editor::new_input_stream(int index) {
    if (done_ || index < 0 || static_cast<size_t>(index) >= streams_.size()) {
        return nullptr;
    }
    auto& slot = streams_[static_cast<size_t>(index)];
    if (!slot) {
        return nullptr;
    }
    slot->flush();
    auto in = std::make_unique<std::ifstream>(cache_->dirty_file(name_, index), std::ios::binary);
    if (!in->is_open()) {
        return nullptr;
    }
    return in;
}

bool DiskLruCache::Editor::commit() {
    if (done_) {
        return false;
    }
    bool has_errors = false;
    for (auto& stream : streams_) {
        if (stream) {
            stream->flush();
            if (!stream->good()) {
                has_errors = true;
            }
            stream->close();
        }
    }
    done_ = true;

    if (has_errors) {
        spdlog::warn("[DiskLruCache] Write error while editing {}, discarding", key_);
        cache_->complete_edit(*this, false);
        cache_->remove(key_);
        return false;
    }
    return cache_->complete_edit(*this, true);
}

void DiskLruCache::Editor::abort() {
    if (done_) {
        return;
    }
    for (auto& stream : streams_) {
        if (stream) {
            stream->close();
        }
    }
    done_ = true;
    cache_->complete_edit(*this, false);
}

// =============================================================================
// DiskLruCache
// =============================================================================

DiskLruCache::DiskLruCache(std::string directory, int app_version, int value_count,
                           uint64_t max_size)
    : directory_(std::move(directory)), app_version_(app_version), value_count_(value_count),
      max_size_(max_size), name_generator_(std::make_shared<Sha256FileNameGenerator>()) {}

DiskLruCache::~DiskLruCache() {
    close();
}

std::unique_ptr<DiskLruCache> DiskLruCache::open(const std::string& directory,
                                                 int app_version, int value_count,
                                                 uint64_t max_size, std::string* err) {
    if (value_count <= 0) {
        set_error(err, "value_count <= 0");
        return nullptr;
    }
    if (max_size == 0) {
        set_error(err, "max_size == 0");
        return nullptr;
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        set_error(err, "cannot create " + directory + ": " + ec.message());
        return nullptr;
    }

    // Prefer the journal; fall back to a backup left by an interrupted rebuild
    const fs::path journal = fs::path(directory) / JOURNAL_FILE;
    const fs::path backup = fs::path(directory) / JOURNAL_FILE_BACKUP;
    if (fs::exists(backup, ec)) {
        if (fs::exists(journal, ec)) {
            fs::remove(backup, ec);
        } else {
            fs::rename(backup, journal, ec);
        }
    }

    // The instance is not shared yet, so the *_locked helpers are called without mutex_
    std::unique_ptr<DiskLruCache> cache(
        new DiskLruCache(directory, app_version, value_count, max_size));
    if (fs::exists(journal, ec)) {
        std::string read_err;
        bool truncated = false;
        if (cache->read_journal_locked(&read_err, &truncated)) {
            cache->process_journal_locked();
            bool writer_ok = truncated ? cache->rebuild_journal_locked(&read_err)
                                       : cache->open_journal_writer_locked(&read_err);
            if (writer_ok) {
                spdlog::debug("[DiskLruCache] Opened {} ({} entries, {} bytes)", directory,
                              cache->entries_.size(), cache->size_);
                return cache;
            }
        }

        spdlog::warn("[DiskLruCache] {} is corrupt: {}, removing", directory, read_err);
        if (!cache->delete_cache()) {
            set_error(err, "cannot wipe corrupt cache in " + directory);
            return nullptr;
        }
        cache.reset();
    }

    fs::create_directories(directory, ec);
    if (ec) {
        set_error(err, "cannot create " + directory + ": " + ec.message());
        return nullptr;
    }
    cache.reset(new DiskLruCache(directory, app_version, value_count, max_size));
    std::string rebuild_err;
    if (!cache->rebuild_journal_locked(&rebuild_err)) {
        set_error(err, rebuild_err);
        return nullptr;
    }
    spdlog::debug("[DiskLruCache] Created new cache in {}", directory);
    return cache;
}

bool DiskLruCache::read_journal_locked(std::string* err, bool* truncated) {
    std::ifstream in(fs::path(directory_) / JOURNAL_FILE);
    if (!in.is_open()) {
        set_error(err, "cannot read journal");
        return false;
    }

    std::string magic, version, app_version, value_count, blank;
    std::getline(in, magic);
    std::getline(in, version);
    std::getline(in, app_version);
    std::getline(in, value_count);
    std::getline(in, blank);
    if (!in || magic != MAGIC || version != VERSION_1 ||
        app_version != std::to_string(app_version_) ||
        value_count != std::to_string(value_count_) || !blank.empty()) {
        set_error(err, "unexpected journal header: [" + magic + ", " + version + ", " +
                           app_version + ", " + value_count + ", " + blank + "]");
        return false;
    }

    int line_count = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (in.eof()) {
            // Last line has no terminator: the process died mid-write
            *truncated = true;
            break;
        }
        if (!read_journal_line_locked(line, err)) {
            return false;
        }
        ++line_count;
    }
    redundant_op_count_ = line_count - static_cast<int>(entries_.size());
    return true;
}

bool DiskLruCache::read_journal_line_locked(const std::string& line, std::string* err) {
    std::vector<std::string> parts = split_line(line);
    if (parts.size() < 2) {
        set_error(err, "unexpected journal line: " + line);
        return false;
    }
    const std::string& op = parts[0];
    const std::string& name = parts[1];

    if (op == REMOVE && parts.size() == 2) {
        auto it = find_locked(name);
        if (it != entries_.end()) {
            index_.erase(name);
            entries_.erase(it);
        }
        return true;
    }

    auto it = find_locked(name);
    if (it == entries_.end()) {
        Entry entry;
        entry.name = name;
        entry.lengths.assign(static_cast<size_t>(value_count_), 0);
        entries_.push_back(std::move(entry));
        it = std::prev(entries_.end());
        index_[name] = it;
    } else {
        entries_.splice(entries_.end(), entries_, it);
    }

    if (op == CLEAN && parts.size() == static_cast<size_t>(3 + value_count_) &&
        parts[2].rfind(EXPIRY_PREFIX, 0) == 0) {
        try {
            it->expiry_timestamp = std::stoll(parts[2].substr(2));
            for (int i = 0; i < value_count_; ++i) {
                it->lengths[static_cast<size_t>(i)] =
                    std::stoull(parts[static_cast<size_t>(3 + i)]);
            }
        } catch (const std::logic_error&) {
            set_error(err, "unexpected journal line: " + line);
            return false;
        }
        it->readable = true;
        it->dirty_on_replay = false;
        return true;
    }
    if (op == DIRTY && parts.size() == 2) {
        it->dirty_on_replay = true;
        return true;
    }
    if (op == READ && parts.size() == 2) {
        return true;
    }
    set_error(err, "unexpected journal line: " + line);
    return false;
}

void DiskLruCache::process_journal_locked() {
    delete_if_exists((fs::path(directory_) / JOURNAL_FILE_TEMP).string());
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!it->dirty_on_replay) {
            for (uint64_t length : it->lengths) {
                size_ += length;
            }
            ++it;
            continue;
        }
        spdlog::debug("[DiskLruCache] Dropping interrupted edit {}", it->name);
        for (int i = 0; i < value_count_; ++i) {
            delete_if_exists(clean_file(it->name, i));
            delete_if_exists(dirty_file(it->name, i));
        }
        index_.erase(it->name);
        it = entries_.erase(it);
    }
}

bool DiskLruCache::rebuild_journal_locked(std::string* err) {
    if (journal_writer_.is_open()) {
        journal_writer_.close();
    }

    const fs::path journal = fs::path(directory_) / JOURNAL_FILE;
    const fs::path temp = fs::path(directory_) / JOURNAL_FILE_TEMP;
    const fs::path backup = fs::path(directory_) / JOURNAL_FILE_BACKUP;

    {
        std::ofstream out(temp, std::ios::trunc);
        out << MAGIC << '\n'
            << VERSION_1 << '\n'
            << app_version_ << '\n'
            << value_count_ << '\n'
            << '\n';
        for (const auto& entry : entries_) {
            if (entry.current_editor) {
                out << DIRTY << ' ' << entry.name << '\n';
            } else {
                out << CLEAN << ' ' << entry.name << ' ' << EXPIRY_PREFIX
                    << entry.expiry_timestamp;
                for (uint64_t length : entry.lengths) {
                    out << ' ' << length;
                }
                out << '\n';
            }
        }
        out.flush();
        if (!out.good()) {
            set_error(err, "cannot write " + temp.string());
            return false;
        }
    }

    std::error_code ec;
    if (fs::exists(journal, ec)) {
        fs::rename(journal, backup, ec);
        if (ec) {
            set_error(err, "cannot back up journal: " + ec.message());
            return false;
        }
    }
    fs::rename(temp, journal, ec);
    if (ec) {
        set_error(err, "cannot install journal: " + ec.message());
        return false;
    }
    fs::remove(backup, ec);

    redundant_op_count_ = 0;
    return open_journal_writer_locked(err);
}

bool DiskLruCache::open_journal_writer_locked(std::string* err) {
    journal_writer_.open(fs::path(directory_) / JOURNAL_FILE, std::ios::app);
    if (!journal_writer_.is_open()) {
        set_error(err, "cannot open journal for append");
        return false;
    }
    return true;
}

void DiskLruCache::append_journal_line_locked(const std::string& line) {
    journal_writer_ << line << '\n';
    journal_writer_.flush();
    if (!journal_writer_.good()) {
        spdlog::warn("[DiskLruCache] Journal write failed in {}", directory_);
    }
}

bool DiskLruCache::journal_rebuild_required_locked() const {
    return redundant_op_count_ >= REDUNDANT_OP_COMPACT_THRESHOLD &&
           redundant_op_count_ >= static_cast<int>(entries_.size());
}

void DiskLruCache::maybe_compact_locked() {
    if (!journal_rebuild_required_locked()) {
        return;
    }
    std::string err;
    if (rebuild_journal_locked(&err)) {
        spdlog::debug("[DiskLruCache] Compacted journal ({} entries)", entries_.size());
    } else {
        spdlog::warn("[DiskLruCache] Journal compaction failed: {}", err);
    }
}

void DiskLruCache::trim_to_size_locked() {
    while (size_ > max_size_) {
        auto victim = std::find_if(entries_.begin(), entries_.end(),
                                   [](const Entry& e) { return e.current_editor == nullptr; });
        if (victim == entries_.end()) {
            break;
        }
        std::string name = victim->name;
        spdlog::trace("[DiskLruCache] Evicting {} (size {} > {})", name, size_, max_size_);
        if (!remove_locked(name)) {
            break;
        }
    }
}

bool DiskLruCache::remove_locked(const std::string& name) {
    auto it = find_locked(name);
    if (it == entries_.end() || it->current_editor) {
        return false;
    }
    for (int i = 0; i < value_count_; ++i) {
        if (!delete_if_exists(clean_file(name, i))) {
            return false;
        }
        size_ -= it->lengths[static_cast<size_t>(i)];
    }

    ++redundant_op_count_;
    append_journal_line_locked(std::string(REMOVE) + " " + name);
    index_.erase(name);
    entries_.erase(it);

    maybe_compact_locked();
    return true;
}

bool DiskLruCache::complete_edit(Editor& editor, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = find_locked(editor.name_);
    if (closed_ || it == entries_.end() || it->current_editor != &editor) {
        for (int i = 0; i < value_count_; ++i) {
            delete_if_exists(dirty_file(editor.name_, i));
        }
        return false;
    }
    Entry& entry = *it;

    // A new record needs every slot written
    if (success && !entry.readable) {
        std::error_code ec;
        for (int i = 0; i < value_count_; ++i) {
            if (!fs::exists(dirty_file(entry.name, i), ec)) {
                spdlog::warn("[DiskLruCache] Edit of {} did not write slot {}", editor.key_, i);
                success = false;
                break;
            }
        }
    }

    for (int i = 0; i < value_count_; ++i) {
        const std::string dirty = dirty_file(entry.name, i);
        if (!success) {
            delete_if_exists(dirty);
            continue;
        }
        std::error_code ec;
        if (!fs::exists(dirty, ec)) {
            continue;
        }
        const std::string clean = clean_file(entry.name, i);
        fs::rename(dirty, clean, ec);
        if (ec) {
            spdlog::warn("[DiskLruCache] Cannot publish {}: {}", clean, ec.message());
            delete_if_exists(dirty);
            continue;
        }
        uint64_t new_length = fs::file_size(clean, ec);
        if (ec) {
            new_length = 0;
        }
        size_ = size_ - entry.lengths[static_cast<size_t>(i)] + new_length;
        entry.lengths[static_cast<size_t>(i)] = new_length;
    }

    ++redundant_op_count_;
    entry.current_editor = nullptr;
    if (entry.readable || success) {
        entry.readable = true;
        if (success) {
            entry.expiry_timestamp = editor.expiry_timestamp_;
        }
        std::string line = std::string(CLEAN) + " " + entry.name + " " + EXPIRY_PREFIX +
                           std::to_string(entry.expiry_timestamp);
        for (uint64_t length : entry.lengths) {
            line += " " + std::to_string(length);
        }
        append_journal_line_locked(line);
    } else {
        append_journal_line_locked(std::string(REMOVE) + " " + entry.name);
        index_.erase(entry.name);
        entries_.erase(it);
    }

    if (size_ > max_size_) {
        trim_to_size_locked();
    }
    maybe_compact_locked();
    return success;
}

std::unique_ptr<DiskLruCache::Snapshot> DiskLruCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return nullptr;
    }
    const std::string name = name_for_locked(key);
    auto it = find_locked(name);
    if (name.empty() || it == entries_.end() || !it->readable) {
        return nullptr;
    }

    if (it->expiry_timestamp < current_time_millis()) {
        spdlog::debug("[DiskLruCache] {} expired, removing", key);
        remove_locked(name);
        return nullptr;
    }

    std::vector<std::unique_ptr<std::ifstream>> streams;
    for (int i = 0; i < value_count_; ++i) {
        auto in = std::make_unique<std::ifstream>(clean_file(name, i), std::ios::binary);
        if (!in->is_open()) {
            // File deleted behind our back
            spdlog::debug("[DiskLruCache] Slot {} of {} is missing", i, key);
            return nullptr;
        }
        streams.push_back(std::move(in));
    }

    ++redundant_op_count_;
    append_journal_line_locked(std::string(READ) + " " + name);
    entries_.splice(entries_.end(), entries_, it);
    auto snapshot = std::make_unique<Snapshot>(key, std::move(streams), it->lengths,
                                               it->expiry_timestamp);
    maybe_compact_locked();
    return snapshot;
}

std::unique_ptr<DiskLruCache::Editor> DiskLruCache::edit(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return nullptr;
    }
    const std::string name = name_for_locked(key);
    if (name.empty()) {
        return nullptr;
    }

    auto it = find_locked(name);
    if (it != entries_.end() && it->current_editor) {
        return nullptr;
    }
    if (it == entries_.end()) {
        Entry entry;
        entry.name = name;
        entry.lengths.assign(static_cast<size_t>(value_count_), 0);
        entries_.push_back(std::move(entry));
        it = std::prev(entries_.end());
        index_[name] = it;
    } else {
        entries_.splice(entries_.end(), entries_, it);
    }

    std::unique_ptr<Editor> editor(new Editor(this, key, name, value_count_));
    it->current_editor = editor.get();
    append_journal_line_locked(std::string(DIRTY) + " " + name);
    return editor;
}

bool DiskLruCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    const std::string name = name_for_locked(key);
    return !name.empty() && remove_locked(name);
}

std::string DiskLruCache::get_cache_file(const std::string& key, int index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = name_for_locked(key);
    auto it = find_locked(name);
    if (name.empty() || it == entries_.end() || !it->readable || index < 0 ||
        index >= value_count_) {
        return "";
    }
    return clean_file(name, index);
}

int64_t DiskLruCache::get_expiry_timestamp(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = name_for_locked(key);
    auto it = find_locked(name);
    if (name.empty() || it == entries_.end() || !it->readable) {
        return 0;
    }
    return it->expiry_timestamp;
}

void DiskLruCache::set_max_size(uint64_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_size_ = max_size;
    if (!closed_) {
        trim_to_size_locked();
    }
}

uint64_t DiskLruCache::max_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_size_;
}

uint64_t DiskLruCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

size_t DiskLruCache::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool DiskLruCache::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    trim_to_size_locked();
    journal_writer_.flush();
    return journal_writer_.good();
}

void DiskLruCache::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void DiskLruCache::close_locked() {
    if (closed_) {
        return;
    }
    for (auto it = entries_.begin(); it != entries_.end();) {
        Editor* editor = it->current_editor;
        if (!editor) {
            ++it;
            continue;
        }
        // Detach the editor; its later commit/abort becomes a no-op
        for (auto& stream : editor->streams_) {
            if (stream) {
                stream->close();
            }
        }
        editor->done_ = true;
        for (int i = 0; i < value_count_; ++i) {
            delete_if_exists(dirty_file(it->name, i));
        }
        it->current_editor = nullptr;
        if (it->readable) {
            ++it;
        } else {
            index_.erase(it->name);
            it = entries_.erase(it);
        }
    }
    if (journal_writer_.is_open()) {
        trim_to_size_locked();
        journal_writer_.close();
    }
    closed_ = true;
}

bool DiskLruCache::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool DiskLruCache::delete_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) {
        spdlog::warn("[DiskLruCache] Failed to delete {}: {}", directory_, ec.message());
        return false;
    }
    entries_.clear();
    index_.clear();
    size_ = 0;
    spdlog::info("[DiskLruCache] Deleted cache directory {}", directory_);
    return true;
}

void DiskLruCache::set_file_name_generator(
    std::shared_ptr<const DiskCacheFileNameGenerator> generator) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generator) {
        name_generator_ = std::move(generator);
    } else {
        name_generator_ = std::make_shared<Sha256FileNameGenerator>();
    }
}

DiskLruCache::EntryList::iterator DiskLruCache::find_locked(const std::string& name) {
    auto it = index_.find(name);
    return it == index_.end() ? entries_.end() : it->second;
}

DiskLruCache::EntryList::const_iterator DiskLruCache::find_locked(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? entries_.cend() : EntryList::const_iterator(it->second);
}

std::string DiskLruCache::name_for_locked(const std::string& key) const {
    std::string name = name_generator_->generate(key);
    if (!is_valid_name(name)) {
        spdlog::error("[DiskLruCache] Generated file name \"{}\" for {} is not valid", name, key);
        return "";
    }
    return name;
}

std::string DiskLruCache::clean_file(const std::string& name, int index) const {
    return (fs::path(directory_) / (name + "." + std::to_string(index))).string();
}

std::string DiskLruCache::dirty_file(const std::string& name, int index) const {
    return (fs::path(directory_) / (name + "." + std::to_string(index) + ".tmp")).string();
}

} // namespace pixcache
