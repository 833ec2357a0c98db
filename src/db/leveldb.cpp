// HYDROSTAKE - LevelDB Backend
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/db/leveldb.h"
#include "hydrostake/util/logging.h"

#include <leveldb/write_batch.h>

#include <system_error>

namespace hydrostake {
namespace db {

namespace {

leveldb::ReadOptions ToLevelDB(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions ToLevelDB(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

leveldb::Slice ToLevelDB(const Slice& slice) {
    return leveldb::Slice(slice.data(), slice.size());
}

Slice FromLevelDB(const leveldb::Slice& slice) {
    return Slice(slice.data(), slice.size());
}

} // namespace

// ============================================================================
// LevelDBIterator
// ============================================================================

void LevelDBIterator::Seek(const Slice& target) {
    iter_->Seek(ToLevelDB(target));
}

Slice LevelDBIterator::key() const {
    return FromLevelDB(iter_->key());
}

Slice LevelDBIterator::value() const {
    return FromLevelDB(iter_->value());
}

Status LevelDBIterator::status() const {
    return LevelDBDatabase::ConvertStatus(iter_->status());
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter,
                                 const std::filesystem::path& path)
    : db_(db), cache_(cache), filter_(filter), path_(path) {}

LevelDBDatabase::~LevelDBDatabase() {
    // The handle still references cache and filter until it is closed
    db_.reset();
    cache_.reset();
    filter_.reset();
}

Status LevelDBDatabase::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) {
        return Status::Ok();
    }
    const std::string text = s.ToString();
    if (s.IsNotFound()) return Status::NotFound(text);
    if (s.IsCorruption()) return Status::Corruption(text);
    if (s.IsNotSupportedError()) return Status::NotSupported(text);
    if (s.IsInvalidArgument()) return Status::InvalidArgument(text);
    return Status::IOError(text);
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return ConvertStatus(db_->Get(ToLevelDB(options), ToLevelDB(key), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return ConvertStatus(db_->Put(ToLevelDB(options), ToLevelDB(key), ToLevelDB(value)));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return ConvertStatus(db_->Delete(ToLevelDB(options), ToLevelDB(key)));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return ConvertStatus(db_->Write(ToLevelDB(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(ToLevelDB(options)));
}

void LevelDBDatabase::Compact() {
    db_->CompactRange(nullptr, nullptr);
}

std::string LevelDBDatabase::GetStats() const {
    std::string stats;
    if (!db_->GetProperty("leveldb.stats", &stats)) {
        return "";
    }
    return stats;
}

// ============================================================================
// Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options) {
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {LevelDBDatabase::ConvertStatus(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened database " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter, path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return LevelDBDatabase::ConvertStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace hydrostake
