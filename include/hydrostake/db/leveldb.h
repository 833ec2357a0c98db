// HYDROSTAKE - Database Backends
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#ifndef HYDROSTAKE_DB_LEVELDB_H
#define HYDROSTAKE_DB_LEVELDB_H

#include "hydrostake/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>

#include <map>
#include <mutex>

namespace hydrostake {
namespace db {

// ============================================================================
// LevelDB
// ============================================================================

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override;
    void Next() override { iter_->Next(); }
    Slice key() const override;
    Slice value() const override;
    Status status() const override;

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

/**
 * On-disk database.
 *
 * Owns the leveldb handle together with the block cache and filter policy
 * it was opened with; the handle is closed first on destruction.
 */
class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    void Compact() override;
    std::string GetStats() const override;

    const std::filesystem::path& GetPath() const { return path_; }

    static Status ConvertStatus(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory
// ============================================================================

/// Volatile database; iterators see a copy taken at creation
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;
    void Clear();

    /// Number of Write() calls applied
    size_t BatchCount() const;

private:
    std::map<std::string, std::string> data_;
    size_t batchCount_{0};
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace hydrostake

#endif // HYDROSTAKE_DB_LEVELDB_H
