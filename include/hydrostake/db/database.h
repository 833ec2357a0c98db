// HYDROSTAKE - Database Abstraction Layer
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Key-value store behind engine persistence. LevelDB backs it on disk;
// MemoryDatabase serves tests and volatile runs. Keys and values are opaque
// byte strings; StakingStore owns the key layout.

#ifndef HYDROSTAKE_DB_DATABASE_H
#define HYDROSTAKE_DB_DATABASE_H

#include "hydrostake/core/serialize.h"

#include <cstdint>
#include <cstring>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hydrostake {
namespace db {

// ============================================================================
// Status
// ============================================================================

/// Outcome of a storage call; database errors never throw
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };

    Status() = default;
    Status(Code code, std::string msg = "") : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(NOT_FOUND, std::move(msg)); }
    static Status Corruption(std::string msg = "") { return Status(CORRUPTION, std::move(msg)); }
    static Status NotSupported(std::string msg = "") { return Status(NOT_SUPPORTED, std::move(msg)); }
    static Status InvalidArgument(std::string msg = "") { return Status(INVALID_ARGUMENT, std::move(msg)); }
    static Status IOError(std::string msg = "") { return Status(IO_ERROR, std::move(msg)); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsNotSupported() const { return code_ == NOT_SUPPORTED; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "OK" or "<Kind>: <message>"
    std::string ToString() const;

private:
    Code code_{OK};
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a key or value; the referenced bytes must outlive it
class Slice {
public:
    Slice() = default;
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    char operator[](size_t n) const { return data_[n]; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        if (prefix.size_ > size_) {
            return false;
        }
        return prefix.size_ == 0 || std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    bool operator==(const Slice& other) const {
        if (size_ != other.size_) {
            return false;
        }
        return size_ == 0 || std::memcmp(data_, other.data_, size_) == 0;
    }
    bool operator!=(const Slice& other) const { return !(*this == other); }

private:
    const char* data_{""};
    size_t size_{0};
};

// ============================================================================
// Options
// ============================================================================

/// Open-time tuning. Staking state is small, so the defaults stay modest.
struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = true;
    size_t write_buffer_size = 1 * 1024 * 1024;
    int max_open_files = 32;
    size_t block_cache_size = 2 * 1024 * 1024;
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = true;
    bool fill_cache = true;
};

struct WriteOptions {
    bool sync = false;
};

// ============================================================================
// Write Batch
// ============================================================================

/// Ordered puts and deletes applied atomically by Database::Write
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        ops_.push_back({key.ToString(), value.ToString()});
    }

    void Delete(const Slice& key) {
        ops_.push_back({key.ToString(), std::nullopt});
    }

    void Clear() { ops_.clear(); }
    size_t Count() const { return ops_.size(); }
    bool Empty() const { return ops_.empty(); }

    /// func(key, value) per operation in insertion order; value empty for deletes
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const Op& op : ops_) {
            func(op.key, op.value);
        }
    }

private:
    struct Op {
        std::string key;
        std::optional<std::string> value;
    };
    std::vector<Op> ops_;
};

// ============================================================================
// Iterator
// ============================================================================

/// Forward cursor over keys in bytewise order
class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;

    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    Status Get(const Slice& key, std::string* value) { return Get(ReadOptions(), key, value); }
    Status Put(const Slice& key, const Slice& value) { return Put(WriteOptions(), key, value); }
    Status Delete(const Slice& key) { return Delete(WriteOptions(), key); }
    Status Write(WriteBatch* batch) { return Write(WriteOptions(), batch); }
    std::unique_ptr<Iterator> NewIterator() { return NewIterator(ReadOptions()); }

    bool Exists(const Slice& key) {
        std::string ignored;
        return Get(key, &ignored).ok();
    }

    virtual void Compact() {}
    virtual std::string GetStats() const { return ""; }
};

/// Open (creating if allowed) a LevelDB database in directory path
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream stream;
    stream << obj;
    return stream.str();
}

/// False on truncated input or trailing bytes
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    DataStream stream(data);
    try {
        stream >> obj;
    } catch (const std::exception&) {
        return false;
    }
    return stream.empty();
}

} // namespace db
} // namespace hydrostake

#endif // HYDROSTAKE_DB_DATABASE_H
