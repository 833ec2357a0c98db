// HYDROSTAKE - Serialization Header
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Compact little-endian binary encoding used for persisted engine state.
// Types opt in by providing free Serialize/Unserialize overloads.

#ifndef HYDROSTAKE_CORE_SERIALIZE_H
#define HYDROSTAKE_CORE_SERIALIZE_H

#include "hydrostake/core/types.h"
#include "hydrostake/core/uint256.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace hydrostake {

/// Upper bound on any length prefix (32 MB)
static constexpr uint64_t MAX_SIZE = 0x02000000;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;

    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    explicit DataStream(const std::string& bytes)
        : data_(bytes.begin(), bytes.end()) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    const uint8_t* data() const noexcept { return data_.data() + readPos_; }

    /// Unread bytes as a binary string
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t readPos_ = 0;
};

// ============================================================================
// Fixed-Width Integers (little-endian)
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    }
    s.Write(buf, 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint8_t buf[8];
    s.Read(buf, 8);
    uint64_t obj = 0;
    for (int i = 0; i < 8; ++i) {
        obj |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return obj;
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   otherwise          -- 0xFF + 8 bytes little-endian

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    if (marker < 253) {
        return marker;
    }
    if (marker != 0xFF) {
        throw std::ios_base::failure("ReadCompactSize(): unsupported marker");
    }
    uint64_t size = ser_readdata64(s);
    if (size < 253) {
        throw std::ios_base::failure("ReadCompactSize(): non-canonical encoding");
    }
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }
template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ser_readdata8(s);
    if (v > 1) {
        throw std::ios_base::failure("Unserialize(bool): invalid value");
    }
    a = (v == 1);
}

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

/// Minimal big-endian magnitude with a length prefix (zero is one byte)
template<typename Stream>
void Serialize(Stream& s, const Uint256& value) {
    auto bytes = value.ToBytes();
    size_t skip = 0;
    while (skip < bytes.size() && bytes[skip] == 0) {
        ++skip;
    }
    ser_writedata8(s, static_cast<uint8_t>(bytes.size() - skip));
    if (skip < bytes.size()) {
        s.Write(bytes.data() + skip, bytes.size() - skip);
    }
}

template<typename Stream>
void Unserialize(Stream& s, Uint256& value) {
    uint8_t len = ser_readdata8(s);
    if (len > Uint256::NUM_BYTES) {
        throw std::ios_base::failure("Unserialize(Uint256): length exceeds 32 bytes");
    }
    uint8_t buf[Uint256::NUM_BYTES];
    if (len > 0) {
        s.Read(buf, len);
        if (buf[0] == 0) {
            throw std::ios_base::failure("Unserialize(Uint256): non-minimal encoding");
        }
    }
    value = Uint256::FromBytes(buf, len);
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(static_cast<size_t>(size < 4096 ? size : 4096));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace hydrostake

#endif // HYDROSTAKE_CORE_SERIALIZE_H
