// HYDROSTAKE - Core Types Header
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Fundamental types shared by the ledgers, the staking engine and storage.

#ifndef HYDROSTAKE_CORE_TYPES_H
#define HYDROSTAKE_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

namespace hydrostake {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;

/// Unix epoch seconds
using Timestamp = int64_t;

// ============================================================================
// Fixed-Size Byte Strings
// ============================================================================

/// Fixed-width opaque identifier stored in display order
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Null (all zeros)
    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Copies up to SIZE bytes, zero-filling the remainder
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex, byte 0 first
    std::string ToHex() const;

    /// Parse exactly SIZE*2 hex digits; throws std::invalid_argument
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit digest (event topics)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/**
 * 20-byte account address.
 *
 * The null address is the "nobody" account: ownership renounced to it can
 * never be exercised again.
 */
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    explicit Address(const BaseHash<160>& h) : BaseHash<160>(h) {}

    /// "0x" followed by 40 lowercase hex digits
    std::string ToString() const { return "0x" + ToHex(); }

    /// Accepts an optional 0x prefix; throws std::invalid_argument
    static Address FromString(const std::string& str);

    /// Deterministic test/simulation address: every byte set to id
    static Address FromId(uint8_t id);
};

/// Hasher for unordered containers keyed by Address
struct AddressHasher {
    size_t operator()(const Address& addr) const noexcept {
        size_t h = 0;
        std::memcpy(&h, addr.data(), sizeof(h));
        return h;
    }
};

} // namespace hydrostake

#endif // HYDROSTAKE_CORE_TYPES_H
