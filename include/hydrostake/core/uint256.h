// HYDROSTAKE - 256-bit Unsigned Integer
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Token quantities and rate products are carried as 256-bit unsigned
// integers. Arithmetic operators are checked: overflow, underflow and
// division by zero throw instead of wrapping. The static Add/Sub/Mul helpers
// expose the raw carry/borrow/high word for callers that handle it themselves.

#ifndef HYDROSTAKE_CORE_UINT256_H
#define HYDROSTAKE_CORE_UINT256_H

#include "hydrostake/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace hydrostake {

/// 256-bit unsigned integer as 4 x 64-bit limbs (limb[0] least significant)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;
    static constexpr size_t NUM_BYTES = 32;

    std::array<uint64_t, NUM_LIMBS> limbs;

    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    /// Implicit so small literals mix freely with 256-bit values
    constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// 2^bits - 1 (bits in [0, 256])
    static Uint256 MaxForBits(unsigned bits);

    static Uint256 Max() { return MaxForBits(256); }

    // ========================================================================
    // Conversion
    // ========================================================================

    /// Decimal digits only; throws std::invalid_argument or std::overflow_error
    static Uint256 FromDecimal(const std::string& str);

    /// Optional 0x prefix, at most 64 digits; throws std::invalid_argument
    static Uint256 FromHex(const std::string& hex);

    /// Base-10 representation
    std::string ToString() const;

    /// 64 hex digits, most significant first
    std::string ToHex() const;

    /// Big-endian 32 bytes
    std::array<Byte, NUM_BYTES> ToBytes() const;
    static Uint256 FromBytes(const Byte* data, size_t len = NUM_BYTES);

    /// Low 64 bits; throws std::overflow_error if the value does not fit
    uint64_t GetLow64() const;

    bool IsZero() const {
        return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
    }

    /// Position of the highest set bit plus one (0 for zero)
    unsigned Bits() const;

    bool FitsInBits(unsigned bits) const { return Bits() <= bits; }

    // ========================================================================
    // Comparison
    // ========================================================================

    bool operator==(const Uint256& other) const { return limbs == other.limbs; }
    bool operator!=(const Uint256& other) const { return !(*this == other); }
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const { return !(other < *this); }
    bool operator>(const Uint256& other) const { return other < *this; }
    bool operator>=(const Uint256& other) const { return !(*this < other); }

    // ========================================================================
    // Checked Arithmetic
    // ========================================================================

    Uint256 operator+(const Uint256& other) const;
    Uint256 operator-(const Uint256& other) const;
    Uint256 operator*(const Uint256& other) const;
    Uint256 operator/(const Uint256& other) const;
    Uint256 operator%(const Uint256& other) const;

    Uint256& operator+=(const Uint256& other) { return *this = *this + other; }
    Uint256& operator-=(const Uint256& other) { return *this = *this - other; }
    Uint256& operator*=(const Uint256& other) { return *this = *this * other; }
    Uint256& operator/=(const Uint256& other) { return *this = *this / other; }

    Uint256 operator<<(unsigned shift) const;
    Uint256 operator>>(unsigned shift) const;

    /// nullopt instead of throwing
    static std::optional<Uint256> TryAdd(const Uint256& a, const Uint256& b);
    static std::optional<Uint256> TrySub(const Uint256& a, const Uint256& b);
    static std::optional<Uint256> TryMul(const Uint256& a, const Uint256& b);

    // ========================================================================
    // Raw Limb Arithmetic
    // ========================================================================

    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);

    /// Full 512-bit product; returns the low half
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);

    /// Quotient and remainder; throws std::domain_error when divisor is zero
    static void DivMod(const Uint256& a, const Uint256& b,
                       Uint256& quotient, Uint256& remainder);
};

inline std::ostream& operator<<(std::ostream& os, const Uint256& v) {
    return os << v.ToString();
}

} // namespace hydrostake

#endif // HYDROSTAKE_CORE_UINT256_H
