// HYDROSTAKE - 256-bit Unsigned Integer Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/core/uint256.h"

#include <algorithm>
#include <stdexcept>

namespace hydrostake {

namespace {

int HexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// In-place division by a single limb; returns the remainder
uint64_t DivSmall(Uint256& value, uint64_t divisor) {
    __uint128_t rem = 0;
    for (int i = 3; i >= 0; --i) {
        __uint128_t cur = (rem << 64) | value.limbs[i];
        value.limbs[i] = static_cast<uint64_t>(cur / divisor);
        rem = cur % divisor;
    }
    return static_cast<uint64_t>(rem);
}

} // namespace

// ============================================================================
// Construction and Conversion
// ============================================================================

Uint256 Uint256::MaxForBits(unsigned bits) {
    if (bits > 256) {
        throw std::invalid_argument("Uint256::MaxForBits: more than 256 bits");
    }
    Uint256 result;
    for (unsigned i = 0; i < NUM_LIMBS; ++i) {
        unsigned lo = i * 64;
        if (bits >= lo + 64) {
            result.limbs[i] = ~0ULL;
        } else if (bits > lo) {
            result.limbs[i] = (1ULL << (bits - lo)) - 1;
        }
    }
    return result;
}

Uint256 Uint256::FromDecimal(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Uint256::FromDecimal: empty string");
    }

    Uint256 result;
    for (char c : str) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Uint256::FromDecimal: invalid digit in '" + str + "'");
        }
        Uint256 high;
        Uint256 scaled = Mul(result, Uint256(10), high);
        bool carry = false;
        result = Add(scaled, Uint256(static_cast<uint64_t>(c - '0')), carry);
        if (!high.IsZero() || carry) {
            throw std::overflow_error("Uint256::FromDecimal: value exceeds 256 bits");
        }
    }
    return result;
}

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = hex;
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) {
        h = h.substr(2);
    }
    if (h.empty() || h.size() > 64) {
        throw std::invalid_argument("Uint256::FromHex: expected 1 to 64 hex digits");
    }

    Uint256 result;
    size_t bit = 0;
    for (auto it = h.rbegin(); it != h.rend(); ++it, bit += 4) {
        int nibble = HexNibble(*it);
        if (nibble < 0) {
            throw std::invalid_argument("Uint256::FromHex: invalid hex character");
        }
        result.limbs[bit / 64] |= static_cast<uint64_t>(nibble) << (bit % 64);
    }
    return result;
}

std::string Uint256::ToString() const {
    if (IsZero()) {
        return "0";
    }

    // Peel off 19 decimal digits at a time
    constexpr uint64_t CHUNK = 10000000000000000000ULL;
    Uint256 value = *this;
    std::string digits;
    while (!value.IsZero()) {
        uint64_t part = DivSmall(value, CHUNK);
        for (int i = 0; i < 19; ++i) {
            digits.push_back(static_cast<char>('0' + part % 10));
            part /= 10;
            if (value.IsZero() && part == 0) {
                break;
            }
        }
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string Uint256::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(64);
    for (int i = 3; i >= 0; --i) {
        for (int shift = 60; shift >= 0; shift -= 4) {
            result.push_back(hexChars[(limbs[i] >> shift) & 0x0F]);
        }
    }
    return result;
}

std::array<Byte, Uint256::NUM_BYTES> Uint256::ToBytes() const {
    std::array<Byte, NUM_BYTES> out;
    for (size_t i = 0; i < NUM_BYTES; ++i) {
        size_t limb = 3 - i / 8;
        unsigned shift = 56 - 8 * (i % 8);
        out[i] = static_cast<Byte>(limbs[limb] >> shift);
    }
    return out;
}

Uint256 Uint256::FromBytes(const Byte* data, size_t len) {
    if (len > NUM_BYTES) {
        throw std::invalid_argument("Uint256::FromBytes: more than 32 bytes");
    }
    Uint256 result;
    for (size_t i = 0; i < len; ++i) {
        size_t bitPos = 8 * (len - 1 - i);
        result.limbs[bitPos / 64] |= static_cast<uint64_t>(data[i]) << (bitPos % 64);
    }
    return result;
}

uint64_t Uint256::GetLow64() const {
    if (limbs[1] != 0 || limbs[2] != 0 || limbs[3] != 0) {
        throw std::overflow_error("Uint256::GetLow64: value exceeds 64 bits");
    }
    return limbs[0];
}

unsigned Uint256::Bits() const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] != 0) {
            return static_cast<unsigned>(i * 64 + 64 - __builtin_clzll(limbs[i]));
        }
    }
    return 0;
}

// ============================================================================
// Comparison
// ============================================================================

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] != other.limbs[i]) {
            return limbs[i] < other.limbs[i];
        }
    }
    return false;
}

// ============================================================================
// Raw Limb Arithmetic
// ============================================================================

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) + b.limbs[i] + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }
    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) - b.limbs[i] - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>(diff >> 127) & 1;
    }
    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook: each column accumulates at most 8 half-products
    __uint128_t columns[8] = {0};
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        for (size_t j = 0; j < NUM_LIMBS; ++j) {
            __uint128_t prod = static_cast<__uint128_t>(a.limbs[i]) * b.limbs[j];
            columns[i + j] += static_cast<uint64_t>(prod);
            columns[i + j + 1] += prod >> 64;
        }
    }

    uint64_t words[8];
    __uint128_t carry = 0;
    for (int i = 0; i < 8; ++i) {
        __uint128_t sum = columns[i] + carry;
        words[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }

    high = Uint256(words[4], words[5], words[6], words[7]);
    return Uint256(words[0], words[1], words[2], words[3]);
}

void Uint256::DivMod(const Uint256& a, const Uint256& b,
                     Uint256& quotient, Uint256& remainder) {
    if (b.IsZero()) {
        throw std::domain_error("Uint256: division by zero");
    }

    if (b.Bits() <= 64) {
        quotient = a;
        remainder = Uint256(DivSmall(quotient, b.limbs[0]));
        return;
    }

    quotient = Uint256();
    remainder = Uint256();
    for (int bit = static_cast<int>(a.Bits()) - 1; bit >= 0; --bit) {
        bool topBit = (remainder.limbs[3] >> 63) != 0;
        remainder = remainder << 1;
        remainder.limbs[0] |= (a.limbs[bit / 64] >> (bit % 64)) & 1;
        if (topBit || remainder >= b) {
            bool borrow = false;
            remainder = Sub(remainder, b, borrow);
            quotient.limbs[bit / 64] |= 1ULL << (bit % 64);
        }
    }
}

// ============================================================================
// Checked Arithmetic
// ============================================================================

std::optional<Uint256> Uint256::TryAdd(const Uint256& a, const Uint256& b) {
    bool carry = false;
    Uint256 sum = Add(a, b, carry);
    if (carry) {
        return std::nullopt;
    }
    return sum;
}

std::optional<Uint256> Uint256::TrySub(const Uint256& a, const Uint256& b) {
    bool borrow = false;
    Uint256 diff = Sub(a, b, borrow);
    if (borrow) {
        return std::nullopt;
    }
    return diff;
}

std::optional<Uint256> Uint256::TryMul(const Uint256& a, const Uint256& b) {
    Uint256 high;
    Uint256 low = Mul(a, b, high);
    if (!high.IsZero()) {
        return std::nullopt;
    }
    return low;
}

Uint256 Uint256::operator+(const Uint256& other) const {
    auto sum = TryAdd(*this, other);
    if (!sum) {
        throw std::overflow_error("Uint256: addition overflow");
    }
    return *sum;
}

Uint256 Uint256::operator-(const Uint256& other) const {
    auto diff = TrySub(*this, other);
    if (!diff) {
        throw std::overflow_error("Uint256: subtraction underflow");
    }
    return *diff;
}

Uint256 Uint256::operator*(const Uint256& other) const {
    auto prod = TryMul(*this, other);
    if (!prod) {
        throw std::overflow_error("Uint256: multiplication overflow");
    }
    return *prod;
}

Uint256 Uint256::operator/(const Uint256& other) const {
    Uint256 q, r;
    DivMod(*this, other, q, r);
    return q;
}

Uint256 Uint256::operator%(const Uint256& other) const {
    Uint256 q, r;
    DivMod(*this, other, q, r);
    return r;
}

Uint256 Uint256::operator<<(unsigned shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    unsigned limbShift = shift / 64;
    unsigned bitShift = shift % 64;
    for (int i = 3; i >= static_cast<int>(limbShift); --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift != 0 && i > static_cast<int>(limbShift)) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }
    return result;
}

Uint256 Uint256::operator>>(unsigned shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    unsigned limbShift = shift / 64;
    unsigned bitShift = shift % 64;
    for (unsigned i = 0; i + limbShift < NUM_LIMBS; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift != 0 && i + limbShift + 1 < NUM_LIMBS) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }
    return result;
}

} // namespace hydrostake
