// HYDROSTAKE - Core Types Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/core/types.h"
#include "hydrostake/core/hex.h"

#include <stdexcept>

namespace hydrostake {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.size() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: expected " +
                                    std::to_string(SIZE * 2) + " digits");
    }
    std::vector<HexByte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Address Implementation
// ============================================================================

Address Address::FromString(const std::string& str) {
    std::string hex = str;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    return Address(BaseHash<160>::FromHex(hex));
}

Address Address::FromId(uint8_t id) {
    std::array<Byte, SIZE> bytes;
    bytes.fill(id);
    return Address(bytes);
}

} // namespace hydrostake
