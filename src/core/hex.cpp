// HYDROSTAKE - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/core/hex.h"

#include <stdexcept>

namespace hydrostake {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    int Nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_CHARS[data[i] >> 4]);
        out.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    return out;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<HexByte> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = Nibble(hex[i]);
        int low = Nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out.push_back(static_cast<HexByte>((high << 4) | low));
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (Nibble(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace hydrostake
