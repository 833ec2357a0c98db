// HYDROSTAKE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#ifndef HYDROSTAKE_CORE_HEX_H
#define HYDROSTAKE_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hydrostake {

// Plain uint8_t so types.h can include this header
using HexByte = uint8_t;

std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Throws std::invalid_argument on odd length or non-hex characters
std::vector<HexByte> HexToBytes(const std::string& hex);

bool IsValidHex(const std::string& str);

} // namespace hydrostake

#endif // HYDROSTAKE_CORE_HEX_H
