// HYDROSTAKE - Serialization Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/core/serialize.h"
#include "hydrostake/core/hex.h"

namespace hydrostake {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace hydrostake
