// HYDROSTAKE - Message Digests
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// SHA-256 backed by OpenSSL's EVP interface. Used to derive event topics
// from event signature strings.

#ifndef HYDROSTAKE_CRYPTO_DIGEST_H
#define HYDROSTAKE_CRYPTO_DIGEST_H

#include "hydrostake/core/types.h"

#include <cstddef>
#include <memory>
#include <string>

namespace hydrostake {
namespace crypto {

/// Incremental SHA-256 hasher
class SHA256Hasher {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;

    SHA256Hasher& Write(const Byte* data, size_t len);
    SHA256Hasher& Write(const std::string& data);

    /// Produce the digest and reset for reuse
    Hash256 Finalize();

    void Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// One-shot SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace crypto
} // namespace hydrostake

#endif // HYDROSTAKE_CRYPTO_DIGEST_H
