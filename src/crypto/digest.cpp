// HYDROSTAKE - Message Digest Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/crypto/digest.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace hydrostake {
namespace crypto {

struct SHA256Hasher::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        Init();
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }

    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
    }
};

SHA256Hasher::SHA256Hasher() : impl_(std::make_unique<Impl>()) {}

SHA256Hasher::~SHA256Hasher() = default;

SHA256Hasher& SHA256Hasher::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

SHA256Hasher& SHA256Hasher::Write(const std::string& data) {
    return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
}

Hash256 SHA256Hasher::Finalize() {
    Byte out[OUTPUT_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, out, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    impl_->Init();
    return Hash256(out, OUTPUT_SIZE);
}

void SHA256Hasher::Reset() {
    impl_->Init();
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256Hasher hasher;
    hasher.Write(data, len);
    return hasher.Finalize();
}

} // namespace crypto
} // namespace hydrostake
