// BTCSTAKER - SHA256 Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/crypto/sha256.h"
#include <openssl/evp.h>
#include <stdexcept>

namespace btcstaker {

// ============================================================================
// SHA256 Class Implementation
// ============================================================================

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: EVP_DigestFinal_ex failed");
    }
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA256().Write(data, len).Finalize(result.data());
    return result;
}

Hash256 DoubleSHA256(const Byte* data, size_t len) {
    Byte first[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.Write(data, len).Finalize(first);

    Hash256 result;
    hasher.Reset().Write(first, SHA256::OUTPUT_SIZE).Finalize(result.data());
    return result;
}

} // namespace btcstaker
