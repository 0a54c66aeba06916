// BTCSTAKER - SHA256 Hash Function
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// SHA-256 backed by the OpenSSL EVP digest interface.

#ifndef BTCSTAKER_CRYPTO_SHA256_H
#define BTCSTAKER_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include "btcstaker/core/types.h"

// Forward declaration to keep OpenSSL headers out of the public interface
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace btcstaker {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output
    /// @param hash Output buffer of at least OUTPUT_SIZE bytes
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute double SHA256 (SHA256(SHA256(data))), used for txids and
/// Base58Check checksums
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace btcstaker

#endif // BTCSTAKER_CRYPTO_SHA256_H
