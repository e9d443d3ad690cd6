// FEEDROUTE - SHA256 Hash Function
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Incremental SHA-256 on top of the OpenSSL EVP digest API.

#ifndef FEEDROUTE_CRYPTO_SHA256_H
#define FEEDROUTE_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <vector>

#include "feedroute/core/types.h"

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace feedroute {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write OUTPUT_SIZE bytes to output.
    /// The hasher must be Reset() before reuse.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace feedroute

#endif // FEEDROUTE_CRYPTO_SHA256_H
