// FEEDROUTE - SHA256 Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include "feedroute/crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace feedroute {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create digest context");
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256");
    }
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA-256 finalize failed");
    }
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Byte out[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.Write(data, len).Finalize(out);
    return Hash256(out, SHA256::OUTPUT_SIZE);
}

} // namespace feedroute
