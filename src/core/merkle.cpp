// FEEDROUTE - Merkle Tree Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include "feedroute/core/merkle.h"
#include "feedroute/crypto/sha256.h"
#include <cstring>

namespace feedroute {

// ============================================================================
// Helper Functions
// ============================================================================

Hash256 HashSortedPair(const Hash256& a, const Hash256& b) {
    const Hash256& lo = (b < a) ? b : a;
    const Hash256& hi = (b < a) ? a : b;

    Byte combined[64];
    std::memcpy(combined, lo.data(), 32);
    std::memcpy(combined + 32, hi.data(), 32);
    return SHA256Hash(combined, 64);
}

// ============================================================================
// Merkle Root Computation
// ============================================================================

Hash256 ComputeMerkleRoot(std::vector<Hash256> hashes) {
    if (hashes.empty()) {
        return Hash256();
    }

    while (hashes.size() > 1) {
        size_t newSize = (hashes.size() + 1) / 2;
        for (size_t i = 0; i < newSize; ++i) {
            if (i * 2 + 1 < hashes.size()) {
                hashes[i] = HashSortedPair(hashes[i * 2], hashes[i * 2 + 1]);
            } else {
                hashes[i] = hashes[i * 2];
            }
        }
        hashes.resize(newSize);
    }

    return hashes[0];
}

std::vector<Hash256> ComputeMerklePath(const std::vector<Hash256>& leaves, uint32_t position) {
    std::vector<Hash256> proof;

    if (position >= leaves.size()) {
        return proof;
    }

    std::vector<Hash256> hashes = leaves;
    uint32_t pos = position;

    while (hashes.size() > 1) {
        uint32_t siblingPos = (pos & 1) ? (pos - 1) : (pos + 1);
        if (siblingPos < hashes.size()) {
            proof.push_back(hashes[siblingPos]);
        }

        size_t newSize = (hashes.size() + 1) / 2;
        for (size_t i = 0; i < newSize; ++i) {
            if (i * 2 + 1 < hashes.size()) {
                hashes[i] = HashSortedPair(hashes[i * 2], hashes[i * 2 + 1]);
            } else {
                hashes[i] = hashes[i * 2];
            }
        }
        hashes.resize(newSize);
        pos /= 2;
    }

    return proof;
}

// ============================================================================
// Proof Verification
// ============================================================================

Hash256 ProcessMerkleProof(const Hash256& leaf, const std::vector<Hash256>& proof) {
    Hash256 current = leaf;
    for (const Hash256& sibling : proof) {
        current = HashSortedPair(current, sibling);
    }
    return current;
}

bool VerifyMerkleProof(const Hash256& leaf, const Hash256& root,
                       const std::vector<Hash256>& proof) {
    return ProcessMerkleProof(leaf, proof) == root;
}

} // namespace feedroute
