// FEEDROUTE - Merkle Tree Header
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Merkle trees with commutative (sorted) pair hashing. A node is
// SHA256(min(a, b) || max(a, b)) with byte-wise big-endian comparison, so a
// proof is a plain list of sibling hashes and carries no left/right flags.

#ifndef FEEDROUTE_CORE_MERKLE_H
#define FEEDROUTE_CORE_MERKLE_H

#include "feedroute/core/types.h"
#include <vector>
#include <cstdint>

namespace feedroute {

// ============================================================================
// Helper Functions
// ============================================================================

/// Hash two nodes in ascending byte order
Hash256 HashSortedPair(const Hash256& a, const Hash256& b);

// ============================================================================
// Merkle Root Computation
// ============================================================================

/// Compute the root of a tree built bottom-up from the given leaves.
/// An unpaired node at the end of a level is carried up unchanged.
/// @return The root, or a null hash if leaves is empty
Hash256 ComputeMerkleRoot(std::vector<Hash256> leaves);

/// Sibling hashes from the leaf at `position` up to the root.
/// Levels where the node has no sibling contribute nothing.
std::vector<Hash256> ComputeMerklePath(const std::vector<Hash256>& leaves, uint32_t position);

// ============================================================================
// Proof Verification
// ============================================================================

/// Fold a proof onto a leaf and return the reconstructed root
Hash256 ProcessMerkleProof(const Hash256& leaf, const std::vector<Hash256>& proof);

/// True if folding the proof onto the leaf yields root
bool VerifyMerkleProof(const Hash256& leaf, const Hash256& root,
                       const std::vector<Hash256>& proof);

} // namespace feedroute

#endif // FEEDROUTE_CORE_MERKLE_H
