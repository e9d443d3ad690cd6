// FEEDROUTE - Feed Data Proofs
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Feed data finalized off-chain is committed to in a Merkle tree whose root
// is published per voting round. A holder of a record and its proof can
// check it against that root without trusting the sender.

#ifndef FEEDROUTE_FEEDS_PROOF_H
#define FEEDROUTE_FEEDS_PROOF_H

#include <feedroute/core/types.h>
#include <feedroute/feeds/interfaces.h>

#include <cstdint>
#include <string>
#include <vector>

namespace feedroute {
namespace feeds {

/// Protocol id under which feed data roots are published
constexpr uint8_t FTSO_PROTOCOL_ID = 100;

/// Size of the canonical FeedData encoding (five 32-byte words)
constexpr size_t FEED_DATA_ENCODED_SIZE = 5 * 32;

/// A finalized feed record
struct FeedData {
    uint32_t votingRoundId{0};
    FeedId id;
    int32_t value{0};
    uint16_t turnoutBIPS{0};
    int8_t decimals{0};

    /**
     * Canonical encoding: five 32-byte words.
     * Integers are big-endian and right aligned, signed values sign
     * extended; the identifier is left aligned and zero padded.
     */
    std::vector<Byte> Encode() const;

    /// Merkle leaf: SHA256 of Encode()
    Hash256 GetHash() const;

    std::string ToString() const;
};

/// A record plus the sibling hashes from its leaf to the root
struct FeedDataWithProof {
    std::vector<Hash256> proof;
    FeedData body;
};

/**
 * Checks FeedData records against published roots.
 */
class ProofVerifier {
public:
    ProofVerifier(const IRootPublisher& publisher, uint8_t protocolId = FTSO_PROTOCOL_ID);

    /**
     * Verify a record.
     * @return true on success
     * @throws RegistryError InvalidProof if the reconstructed root differs
     *         from the published one
     */
    bool Verify(const FeedDataWithProof& data) const;

    uint8_t GetProtocolId() const { return protocolId_; }

private:
    const IRootPublisher& publisher_;
    uint8_t protocolId_;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_PROOF_H
