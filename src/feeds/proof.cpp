// FEEDROUTE - Feed Data Proofs Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/proof.h>
#include <feedroute/feeds/errors.h>
#include <feedroute/feeds/feed_id.h>
#include <feedroute/core/merkle.h>
#include <feedroute/crypto/sha256.h>
#include <feedroute/util/logging.h>

#include <sstream>

namespace feedroute {
namespace feeds {

namespace {

/// Append an integer as a right-aligned big-endian 32-byte word.
/// Negative values are sign extended.
void AppendWord(std::vector<Byte>& out, int64_t value) {
    Byte fill = value < 0 ? 0xFF : 0x00;
    uint64_t bits = static_cast<uint64_t>(value);
    for (int i = 0; i < 24; ++i) {
        out.push_back(fill);
    }
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<Byte>((bits >> (i * 8)) & 0xFF));
    }
}

} // namespace

// ============================================================================
// FeedData
// ============================================================================

std::vector<Byte> FeedData::Encode() const {
    std::vector<Byte> out;
    out.reserve(FEED_DATA_ENCODED_SIZE);

    AppendWord(out, votingRoundId);

    out.insert(out.end(), id.begin(), id.end());
    out.resize(out.size() + (32 - FeedId::SIZE), 0);

    AppendWord(out, value);
    AppendWord(out, turnoutBIPS);
    AppendWord(out, decimals);
    return out;
}

Hash256 FeedData::GetHash() const {
    return SHA256Hash(Encode());
}

std::string FeedData::ToString() const {
    std::ostringstream ss;
    ss << "FeedData {"
       << " round: " << votingRoundId
       << ", id: " << FeedIdToString(id)
       << ", value: " << value
       << ", turnout: " << turnoutBIPS
       << ", decimals: " << static_cast<int>(decimals)
       << " }";
    return ss.str();
}

// ============================================================================
// ProofVerifier
// ============================================================================

ProofVerifier::ProofVerifier(const IRootPublisher& publisher, uint8_t protocolId)
    : publisher_(publisher), protocolId_(protocolId) {}

bool ProofVerifier::Verify(const FeedDataWithProof& data) const {
    Hash256 leaf = data.body.GetHash();
    Hash256 published = publisher_.RootFor(protocolId_, data.body.votingRoundId);
    Hash256 computed = ProcessMerkleProof(leaf, data.proof);

    if (computed != published) {
        LOG_WARN(util::LogCategory::PROOF)
            << "Proof rejected for " << data.body.ToString()
            << ": computed root " << computed.ToHex()
            << ", published " << published.ToHex();
        throw RegistryError(RegistryErrorCode::InvalidProof,
                            "round " + std::to_string(data.body.votingRoundId));
    }

    LOG_DEBUG(util::LogCategory::PROOF)
        << "Verified " << data.body.ToString() << " against root " << published.ToHex();
    return true;
}

} // namespace feeds
} // namespace feedroute
