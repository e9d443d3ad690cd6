// FEEDROUTE - Collaborator Interfaces
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// The registry does not produce feed values, compute fees or publish Merkle
// roots itself. It talks to those services through the interfaces below.
// Implementations signal failures by throwing; the registry lets every such
// exception propagate and abort the operation in progress.

#ifndef FEEDROUTE_FEEDS_INTERFACES_H
#define FEEDROUTE_FEEDS_INTERFACES_H

#include <feedroute/core/types.h>
#include <feedroute/core/uint256.h>

#include <cstdint>
#include <vector>

namespace feedroute {
namespace feeds {

// ============================================================================
// Feed Values
// ============================================================================

/// A single feed reading
struct FeedValue {
    Uint256 value;
    int8_t decimals{0};
    Timestamp timestamp{0};
};

/// Readings for a batch request, in request order
struct FeedValues {
    std::vector<Uint256> values;
    std::vector<int8_t> decimals;
    Timestamp timestamp{0};
};

// ============================================================================
// Index-addressed Feed Source
// ============================================================================

/**
 * The fast-update feed set. Feeds are addressed by their position in the
 * source's configuration list; removed feeds leave a zero identifier in
 * their slot.
 */
class IIndexedFeedSource {
public:
    virtual ~IIndexedFeedSource() = default;

    /// Index of a registered identifier; throws RegistryError(NotFound)
    virtual FeedIndex IdToIndex(const FeedId& id) const = 0;

    /// Identifier at an index, or the zero identifier for an unused slot
    virtual FeedId IndexToId(FeedIndex index) const = 0;

    /// Full configuration list (zero identifiers for removed slots)
    virtual std::vector<FeedId> FeedIds() const = 0;

    /// Fetch current values for the indices, paying `value`
    virtual FeedValues FetchBatch(const std::vector<FeedIndex>& indices, Amount value) = 0;
};

// ============================================================================
// Calculated Feed
// ============================================================================

/// A derived feed computed on demand
class ICalculatedFeed {
public:
    virtual ~ICalculatedFeed() = default;

    /// Identifier this feed serves
    virtual FeedId GetFeedId() const = 0;

    /// Fee for one reading
    virtual Amount CalculateFee() const = 0;

    /// Current reading, paying `value`
    virtual FeedValue GetCurrentFeed(Amount value) = 0;
};

// ============================================================================
// Fee Schedule
// ============================================================================

/// Fee quotes for the index-addressed feed set
class IFeeSchedule {
public:
    virtual ~IFeeSchedule() = default;

    virtual Amount FeeForIds(const std::vector<FeedId>& ids) const = 0;
    virtual Amount FeeForIndices(const std::vector<FeedIndex>& indices) const = 0;
};

// ============================================================================
// Root Publisher
// ============================================================================

/// Source of finalized Merkle roots per protocol and voting round
class IRootPublisher {
public:
    virtual ~IRootPublisher() = default;

    /// Published root, or a null hash if none was published
    virtual Hash256 RootFor(uint8_t protocolId, uint32_t votingRoundId) const = 0;
};

// ============================================================================
// Authorization
// ============================================================================

/// Decides who may change the calculated feed registry and alias table
class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;

    virtual bool IsAuthorized(const Address& caller) const = 0;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_INTERFACES_H
