// FEEDROUTE - Fee Aggregation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#ifndef FEEDROUTE_FEEDS_FEES_H
#define FEEDROUTE_FEEDS_FEES_H

#include <feedroute/core/types.h>
#include <feedroute/feeds/alias_table.h>
#include <feedroute/feeds/calculated_registry.h>
#include <feedroute/feeds/interfaces.h>

#include <vector>

namespace feedroute {
namespace feeds {

/// Add two fees; throws RegistryError(ArithmeticOverflow) on wrap-around
Amount AddFees(Amount a, Amount b);

/**
 * Quotes the fee a caller must supply for a fetch.
 *
 * Calculated feeds quote their own fee; index-addressed feeds are quoted
 * by the fee schedule in a single call per request.
 */
class FeeAggregator {
public:
    FeeAggregator(const AliasTable& aliases,
                  const CalculatedFeedRegistry& calculated,
                  const IIndexedFeedSource& source,
                  const IFeeSchedule& schedule);

    /// @throws RegistryError CalculatedFeedNotSupported, NotFound
    Amount FeeForOne(const FeedId& id) const;

    /// @throws RegistryError CalculatedFeedNotSupported, ArithmeticOverflow
    Amount FeeForMany(const std::vector<FeedId>& ids) const;

    Amount FeeForIndex(FeedIndex index) const;
    Amount FeeForIndices(const std::vector<FeedIndex>& indices) const;

private:
    Amount CalculatedFee(const FeedId& id) const;

    const AliasTable& aliases_;
    const CalculatedFeedRegistry& calculated_;
    const IIndexedFeedSource& source_;
    const IFeeSchedule& schedule_;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_FEES_H
