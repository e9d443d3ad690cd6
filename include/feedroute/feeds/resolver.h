// FEEDROUTE - Feed Resolver
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Dispatches feed requests to the index-addressed source or to calculated
// feeds and merges the results back into request order.

#ifndef FEEDROUTE_FEEDS_RESOLVER_H
#define FEEDROUTE_FEEDS_RESOLVER_H

#include <feedroute/core/types.h>
#include <feedroute/feeds/alias_table.h>
#include <feedroute/feeds/calculated_registry.h>
#include <feedroute/feeds/interfaces.h>

#include <vector>

namespace feedroute {
namespace feeds {

/// Batch result plus the part of the supplied value no source received
struct ResolvedFeeds {
    FeedValues feeds;
    Amount retainedValue{0};
};

/**
 * Request dispatcher.
 *
 * Holds references only; the owner keeps the alias table, the registry
 * and the source alive for the resolver's lifetime.
 */
class FeedResolver {
public:
    FeedResolver(const AliasTable& aliases,
                 const CalculatedFeedRegistry& calculated,
                 IIndexedFeedSource& source);

    /**
     * Fetch one feed, forwarding the whole value to the source that
     * serves it.
     * @throws RegistryError CalculatedFeedNotSupported, NotFound
     */
    FeedValue ResolveOne(const FeedId& id, Amount value);

    /**
     * Fetch a batch of feeds.
     *
     * When every identifier is index-addressed the whole value goes to a
     * single source call. Otherwise each calculated feed is paid exactly
     * its fee, in request order, and the remaining balance goes to one
     * index batch. The timestamp is that of the last source called.
     * Every lookup and the fee total are checked before any source is
     * called, so a failing batch pays nothing.
     *
     * @throws RegistryError CalculatedFeedNotSupported, NotFound,
     *         InsufficientValue, ArithmeticOverflow
     */
    ResolvedFeeds ResolveMany(const std::vector<FeedId>& ids, Amount value);

    /// Fetch by index, forwarding the whole value
    FeedValue FetchByIndex(FeedIndex index, Amount value);
    FeedValues FetchByIndices(const std::vector<FeedIndex>& indices, Amount value);

private:
    FeedValues FetchBatch(const std::vector<FeedIndex>& indices, Amount value);

    const AliasTable& aliases_;
    const CalculatedFeedRegistry& calculated_;
    IIndexedFeedSource& source_;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_RESOLVER_H
