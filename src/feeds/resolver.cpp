// FEEDROUTE - Feed Resolver Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/resolver.h>
#include <feedroute/feeds/errors.h>
#include <feedroute/feeds/feed_id.h>
#include <feedroute/feeds/fees.h>
#include <feedroute/util/logging.h>

#include <stdexcept>
#include <utility>

namespace feedroute {
namespace feeds {

FeedResolver::FeedResolver(const AliasTable& aliases,
                           const CalculatedFeedRegistry& calculated,
                           IIndexedFeedSource& source)
    : aliases_(aliases), calculated_(calculated), source_(source) {}

FeedValues FeedResolver::FetchBatch(const std::vector<FeedIndex>& indices, Amount value) {
    FeedValues result = source_.FetchBatch(indices, value);
    if (result.values.size() != indices.size() ||
        result.decimals.size() != indices.size()) {
        throw std::runtime_error("Index source returned " +
                                 std::to_string(result.values.size()) + " values for " +
                                 std::to_string(indices.size()) + " indices");
    }
    return result;
}

FeedValue FeedResolver::ResolveOne(const FeedId& id, Amount value) {
    FeedId resolved = aliases_.Resolve(id);

    if (IsCalculatedFeedId(resolved)) {
        CalculatedFeedPtr feed = calculated_.Get(resolved);
        if (!feed) {
            throw RegistryError(RegistryErrorCode::CalculatedFeedNotSupported,
                                FeedIdToString(resolved));
        }
        LOG_DEBUG(util::LogCategory::RESOLVER)
            << "Fetching calculated feed " << FeedIdToString(resolved) << " value=" << value;
        return feed->GetCurrentFeed(value);
    }

    FeedIndex index = source_.IdToIndex(resolved);
    LOG_DEBUG(util::LogCategory::RESOLVER)
        << "Fetching " << FeedIdToString(resolved) << " at index " << index
        << " value=" << value;
    return FetchByIndex(index, value);
}

ResolvedFeeds FeedResolver::ResolveMany(const std::vector<FeedId>& ids, Amount value) {
    const size_t count = ids.size();

    // Split into calculated and index-addressed requests, keeping the
    // original slot of each
    std::vector<FeedId> calculatedIds;
    std::vector<size_t> calculatedSlots;
    std::vector<FeedIndex> indices;
    std::vector<size_t> indexSlots;

    for (size_t i = 0; i < count; ++i) {
        FeedId resolved = aliases_.Resolve(ids[i]);
        if (IsCalculatedFeedId(resolved)) {
            calculatedIds.push_back(resolved);
            calculatedSlots.push_back(i);
        } else {
            indices.push_back(source_.IdToIndex(resolved));
            indexSlots.push_back(i);
        }
    }

    ResolvedFeeds result;

    if (calculatedIds.empty()) {
        LOG_DEBUG(util::LogCategory::RESOLVER)
            << "Batch of " << count << " served by index source, value=" << value;
        result.feeds = FetchBatch(indices, value);
        return result;
    }

    LOG_DEBUG(util::LogCategory::RESOLVER)
        << "Mixed batch: " << calculatedIds.size() << " calculated, "
        << indices.size() << " indexed, value=" << value;

    FeedValues& feeds = result.feeds;
    feeds.values.assign(count, Uint256());
    feeds.decimals.assign(count, 0);

    // Look up every handle and its fee before any feed is paid
    std::vector<CalculatedFeedPtr> handles;
    std::vector<Amount> fees;
    Amount totalFees = 0;
    for (const auto& id : calculatedIds) {
        CalculatedFeedPtr feed = calculated_.Get(id);
        if (!feed) {
            throw RegistryError(RegistryErrorCode::CalculatedFeedNotSupported,
                                FeedIdToString(id));
        }
        Amount fee = feed->CalculateFee();
        totalFees = AddFees(totalFees, fee);
        handles.push_back(std::move(feed));
        fees.push_back(fee);
    }
    if (totalFees > value) {
        throw RegistryError(RegistryErrorCode::InsufficientValue,
                            "calculated fees " + std::to_string(totalFees) +
                            " exceed value " + std::to_string(value));
    }

    Amount balance = value - totalFees;

    for (size_t i = 0; i < handles.size(); ++i) {
        FeedValue reading = handles[i]->GetCurrentFeed(fees[i]);
        size_t slot = calculatedSlots[i];
        feeds.values[slot] = reading.value;
        feeds.decimals[slot] = reading.decimals;
        feeds.timestamp = reading.timestamp;
    }

    if (!indices.empty()) {
        FeedValues batch = FetchBatch(indices, balance);
        balance = 0;
        for (size_t i = 0; i < indexSlots.size(); ++i) {
            feeds.values[indexSlots[i]] = batch.values[i];
            feeds.decimals[indexSlots[i]] = batch.decimals[i];
        }
        feeds.timestamp = batch.timestamp;
    }

    result.retainedValue = balance;
    return result;
}

FeedValue FeedResolver::FetchByIndex(FeedIndex index, Amount value) {
    FeedValues batch = FetchBatch({index}, value);
    FeedValue reading;
    reading.value = batch.values[0];
    reading.decimals = batch.decimals[0];
    reading.timestamp = batch.timestamp;
    return reading;
}

FeedValues FeedResolver::FetchByIndices(const std::vector<FeedIndex>& indices, Amount value) {
    return FetchBatch(indices, value);
}

} // namespace feeds
} // namespace feedroute
