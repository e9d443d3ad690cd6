// FEEDROUTE - Fee Aggregation Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/fees.h>
#include <feedroute/feeds/errors.h>
#include <feedroute/feeds/feed_id.h>
#include <feedroute/util/logging.h>

#include <limits>

namespace feedroute {
namespace feeds {

Amount AddFees(Amount a, Amount b) {
    if (a > std::numeric_limits<Amount>::max() - b) {
        throw RegistryError(RegistryErrorCode::ArithmeticOverflow,
                            std::to_string(a) + " + " + std::to_string(b));
    }
    return a + b;
}

FeeAggregator::FeeAggregator(const AliasTable& aliases,
                             const CalculatedFeedRegistry& calculated,
                             const IIndexedFeedSource& source,
                             const IFeeSchedule& schedule)
    : aliases_(aliases), calculated_(calculated), source_(source), schedule_(schedule) {}

Amount FeeAggregator::CalculatedFee(const FeedId& id) const {
    CalculatedFeedPtr feed = calculated_.Get(id);
    if (!feed) {
        throw RegistryError(RegistryErrorCode::CalculatedFeedNotSupported, FeedIdToString(id));
    }
    return feed->CalculateFee();
}

Amount FeeAggregator::FeeForOne(const FeedId& id) const {
    FeedId resolved = aliases_.Resolve(id);
    if (IsCalculatedFeedId(resolved)) {
        return CalculatedFee(resolved);
    }

    // Confirm the feed is registered before quoting it
    source_.IdToIndex(resolved);
    return schedule_.FeeForIds({resolved});
}

Amount FeeAggregator::FeeForMany(const std::vector<FeedId>& ids) const {
    Amount total = 0;
    std::vector<FeedId> indexed;

    for (const auto& id : ids) {
        FeedId resolved = aliases_.Resolve(id);
        if (IsCalculatedFeedId(resolved)) {
            total = AddFees(total, CalculatedFee(resolved));
        } else {
            indexed.push_back(resolved);
        }
    }

    if (!indexed.empty()) {
        total = AddFees(total, schedule_.FeeForIds(indexed));
    }

    LOG_DEBUG(util::LogCategory::FEES)
        << "Fee for " << ids.size() << " feeds (" << indexed.size()
        << " indexed): " << total;
    return total;
}

Amount FeeAggregator::FeeForIndex(FeedIndex index) const {
    return schedule_.FeeForIndices({index});
}

Amount FeeAggregator::FeeForIndices(const std::vector<FeedIndex>& indices) const {
    return schedule_.FeeForIndices(indices);
}

} // namespace feeds
} // namespace feedroute
