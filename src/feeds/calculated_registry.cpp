// FEEDROUTE - Calculated Feed Registry Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/calculated_registry.h>
#include <feedroute/feeds/errors.h>
#include <feedroute/feeds/feed_id.h>

namespace feedroute {
namespace feeds {

namespace {

/// Reject empty handles before they are dereferenced
const CalculatedFeedPtr& RequireFeed(const CalculatedFeedPtr& feed) {
    if (!feed) {
        throw std::invalid_argument("Calculated feed handle is null");
    }
    return feed;
}

} // namespace

const char* CalculatedFeedEventKindToString(CalculatedFeedEvent::Kind kind) {
    switch (kind) {
        case CalculatedFeedEvent::Kind::Added:    return "Added";
        case CalculatedFeedEvent::Kind::Replaced: return "Replaced";
        case CalculatedFeedEvent::Kind::Removed:  return "Removed";
        default:                                  return "Unknown";
    }
}

CalculatedFeedPtr CalculatedFeedRegistry::Get(const FeedId& id) const {
    const CalculatedFeedPtr* feed = feeds_.Find(id);
    return feed ? *feed : nullptr;
}

std::vector<CalculatedFeedEvent> CalculatedFeedRegistry::Add(
    const std::vector<CalculatedFeedPtr>& feeds) {
    auto staged = feeds_;
    std::vector<CalculatedFeedEvent> events;
    events.reserve(feeds.size());

    for (const auto& feed : feeds) {
        FeedId id = RequireFeed(feed)->GetFeedId();
        if (!IsCalculatedFeedId(id)) {
            throw RegistryError(RegistryErrorCode::InvalidCategory,
                                FeedIdToString(id) + " is not a calculated feed id");
        }
        if (!staged.Insert(id, feed)) {
            throw RegistryError(RegistryErrorCode::AlreadyExists, FeedIdToString(id));
        }
        events.push_back({CalculatedFeedEvent::Kind::Added, id, nullptr, feed});
    }

    feeds_ = std::move(staged);
    return events;
}

std::vector<CalculatedFeedEvent> CalculatedFeedRegistry::Replace(
    const std::vector<CalculatedFeedPtr>& feeds) {
    auto staged = feeds_;
    std::vector<CalculatedFeedEvent> events;
    events.reserve(feeds.size());

    for (const auto& feed : feeds) {
        FeedId id = RequireFeed(feed)->GetFeedId();
        const CalculatedFeedPtr* existing = staged.Find(id);
        if (!existing) {
            throw RegistryError(RegistryErrorCode::NotFound, FeedIdToString(id));
        }
        CalculatedFeedPtr previous = *existing;
        staged.Assign(id, feed);
        events.push_back({CalculatedFeedEvent::Kind::Replaced, id, previous, feed});
    }

    feeds_ = std::move(staged);
    return events;
}

std::vector<CalculatedFeedEvent> CalculatedFeedRegistry::Remove(const std::vector<FeedId>& ids) {
    auto staged = feeds_;
    std::vector<CalculatedFeedEvent> events;
    events.reserve(ids.size());

    for (const auto& id : ids) {
        const CalculatedFeedPtr* existing = staged.Find(id);
        if (!existing) {
            throw RegistryError(RegistryErrorCode::NotFound, FeedIdToString(id));
        }
        CalculatedFeedPtr previous = *existing;
        staged.Erase(id);
        events.push_back({CalculatedFeedEvent::Kind::Removed, id, previous, nullptr});
    }

    feeds_ = std::move(staged);
    return events;
}

} // namespace feeds
} // namespace feedroute
