// FEEDROUTE - Calculated Feed Registry
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#ifndef FEEDROUTE_FEEDS_CALCULATED_REGISTRY_H
#define FEEDROUTE_FEEDS_CALCULATED_REGISTRY_H

#include <feedroute/core/types.h>
#include <feedroute/feeds/indexed_map.h>
#include <feedroute/feeds/interfaces.h>

#include <memory>
#include <vector>

namespace feedroute {
namespace feeds {

using CalculatedFeedPtr = std::shared_ptr<ICalculatedFeed>;

/// Registry change notification
struct CalculatedFeedEvent {
    enum class Kind { Added, Replaced, Removed };

    Kind kind;
    FeedId feedId;
    CalculatedFeedPtr previous;   // Replaced, Removed
    CalculatedFeedPtr current;    // Added, Replaced
};

const char* CalculatedFeedEventKindToString(CalculatedFeedEvent::Kind kind);

/**
 * Enumerable set of calculated feed identifiers, each backed by one
 * calculated feed. Every mutating call is all-or-nothing.
 */
class CalculatedFeedRegistry {
public:
    /// Backing feed, or nullptr if unregistered
    CalculatedFeedPtr Get(const FeedId& id) const;

    /// Registered identifiers in list order
    const std::vector<FeedId>& List() const { return feeds_.Keys(); }

    /// 1-based list position, 0 if absent
    size_t PositionOf(const FeedId& id) const { return feeds_.PositionOf(id); }

    size_t Size() const { return feeds_.Size(); }

    /**
     * Register feeds under their self-reported identifiers.
     * @throws RegistryError InvalidCategory, AlreadyExists
     */
    std::vector<CalculatedFeedEvent> Add(const std::vector<CalculatedFeedPtr>& feeds);

    /**
     * Swap the backing feed of already registered identifiers.
     * @throws RegistryError NotFound
     */
    std::vector<CalculatedFeedEvent> Replace(const std::vector<CalculatedFeedPtr>& feeds);

    /**
     * Unregister identifiers (swap-and-pop).
     * @throws RegistryError NotFound
     */
    std::vector<CalculatedFeedEvent> Remove(const std::vector<FeedId>& ids);

    bool CheckConsistency() const { return feeds_.CheckConsistency(); }

private:
    IndexedMap<FeedId, CalculatedFeedPtr, FixedBytesHasher> feeds_;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_CALCULATED_REGISTRY_H
