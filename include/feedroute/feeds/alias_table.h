// FEEDROUTE - Feed Identifier Aliases
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Maps a retired feed identifier to its replacement so callers holding the
// old identifier keep working after a rename.

#ifndef FEEDROUTE_FEEDS_ALIAS_TABLE_H
#define FEEDROUTE_FEEDS_ALIAS_TABLE_H

#include <feedroute/core/types.h>
#include <feedroute/feeds/indexed_map.h>

#include <vector>

namespace feedroute {
namespace feeds {

/// One applied alias change. newId is zero when the alias was removed.
struct FeedIdChange {
    FeedId oldId;
    FeedId newId;
};

class AliasTable {
public:
    /**
     * One-hop resolution: the alias target if one exists, otherwise the
     * identifier itself. Targets are never resolved further, so a -> b and
     * b -> c resolve a to b.
     */
    FeedId Resolve(const FeedId& id) const;

    /// Alias target, or the zero identifier if none
    FeedId GetAlias(const FeedId& oldId) const;

    /// Identifiers that currently have an alias, in list order
    const std::vector<FeedId>& ListChanged() const { return aliases_.Keys(); }

    /// 1-based position of oldId in ListChanged(), 0 if absent
    size_t PositionOf(const FeedId& oldId) const { return aliases_.PositionOf(oldId); }

    size_t Size() const { return aliases_.Size(); }

    /**
     * Apply a batch of alias changes, pair by pair.
     *
     * A zero newId removes the alias of oldId. Otherwise the alias is
     * created, or its target replaced in place.
     *
     * All-or-nothing: on error the table is left untouched.
     *
     * @throws RegistryError ArrayLengthMismatch, SameIdentifier, AliasNotFound
     * @return The applied changes, one per pair
     */
    std::vector<FeedIdChange> Change(const std::vector<FeedId>& oldIds,
                                     const std::vector<FeedId>& newIds);

    bool CheckConsistency() const { return aliases_.CheckConsistency(); }

private:
    IndexedMap<FeedId, FeedId, FixedBytesHasher> aliases_;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_ALIAS_TABLE_H
