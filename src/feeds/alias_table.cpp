// FEEDROUTE - Feed Identifier Aliases Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/alias_table.h>
#include <feedroute/feeds/errors.h>
#include <feedroute/feeds/feed_id.h>

namespace feedroute {
namespace feeds {

FeedId AliasTable::Resolve(const FeedId& id) const {
    const FeedId* target = aliases_.Find(id);
    return target ? *target : id;
}

FeedId AliasTable::GetAlias(const FeedId& oldId) const {
    const FeedId* target = aliases_.Find(oldId);
    return target ? *target : ZeroFeedId();
}

std::vector<FeedIdChange> AliasTable::Change(const std::vector<FeedId>& oldIds,
                                             const std::vector<FeedId>& newIds) {
    if (oldIds.size() != newIds.size()) {
        throw RegistryError(RegistryErrorCode::ArrayLengthMismatch,
                            std::to_string(oldIds.size()) + " old ids, " +
                            std::to_string(newIds.size()) + " new ids");
    }

    // Stage on a copy; commit only if every pair applies
    IndexedMap<FeedId, FeedId, FixedBytesHasher> staged = aliases_;
    std::vector<FeedIdChange> changes;
    changes.reserve(oldIds.size());

    for (size_t i = 0; i < oldIds.size(); ++i) {
        const FeedId& oldId = oldIds[i];
        const FeedId& newId = newIds[i];

        if (oldId == newId) {
            throw RegistryError(RegistryErrorCode::SameIdentifier, FeedIdToString(oldId));
        }

        if (newId.IsNull()) {
            if (!staged.Erase(oldId)) {
                throw RegistryError(RegistryErrorCode::AliasNotFound, FeedIdToString(oldId));
            }
        } else if (!staged.Assign(oldId, newId)) {
            staged.Insert(oldId, newId);
        }

        changes.push_back({oldId, newId});
    }

    aliases_ = std::move(staged);
    return changes;
}

} // namespace feeds
} // namespace feedroute
