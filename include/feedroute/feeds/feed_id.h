// FEEDROUTE - Feed Identifiers
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// A feed identifier is 21 bytes: a category byte followed by the feed name,
// zero padded to 20 bytes. Categories 32..63 denote calculated feeds; every
// other category is served by the index-addressed feed source.

#ifndef FEEDROUTE_FEEDS_FEED_ID_H
#define FEEDROUTE_FEEDS_FEED_ID_H

#include <feedroute/core/types.h>

#include <string>
#include <utility>

namespace feedroute {
namespace feeds {

// ============================================================================
// Categories
// ============================================================================

constexpr Byte FEED_CATEGORY_CRYPTO = 1;
constexpr Byte FEED_CATEGORY_FOREX = 2;
constexpr Byte FEED_CATEGORY_COMMODITY = 3;
constexpr Byte FEED_CATEGORY_STOCK = 4;

/// Calculated category range, inclusive
constexpr Byte FEED_CATEGORY_CALCULATED_MIN = 32;
constexpr Byte FEED_CATEGORY_CALCULATED_MAX = 63;

/// Maximum encoded name length in bytes
constexpr size_t FEED_NAME_MAX_LENGTH = FeedId::SIZE - 1;

// ============================================================================
// Classification
// ============================================================================

/// True iff the category byte lies in [32, 64)
inline bool IsCalculatedFeedId(const FeedId& id) noexcept {
    Byte category = id.Category();
    return category >= FEED_CATEGORY_CALCULATED_MIN &&
           category <= FEED_CATEGORY_CALCULATED_MAX;
}

/// The all-zero identifier used as "no identifier"
inline const FeedId& ZeroFeedId() noexcept {
    static const FeedId zero;
    return zero;
}

// ============================================================================
// Encoding
// ============================================================================

/// Encode category and name; throws RegistryError(InvalidFeedName) when the
/// name is longer than FEED_NAME_MAX_LENGTH bytes.
FeedId EncodeFeedId(Byte category, const std::string& name);

/// Split an identifier into category and name (trailing zeros stripped)
std::pair<Byte, std::string> DecodeFeedId(const FeedId& id);

/// "category:name" for log messages; hex when the name is not printable
std::string FeedIdToString(const FeedId& id);

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_FEED_ID_H
