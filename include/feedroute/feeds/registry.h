// FEEDROUTE - Feed Registry
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Public entry point combining the alias table, the calculated feed
// registry, request dispatch, fee quotes and proof verification behind a
// single lock.

#ifndef FEEDROUTE_FEEDS_REGISTRY_H
#define FEEDROUTE_FEEDS_REGISTRY_H

#include <feedroute/core/types.h>
#include <feedroute/core/uint256.h>
#include <feedroute/feeds/alias_table.h>
#include <feedroute/feeds/calculated_registry.h>
#include <feedroute/feeds/fees.h>
#include <feedroute/feeds/interfaces.h>
#include <feedroute/feeds/proof.h>
#include <feedroute/feeds/registry_config.h>
#include <feedroute/feeds/resolver.h>

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace feedroute {
namespace feeds {

// ============================================================================
// Wei-normalized Results
// ============================================================================

struct WeiFeedValue {
    Uint256 value;
    Timestamp timestamp{0};
};

struct WeiFeedValues {
    std::vector<Uint256> values;
    Timestamp timestamp{0};
};

struct ResolvedWeiFeeds {
    WeiFeedValues feeds;
    Amount retainedValue{0};
};

// ============================================================================
// Feed Registry
// ============================================================================

/**
 * Feed registry facade.
 *
 * Every public method runs under one registry-wide recursive mutex, so a
 * calculated feed may read its base feeds through the registry while it
 * is being fetched or quoted. Mutations are
 * all-or-nothing and require the caller to pass the authorizer. Event
 * callbacks run after the change is committed and the lock released, so a
 * callback may call back into the registry.
 */
class FeedRegistry {
public:
    using FeedIdChangedCallback = std::function<void(const FeedIdChange&)>;
    using CalculatedFeedCallback = std::function<void(const CalculatedFeedEvent&)>;

    /// @throws std::invalid_argument if a collaborator is null
    FeedRegistry(std::shared_ptr<IIndexedFeedSource> source,
                 std::shared_ptr<IFeeSchedule> feeSchedule,
                 std::shared_ptr<IRootPublisher> rootPublisher,
                 std::shared_ptr<IAuthorizer> authorizer,
                 const RegistryConfig& config = RegistryConfig());
    ~FeedRegistry();

    FeedRegistry(const FeedRegistry&) = delete;
    FeedRegistry& operator=(const FeedRegistry&) = delete;

    // ========================================================================
    // Enumeration and Lookup
    // ========================================================================

    /// Registered index-addressed identifiers followed by calculated ones
    std::vector<FeedId> GetSupportedFeedIds() const;

    /// Current aliases as (old, new) pairs, in changed-list order
    std::vector<FeedIdChange> GetFeedIdChanges() const;

    std::vector<FeedId> GetCalculatedFeedIds() const;

    /// Backing feed of a calculated identifier, nullptr if unregistered
    CalculatedFeedPtr GetCalculatedFeed(const FeedId& id) const;

    /// Index of an identifier after alias resolution
    /// @throws RegistryError NotFound
    FeedIndex GetFeedIndex(const FeedId& id) const;

    /// Identifier at an index
    /// @throws RegistryError NotFound for an unused slot
    FeedId GetFeedId(FeedIndex index) const;

    /// One-hop alias resolution
    FeedId ResolveFeedId(const FeedId& id) const;

    // ========================================================================
    // Fetch
    // ========================================================================

    FeedValue GetFeedById(const FeedId& id, Amount value);
    ResolvedFeeds GetFeedsById(const std::vector<FeedId>& ids, Amount value);
    FeedValue GetFeedByIndex(FeedIndex index, Amount value);
    FeedValues GetFeedsByIndex(const std::vector<FeedIndex>& indices, Amount value);

    WeiFeedValue GetFeedByIdInWei(const FeedId& id, Amount value);
    ResolvedWeiFeeds GetFeedsByIdInWei(const std::vector<FeedId>& ids, Amount value);
    WeiFeedValue GetFeedByIndexInWei(FeedIndex index, Amount value);
    WeiFeedValues GetFeedsByIndexInWei(const std::vector<FeedIndex>& indices, Amount value);

    // ========================================================================
    // Fee Quotes
    // ========================================================================

    Amount CalculateFeeById(const FeedId& id) const;
    Amount CalculateFeeByIds(const std::vector<FeedId>& ids) const;
    Amount CalculateFeeByIndex(FeedIndex index) const;
    Amount CalculateFeeByIndices(const std::vector<FeedIndex>& indices) const;

    // ========================================================================
    // Governance
    // ========================================================================

    void AddCalculatedFeeds(const Address& caller, const std::vector<CalculatedFeedPtr>& feeds);
    void ReplaceCalculatedFeeds(const Address& caller, const std::vector<CalculatedFeedPtr>& feeds);
    void RemoveCalculatedFeedsByIds(const Address& caller, const std::vector<FeedId>& ids);

    /// Set (or with a zero new id, remove) aliases pairwise
    void ChangeFeedIds(const Address& caller,
                       const std::vector<FeedId>& oldIds,
                       const std::vector<FeedId>& newIds);

    // ========================================================================
    // Proofs
    // ========================================================================

    /// @throws RegistryError InvalidProof
    bool VerifyFeedData(const FeedDataWithProof& data) const;

    // ========================================================================
    // Events
    // ========================================================================

    void OnFeedIdChanged(FeedIdChangedCallback callback);
    void OnCalculatedFeedEvent(CalculatedFeedCallback callback);

    const RegistryConfig& GetConfig() const { return config_; }

private:
    void Authorize(const Address& caller, const char* operation) const;
    void PublishCalculatedFeedEvents(std::unique_lock<std::recursive_mutex>& lock,
                                     const std::vector<CalculatedFeedEvent>& events);

    RegistryConfig config_;

    std::shared_ptr<IIndexedFeedSource> source_;
    std::shared_ptr<IFeeSchedule> feeSchedule_;
    std::shared_ptr<IRootPublisher> rootPublisher_;
    std::shared_ptr<IAuthorizer> authorizer_;

    AliasTable aliases_;
    CalculatedFeedRegistry calculated_;

    std::unique_ptr<FeedResolver> resolver_;
    std::unique_ptr<FeeAggregator> fees_;
    std::unique_ptr<ProofVerifier> verifier_;

    std::vector<FeedIdChangedCallback> feedIdCallbacks_;
    std::vector<CalculatedFeedCallback> calculatedCallbacks_;

    mutable std::recursive_mutex mutex_;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_REGISTRY_H
