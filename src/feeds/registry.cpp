// FEEDROUTE - Feed Registry Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/registry.h>
#include <feedroute/feeds/decimals.h>
#include <feedroute/feeds/errors.h>
#include <feedroute/feeds/feed_id.h>
#include <feedroute/util/logging.h>

#include <stdexcept>

namespace feedroute {
namespace feeds {

namespace {

template<typename T>
std::shared_ptr<T> Require(std::shared_ptr<T> ptr, const char* name) {
    if (!ptr) {
        throw std::invalid_argument(std::string("FeedRegistry: null ") + name);
    }
    return ptr;
}

WeiFeedValue ToWeiValue(const FeedValue& reading) {
    WeiFeedValue result;
    result.value = ToWei(reading.value, reading.decimals);
    result.timestamp = reading.timestamp;
    return result;
}

WeiFeedValues ToWeiValues(const FeedValues& readings) {
    WeiFeedValues result;
    result.values = ToWei(readings.values, readings.decimals);
    result.timestamp = readings.timestamp;
    return result;
}

} // namespace

FeedRegistry::FeedRegistry(std::shared_ptr<IIndexedFeedSource> source,
                           std::shared_ptr<IFeeSchedule> feeSchedule,
                           std::shared_ptr<IRootPublisher> rootPublisher,
                           std::shared_ptr<IAuthorizer> authorizer,
                           const RegistryConfig& config)
    : config_(config)
    , source_(Require(std::move(source), "feed source"))
    , feeSchedule_(Require(std::move(feeSchedule), "fee schedule"))
    , rootPublisher_(Require(std::move(rootPublisher), "root publisher"))
    , authorizer_(Require(std::move(authorizer), "authorizer")) {
    resolver_ = std::make_unique<FeedResolver>(aliases_, calculated_, *source_);
    fees_ = std::make_unique<FeeAggregator>(aliases_, calculated_, *source_, *feeSchedule_);
    verifier_ = std::make_unique<ProofVerifier>(*rootPublisher_, config_.protocolId);

    LOG_DEBUG(util::LogCategory::REGISTRY)
        << "Feed registry created, protocol id " << static_cast<int>(config_.protocolId);
}

FeedRegistry::~FeedRegistry() = default;

// ============================================================================
// Enumeration and Lookup
// ============================================================================

std::vector<FeedId> FeedRegistry::GetSupportedFeedIds() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<FeedId> result;
    for (const auto& id : source_->FeedIds()) {
        if (!id.IsNull()) {
            result.push_back(id);
        }
    }
    const auto& calculated = calculated_.List();
    result.insert(result.end(), calculated.begin(), calculated.end());
    return result;
}

std::vector<FeedIdChange> FeedRegistry::GetFeedIdChanges() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<FeedIdChange> result;
    result.reserve(aliases_.Size());
    for (const auto& oldId : aliases_.ListChanged()) {
        result.push_back({oldId, aliases_.GetAlias(oldId)});
    }
    return result;
}

std::vector<FeedId> FeedRegistry::GetCalculatedFeedIds() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return calculated_.List();
}

CalculatedFeedPtr FeedRegistry::GetCalculatedFeed(const FeedId& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return calculated_.Get(id);
}

FeedIndex FeedRegistry::GetFeedIndex(const FeedId& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return source_->IdToIndex(aliases_.Resolve(id));
}

FeedId FeedRegistry::GetFeedId(FeedIndex index) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    FeedId id = source_->IndexToId(index);
    if (id.IsNull()) {
        throw RegistryError(RegistryErrorCode::NotFound, "index " + std::to_string(index));
    }
    return id;
}

FeedId FeedRegistry::ResolveFeedId(const FeedId& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return aliases_.Resolve(id);
}

// ============================================================================
// Fetch
// ============================================================================

FeedValue FeedRegistry::GetFeedById(const FeedId& id, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return resolver_->ResolveOne(id, value);
}

ResolvedFeeds FeedRegistry::GetFeedsById(const std::vector<FeedId>& ids, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return resolver_->ResolveMany(ids, value);
}

FeedValue FeedRegistry::GetFeedByIndex(FeedIndex index, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return resolver_->FetchByIndex(index, value);
}

FeedValues FeedRegistry::GetFeedsByIndex(const std::vector<FeedIndex>& indices, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return resolver_->FetchByIndices(indices, value);
}

WeiFeedValue FeedRegistry::GetFeedByIdInWei(const FeedId& id, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ToWeiValue(resolver_->ResolveOne(id, value));
}

ResolvedWeiFeeds FeedRegistry::GetFeedsByIdInWei(const std::vector<FeedId>& ids, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ResolvedFeeds resolved = resolver_->ResolveMany(ids, value);

    ResolvedWeiFeeds result;
    result.feeds = ToWeiValues(resolved.feeds);
    result.retainedValue = resolved.retainedValue;
    return result;
}

WeiFeedValue FeedRegistry::GetFeedByIndexInWei(FeedIndex index, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ToWeiValue(resolver_->FetchByIndex(index, value));
}

WeiFeedValues FeedRegistry::GetFeedsByIndexInWei(const std::vector<FeedIndex>& indices,
                                                 Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ToWeiValues(resolver_->FetchByIndices(indices, value));
}

// ============================================================================
// Fee Quotes
// ============================================================================

Amount FeedRegistry::CalculateFeeById(const FeedId& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fees_->FeeForOne(id);
}

Amount FeedRegistry::CalculateFeeByIds(const std::vector<FeedId>& ids) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fees_->FeeForMany(ids);
}

Amount FeedRegistry::CalculateFeeByIndex(FeedIndex index) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fees_->FeeForIndex(index);
}

Amount FeedRegistry::CalculateFeeByIndices(const std::vector<FeedIndex>& indices) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fees_->FeeForIndices(indices);
}

// ============================================================================
// Governance
// ============================================================================

void FeedRegistry::Authorize(const Address& caller, const char* operation) const {
    if (!authorizer_->IsAuthorized(caller)) {
        LOG_WARN(util::LogCategory::REGISTRY)
            << operation << " rejected: caller 0x" << caller.ToHex() << " is not authorized";
        throw RegistryError(RegistryErrorCode::Unauthorized, "0x" + caller.ToHex());
    }
}

void FeedRegistry::PublishCalculatedFeedEvents(std::unique_lock<std::recursive_mutex>& lock,
                                               const std::vector<CalculatedFeedEvent>& events) {
    for (const auto& event : events) {
        LOG_INFO(util::LogCategory::REGISTRY)
            << "Calculated feed " << CalculatedFeedEventKindToString(event.kind)
            << ": " << FeedIdToString(event.feedId);
    }

    auto callbacks = calculatedCallbacks_;
    lock.unlock();

    for (const auto& event : events) {
        for (const auto& callback : callbacks) {
            callback(event);
        }
    }
}

void FeedRegistry::AddCalculatedFeeds(const Address& caller,
                                      const std::vector<CalculatedFeedPtr>& feeds) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    Authorize(caller, "AddCalculatedFeeds");

    std::vector<CalculatedFeedEvent> events;
    try {
        events = calculated_.Add(feeds);
    } catch (const RegistryError& e) {
        LOG_WARN(util::LogCategory::REGISTRY) << "AddCalculatedFeeds rejected: " << e.what();
        throw;
    }
    PublishCalculatedFeedEvents(lock, events);
}

void FeedRegistry::ReplaceCalculatedFeeds(const Address& caller,
                                          const std::vector<CalculatedFeedPtr>& feeds) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    Authorize(caller, "ReplaceCalculatedFeeds");

    std::vector<CalculatedFeedEvent> events;
    try {
        events = calculated_.Replace(feeds);
    } catch (const RegistryError& e) {
        LOG_WARN(util::LogCategory::REGISTRY) << "ReplaceCalculatedFeeds rejected: " << e.what();
        throw;
    }
    PublishCalculatedFeedEvents(lock, events);
}

void FeedRegistry::RemoveCalculatedFeedsByIds(const Address& caller,
                                              const std::vector<FeedId>& ids) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    Authorize(caller, "RemoveCalculatedFeedsByIds");

    std::vector<CalculatedFeedEvent> events;
    try {
        events = calculated_.Remove(ids);
    } catch (const RegistryError& e) {
        LOG_WARN(util::LogCategory::REGISTRY) << "RemoveCalculatedFeedsByIds rejected: " << e.what();
        throw;
    }
    PublishCalculatedFeedEvents(lock, events);
}

void FeedRegistry::ChangeFeedIds(const Address& caller,
                                 const std::vector<FeedId>& oldIds,
                                 const std::vector<FeedId>& newIds) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    Authorize(caller, "ChangeFeedIds");

    std::vector<FeedIdChange> changes;
    try {
        changes = aliases_.Change(oldIds, newIds);
    } catch (const RegistryError& e) {
        LOG_WARN(util::LogCategory::ALIAS) << "ChangeFeedIds rejected: " << e.what();
        throw;
    }

    for (const auto& change : changes) {
        if (change.newId.IsNull()) {
            LOG_INFO(util::LogCategory::ALIAS)
                << "Alias removed: " << FeedIdToString(change.oldId);
        } else {
            LOG_INFO(util::LogCategory::ALIAS)
                << "Alias set: " << FeedIdToString(change.oldId)
                << " -> " << FeedIdToString(change.newId);
        }
    }

    auto callbacks = feedIdCallbacks_;
    lock.unlock();

    for (const auto& change : changes) {
        for (const auto& callback : callbacks) {
            callback(change);
        }
    }
}

// ============================================================================
// Proofs
// ============================================================================

bool FeedRegistry::VerifyFeedData(const FeedDataWithProof& data) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return verifier_->Verify(data);
}

// ============================================================================
// Events
// ============================================================================

void FeedRegistry::OnFeedIdChanged(FeedIdChangedCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    feedIdCallbacks_.push_back(std::move(callback));
}

void FeedRegistry::OnCalculatedFeedEvent(CalculatedFeedCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    calculatedCallbacks_.push_back(std::move(callback));
}

} // namespace feeds
} // namespace feedroute
