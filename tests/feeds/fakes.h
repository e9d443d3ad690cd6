// FEEDROUTE - Test Collaborators
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// In-memory implementations of the registry's collaborator interfaces.
// Each records the calls it receives so tests can check what was forwarded.

#ifndef FEEDROUTE_TESTS_FEEDS_FAKES_H
#define FEEDROUTE_TESTS_FEEDS_FAKES_H

#include <feedroute/core/types.h>
#include <feedroute/feeds/errors.h>
#include <feedroute/feeds/feed_id.h>
#include <feedroute/feeds/interfaces.h>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace feedroute {
namespace feeds {
namespace test {

inline FeedId Crypto(const std::string& name) {
    return EncodeFeedId(FEED_CATEGORY_CRYPTO, name);
}

inline FeedId Calculated(const std::string& name, Byte category = FEED_CATEGORY_CALCULATED_MIN) {
    return EncodeFeedId(category, name);
}

// ============================================================================
// Index Source
// ============================================================================

class FakeIndexedSource : public IIndexedFeedSource {
public:
    struct Reading {
        Uint256 value;
        int8_t decimals{0};
    };

    struct Call {
        std::vector<FeedIndex> indices;
        Amount value{0};
    };

    /// Append a feed at the next index and return that index
    FeedIndex AddFeed(const FeedId& id, uint64_t value, int8_t decimals) {
        FeedIndex index = static_cast<FeedIndex>(ids_.size());
        ids_.push_back(id);
        readings_[index] = Reading{Uint256(value), decimals};
        return index;
    }

    /// Leave a zero identifier in the slot
    void RemoveFeed(FeedIndex index) {
        ids_[index].SetNull();
    }

    FeedIndex IdToIndex(const FeedId& id) const override {
        for (size_t i = 0; i < ids_.size(); ++i) {
            if (!id.IsNull() && ids_[i] == id) {
                return static_cast<FeedIndex>(i);
            }
        }
        throw RegistryError(RegistryErrorCode::NotFound, FeedIdToString(id));
    }

    FeedId IndexToId(FeedIndex index) const override {
        return index < ids_.size() ? ids_[index] : FeedId();
    }

    std::vector<FeedId> FeedIds() const override {
        return ids_;
    }

    FeedValues FetchBatch(const std::vector<FeedIndex>& indices, Amount value) override {
        calls.push_back({indices, value});
        FeedValues result;
        for (FeedIndex index : indices) {
            auto it = readings_.find(index);
            if (it == readings_.end()) {
                throw RegistryError(RegistryErrorCode::NotFound,
                                    "index " + std::to_string(index));
            }
            result.values.push_back(it->second.value);
            result.decimals.push_back(it->second.decimals);
        }
        result.timestamp = timestamp;
        return result;
    }

    Timestamp timestamp{1700000000};
    std::vector<Call> calls;

private:
    std::vector<FeedId> ids_;
    std::map<FeedIndex, Reading> readings_;
};

// ============================================================================
// Calculated Feed
// ============================================================================

class FakeCalculatedFeed : public ICalculatedFeed {
public:
    FakeCalculatedFeed(const FeedId& id, Amount fee, uint64_t value, int8_t decimals,
                       Timestamp timestamp = 1600000000)
        : id_(id), fee_(fee), value_(value), decimals_(decimals), timestamp_(timestamp) {}

    FeedId GetFeedId() const override { return id_; }
    Amount CalculateFee() const override { return fee_; }

    FeedValue GetCurrentFeed(Amount value) override {
        received.push_back(value);
        FeedValue reading;
        reading.value = Uint256(value_);
        reading.decimals = decimals_;
        reading.timestamp = timestamp_;
        return reading;
    }

    std::vector<Amount> received;

private:
    FeedId id_;
    Amount fee_;
    uint64_t value_;
    int8_t decimals_;
    Timestamp timestamp_;
};

inline std::shared_ptr<FakeCalculatedFeed> MakeCalculatedFeed(
    const FeedId& id, Amount fee = 0, uint64_t value = 0, int8_t decimals = 0,
    Timestamp timestamp = 1600000000) {
    return std::make_shared<FakeCalculatedFeed>(id, fee, value, decimals, timestamp);
}

// ============================================================================
// Fee Schedule
// ============================================================================

class FakeFeeSchedule : public IFeeSchedule {
public:
    Amount FeeForIds(const std::vector<FeedId>& ids) const override {
        ++idCalls;
        lastIds = ids;
        Amount total = 0;
        for (const auto& id : ids) {
            auto it = feeById.find(id);
            total += it != feeById.end() ? it->second : defaultFee;
        }
        return total;
    }

    Amount FeeForIndices(const std::vector<FeedIndex>& indices) const override {
        ++indexCalls;
        return static_cast<Amount>(indices.size()) * defaultFee;
    }

    std::map<FeedId, Amount> feeById;
    Amount defaultFee{1};

    mutable int idCalls{0};
    mutable int indexCalls{0};
    mutable std::vector<FeedId> lastIds;
};

// ============================================================================
// Root Publisher
// ============================================================================

class FakeRootPublisher : public IRootPublisher {
public:
    void Publish(uint8_t protocolId, uint32_t round, const Hash256& root) {
        roots_[{protocolId, round}] = root;
    }

    Hash256 RootFor(uint8_t protocolId, uint32_t votingRoundId) const override {
        auto it = roots_.find({protocolId, votingRoundId});
        return it != roots_.end() ? it->second : Hash256();
    }

private:
    std::map<std::pair<uint8_t, uint32_t>, Hash256> roots_;
};

// ============================================================================
// Authorizer
// ============================================================================

class FakeAuthorizer : public IAuthorizer {
public:
    void Allow(const Address& caller) { allowed_.insert(caller); }

    bool IsAuthorized(const Address& caller) const override {
        return allowed_.count(caller) != 0;
    }

private:
    std::set<Address> allowed_;
};

inline Address MakeAddress(Byte seed) {
    Address addr;
    for (size_t i = 0; i < Address::SIZE; ++i) {
        addr[i] = seed;
    }
    return addr;
}

} // namespace test
} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_TESTS_FEEDS_FAKES_H
