// FEEDROUTE - Enumerable Map
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Map whose keys are also kept in a dense list. Each entry stores its
// 1-based position in that list. Removal moves the last key into the freed
// slot (swap-and-pop), so key order is not preserved, but every stored
// position always matches the key's actual slot.

#ifndef FEEDROUTE_FEEDS_INDEXED_MAP_H
#define FEEDROUTE_FEEDS_INDEXED_MAP_H

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace feedroute {
namespace feeds {

template<typename Key, typename Value, typename Hasher = std::hash<Key>>
class IndexedMap {
public:
    /// Look up a value; nullptr if absent
    const Value* Find(const Key& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second.value;
    }

    bool Contains(const Key& key) const {
        return entries_.find(key) != entries_.end();
    }

    /// 1-based list position, 0 if absent
    size_t PositionOf(const Key& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? 0 : it->second.position;
    }

    /// Append a new key; false if the key is already present
    bool Insert(const Key& key, Value value) {
        if (Contains(key)) {
            return false;
        }
        keys_.push_back(key);
        entries_.emplace(key, Slot{std::move(value), keys_.size()});
        return true;
    }

    /// Replace the value of an existing key, keeping its position.
    /// Returns false if the key is absent.
    bool Assign(const Key& key, Value value) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        it->second.value = std::move(value);
        return true;
    }

    /// Swap-and-pop removal; false if the key is absent
    bool Erase(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }

        size_t slot = it->second.position - 1;
        size_t last = keys_.size() - 1;
        if (slot != last) {
            const Key& moved = keys_[last];
            keys_[slot] = moved;
            entries_.find(moved)->second.position = slot + 1;
        }
        keys_.pop_back();
        entries_.erase(it);
        return true;
    }

    /// Keys in list order
    const std::vector<Key>& Keys() const { return keys_; }

    size_t Size() const { return keys_.size(); }
    bool Empty() const { return keys_.empty(); }

    void Clear() {
        keys_.clear();
        entries_.clear();
    }

    /// Verify that the list and the reverse index agree
    bool CheckConsistency() const {
        if (keys_.size() != entries_.size()) {
            return false;
        }
        for (size_t i = 0; i < keys_.size(); ++i) {
            auto it = entries_.find(keys_[i]);
            if (it == entries_.end() || it->second.position != i + 1) {
                return false;
            }
        }
        return true;
    }

private:
    struct Slot {
        Value value;
        size_t position;   // 1-based index into keys_
    };

    std::vector<Key> keys_;
    std::unordered_map<Key, Slot, Hasher> entries_;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_INDEXED_MAP_H
