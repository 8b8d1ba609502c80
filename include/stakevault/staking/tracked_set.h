// STAKEVAULT - Tracked Set
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#ifndef STAKEVAULT_STAKING_TRACKED_SET_H
#define STAKEVAULT_STAKING_TRACKED_SET_H

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

namespace stakevault {
namespace staking {

/**
 * Enumeration set with constant-time insert, remove and lookup.
 *
 * Elements live in a dense vector; removal swaps the last element into the
 * hole, so iteration order is not stable across removals.
 */
template<typename T, typename Hash = std::hash<T>>
class TrackedSet {
public:
    /// Insert if absent; returns true if the element was added
    bool Insert(const T& value) {
        if (index_.count(value) > 0) {
            return false;
        }
        index_.emplace(value, items_.size());
        items_.push_back(value);
        return true;
    }

    /// Remove if present; returns true if the element was removed
    bool Remove(const T& value) {
        auto it = index_.find(value);
        if (it == index_.end()) {
            return false;
        }

        size_t pos = it->second;
        size_t last = items_.size() - 1;
        index_.erase(it);
        if (pos != last) {
            items_[pos] = items_[last];
            index_[items_[pos]] = pos;
        }
        items_.pop_back();
        return true;
    }

    bool Contains(const T& value) const {
        return index_.count(value) > 0;
    }

    size_t Size() const { return items_.size(); }
    bool Empty() const { return items_.empty(); }

    void Clear() {
        items_.clear();
        index_.clear();
    }

    /// Snapshot of the members, order unspecified
    const std::vector<T>& Items() const { return items_; }

    typename std::vector<T>::const_iterator begin() const { return items_.begin(); }
    typename std::vector<T>::const_iterator end() const { return items_.end(); }

private:
    std::vector<T> items_;
    std::unordered_map<T, size_t, Hash> index_;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_TRACKED_SET_H
