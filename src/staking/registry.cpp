// STAKEVAULT - Stake Registry
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/registry.h"
#include "stakevault/util/logging.h"

#include <algorithm>

namespace stakevault {
namespace staking {

// ============================================================================
// Mutation
// ============================================================================

bool StakeRegistry::Add(AssetId asset, const StakeEntry& entry) {
    if (entries_.count(asset) > 0) {
        return false;
    }

    entries_.emplace(asset, entry);
    byOwner_[entry.owner].push_back(asset);
    trackedAssets_.Insert(asset);
    trackedOwners_.Insert(entry.owner);
    ++stakesCount_;

    LOG_TRACE(util::LogCategory::REGISTRY) << "Added asset " << asset
                                           << " for " << entry.owner.ToHex();
    return true;
}

bool StakeRegistry::Remove(AssetId asset) {
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return false;
    }

    Address owner = it->second.owner;

    auto ownerIt = byOwner_.find(owner);
    if (ownerIt != byOwner_.end()) {
        auto& assets = ownerIt->second;
        auto pos = std::find(assets.begin(), assets.end(), asset);
        if (pos != assets.end()) {
            *pos = assets.back();
            assets.pop_back();
        }
        if (assets.empty()) {
            byOwner_.erase(ownerIt);
            trackedOwners_.Remove(owner);
        }
    }

    trackedAssets_.Remove(asset);
    entries_.erase(it);
    --stakesCount_;

    LOG_TRACE(util::LogCategory::REGISTRY) << "Removed asset " << asset
                                           << " of " << owner.ToHex();
    return true;
}

bool StakeRegistry::Update(AssetId asset, const StakeEntry& entry) {
    auto it = entries_.find(asset);
    if (it == entries_.end() || it->second.owner != entry.owner) {
        return false;
    }
    it->second = entry;
    return true;
}

bool StakeRegistry::DecrementActive() {
    if (activeStakesCount_ == 0) {
        return false;
    }
    --activeStakesCount_;
    return true;
}

void StakeRegistry::Clear() {
    entries_.clear();
    byOwner_.clear();
    trackedAssets_.Clear();
    trackedOwners_.Clear();
    stakesCount_ = 0;
    activeStakesCount_ = 0;
}

// ============================================================================
// Queries
// ============================================================================

const StakeEntry* StakeRegistry::Get(AssetId asset) const {
    auto it = entries_.find(asset);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<AssetId> StakeRegistry::ListByOwner(const Address& owner) const {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) {
        return {};
    }
    return it->second;
}

size_t StakeRegistry::CountByOwner(const Address& owner) const {
    auto it = byOwner_.find(owner);
    return it == byOwner_.end() ? 0 : it->second.size();
}

std::vector<StakeView> StakeRegistry::Entries() const {
    std::vector<StakeView> result;
    result.reserve(entries_.size());
    for (const auto& [asset, entry] : entries_) {
        result.push_back({asset, entry});
    }
    return result;
}

std::vector<std::string> StakeRegistry::CheckInvariants() const {
    std::vector<std::string> violations;

    // Entry <-> tracked asset <-> exactly one owner list
    std::map<AssetId, size_t> listed;
    for (const auto& [owner, assets] : byOwner_) {
        if (assets.empty()) {
            violations.push_back("owner " + owner.ToHex() + " has an empty asset list");
        }
        if (!trackedOwners_.Contains(owner)) {
            violations.push_back("owner " + owner.ToHex() + " not tracked");
        }
        for (AssetId asset : assets) {
            ++listed[asset];
            auto it = entries_.find(asset);
            if (it == entries_.end()) {
                violations.push_back("asset " + std::to_string(asset) +
                                     " listed without an entry");
            } else if (it->second.owner != owner) {
                violations.push_back("asset " + std::to_string(asset) +
                                     " listed under a different owner");
            }
        }
    }

    uint64_t active = 0;
    for (const auto& [asset, entry] : entries_) {
        if (entry.state == StakeState::Staked) {
            ++active;
        }
        if (!trackedAssets_.Contains(asset)) {
            violations.push_back("asset " + std::to_string(asset) + " not tracked");
        }
        auto it = listed.find(asset);
        if (it == listed.end() || it->second != 1) {
            violations.push_back("asset " + std::to_string(asset) +
                                 " not in exactly one owner list");
        }
    }

    if (trackedAssets_.Size() != entries_.size()) {
        violations.push_back("tracked asset count differs from entry count");
    }
    if (trackedOwners_.Size() != byOwner_.size()) {
        violations.push_back("tracked owner count differs from owner list count");
    }
    if (stakesCount_ != entries_.size()) {
        violations.push_back("stakesCount " + std::to_string(stakesCount_) +
                             " != entries " + std::to_string(entries_.size()));
    }
    if (activeStakesCount_ != active) {
        violations.push_back("activeStakesCount " + std::to_string(activeStakesCount_) +
                             " != staked entries " + std::to_string(active));
    }

    return violations;
}

} // namespace staking
} // namespace stakevault
