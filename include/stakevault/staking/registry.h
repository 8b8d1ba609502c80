// STAKEVAULT - Stake Registry
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Storage for stake entries and the indices derived from them:
// - asset -> entry
// - owner -> assets
// - tracked assets / tracked owners enumeration sets
// - total and active stake counters
//
// The registry applies no staking policy. It is not internally locked; the
// owning StakeVault serializes access.

#ifndef STAKEVAULT_STAKING_REGISTRY_H
#define STAKEVAULT_STAKING_REGISTRY_H

#include "stakevault/staking/entry.h"
#include "stakevault/staking/tracked_set.h"

#include <map>
#include <string>
#include <vector>

namespace stakevault {
namespace staking {

class StakeRegistry {
public:
    StakeRegistry() = default;

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * Insert a new entry and index it under its owner.
     * @return false (and no change) if the asset already has an entry
     */
    bool Add(AssetId asset, const StakeEntry& entry);

    /**
     * Delete an entry. The owner leaves the tracked-owner set once their
     * last asset is gone.
     * @return false (and no change) if the asset has no entry
     */
    bool Remove(AssetId asset);

    /// Replace an entry in place; the owner must not change
    bool Update(AssetId asset, const StakeEntry& entry);

    void IncrementActive() { ++activeStakesCount_; }

    /// False if the counter is already zero
    bool DecrementActive();

    void Clear();

    // ========================================================================
    // Queries
    // ========================================================================

    const StakeEntry* Get(AssetId asset) const;
    bool Contains(AssetId asset) const { return entries_.count(asset) > 0; }

    /// Assets held by an owner, order unspecified
    std::vector<AssetId> ListByOwner(const Address& owner) const;
    size_t CountByOwner(const Address& owner) const;

    const std::vector<AssetId>& TrackedAssets() const { return trackedAssets_.Items(); }
    const std::vector<Address>& TrackedOwners() const { return trackedOwners_.Items(); }

    uint64_t StakesCount() const { return stakesCount_; }
    uint64_t ActiveStakesCount() const { return activeStakesCount_; }

    /// All entries ordered by asset id
    std::vector<StakeView> Entries() const;

    /// Describe every broken registry invariant; empty when consistent
    std::vector<std::string> CheckInvariants() const;

private:
    std::map<AssetId, StakeEntry> entries_;
    std::map<Address, std::vector<AssetId>> byOwner_;
    TrackedSet<AssetId> trackedAssets_;
    TrackedSet<Address, AddressHasher> trackedOwners_;

    uint64_t stakesCount_{0};
    uint64_t activeStakesCount_{0};
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_REGISTRY_H
