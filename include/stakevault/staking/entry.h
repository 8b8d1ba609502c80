// STAKEVAULT - Stake Entry
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// The per-asset record kept while an asset sits in vault custody.

#ifndef STAKEVAULT_STAKING_ENTRY_H
#define STAKEVAULT_STAKING_ENTRY_H

#include "stakevault/core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace stakevault {
namespace staking {

/// Lifecycle of a staked asset: Staked -> Unbonding -> Free -> removed
enum class StakeState : uint8_t {
    /// Accruing rewards
    Staked = 0,

    /// Voluntary exit requested, waiting for unbondingAt
    Unbonding = 1,

    /// Exit tax paid, ready to be withdrawn
    Free = 2
};

/// Convert state to string
const char* StakeStateToString(StakeState state);

/**
 * One staked (or exiting) asset.
 */
struct StakeEntry {
    StakeState state{StakeState::Staked};

    /// Depositor; never changes for the life of the entry
    Address owner;

    /// When the asset entered Staked
    Timestamp stakedAt{0};

    /// Unbonding completion time after a voluntary unstake, or the time the
    /// exit tax was paid after a forced one. Zero while Staked.
    Timestamp unbondingAt{0};

    /// Block height through which rewards have been paid
    BlockHeight lastClaimedBlock{0};

    bool IsStaked() const { return state == StakeState::Staked; }

    std::vector<Byte> Serialize() const;
    static std::optional<StakeEntry> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;

    bool operator==(const StakeEntry& other) const {
        return state == other.state && owner == other.owner &&
               stakedAt == other.stakedAt && unbondingAt == other.unbondingAt &&
               lastClaimedBlock == other.lastClaimedBlock;
    }
    bool operator!=(const StakeEntry& other) const { return !(*this == other); }
};

/// Entry together with the asset it belongs to
struct StakeView {
    AssetId asset{0};
    StakeEntry entry;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_ENTRY_H
