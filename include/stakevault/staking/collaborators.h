// STAKEVAULT - External Collaborators
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Narrow interfaces the vault depends on for custody, authorization and
// pausing. All calls are synchronous and report failure through their
// return value.

#ifndef STAKEVAULT_STAKING_COLLABORATORS_H
#define STAKEVAULT_STAKING_COLLABORATORS_H

#include "stakevault/core/types.h"

#include <optional>

namespace stakevault {
namespace staking {

// ============================================================================
// Custody
// ============================================================================

/// Registry of unique collectible assets
class IAssetCustodian {
public:
    virtual ~IAssetCustodian() = default;

    /// Current holder, or nullopt if the asset does not exist
    virtual std::optional<Address> OwnerOf(AssetId asset) const = 0;

    /// Move an asset; false if from is not the holder or the receiver refuses
    virtual bool Transfer(const Address& from, const Address& to, AssetId asset) = 0;
};

/// Fungible reward token balances
class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    virtual Amount BalanceOf(const Address& account) const = 0;

    /// Move tokens; false on insufficient balance or invalid amount
    virtual bool Transfer(const Address& from, const Address& to, Amount amount) = 0;
};

/// Implemented by accounts that must acknowledge incoming assets
class IAssetReceiver {
public:
    virtual ~IAssetReceiver() = default;

    virtual bool OnAssetReceived(const Address& op, const Address& from, AssetId asset) = 0;
};

// ============================================================================
// Authorization and Pausing
// ============================================================================

/// Privileged vault operations
enum class AdminAction : uint8_t {
    SetStakeLimit,
    SetRewardPerBlock,
    SetEarlyExitTax,
    SetCarryAmount,
    SetStakingEndTime,
    SetUnbondingPeriod,
    Pause,
    Unpause,
    WithdrawRewardPool,
    WithdrawAsset
};

/// Convert action to string
const char* AdminActionToString(AdminAction action);

class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;

    virtual bool IsAuthorized(const Address& caller, AdminAction action) const = 0;
};

class IPauseGate {
public:
    virtual ~IPauseGate() = default;

    virtual bool IsPaused() const = 0;
    virtual void SetPaused(bool paused) = 0;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_COLLABORATORS_H
