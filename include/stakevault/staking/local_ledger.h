// STAKEVAULT - Local Ledgers
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// In-process implementations of the collaborator interfaces. The CLI keeps
// its whole world in these and persists them next to the vault state.

#ifndef STAKEVAULT_STAKING_LOCAL_LEDGER_H
#define STAKEVAULT_STAKING_LOCAL_LEDGER_H

#include "stakevault/staking/collaborators.h"

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace stakevault {
namespace staking {

// ============================================================================
// LocalAssetBook
// ============================================================================

/**
 * Ownership map of unique assets. Transfers to an address with a registered
 * IAssetReceiver are offered to the receiver and rolled back if refused.
 */
class LocalAssetBook : public IAssetCustodian {
public:
    LocalAssetBook() = default;

    /// Create a new asset; false if the id already exists
    bool Mint(const Address& owner, AssetId asset);

    std::optional<Address> OwnerOf(AssetId asset) const override;
    bool Transfer(const Address& from, const Address& to, AssetId asset) override;

    /// The receiver is not owned and must outlive its registration
    void RegisterReceiver(const Address& account, IAssetReceiver* receiver);
    void UnregisterReceiver(const Address& account);

    /// Assets held by an account, in id order
    std::vector<AssetId> AssetsOf(const Address& owner) const;

    size_t Size() const;

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    std::map<AssetId, Address> owners_;
    std::map<Address, IAssetReceiver*> receivers_;
    mutable std::mutex mutex_;
};

// ============================================================================
// LocalTokenBook
// ============================================================================

class LocalTokenBook : public ITokenLedger {
public:
    LocalTokenBook() = default;

    /// Credit new tokens; false on a non-positive amount or overflow
    bool Mint(const Address& account, Amount amount);

    Amount BalanceOf(const Address& account) const override;
    bool Transfer(const Address& from, const Address& to, Amount amount) override;

    Amount TotalSupply() const;

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    std::map<Address, Amount> balances_;
    mutable std::mutex mutex_;
};

// ============================================================================
// RoleAuthorizer
// ============================================================================

/**
 * Admins may perform every action; other accounts only what they were granted.
 */
class RoleAuthorizer : public IAuthorizer {
public:
    RoleAuthorizer() = default;

    void AddAdmin(const Address& account);
    void RemoveAdmin(const Address& account);
    bool IsAdmin(const Address& account) const;

    void Grant(const Address& account, AdminAction action);
    void Revoke(const Address& account, AdminAction action);

    bool IsAuthorized(const Address& caller, AdminAction action) const override;

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    std::set<Address> admins_;
    std::set<std::pair<Address, AdminAction>> grants_;
    mutable std::mutex mutex_;
};

// ============================================================================
// LocalPauseGate
// ============================================================================

class LocalPauseGate : public IPauseGate {
public:
    explicit LocalPauseGate(bool paused = false) : paused_(paused) {}

    bool IsPaused() const override { return paused_.load(); }
    void SetPaused(bool paused) override { paused_.store(paused); }

private:
    std::atomic<bool> paused_;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_LOCAL_LEDGER_H
