// STAKEVAULT - Local Ledgers
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/local_ledger.h"
#include "stakevault/core/serialize.h"
#include "stakevault/util/logging.h"

namespace stakevault {
namespace staking {

const char* AdminActionToString(AdminAction action) {
    switch (action) {
        case AdminAction::SetStakeLimit: return "SetStakeLimit";
        case AdminAction::SetRewardPerBlock: return "SetRewardPerBlock";
        case AdminAction::SetEarlyExitTax: return "SetEarlyExitTax";
        case AdminAction::SetCarryAmount: return "SetCarryAmount";
        case AdminAction::SetStakingEndTime: return "SetStakingEndTime";
        case AdminAction::SetUnbondingPeriod: return "SetUnbondingPeriod";
        case AdminAction::Pause: return "Pause";
        case AdminAction::Unpause: return "Unpause";
        case AdminAction::WithdrawRewardPool: return "WithdrawRewardPool";
        case AdminAction::WithdrawAsset: return "WithdrawAsset";
        default: return "Unknown";
    }
}

// ============================================================================
// LocalAssetBook
// ============================================================================

bool LocalAssetBook::Mint(const Address& owner, AssetId asset) {
    if (owner.IsNull()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.emplace(asset, owner).second;
}

std::optional<Address> LocalAssetBook::OwnerOf(AssetId asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(asset);
    if (it == owners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LocalAssetBook::Transfer(const Address& from, const Address& to, AssetId asset) {
    IAssetReceiver* receiver = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = owners_.find(asset);
        if (it == owners_.end() || it->second != from || to.IsNull()) {
            return false;
        }
        it->second = to;

        auto rit = receivers_.find(to);
        if (rit != receivers_.end()) {
            receiver = rit->second;
        }
    }

    // Receiver runs unlocked so it may query the book
    if (receiver && !receiver->OnAssetReceived(from, from, asset)) {
        std::lock_guard<std::mutex> lock(mutex_);
        owners_[asset] = from;
        LOG_WARN(util::LogCategory::CUSTODY) << "Receiver " << to.ToHex()
                                             << " refused asset " << asset;
        return false;
    }

    LOG_TRACE(util::LogCategory::CUSTODY) << "Asset " << asset << " "
                                          << from.ToHex() << " -> " << to.ToHex();
    return true;
}

void LocalAssetBook::RegisterReceiver(const Address& account, IAssetReceiver* receiver) {
    std::lock_guard<std::mutex> lock(mutex_);
    receivers_[account] = receiver;
}

void LocalAssetBook::UnregisterReceiver(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    receivers_.erase(account);
}

std::vector<AssetId> LocalAssetBook::AssetsOf(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AssetId> result;
    for (const auto& [asset, holder] : owners_) {
        if (holder == owner) {
            result.push_back(asset);
        }
    }
    return result;
}

size_t LocalAssetBook::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.size();
}

std::vector<Byte> LocalAssetBook::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataStream ss;
    WriteCompactSize(ss, owners_.size());
    for (const auto& [asset, owner] : owners_) {
        ss << asset;
        ss << owner;
    }
    return ss.Bytes();
}

bool LocalAssetBook::Deserialize(const Byte* data, size_t len) {
    std::map<AssetId, Address> owners;
    try {
        DataStream ss(data, len);
        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            AssetId asset;
            Address owner;
            ss >> asset;
            ss >> owner;
            owners[asset] = owner;
        }
        if (!ss.empty()) {
            return false;
        }
    } catch (const std::ios_base::failure&) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    owners_ = std::move(owners);
    return true;
}

// ============================================================================
// LocalTokenBook
// ============================================================================

bool LocalTokenBook::Mint(const Address& account, Amount amount) {
    if (amount <= 0 || !MoneyRange(amount) || account.IsNull()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& balance = balances_[account];
    if (balance > MAX_MONEY - amount) {
        return false;
    }
    balance += amount;
    return true;
}

Amount LocalTokenBook::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

bool LocalTokenBook::Transfer(const Address& from, const Address& to, Amount amount) {
    if (amount < 0 || to.IsNull()) {
        return false;
    }
    if (amount == 0) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    balances_[to] += amount;

    LOG_TRACE(util::LogCategory::CUSTODY) << FormatAmount(amount) << " "
                                          << from.ToHex() << " -> " << to.ToHex();
    return true;
}

Amount LocalTokenBook::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [account, balance] : balances_) {
        total += balance;
    }
    return total;
}

std::vector<Byte> LocalTokenBook::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataStream ss;
    WriteCompactSize(ss, balances_.size());
    for (const auto& [account, balance] : balances_) {
        ss << account;
        ss << balance;
    }
    return ss.Bytes();
}

bool LocalTokenBook::Deserialize(const Byte* data, size_t len) {
    std::map<Address, Amount> balances;
    try {
        DataStream ss(data, len);
        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            Address account;
            Amount balance;
            ss >> account;
            ss >> balance;
            if (!MoneyRange(balance)) {
                return false;
            }
            balances[account] = balance;
        }
        if (!ss.empty()) {
            return false;
        }
    } catch (const std::ios_base::failure&) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    balances_ = std::move(balances);
    return true;
}

// ============================================================================
// RoleAuthorizer
// ============================================================================

void RoleAuthorizer::AddAdmin(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    admins_.insert(account);
}

void RoleAuthorizer::RemoveAdmin(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    admins_.erase(account);
}

bool RoleAuthorizer::IsAdmin(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admins_.count(account) > 0;
}

void RoleAuthorizer::Grant(const Address& account, AdminAction action) {
    std::lock_guard<std::mutex> lock(mutex_);
    grants_.emplace(account, action);
}

void RoleAuthorizer::Revoke(const Address& account, AdminAction action) {
    std::lock_guard<std::mutex> lock(mutex_);
    grants_.erase({account, action});
}

bool RoleAuthorizer::IsAuthorized(const Address& caller, AdminAction action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admins_.count(caller) > 0 || grants_.count({caller, action}) > 0;
}

std::vector<Byte> RoleAuthorizer::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataStream ss;
    WriteCompactSize(ss, admins_.size());
    for (const auto& admin : admins_) {
        ss << admin;
    }
    WriteCompactSize(ss, grants_.size());
    for (const auto& [account, action] : grants_) {
        ss << account;
        ss << static_cast<uint8_t>(action);
    }
    return ss.Bytes();
}

bool RoleAuthorizer::Deserialize(const Byte* data, size_t len) {
    std::set<Address> admins;
    std::set<std::pair<Address, AdminAction>> grants;
    try {
        DataStream ss(data, len);
        uint64_t adminCount = ReadCompactSize(ss);
        for (uint64_t i = 0; i < adminCount; ++i) {
            Address admin;
            ss >> admin;
            admins.insert(admin);
        }
        uint64_t grantCount = ReadCompactSize(ss);
        for (uint64_t i = 0; i < grantCount; ++i) {
            Address account;
            uint8_t action;
            ss >> account;
            ss >> action;
            if (action > static_cast<uint8_t>(AdminAction::WithdrawAsset)) {
                return false;
            }
            grants.emplace(account, static_cast<AdminAction>(action));
        }
        if (!ss.empty()) {
            return false;
        }
    } catch (const std::ios_base::failure&) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    admins_ = std::move(admins);
    grants_ = std::move(grants);
    return true;
}

} // namespace staking
} // namespace stakevault
