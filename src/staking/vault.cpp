// STAKEVAULT - Stake Vault Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/vault.h"
#include "stakevault/util/logging.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace stakevault {
namespace staking {

namespace {

using util::LogCategory::CUSTODY;
using util::LogCategory::STAKING;

// ============================================================================
// Transfer Journal
// ============================================================================

/**
 * Records every transfer made during one operation so that a failure part
 * way through can be undone. Transfers are reversed in the opposite order
 * when the journal goes out of scope without Commit().
 */
class TransferJournal {
public:
    TransferJournal(ITokenLedger& token, IAssetCustodian& custodian)
        : token_(token), custodian_(custodian) {}

    ~TransferJournal() {
        if (!committed_) {
            Rollback();
        }
    }

    TransferJournal(const TransferJournal&) = delete;
    TransferJournal& operator=(const TransferJournal&) = delete;

    bool MoveTokens(const Address& from, const Address& to, Amount amount) {
        if (amount == 0) {
            return true;
        }
        if (!token_.Transfer(from, to, amount)) {
            return false;
        }
        moves_.push_back({Move::Kind::Tokens, from, to, amount, 0});
        return true;
    }

    bool MoveAsset(const Address& from, const Address& to, AssetId asset) {
        if (!custodian_.Transfer(from, to, asset)) {
            return false;
        }
        moves_.push_back({Move::Kind::Asset, from, to, 0, asset});
        return true;
    }

    void Commit() { committed_ = true; }

    /// Undo the transfers so far and describe the failed step for the caller
    std::string Abort(const char* step) {
        std::string failed = Rollback();
        if (failed.empty()) {
            return step;
        }
        return std::string(step) + "; rollback incomplete, not returned: " + failed;
    }

    /**
     * Reverse every recorded transfer, newest first. Returns a description of
     * the transfers that could not be undone, or an empty string when the
     * rollback was complete.
     */
    std::string Rollback() {
        std::string failed;
        for (auto it = moves_.rbegin(); it != moves_.rend(); ++it) {
            bool tokens = it->kind == Move::Kind::Tokens;
            bool undone = tokens ? token_.Transfer(it->to, it->from, it->amount)
                                 : custodian_.Transfer(it->to, it->from, it->asset);
            if (!undone) {
                std::string what = tokens ? "tokens " + FormatAmount(it->amount)
                                          : "asset " + std::to_string(it->asset);
                LOG_ERROR(CUSTODY) << "Rollback failed: " << what << " from "
                                   << it->to.ToHex() << " back to " << it->from.ToHex();
                failed += failed.empty() ? what : ", " + what;
            }
        }
        moves_.clear();
        return failed;
    }

private:
    struct Move {
        enum class Kind { Tokens, Asset };
        Kind kind;
        Address from;
        Address to;
        Amount amount;
        AssetId asset;
    };

    ITokenLedger& token_;
    IAssetCustodian& custodian_;
    std::vector<Move> moves_;
    bool committed_{false};
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

StakeVault::StakeVault(const Address& self, VaultContext context)
    : self_(self)
    , ctx_(std::move(context))
    , engine_(ctx_.clock ? *ctx_.clock
                         : throw std::invalid_argument("StakeVault: clock is required")) {
    if (!ctx_.custodian || !ctx_.token || !ctx_.authorizer || !ctx_.pauseGate) {
        throw std::invalid_argument("StakeVault: missing collaborator");
    }
    if (self_.IsNull()) {
        throw std::invalid_argument("StakeVault: vault address must not be null");
    }
}

StakeVault::~StakeVault() = default;

// ============================================================================
// Precondition Helpers
// ============================================================================

StakeError StakeVault::CheckUserOperation(const Address& caller) const {
    if (inOperation_) {
        return StakeError::REENTRANT_CALL;
    }
    if (!initialized_) {
        return StakeError::NOT_INITIALIZED;
    }
    if (caller.IsNull()) {
        return StakeError::INVALID_PARAMS;
    }
    if (ctx_.pauseGate->IsPaused()) {
        return StakeError::SYSTEM_PAUSED;
    }
    return StakeError::OK;
}

StakeError StakeVault::CheckAdminOperation(const Address& caller, AdminAction action) const {
    if (inOperation_) {
        return StakeError::REENTRANT_CALL;
    }
    if (!initialized_) {
        return StakeError::NOT_INITIALIZED;
    }
    if (caller.IsNull() || !ctx_.authorizer->IsAuthorized(caller, action)) {
        return StakeError::UNAUTHORIZED;
    }
    return StakeError::OK;
}

StakeError StakeVault::FindOwnedEntry(const Address& caller, AssetId asset,
                                      const StakeEntry*& entry) const {
    entry = registry_.Get(asset);
    if (!entry) {
        return StakeError::ENTRY_NOT_FOUND;
    }
    if (entry->owner != caller) {
        return StakeError::CALLER_NOT_ENTRY_OWNER;
    }
    return StakeError::OK;
}

RewardSchedule StakeVault::Schedule() const {
    RewardSchedule schedule;
    schedule.rewardPerBlock = settings_.rewardPerBlock;
    schedule.activeStakes = registry_.ActiveStakesCount();
    schedule.stakingEndTime = settings_.stakingEndTime;
    schedule.averageBlockTime = settings_.averageBlockTime;
    return schedule;
}

StakeResult StakeVault::Reject(const char* op, StakeError error,
                               const std::string& detail) const {
    LOG_DEBUG(STAKING) << op << " rejected: " << StakeErrorToString(error)
                       << (detail.empty() ? "" : " (" + detail + ")");
    return StakeResult::Failure(error, detail);
}

StakeError StakeVault::PlanUnstake(const StakeEntry& entry, bool forceWithTax,
                                   Timestamp now, ExitPlan& plan) const {
    auto reward = engine_.PendingReward(entry, Schedule());
    if (!reward.IsOk()) {
        return reward.error;
    }

    plan.updated = entry;
    plan.updated.lastClaimedBlock = ctx_.clock->Height();
    plan.reward = reward.value;
    plan.leavesActive = true;

    if (forceWithTax) {
        plan.tax = settings_.earlyExitTax;
        plan.updated.state = StakeState::Free;
        plan.updated.unbondingAt = now;
    } else {
        plan.tax = 0;
        plan.updated.state = StakeState::Unbonding;
        plan.updated.unbondingAt = now + settings_.unbondingPeriod;
    }
    return StakeError::OK;
}

// ============================================================================
// Initialization
// ============================================================================

StakeResult StakeVault::Initialize(const Address& caller, const VaultParams& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (inOperation_) {
        return Reject("initialize", StakeError::REENTRANT_CALL);
    }
    if (initialized_) {
        return Reject("initialize", StakeError::ALREADY_INITIALIZED);
    }

    std::string why;
    if (!params.Validate(&why)) {
        return Reject("initialize", StakeError::INVALID_PARAMS, why);
    }

    settings_ = VaultSettings::FromParams(params, ctx_.clock->Now());
    initialized_ = true;

    LOG_INFO(STAKING) << "Vault initialized by " << caller.ToHex() << ": "
                      << settings_.ToString();
    return StakeResult::Success();
}

bool StakeVault::IsInitialized() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return initialized_;
}

// ============================================================================
// Staking Operations
// ============================================================================

StakeResult StakeVault::Stake(const Address& caller, AssetId asset) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StakeError check = CheckUserOperation(caller);
    if (check != StakeError::OK) {
        return Reject("stake", check);
    }
    OperationScope scope(inOperation_);

    Timestamp now = ctx_.clock->Now();
    if (now >= settings_.stakingEndTime) {
        return Reject("stake", StakeError::STAKING_PERIOD_ENDED);
    }
    if (registry_.ActiveStakesCount() >= settings_.stakeLimit) {
        return Reject("stake", StakeError::STAKE_LIMIT_EXCEEDED);
    }
    if (registry_.Contains(asset)) {
        return Reject("stake", StakeError::ALREADY_STAKED, "asset " + std::to_string(asset));
    }

    auto holder = ctx_.custodian->OwnerOf(asset);
    if (!holder || *holder != caller) {
        return Reject("stake", StakeError::CALLER_NOT_ASSET_HOLDER,
                      "asset " + std::to_string(asset));
    }

    TransferJournal journal(*ctx_.token, *ctx_.custodian);
    if (!journal.MoveTokens(caller, self_, settings_.carryAmount)) {
        return Reject("stake", StakeError::TRANSFER_FAILED, journal.Abort("carry deposit"));
    }
    if (!journal.MoveAsset(caller, self_, asset)) {
        return Reject("stake", StakeError::TRANSFER_FAILED, journal.Abort("asset deposit"));
    }
    journal.Commit();

    StakeEntry entry;
    entry.state = StakeState::Staked;
    entry.owner = caller;
    entry.stakedAt = now;
    entry.unbondingAt = 0;
    entry.lastClaimedBlock = ctx_.clock->Height();
    registry_.Add(asset, entry);
    registry_.IncrementActive();

    LOG_INFO(STAKING) << "Staked asset " << asset << " for " << caller.ToHex()
                      << " at height " << entry.lastClaimedBlock;
    return StakeResult::Success();
}

StakeResult StakeVault::Unstake(const Address& caller, AssetId asset, bool forceWithTax) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StakeError check = CheckUserOperation(caller);
    if (check != StakeError::OK) {
        return Reject("unstake", check);
    }
    OperationScope scope(inOperation_);

    Timestamp now = ctx_.clock->Now();
    if (now >= settings_.stakingEndTime) {
        return Reject("unstake", StakeError::STAKING_PERIOD_ENDED);
    }

    const StakeEntry* entry = nullptr;
    check = FindOwnedEntry(caller, asset, entry);
    if (check != StakeError::OK) {
        return Reject("unstake", check, "asset " + std::to_string(asset));
    }
    if (!entry->IsStaked()) {
        return Reject("unstake", StakeError::NOT_STAKED, "asset " + std::to_string(asset));
    }

    ExitPlan plan;
    check = PlanUnstake(*entry, forceWithTax, now, plan);
    if (check != StakeError::OK) {
        return Reject("unstake", check);
    }
    if (ctx_.token->BalanceOf(self_) < plan.reward) {
        return Reject("unstake", StakeError::INSUFFICIENT_REWARD_POOL,
                      "reward " + FormatAmount(plan.reward));
    }

    TransferJournal journal(*ctx_.token, *ctx_.custodian);
    if (!journal.MoveTokens(caller, self_, plan.tax)) {
        return Reject("unstake", StakeError::TRANSFER_FAILED, journal.Abort("exit tax"));
    }
    if (!journal.MoveTokens(self_, caller, plan.reward)) {
        return Reject("unstake", StakeError::TRANSFER_FAILED, journal.Abort("reward payout"));
    }
    journal.Commit();

    registry_.DecrementActive();
    registry_.Update(asset, plan.updated);

    LOG_INFO(STAKING) << "Unstaked asset " << asset << " ("
                      << StakeStateToString(plan.updated.state) << "), reward "
                      << FormatAmount(plan.reward)
                      << (forceWithTax ? ", tax " + FormatAmount(plan.tax) : "");
    return StakeResult::Success(plan.reward);
}

StakeResult StakeVault::Withdraw(const Address& caller, AssetId asset, bool forceWithTax) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StakeError check = CheckUserOperation(caller);
    if (check != StakeError::OK) {
        return Reject("withdraw", check);
    }
    OperationScope scope(inOperation_);

    const StakeEntry* entry = nullptr;
    check = FindOwnedEntry(caller, asset, entry);
    if (check != StakeError::OK) {
        return Reject("withdraw", check, "asset " + std::to_string(asset));
    }

    Timestamp now = ctx_.clock->Now();
    bool periodOver = now >= settings_.stakingEndTime;

    ExitPlan plan;
    plan.updated = *entry;

    if (periodOver) {
        // Unconditional; a still-Staked entry stops counting as active
        plan.leavesActive = entry->IsStaked();
    } else if (entry->IsStaked()) {
        // Settles the reward; the caller's flag picks Free (taxed) or Unbonding
        check = PlanUnstake(*entry, forceWithTax, now, plan);
        if (check != StakeError::OK) {
            return Reject("withdraw", check);
        }
    } else if (now < entry->unbondingAt) {
        if (!forceWithTax) {
            return Reject("withdraw", StakeError::FORCED_EXIT_REQUIRED,
                          "unbonding until " + std::to_string(entry->unbondingAt));
        }
        if (entry->state == StakeState::Unbonding) {
            plan.tax = settings_.earlyExitTax;
        }
    }

    auto custodyHolder = ctx_.custodian->OwnerOf(asset);
    if (!custodyHolder || *custodyHolder != self_) {
        return Reject("withdraw", StakeError::TRANSFER_FAILED, "asset not in custody");
    }

    Amount payout = plan.reward + settings_.carryAmount;
    if (ctx_.token->BalanceOf(self_) < payout) {
        return Reject("withdraw", StakeError::INSUFFICIENT_REWARD_POOL,
                      "payout " + FormatAmount(payout));
    }

    TransferJournal journal(*ctx_.token, *ctx_.custodian);
    if (!journal.MoveTokens(caller, self_, plan.tax)) {
        return Reject("withdraw", StakeError::TRANSFER_FAILED, journal.Abort("exit tax"));
    }
    if (!journal.MoveTokens(self_, caller, plan.reward)) {
        return Reject("withdraw", StakeError::TRANSFER_FAILED, journal.Abort("reward payout"));
    }
    if (!journal.MoveTokens(self_, caller, settings_.carryAmount)) {
        return Reject("withdraw", StakeError::TRANSFER_FAILED, journal.Abort("carry refund"));
    }
    if (!journal.MoveAsset(self_, caller, asset)) {
        return Reject("withdraw", StakeError::TRANSFER_FAILED, journal.Abort("asset return"));
    }
    journal.Commit();

    if (plan.leavesActive) {
        registry_.DecrementActive();
    }
    registry_.Remove(asset);

    LOG_INFO(STAKING) << "Withdrew asset " << asset << " to " << caller.ToHex()
                      << ", paid " << FormatAmount(payout)
                      << (plan.tax > 0 ? ", tax " + FormatAmount(plan.tax) : "");
    return StakeResult::Success(payout);
}

StakeResult StakeVault::ClaimReward(const Address& caller, AssetId asset) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StakeError check = CheckUserOperation(caller);
    if (check != StakeError::OK) {
        return Reject("claim", check);
    }
    OperationScope scope(inOperation_);

    const StakeEntry* entry = nullptr;
    check = FindOwnedEntry(caller, asset, entry);
    if (check != StakeError::OK) {
        return Reject("claim", check, "asset " + std::to_string(asset));
    }
    if (!entry->IsStaked()) {
        return Reject("claim", StakeError::NOT_STAKED, "asset " + std::to_string(asset));
    }

    auto reward = engine_.PendingReward(*entry, Schedule());
    if (!reward.IsOk()) {
        return Reject("claim", reward.error);
    }
    if (ctx_.token->BalanceOf(self_) < reward.value) {
        return Reject("claim", StakeError::INSUFFICIENT_REWARD_POOL,
                      "reward " + FormatAmount(reward.value));
    }

    TransferJournal journal(*ctx_.token, *ctx_.custodian);
    if (!journal.MoveTokens(self_, caller, reward.value)) {
        return Reject("claim", StakeError::TRANSFER_FAILED, journal.Abort("reward payout"));
    }
    journal.Commit();

    StakeEntry updated = *entry;
    updated.lastClaimedBlock = ctx_.clock->Height();
    registry_.Update(asset, updated);

    LOG_INFO(util::LogCategory::REWARD) << "Claimed " << FormatAmount(reward.value)
                                        << " for asset " << asset;
    return StakeResult::Success(reward.value);
}

StakeResult StakeVault::ClaimAllRewards(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StakeError check = CheckUserOperation(caller);
    if (check != StakeError::OK) {
        return Reject("claimall", check);
    }
    OperationScope scope(inOperation_);

    BlockHeight height = ctx_.clock->Height();
    RewardSchedule schedule = Schedule();

    Amount total = 0;
    std::vector<StakeView> updates;
    for (AssetId asset : registry_.ListByOwner(caller)) {
        const StakeEntry* entry = registry_.Get(asset);
        if (!entry || !entry->IsStaked()) {
            continue;
        }
        auto reward = engine_.PendingReward(*entry, schedule);
        if (!reward.IsOk()) {
            return Reject("claimall", reward.error, "asset " + std::to_string(asset));
        }
        if (reward.value > MAX_MONEY - total) {
            return Reject("claimall", StakeError::INVALID_PARAMS, "reward total overflow");
        }
        total += reward.value;
        StakeView view;
        view.asset = asset;
        view.entry = *entry;
        view.entry.lastClaimedBlock = height;
        updates.push_back(view);
    }

    if (ctx_.token->BalanceOf(self_) < total) {
        return Reject("claimall", StakeError::INSUFFICIENT_REWARD_POOL,
                      "reward " + FormatAmount(total));
    }

    TransferJournal journal(*ctx_.token, *ctx_.custodian);
    if (!journal.MoveTokens(self_, caller, total)) {
        return Reject("claimall", StakeError::TRANSFER_FAILED, journal.Abort("reward payout"));
    }
    journal.Commit();

    for (const auto& view : updates) {
        registry_.Update(view.asset, view.entry);
    }

    LOG_INFO(util::LogCategory::REWARD) << "Claimed " << FormatAmount(total) << " over "
                                        << updates.size() << " stakes for "
                                        << caller.ToHex();
    return StakeResult::Success(total);
}

// ============================================================================
// Administration
// ============================================================================

template<typename Apply>
StakeResult StakeVault::AdminUpdate(const Address& caller, AdminAction action,
                                    Apply&& apply) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char* op = AdminActionToString(action);
    StakeError check = CheckAdminOperation(caller, action);
    if (check != StakeError::OK) {
        return Reject(op, check);
    }
    OperationScope scope(inOperation_);

    StakeResult result = apply();
    if (!result.IsOk()) {
        return Reject(op, result.error, result.detail);
    }
    LOG_INFO(STAKING) << op << " by " << caller.ToHex()
                      << (result.detail.empty() ? "" : ": " + result.detail);
    return result;
}

StakeResult StakeVault::SetStakeLimit(const Address& caller, uint64_t limit) {
    return AdminUpdate(caller, AdminAction::SetStakeLimit, [&]() {
        settings_.stakeLimit = limit;
        StakeResult result = StakeResult::Success();
        result.detail = std::to_string(limit);
        return result;
    });
}

StakeResult StakeVault::SetRewardPerBlock(const Address& caller, Amount reward) {
    return AdminUpdate(caller, AdminAction::SetRewardPerBlock, [&]() {
        if (!MoneyRange(reward)) {
            return StakeResult::Failure(StakeError::INVALID_PARAMS, "reward out of range");
        }
        settings_.rewardPerBlock = reward;
        StakeResult result = StakeResult::Success();
        result.detail = FormatAmount(reward);
        return result;
    });
}

StakeResult StakeVault::SetEarlyExitTax(const Address& caller, Amount tax) {
    return AdminUpdate(caller, AdminAction::SetEarlyExitTax, [&]() {
        if (!MoneyRange(tax)) {
            return StakeResult::Failure(StakeError::INVALID_PARAMS, "tax out of range");
        }
        settings_.earlyExitTax = tax;
        StakeResult result = StakeResult::Success();
        result.detail = FormatAmount(tax);
        return result;
    });
}

StakeResult StakeVault::SetCarryAmount(const Address& caller, Amount carry) {
    return AdminUpdate(caller, AdminAction::SetCarryAmount, [&]() {
        if (!MoneyRange(carry)) {
            return StakeResult::Failure(StakeError::INVALID_PARAMS, "carry out of range");
        }
        settings_.carryAmount = carry;
        StakeResult result = StakeResult::Success();
        result.detail = FormatAmount(carry);
        return result;
    });
}

StakeResult StakeVault::SetStakingEndTime(const Address& caller, int64_t hoursFromNow) {
    return AdminUpdate(caller, AdminAction::SetStakingEndTime, [&]() {
        if (hoursFromNow < 0 || hoursFromNow > MAX_DURATION_HOURS) {
            return StakeResult::Failure(StakeError::INVALID_PARAMS, "hours out of range");
        }
        settings_.stakingEndTime = ctx_.clock->Now() + HoursToSeconds(hoursFromNow);
        StakeResult result = StakeResult::Success();
        result.detail = "ends at " + std::to_string(settings_.stakingEndTime);
        return result;
    });
}

StakeResult StakeVault::SetUnbondingPeriod(const Address& caller, int64_t hours) {
    return AdminUpdate(caller, AdminAction::SetUnbondingPeriod, [&]() {
        if (hours < 0 || hours > MAX_DURATION_HOURS) {
            return StakeResult::Failure(StakeError::INVALID_PARAMS, "hours out of range");
        }
        settings_.unbondingPeriod = HoursToSeconds(hours);
        StakeResult result = StakeResult::Success();
        result.detail = std::to_string(hours) + "h";
        return result;
    });
}

StakeResult StakeVault::Pause(const Address& caller) {
    return AdminUpdate(caller, AdminAction::Pause, [&]() {
        ctx_.pauseGate->SetPaused(true);
        return StakeResult::Success();
    });
}

StakeResult StakeVault::Unpause(const Address& caller) {
    return AdminUpdate(caller, AdminAction::Unpause, [&]() {
        ctx_.pauseGate->SetPaused(false);
        return StakeResult::Success();
    });
}

StakeResult StakeVault::ForceWithdrawRewardPool(const Address& caller) {
    return AdminUpdate(caller, AdminAction::WithdrawRewardPool, [&]() {
        Amount balance = ctx_.token->BalanceOf(self_);
        TransferJournal journal(*ctx_.token, *ctx_.custodian);
        if (!journal.MoveTokens(self_, caller, balance)) {
            return StakeResult::Failure(StakeError::TRANSFER_FAILED, "pool transfer");
        }
        journal.Commit();
        StakeResult result = StakeResult::Success(balance);
        result.detail = "drained " + FormatAmount(balance);
        return result;
    });
}

StakeResult StakeVault::ForceWithdrawAsset(const Address& caller, AssetId asset) {
    return AdminUpdate(caller, AdminAction::WithdrawAsset, [&]() {
        auto holder = ctx_.custodian->OwnerOf(asset);
        if (!holder || *holder != self_) {
            return StakeResult::Failure(StakeError::TRANSFER_FAILED, "asset not in custody");
        }
        TransferJournal journal(*ctx_.token, *ctx_.custodian);
        if (!journal.MoveAsset(self_, caller, asset)) {
            return StakeResult::Failure(StakeError::TRANSFER_FAILED, "asset transfer");
        }
        journal.Commit();
        if (registry_.Contains(asset)) {
            LOG_WARN(CUSTODY) << "Asset " << asset
                              << " withdrawn by admin while its entry is still registered";
        }
        StakeResult result = StakeResult::Success();
        result.detail = "asset " + std::to_string(asset);
        return result;
    });
}

// ============================================================================
// IAssetReceiver
// ============================================================================

bool StakeVault::OnAssetReceived(const Address& op, const Address& from, AssetId asset) {
    LOG_DEBUG(CUSTODY) << "Received asset " << asset << " from " << from.ToHex()
                       << " (operator " << op.ToHex() << ")";
    return true;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<AssetId> StakeVault::ListStakesByOwner(const Address& owner) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.ListByOwner(owner);
}

std::vector<StakeView> StakeVault::StakesOf(const Address& owner) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<StakeView> views;
    for (AssetId asset : registry_.ListByOwner(owner)) {
        const StakeEntry* entry = registry_.Get(asset);
        if (entry) {
            views.push_back({asset, *entry});
        }
    }
    return views;
}

StakeQuery<StakeEntry> StakeVault::StakeInfo(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const StakeEntry* entry = registry_.Get(asset);
    if (!entry) {
        return StakeQuery<StakeEntry>::Fail(StakeError::ENTRY_NOT_FOUND);
    }
    return StakeQuery<StakeEntry>::Ok(*entry);
}

StakeQuery<Timestamp> StakeVault::UnbondingTimestamp(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const StakeEntry* entry = registry_.Get(asset);
    if (!entry) {
        return StakeQuery<Timestamp>::Fail(StakeError::ENTRY_NOT_FOUND);
    }
    return StakeQuery<Timestamp>::Ok(entry->unbondingAt);
}

StakeQuery<Amount> StakeVault::PendingReward(AssetId asset) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const StakeEntry* entry = registry_.Get(asset);
    if (!entry) {
        return StakeQuery<Amount>::Fail(StakeError::ENTRY_NOT_FOUND);
    }
    return engine_.PendingReward(*entry, Schedule());
}

size_t StakeVault::StakeCount(const Address& owner) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.CountByOwner(owner);
}

Timestamp StakeVault::StakingEndTime() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return settings_.stakingEndTime;
}

int64_t StakeVault::UnbondingPeriod() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return settings_.unbondingPeriod;
}

Amount StakeVault::RewardPerBlock() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return settings_.rewardPerBlock;
}

uint64_t StakeVault::StakeLimit() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return settings_.stakeLimit;
}

Amount StakeVault::CarryAmount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return settings_.carryAmount;
}

Amount StakeVault::EarlyExitTax() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return settings_.earlyExitTax;
}

int64_t StakeVault::AverageBlockTime() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return settings_.averageBlockTime;
}

std::vector<Address> StakeVault::TrackedOwners() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.TrackedOwners();
}

std::vector<AssetId> StakeVault::TrackedAssets() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.TrackedAssets();
}

uint64_t StakeVault::TotalStakes() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.StakesCount();
}

uint64_t StakeVault::ActiveStakeCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.ActiveStakesCount();
}

bool StakeVault::IsPaused() const {
    return ctx_.pauseGate->IsPaused();
}

bool StakeVault::IsStakingOver() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return initialized_ && ctx_.clock->Now() >= settings_.stakingEndTime;
}

VaultSettings StakeVault::Settings() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return settings_;
}

std::vector<std::string> StakeVault::CheckInvariants() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.CheckInvariants();
}

// ============================================================================
// Persistence
// ============================================================================

VaultSnapshot StakeVault::Snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    VaultSnapshot snapshot;
    snapshot.initialized = initialized_;
    snapshot.settings = settings_;
    snapshot.entries = registry_.Entries();
    snapshot.stakesCount = registry_.StakesCount();
    snapshot.activeStakesCount = registry_.ActiveStakesCount();
    return snapshot;
}

StakeResult StakeVault::Restore(const VaultSnapshot& snapshot) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (inOperation_) {
        return Reject("restore", StakeError::REENTRANT_CALL);
    }
    if (initialized_) {
        return Reject("restore", StakeError::ALREADY_INITIALIZED);
    }
    if (!snapshot.initialized && !snapshot.entries.empty()) {
        return Reject("restore", StakeError::INVALID_PARAMS, "entries without settings");
    }

    StakeRegistry rebuilt;
    for (const auto& view : snapshot.entries) {
        if (!rebuilt.Add(view.asset, view.entry)) {
            return Reject("restore", StakeError::INVALID_PARAMS,
                          "duplicate asset " + std::to_string(view.asset));
        }
        if (view.entry.IsStaked()) {
            rebuilt.IncrementActive();
        }
    }

    if (rebuilt.StakesCount() != snapshot.stakesCount ||
        rebuilt.ActiveStakesCount() != snapshot.activeStakesCount) {
        return Reject("restore", StakeError::INVALID_PARAMS,
                      "stored counters " + std::to_string(snapshot.stakesCount) + "/" +
                      std::to_string(snapshot.activeStakesCount) + " do not match " +
                      std::to_string(rebuilt.StakesCount()) + "/" +
                      std::to_string(rebuilt.ActiveStakesCount()));
    }

    auto problems = rebuilt.CheckInvariants();
    if (!problems.empty()) {
        return Reject("restore", StakeError::INVALID_PARAMS, problems.front());
    }

    registry_ = std::move(rebuilt);
    settings_ = snapshot.settings;
    initialized_ = snapshot.initialized;

    LOG_DEBUG(STAKING) << "Restored " << registry_.StakesCount() << " entries ("
                       << registry_.ActiveStakesCount() << " active)";
    return StakeResult::Success();
}

} // namespace staking
} // namespace stakevault
