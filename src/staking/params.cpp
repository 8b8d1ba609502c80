// STAKEVAULT - Vault Parameters
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/params.h"
#include "stakevault/core/serialize.h"
#include "stakevault/util/config.h"

#include <sstream>

namespace stakevault {
namespace staking {

namespace {

bool Fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

/// Read an optional integer key; false if present but malformed
bool ReadInt(const util::ConfigManager& config, const char* key,
             int64_t& out, std::string* error) {
    if (!config.HasKey(key)) {
        return true;
    }
    auto value = config.TryGetInt(key);
    if (!value) {
        return Fail(error, std::string("Invalid integer for '") + key + "'");
    }
    out = *value;
    return true;
}

bool ReadAddress(const util::ConfigManager& config, const char* key,
                 Address& out, std::string* error) {
    auto value = config.TryGetString(key);
    if (!value || value->empty()) {
        return true;
    }
    if (!ParseAddress(*value, out)) {
        return Fail(error, std::string("Invalid address for '") + key + "'");
    }
    return true;
}

} // namespace

// ============================================================================
// VaultParams
// ============================================================================

bool VaultParams::Validate(std::string* error) const {
    if (!MoneyRange(rewardPerBlock)) {
        return Fail(error, "rewardperblock out of range");
    }
    if (!MoneyRange(earlyExitTax)) {
        return Fail(error, "earlyexittax out of range");
    }
    if (!MoneyRange(carryAmount)) {
        return Fail(error, "carryamount out of range");
    }
    if (stakingHours < 0 || stakingHours > MAX_DURATION_HOURS) {
        return Fail(error, "stakinghours out of range");
    }
    if (unbondingHours < 0 || unbondingHours > MAX_DURATION_HOURS) {
        return Fail(error, "unbondinghours out of range");
    }
    if (averageBlockTime <= 0) {
        return Fail(error, "blocktime must be positive");
    }
    return true;
}

std::optional<VaultParams> VaultParams::FromConfig(const util::ConfigManager& config,
                                                   std::string* error) {
    using namespace util::ConfigKeys;

    VaultParams params;
    int64_t stakeLimit = static_cast<int64_t>(params.stakeLimit);

    if (!ReadAddress(config, COLLECTION, params.collection, error) ||
        !ReadAddress(config, REWARDTOKEN, params.rewardToken, error) ||
        !ReadInt(config, REWARDPERBLOCK, params.rewardPerBlock, error) ||
        !ReadInt(config, EARLYEXITTAX, params.earlyExitTax, error) ||
        !ReadInt(config, STAKELIMIT, stakeLimit, error) ||
        !ReadInt(config, CARRYAMOUNT, params.carryAmount, error) ||
        !ReadInt(config, STAKINGHOURS, params.stakingHours, error) ||
        !ReadInt(config, UNBONDINGHOURS, params.unbondingHours, error) ||
        !ReadInt(config, BLOCKTIME, params.averageBlockTime, error)) {
        return std::nullopt;
    }

    if (stakeLimit < 0) {
        Fail(error, "stakelimit must not be negative");
        return std::nullopt;
    }
    params.stakeLimit = static_cast<uint64_t>(stakeLimit);

    if (!params.Validate(error)) {
        return std::nullopt;
    }
    return params;
}

// ============================================================================
// VaultSettings
// ============================================================================

VaultSettings VaultSettings::FromParams(const VaultParams& params, Timestamp now) {
    VaultSettings settings;
    settings.collection = params.collection;
    settings.rewardToken = params.rewardToken;
    settings.rewardPerBlock = params.rewardPerBlock;
    settings.earlyExitTax = params.earlyExitTax;
    settings.stakeLimit = params.stakeLimit;
    settings.carryAmount = params.carryAmount;
    settings.stakingEndTime = now + HoursToSeconds(params.stakingHours);
    settings.unbondingPeriod = HoursToSeconds(params.unbondingHours);
    settings.averageBlockTime = params.averageBlockTime;
    return settings;
}

std::vector<Byte> VaultSettings::Serialize() const {
    DataStream ss;
    ss << collection;
    ss << rewardToken;
    ss << rewardPerBlock;
    ss << earlyExitTax;
    ss << stakeLimit;
    ss << carryAmount;
    ss << stakingEndTime;
    ss << unbondingPeriod;
    ss << averageBlockTime;
    return ss.Bytes();
}

std::optional<VaultSettings> VaultSettings::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ss(data, len);
        VaultSettings settings;
        ss >> settings.collection;
        ss >> settings.rewardToken;
        ss >> settings.rewardPerBlock;
        ss >> settings.earlyExitTax;
        ss >> settings.stakeLimit;
        ss >> settings.carryAmount;
        ss >> settings.stakingEndTime;
        ss >> settings.unbondingPeriod;
        ss >> settings.averageBlockTime;
        if (!ss.empty() || settings.averageBlockTime <= 0) {
            return std::nullopt;
        }
        return settings;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string VaultSettings::ToString() const {
    std::ostringstream ss;
    ss << "VaultSettings(rewardPerBlock=" << FormatAmount(rewardPerBlock)
       << ", earlyExitTax=" << FormatAmount(earlyExitTax)
       << ", carryAmount=" << FormatAmount(carryAmount)
       << ", stakeLimit=" << stakeLimit
       << ", stakingEndTime=" << stakingEndTime
       << ", unbondingPeriod=" << unbondingPeriod
       << ", averageBlockTime=" << averageBlockTime << ")";
    return ss.str();
}

} // namespace staking
} // namespace stakevault
