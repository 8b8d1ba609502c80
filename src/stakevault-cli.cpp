// STAKEVAULT Command-Line Tool
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Drives a stake vault backed by local ledgers stored in LevelDB.
// Supports:
// - Vault initialization and administration
// - Minting test assets and reward tokens
// - Staking, unstaking, withdrawing and claiming rewards
// - Inspecting entries, balances and vault status

#include "stakevault/db/database.h"
#include "stakevault/staking/clock.h"
#include "stakevault/staking/local_ledger.h"
#include "stakevault/staking/params.h"
#include "stakevault/staking/vault.h"
#include "stakevault/staking/vault_store.h"
#include "stakevault/util/config.h"
#include "stakevault/util/logging.h"
#include "stakevault/util/time.h"

#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace stakevault;
using namespace stakevault::staking;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* DB_DIRNAME = "vault";
constexpr const char* LOG_FILENAME = "debug.log";

/// Custody account of the vault in the local ledgers
constexpr const char* VAULT_ADDRESS_HEX = "000000000000000000005354414b455641554c54";

// ============================================================================
// Output Helpers
// ============================================================================

void PrintUsage() {
    std::cout << "STAKEVAULT CLI v" << VERSION << "\n\n"
              << "Usage: stakevault-cli [options] <command> [args]\n\n"
              << "Options:\n"
              << "  -datadir=<dir>       Data directory (default: ~/.stakevault)\n"
              << "  -conf=<file>         Config file (default: <datadir>/stakevault.conf)\n"
              << "  -from=<address>      Calling account (40 hex chars)\n"
              << "  -loglevel=<level>    trace, debug, info, warn, error\n"
              << "  -printtoconsole      Also log to the console\n"
              << "  -logcategories=<a,b> Only log these categories (staking, reward, ...)\n"
              << "  -sampleconfig        Print a commented stakevault.conf and exit\n"
              << "  -blocktime=<secs>    Average block time for a new data directory\n\n"
              << "Vault initialization (read by 'init'):\n"
              << "  -collection, -rewardtoken, -rewardperblock, -earlyexittax,\n"
              << "  -stakelimit, -carryamount, -stakinghours, -unbondinghours\n\n"
              << "Commands:\n"
              << "  init                      Initialize the vault; caller becomes admin\n"
              << "  mint <asset>              Create an asset owned by the caller\n"
              << "  fund <amount>             Credit reward tokens to the caller\n"
              << "  deposit <amount>          Move caller tokens into the reward pool\n"
              << "  stake <asset>             Stake an asset\n"
              << "  unstake <asset> [force]   Start unbonding, or exit now paying the tax\n"
              << "  withdraw <asset> [force]  Take the asset and carry back\n"
              << "  claim <asset>             Claim the reward of one stake\n"
              << "  claimall                  Claim the rewards of all caller stakes\n"
              << "  info <asset>              Show a stake entry\n"
              << "  list [address]            List stakes of an owner\n"
              << "  pending <asset>           Show the pending reward of a stake\n"
              << "  balance [address]         Show token balance and held assets\n"
              << "  status                    Show vault settings and counters\n\n"
              << "Admin commands:\n"
              << "  setlimit <n>              Maximum simultaneously active stakes\n"
              << "  setreward <amount>        Reward per block\n"
              << "  settax <amount>           Early exit tax\n"
              << "  setcarry <amount>         Carry deposit\n"
              << "  setend <hours>            End staking the given hours from now\n"
              << "  setunbonding <hours>      Unbonding period\n"
              << "  pause | unpause           Toggle the pause gate\n"
              << "  drainpool                 Withdraw the whole reward pool\n"
              << "  rescue <asset>            Withdraw an asset from custody\n\n"
              << "Amounts are in base units (1 SVT = " << COIN << ").\n";
}

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

std::string FormatTime(Timestamp t) {
    return util::FormatISO8601(t) + " (" + std::to_string(t) + ")";
}

int ReportResult(const StakeResult& result, const std::string& successMessage) {
    if (!result.IsOk()) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return 1;
    }
    std::cout << successMessage;
    if (result.amount > 0) {
        std::cout << " (" << FormatAmount(result.amount) << ")";
    }
    std::cout << "\n";
    return 0;
}

// ============================================================================
// Argument Parsing
// ============================================================================

std::optional<int64_t> ParseInt64(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        long long value = std::stoll(str, &pos, 10);
        if (pos != str.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<AssetId> ParseAssetId(const std::string& str) {
    auto value = ParseInt64(str);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<AssetId>(*value);
}

/// Setup logging based on configuration
void SetupLogging(const util::ConfigManager& config, const std::string& dataDir) {
    auto& logger = util::Logger::Instance();

    std::string levelStr = config.GetString(util::ConfigKeys::LOGLEVEL, "info");
    util::LogLevel level = util::LogLevelFromString(levelStr);
    if (config.GetBool(util::ConfigKeys::DEBUG, false)) {
        level = util::LogLevel::Debug;
    }
    logger.SetLevel(level);

    // Comma-separated list; unset logs every category
    std::string categories = config.GetString(util::ConfigKeys::LOGCATEGORIES, "");
    std::istringstream list(categories);
    std::string category;
    while (std::getline(list, category, ',')) {
        if (!category.empty()) {
            logger.EnableCategory(category);
        }
    }

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    util::FileSink::Config fileConfig;
    fileConfig.path = config.GetPath(util::ConfigKeys::LOGFILE,
                                     (fs::path(dataDir) / LOG_FILENAME).string());
    fileConfig.level = level;
    logger.AddSink(std::make_shared<util::FileSink>(fileConfig));
}

// ============================================================================
// Command Context
// ============================================================================

/// Everything a command needs; mutating commands request a save on success
struct CommandContext {
    util::ConfigManager& config;
    LocalEnvironment& env;
    StakeVault& vault;
    const std::vector<std::string>& args;
    Address caller;
    bool hasCaller{false};
    bool dirty{false};

    /// Positional argument after the command name
    std::optional<std::string> Arg(size_t index) const {
        if (index + 1 < args.size()) {
            return args[index + 1];
        }
        return std::nullopt;
    }
};

bool RequireCaller(const CommandContext& ctx) {
    if (!ctx.hasCaller) {
        std::cerr << "Error: this command needs -from=<address>\n";
        return false;
    }
    return true;
}

std::optional<AssetId> RequireAsset(const CommandContext& ctx) {
    auto arg = ctx.Arg(0);
    if (!arg) {
        std::cerr << "Error: missing asset id\n";
        return std::nullopt;
    }
    auto asset = ParseAssetId(*arg);
    if (!asset) {
        std::cerr << "Error: invalid asset id '" << *arg << "'\n";
    }
    return asset;
}

std::optional<int64_t> RequireNumber(const CommandContext& ctx, const char* what) {
    auto arg = ctx.Arg(0);
    if (!arg) {
        std::cerr << "Error: missing " << what << "\n";
        return std::nullopt;
    }
    auto value = ParseInt64(*arg);
    if (!value) {
        std::cerr << "Error: invalid " << what << " '" << *arg << "'\n";
    }
    return value;
}

bool ForceRequested(const CommandContext& ctx) {
    auto arg = ctx.Arg(1);
    return arg && (*arg == "force" || *arg == "true" || *arg == "1");
}

/// Record a successful state change so it gets persisted
int Mutated(CommandContext& ctx, const StakeResult& result, const std::string& message) {
    if (result.IsOk()) {
        ctx.dirty = true;
    }
    return ReportResult(result, message);
}

// ============================================================================
// Commands: Setup
// ============================================================================

int CommandInit(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;

    std::string error;
    auto params = VaultParams::FromConfig(ctx.config, &error);
    if (!params) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    params->averageBlockTime = ctx.env.blockTime;

    StakeResult result = ctx.vault.Initialize(ctx.caller, *params);
    if (result.IsOk()) {
        ctx.env.authorizer->AddAdmin(ctx.caller);
    }
    return Mutated(ctx, result, "Vault initialized; admin " + ctx.caller.ToHex());
}

int CommandMint(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    auto asset = RequireAsset(ctx);
    if (!asset) return 1;

    if (!ctx.env.assets->Mint(ctx.caller, *asset)) {
        std::cerr << "Error: asset " << *asset << " already exists\n";
        return 1;
    }
    ctx.dirty = true;
    std::cout << "Minted asset " << *asset << " to " << ctx.caller.ToHex() << "\n";
    return 0;
}

int CommandFund(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    auto amount = RequireNumber(ctx, "amount");
    if (!amount) return 1;

    if (!ctx.env.tokens->Mint(ctx.caller, *amount)) {
        std::cerr << "Error: cannot mint " << *amount << "\n";
        return 1;
    }
    ctx.dirty = true;
    std::cout << "Credited " << FormatAmount(*amount) << " to " << ctx.caller.ToHex() << "\n";
    return 0;
}

int CommandDeposit(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    auto amount = RequireNumber(ctx, "amount");
    if (!amount) return 1;

    if (*amount <= 0 ||
        !ctx.env.tokens->Transfer(ctx.caller, ctx.vault.VaultAddress(), *amount)) {
        std::cerr << "Error: transfer of " << *amount << " failed\n";
        return 1;
    }
    ctx.dirty = true;
    std::cout << "Deposited " << FormatAmount(*amount) << " into the reward pool\n";
    return 0;
}

// ============================================================================
// Commands: Staking
// ============================================================================

int CommandStake(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    auto asset = RequireAsset(ctx);
    if (!asset) return 1;
    return Mutated(ctx, ctx.vault.Stake(ctx.caller, *asset),
                   "Staked asset " + std::to_string(*asset));
}

int CommandUnstake(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    auto asset = RequireAsset(ctx);
    if (!asset) return 1;
    bool force = ForceRequested(ctx);
    return Mutated(ctx, ctx.vault.Unstake(ctx.caller, *asset, force),
                   std::string(force ? "Exited" : "Unbonding") + " asset " +
                   std::to_string(*asset));
}

int CommandWithdraw(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    auto asset = RequireAsset(ctx);
    if (!asset) return 1;
    return Mutated(ctx, ctx.vault.Withdraw(ctx.caller, *asset, ForceRequested(ctx)),
                   "Withdrew asset " + std::to_string(*asset));
}

int CommandClaim(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    auto asset = RequireAsset(ctx);
    if (!asset) return 1;
    return Mutated(ctx, ctx.vault.ClaimReward(ctx.caller, *asset),
                   "Claimed reward for asset " + std::to_string(*asset));
}

int CommandClaimAll(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    return Mutated(ctx, ctx.vault.ClaimAllRewards(ctx.caller), "Claimed all rewards");
}

// ============================================================================
// Commands: Queries
// ============================================================================

void PrintEntry(AssetId asset, const StakeEntry& entry) {
    std::cout << "Asset:          " << asset << "\n"
              << "State:          " << StakeStateToString(entry.state) << "\n"
              << "Owner:          " << entry.owner.ToHex() << "\n"
              << "Staked at:      " << FormatTime(entry.stakedAt) << "\n";
    if (!entry.IsStaked()) {
        std::cout << "Unbonding at:   " << FormatTime(entry.unbondingAt) << "\n";
    }
    std::cout << "Last claimed:   block " << entry.lastClaimedBlock << "\n";
}

int CommandInfo(CommandContext& ctx) {
    auto asset = RequireAsset(ctx);
    if (!asset) return 1;

    auto info = ctx.vault.StakeInfo(*asset);
    if (!info.IsOk()) {
        std::cerr << "Error: " << StakeErrorToString(info.error) << "\n";
        return 1;
    }
    PrintEntry(*asset, info.value);

    auto pending = ctx.vault.PendingReward(*asset);
    if (pending.IsOk()) {
        std::cout << "Pending reward: " << FormatAmount(pending.value) << "\n";
    }
    return 0;
}

int CommandList(CommandContext& ctx) {
    Address owner = ctx.caller;
    if (auto arg = ctx.Arg(0)) {
        if (!ParseAddress(*arg, owner)) {
            std::cerr << "Error: invalid address '" << *arg << "'\n";
            return 1;
        }
    } else if (!RequireCaller(ctx)) {
        return 1;
    }

    auto stakes = ctx.vault.StakesOf(owner);
    std::cout << stakes.size() << " stake(s) for " << owner.ToHex() << "\n";
    PrintLine();
    for (const auto& view : stakes) {
        std::cout << std::setw(12) << view.asset << "  "
                  << std::setw(9) << StakeStateToString(view.entry.state) << "  ";
        if (view.entry.IsStaked()) {
            auto pending = ctx.vault.PendingReward(view.asset);
            std::cout << "pending " << (pending.IsOk() ? FormatAmount(pending.value) : "-");
        } else {
            std::cout << "until " << util::FormatISO8601(view.entry.unbondingAt);
        }
        std::cout << "\n";
    }
    return 0;
}

int CommandPending(CommandContext& ctx) {
    auto asset = RequireAsset(ctx);
    if (!asset) return 1;

    auto pending = ctx.vault.PendingReward(*asset);
    if (!pending.IsOk()) {
        std::cerr << "Error: " << StakeErrorToString(pending.error) << "\n";
        return 1;
    }
    std::cout << FormatAmount(pending.value) << "\n";
    return 0;
}

int CommandBalance(CommandContext& ctx) {
    Address account = ctx.caller;
    if (auto arg = ctx.Arg(0)) {
        if (*arg == "vault") {
            account = ctx.vault.VaultAddress();
        } else if (!ParseAddress(*arg, account)) {
            std::cerr << "Error: invalid address '" << *arg << "'\n";
            return 1;
        }
    } else if (!RequireCaller(ctx)) {
        return 1;
    }

    std::cout << "Account: " << account.ToHex() << "\n"
              << "Balance: " << FormatAmount(ctx.env.tokens->BalanceOf(account)) << "\n";
    auto assets = ctx.env.assets->AssetsOf(account);
    std::cout << "Assets:  " << assets.size();
    for (AssetId asset : assets) {
        std::cout << " " << asset;
    }
    std::cout << "\n";
    return 0;
}

int CommandStatus(CommandContext& ctx) {
    std::cout << "\n";
    PrintLine('=');
    std::cout << "STAKEVAULT STATUS\n";
    PrintLine('=');

    std::cout << "Vault:            " << ctx.vault.VaultAddress().ToHex() << "\n";
    if (!ctx.vault.IsInitialized()) {
        std::cout << "Initialized:      no\n";
        return 0;
    }

    VaultSettings settings = ctx.vault.Settings();
    Timestamp now = util::GetTime();
    std::cout << "Initialized:      yes\n"
              << "Paused:           " << (ctx.vault.IsPaused() ? "yes" : "no") << "\n"
              << "Collection:       " << settings.collection.ToHex() << "\n"
              << "Reward token:     " << settings.rewardToken.ToHex() << "\n"
              << "Reward per block: " << FormatAmount(settings.rewardPerBlock) << "\n"
              << "Early exit tax:   " << FormatAmount(settings.earlyExitTax) << "\n"
              << "Carry amount:     " << FormatAmount(settings.carryAmount) << "\n"
              << "Stake limit:      " << settings.stakeLimit << "\n"
              << "Staking ends:     " << FormatTime(settings.stakingEndTime) << "\n";
    if (now < settings.stakingEndTime) {
        std::cout << "Time remaining:   "
                  << util::FormatDuration(util::Seconds(settings.stakingEndTime - now)) << "\n";
    } else {
        std::cout << "Staking period:   over\n";
    }
    std::cout << "Unbonding period: "
              << util::FormatDuration(util::Seconds(settings.unbondingPeriod)) << "\n"
              << "Block time:       " << settings.averageBlockTime << "s\n";

    PrintLine();
    std::cout << "Stakes:           " << ctx.vault.TotalStakes() << "\n"
              << "Active stakes:    " << ctx.vault.ActiveStakeCount() << "\n"
              << "Stakers:          " << ctx.vault.TrackedOwners().size() << "\n"
              << "Reward pool:      "
              << FormatAmount(ctx.env.tokens->BalanceOf(ctx.vault.VaultAddress())) << "\n";

    auto problems = ctx.vault.CheckInvariants();
    for (const auto& problem : problems) {
        std::cout << "WARNING: " << problem << "\n";
    }
    return 0;
}

// ============================================================================
// Commands: Administration
// ============================================================================

int CommandAdminNumber(CommandContext& ctx, const char* what,
                       const std::function<StakeResult(int64_t)>& apply) {
    if (!RequireCaller(ctx)) return 1;
    auto value = RequireNumber(ctx, what);
    if (!value) return 1;
    return Mutated(ctx, apply(*value), std::string("Updated ") + what);
}

int CommandSetLimit(CommandContext& ctx) {
    return CommandAdminNumber(ctx, "stake limit", [&](int64_t value) {
        if (value < 0) {
            return StakeResult::Failure(StakeError::INVALID_PARAMS, "negative limit");
        }
        return ctx.vault.SetStakeLimit(ctx.caller, static_cast<uint64_t>(value));
    });
}

int CommandSetReward(CommandContext& ctx) {
    return CommandAdminNumber(ctx, "reward per block", [&](int64_t value) {
        return ctx.vault.SetRewardPerBlock(ctx.caller, value);
    });
}

int CommandSetTax(CommandContext& ctx) {
    return CommandAdminNumber(ctx, "early exit tax", [&](int64_t value) {
        return ctx.vault.SetEarlyExitTax(ctx.caller, value);
    });
}

int CommandSetCarry(CommandContext& ctx) {
    return CommandAdminNumber(ctx, "carry amount", [&](int64_t value) {
        return ctx.vault.SetCarryAmount(ctx.caller, value);
    });
}

int CommandSetEnd(CommandContext& ctx) {
    return CommandAdminNumber(ctx, "staking end", [&](int64_t value) {
        return ctx.vault.SetStakingEndTime(ctx.caller, value);
    });
}

int CommandSetUnbonding(CommandContext& ctx) {
    return CommandAdminNumber(ctx, "unbonding period", [&](int64_t value) {
        return ctx.vault.SetUnbondingPeriod(ctx.caller, value);
    });
}

int CommandPause(CommandContext& ctx, bool paused) {
    if (!RequireCaller(ctx)) return 1;
    StakeResult result = paused ? ctx.vault.Pause(ctx.caller) : ctx.vault.Unpause(ctx.caller);
    return Mutated(ctx, result, paused ? "Vault paused" : "Vault unpaused");
}

int CommandDrainPool(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    return Mutated(ctx, ctx.vault.ForceWithdrawRewardPool(ctx.caller), "Reward pool withdrawn");
}

int CommandRescue(CommandContext& ctx) {
    if (!RequireCaller(ctx)) return 1;
    auto asset = RequireAsset(ctx);
    if (!asset) return 1;
    return Mutated(ctx, ctx.vault.ForceWithdrawAsset(ctx.caller, *asset),
                   "Rescued asset " + std::to_string(*asset));
}

// ============================================================================
// Dispatch
// ============================================================================

using CommandHandler = std::function<int(CommandContext&)>;

const std::map<std::string, CommandHandler>& Commands() {
    static const std::map<std::string, CommandHandler> commands = {
        {"init", CommandInit},
        {"mint", CommandMint},
        {"fund", CommandFund},
        {"deposit", CommandDeposit},
        {"stake", CommandStake},
        {"unstake", CommandUnstake},
        {"withdraw", CommandWithdraw},
        {"claim", CommandClaim},
        {"claimall", CommandClaimAll},
        {"info", CommandInfo},
        {"list", CommandList},
        {"pending", CommandPending},
        {"balance", CommandBalance},
        {"status", CommandStatus},
        {"setlimit", CommandSetLimit},
        {"setreward", CommandSetReward},
        {"settax", CommandSetTax},
        {"setcarry", CommandSetCarry},
        {"setend", CommandSetEnd},
        {"setunbonding", CommandSetUnbonding},
        {"pause", [](CommandContext& ctx) { return CommandPause(ctx, true); }},
        {"unpause", [](CommandContext& ctx) { return CommandPause(ctx, false); }},
        {"drainpool", CommandDrainPool},
        {"rescue", CommandRescue},
    };
    return commands;
}

/// Keeps the vault registered as asset receiver while it is alive
class ReceiverRegistration {
public:
    ReceiverRegistration(LocalAssetBook& book, const Address& account, IAssetReceiver* receiver)
        : book_(book), account_(account) {
        book_.RegisterReceiver(account_, receiver);
    }
    ~ReceiverRegistration() { book_.UnregisterReceiver(account_); }

private:
    LocalAssetBook& book_;
    Address account_;
};

int Run(util::ConfigManager& config) {
    const auto& args = config.GetPositionalArgs();
    auto handler = Commands().find(args.front());
    if (handler == Commands().end()) {
        std::cerr << "Unknown command: " << args.front() << "\n";
        std::cerr << "Run 'stakevault-cli -help' for usage.\n";
        return 1;
    }

    std::string dataDir = config.GetDataDir();
    std::error_code ec;
    fs::create_directories(dataDir, ec);
    if (ec) {
        std::cerr << "Error: cannot create " << dataDir << ": " << ec.message() << "\n";
        return 1;
    }

    SetupLogging(config, dataDir);

    auto [openStatus, database] = db::OpenDatabase(fs::path(dataDir) / DB_DIRNAME);
    if (!openStatus.ok()) {
        std::cerr << "Error: cannot open database: " << openStatus.ToString() << "\n";
        return 1;
    }

    VaultStore store(*database);
    LocalEnvironment env = LocalEnvironment::Create();
    db::Status status = store.LoadEnvironment(env);
    if (!status.ok()) {
        std::cerr << "Error: cannot load ledgers: " << status.ToString() << "\n";
        return 1;
    }
    if (env.genesisTime == 0) {
        env.genesisTime = util::GetTime();
    }
    if (env.blockTime <= 0) {
        env.blockTime = config.GetInt(util::ConfigKeys::BLOCKTIME, DEFAULT_AVERAGE_BLOCK_TIME);
        if (env.blockTime <= 0) {
            std::cerr << "Error: -blocktime must be positive\n";
            return 1;
        }
    }

    VaultContext vaultContext;
    vaultContext.custodian = env.assets;
    vaultContext.token = env.tokens;
    vaultContext.authorizer = env.authorizer;
    vaultContext.pauseGate = env.pauseGate;
    vaultContext.clock = std::make_shared<SystemChainClock>(env.genesisTime, env.blockTime);

    StakeVault vault(Address::FromHex(VAULT_ADDRESS_HEX), vaultContext);
    ReceiverRegistration registration(*env.assets, vault.VaultAddress(), &vault);

    status = store.LoadVault(vault);
    if (!status.ok()) {
        std::cerr << "Error: cannot load vault: " << status.ToString() << "\n";
        return 1;
    }

    CommandContext ctx{config, env, vault, args};
    if (auto from = config.TryGetString(util::ConfigKeys::FROM)) {
        if (!ParseAddress(*from, ctx.caller)) {
            std::cerr << "Error: invalid -from address '" << *from << "'\n";
            return 1;
        }
        ctx.hasCaller = true;
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Running '" << args.front() << "'";
    int rc = handler->second(ctx);

    if (rc == 0 && ctx.dirty) {
        status = store.Save(vault, &env);
        if (!status.ok()) {
            std::cerr << "Error: cannot save state: " << status.ToString() << "\n";
            return 1;
        }
    }
    return rc;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;

    auto parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }

    if (config.GetBool(util::ConfigKeys::VERSION, false)) {
        std::cout << "STAKEVAULT CLI v" << VERSION << "\n";
        return 0;
    }
    if (config.GetBool(util::ConfigKeys::SAMPLECONFIG, false)) {
        std::cout << util::ConfigManager::GenerateSampleConfig();
        return 0;
    }
    bool help = config.GetBool(util::ConfigKeys::HELP, false);
    if (help || config.GetPositionalArgs().empty()) {
        PrintUsage();
        return help ? 0 : 1;
    }

    auto loaded = config.LoadConfigFile(config.GetDataDir());
    if (!loaded.success) {
        std::cerr << "Error reading config file: " << loaded.errorMessage;
        if (loaded.errorLine > 0) {
            std::cerr << " (" << loaded.errorFile << ":" << loaded.errorLine << ")";
        }
        std::cerr << "\n";
        return 1;
    }

    int rc = 1;
    try {
        rc = Run(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    util::Logger::Instance().Flush();
    util::Logger::Instance().ClearSinks();
    return rc;
}
