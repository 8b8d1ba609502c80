// STAKEVAULT - Vault Persistence
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Persists a StakeVault and its local ledgers in a key-value database.
//
// Key layout:
//   P                  -> vault settings
//   F<name>            -> flags and counters (initialized, stakes, active,
//                         genesis, blocktime)
//   E<asset id, BE64>  -> stake entry
//   L<name>            -> local ledgers (assets, tokens, authorizer, paused)
//
// Save writes everything in a single batch, so a crash leaves either the old
// or the new state on disk.

#ifndef STAKEVAULT_STAKING_VAULT_STORE_H
#define STAKEVAULT_STAKING_VAULT_STORE_H

#include "stakevault/db/database.h"
#include "stakevault/staking/local_ledger.h"
#include "stakevault/staking/vault.h"

#include <memory>
#include <string>

namespace stakevault {
namespace staking {

/// In-process collaborators backing a vault run from the CLI
struct LocalEnvironment {
    std::shared_ptr<LocalAssetBook> assets;
    std::shared_ptr<LocalTokenBook> tokens;
    std::shared_ptr<RoleAuthorizer> authorizer;
    std::shared_ptr<LocalPauseGate> pauseGate;

    /// Wall-clock time of block zero for the chain clock
    Timestamp genesisTime{0};

    /// Seconds per block for the chain clock; zero until first saved
    int64_t blockTime{0};

    /// Fresh, empty environment
    static LocalEnvironment Create();
};

class VaultStore {
public:
    explicit VaultStore(db::Database& database) : db_(database) {}

    /// True once a vault has been saved to this database
    bool HasVault();

    /**
     * Write the vault state, and the environment when given, atomically.
     * Entries removed since the last save are deleted from the database.
     */
    db::Status Save(const StakeVault& vault, const LocalEnvironment* env = nullptr);

    /// Load ledgers and clock origin; missing records keep their empty defaults
    db::Status LoadEnvironment(LocalEnvironment& env);

    /**
     * Restore vault state into a freshly constructed vault. An empty database
     * leaves the vault uninitialized. Malformed records and counter
     * mismatches are reported as Corruption.
     */
    db::Status LoadVault(StakeVault& vault);

private:
    static std::string EntryKey(AssetId asset);
    static std::string FlagKey(const char* name);
    static std::string BookKey(const char* name);

    db::Status ReadFlag(const char* name, uint64_t& value, bool& found);

    template<typename Book>
    db::Status ReadBook(const char* name, Book& book);

    db::Database& db_;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_VAULT_STORE_H
