// STAKEVAULT - Vault Persistence Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/vault_store.h"
#include "stakevault/util/logging.h"

#include <set>

namespace stakevault {
namespace staking {

namespace {

using util::LogCategory::DB;

constexpr const char* FLAG_INITIALIZED = "initialized";
constexpr const char* FLAG_STAKES = "stakes";
constexpr const char* FLAG_ACTIVE = "active";
constexpr const char* FLAG_GENESIS = "genesis";
constexpr const char* FLAG_BLOCKTIME = "blocktime";

constexpr const char* BOOK_ASSETS = "assets";
constexpr const char* BOOK_TOKENS = "tokens";
constexpr const char* BOOK_AUTHORIZER = "authorizer";
constexpr const char* BOOK_PAUSED = "paused";

constexpr size_t ENTRY_KEY_SIZE = 1 + 8;

std::string BytesToString(const std::vector<Byte>& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

const Byte* StringBytes(const std::string& s) {
    return reinterpret_cast<const Byte*>(s.data());
}

AssetId DecodeAssetKey(const db::Slice& key) {
    AssetId asset = 0;
    for (size_t i = 1; i < ENTRY_KEY_SIZE; ++i) {
        asset = (asset << 8) | static_cast<uint8_t>(key[i]);
    }
    return asset;
}

} // namespace

// ============================================================================
// LocalEnvironment
// ============================================================================

LocalEnvironment LocalEnvironment::Create() {
    LocalEnvironment env;
    env.assets = std::make_shared<LocalAssetBook>();
    env.tokens = std::make_shared<LocalTokenBook>();
    env.authorizer = std::make_shared<RoleAuthorizer>();
    env.pauseGate = std::make_shared<LocalPauseGate>();
    return env;
}

// ============================================================================
// Keys
// ============================================================================

std::string VaultStore::EntryKey(AssetId asset) {
    // Big-endian so iteration visits entries in asset order
    std::string suffix(8, '\0');
    for (int i = 7; i >= 0; --i) {
        suffix[i] = static_cast<char>(asset & 0xff);
        asset >>= 8;
    }
    return db::MakeKey(db::prefix::ENTRY, suffix);
}

std::string VaultStore::FlagKey(const char* name) {
    return db::MakeKey(db::prefix::FLAG, name);
}

std::string VaultStore::BookKey(const char* name) {
    return db::MakeKey(db::prefix::BOOK, name);
}

// ============================================================================
// Save
// ============================================================================

bool VaultStore::HasVault() {
    return db_.Exists(FlagKey(FLAG_INITIALIZED));
}

db::Status VaultStore::Save(const StakeVault& vault, const LocalEnvironment* env) {
    VaultSnapshot snapshot = vault.Snapshot();

    std::set<std::string> liveKeys;
    for (const auto& view : snapshot.entries) {
        liveKeys.insert(EntryKey(view.asset));
    }

    db::WriteBatch batch;

    // Drop entries that no longer exist
    auto it = db_.NewIterator();
    std::string entryPrefix = db::MakeKey(db::prefix::ENTRY);
    for (it->Seek(entryPrefix); it->Valid() && it->key().starts_with(entryPrefix); it->Next()) {
        std::string key = it->key().ToString();
        if (liveKeys.count(key) == 0) {
            batch.Delete(key);
        }
    }
    db::Status iterStatus = it->status();
    if (!iterStatus.ok()) {
        return iterStatus;
    }

    batch.Put(FlagKey(FLAG_INITIALIZED), db::SerializeToString(snapshot.initialized));
    batch.Put(FlagKey(FLAG_STAKES), db::SerializeToString(snapshot.stakesCount));
    batch.Put(FlagKey(FLAG_ACTIVE), db::SerializeToString(snapshot.activeStakesCount));
    if (snapshot.initialized) {
        batch.Put(db::MakeKey(db::prefix::PARAMS),
                  BytesToString(snapshot.settings.Serialize()));
    }
    for (const auto& view : snapshot.entries) {
        batch.Put(EntryKey(view.asset), BytesToString(view.entry.Serialize()));
    }

    if (env) {
        batch.Put(FlagKey(FLAG_GENESIS), db::SerializeToString(env->genesisTime));
        batch.Put(FlagKey(FLAG_BLOCKTIME), db::SerializeToString(env->blockTime));
        batch.Put(BookKey(BOOK_ASSETS), BytesToString(env->assets->Serialize()));
        batch.Put(BookKey(BOOK_TOKENS), BytesToString(env->tokens->Serialize()));
        batch.Put(BookKey(BOOK_AUTHORIZER), BytesToString(env->authorizer->Serialize()));
        batch.Put(BookKey(BOOK_PAUSED), db::SerializeToString(env->pauseGate->IsPaused()));
    }

    db::WriteOptions options;
    options.sync = true;
    db::Status status = db_.Write(options, &batch);
    if (!status.ok()) {
        LOG_ERROR(DB) << "Failed to save vault: " << status.ToString();
        return status;
    }

    LOG_DEBUG(DB) << "Saved vault: " << snapshot.entries.size() << " entries, "
                  << batch.Count() << " writes";
    return db::Status::Ok();
}

// ============================================================================
// Load
// ============================================================================

db::Status VaultStore::ReadFlag(const char* name, uint64_t& value, bool& found) {
    std::string raw;
    db::Status status = db_.Get(FlagKey(name), &raw);
    if (status.IsNotFound()) {
        found = false;
        return db::Status::Ok();
    }
    if (!status.ok()) {
        return status;
    }
    if (!db::DeserializeFromString(raw, value)) {
        return db::Status::Corruption(std::string("bad flag ") + name);
    }
    found = true;
    return db::Status::Ok();
}

template<typename Book>
db::Status VaultStore::ReadBook(const char* name, Book& book) {
    std::string raw;
    db::Status status = db_.Get(BookKey(name), &raw);
    if (status.IsNotFound()) {
        return db::Status::Ok();
    }
    if (!status.ok()) {
        return status;
    }
    if (!book.Deserialize(StringBytes(raw), raw.size())) {
        return db::Status::Corruption(std::string("bad ledger ") + name);
    }
    return db::Status::Ok();
}

db::Status VaultStore::LoadEnvironment(LocalEnvironment& env) {
    db::Status status = ReadBook(BOOK_ASSETS, *env.assets);
    if (!status.ok()) return status;
    status = ReadBook(BOOK_TOKENS, *env.tokens);
    if (!status.ok()) return status;
    status = ReadBook(BOOK_AUTHORIZER, *env.authorizer);
    if (!status.ok()) return status;

    std::string raw;
    status = db_.Get(BookKey(BOOK_PAUSED), &raw);
    if (status.ok()) {
        bool paused = false;
        if (!db::DeserializeFromString(raw, paused)) {
            return db::Status::Corruption("bad pause flag");
        }
        env.pauseGate->SetPaused(paused);
    } else if (!status.IsNotFound()) {
        return status;
    }

    uint64_t value = 0;
    bool found = false;
    status = ReadFlag(FLAG_GENESIS, value, found);
    if (!status.ok()) return status;
    if (found) {
        env.genesisTime = static_cast<Timestamp>(value);
    }
    status = ReadFlag(FLAG_BLOCKTIME, value, found);
    if (!status.ok()) return status;
    if (found) {
        env.blockTime = static_cast<int64_t>(value);
    }

    return db::Status::Ok();
}

db::Status VaultStore::LoadVault(StakeVault& vault) {
    std::string raw;
    db::Status status = db_.Get(FlagKey(FLAG_INITIALIZED), &raw);
    if (status.IsNotFound()) {
        LOG_DEBUG(DB) << "No stored vault";
        return db::Status::Ok();
    }
    if (!status.ok()) {
        return status;
    }

    VaultSnapshot snapshot;
    if (!db::DeserializeFromString(raw, snapshot.initialized)) {
        return db::Status::Corruption("bad initialized flag");
    }

    bool found = false;
    status = ReadFlag(FLAG_STAKES, snapshot.stakesCount, found);
    if (!status.ok()) return status;
    status = ReadFlag(FLAG_ACTIVE, snapshot.activeStakesCount, found);
    if (!status.ok()) return status;

    if (snapshot.initialized) {
        status = db_.Get(db::MakeKey(db::prefix::PARAMS), &raw);
        if (status.IsNotFound()) {
            return db::Status::Corruption("initialized vault without settings");
        }
        if (!status.ok()) {
            return status;
        }
        auto settings = VaultSettings::Deserialize(StringBytes(raw), raw.size());
        if (!settings) {
            return db::Status::Corruption("bad vault settings");
        }
        snapshot.settings = *settings;
    }

    auto it = db_.NewIterator();
    std::string entryPrefix = db::MakeKey(db::prefix::ENTRY);
    for (it->Seek(entryPrefix); it->Valid() && it->key().starts_with(entryPrefix); it->Next()) {
        db::Slice key = it->key();
        if (key.size() != ENTRY_KEY_SIZE) {
            return db::Status::Corruption("bad entry key");
        }
        db::Slice value = it->value();
        auto entry = StakeEntry::Deserialize(reinterpret_cast<const Byte*>(value.data()),
                                             value.size());
        if (!entry) {
            return db::Status::Corruption("bad entry for asset " +
                                          std::to_string(DecodeAssetKey(key)));
        }
        StakeView view;
        view.asset = DecodeAssetKey(key);
        view.entry = *entry;
        snapshot.entries.push_back(view);
    }
    status = it->status();
    if (!status.ok()) {
        return status;
    }

    StakeResult restored = vault.Restore(snapshot);
    if (!restored.IsOk()) {
        LOG_ERROR(DB) << "Stored vault rejected: " << restored.ToString();
        return db::Status::Corruption(restored.ToString());
    }

    LOG_DEBUG(DB) << "Loaded vault: " << snapshot.entries.size() << " entries";
    return db::Status::Ok();
}

} // namespace staking
} // namespace stakevault
