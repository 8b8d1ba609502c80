// STAKEVAULT - Core Types Header
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// This file defines fundamental types used throughout STAKEVAULT.

#ifndef STAKEVAULT_CORE_TYPES_H
#define STAKEVAULT_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakevault {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount of reward token in smallest units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Block height
using BlockHeight = int64_t;

/// Opaque identifier of a unique collectible asset
using AssetId = uint64_t;

/// Display unit: 1 SVT = 10^8 base units
constexpr Amount COIN = 100000000LL;

/// Largest amount any single balance or parameter may hold
constexpr Amount MAX_MONEY = 10000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

/// Format an amount for display (e.g. "1.5 SVT")
std::string FormatAmount(Amount amount);

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque byte string, used for identities
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (storage byte order)
    std::string ToHex() const;

    /// Parse from hex string; throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 160-bit value (20 bytes) - identities of holders, admins and the vault
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Identity of a caller, holder or custody account
using Address = Hash160;

/// Parse an address, accepting an optional "0x" prefix
bool ParseAddress(const std::string& str, Address& out);

/// Hasher for unordered containers keyed by address
struct AddressHasher {
    size_t operator()(const Address& addr) const noexcept {
        size_t h = 0;
        for (Byte b : addr) {
            h = h * 131 + b;
        }
        return h;
    }
};

// ============================================================================
// Hex Helpers
// ============================================================================

/// Convert bytes to hex string
std::string BytesToHex(const Byte* data, size_t len);

/// Convert hex string to bytes; returns false on malformed input
bool HexToBytes(const std::string& hex, std::vector<Byte>& out);

/// Check if string is valid, even-length hex
bool IsValidHex(const std::string& str);

} // namespace stakevault

#endif // STAKEVAULT_CORE_TYPES_H
