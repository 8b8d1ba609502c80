// STAKEVAULT - Core Types Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/core/types.h"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace stakevault {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

// ============================================================================
// Hex Helpers
// ============================================================================

std::string BytesToHex(const Byte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

bool HexToBytes(const std::string& hex, std::vector<Byte>& out) {
    if (hex.length() % 2 != 0) {
        return false;
    }

    std::vector<Byte> bytes;
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        bytes.push_back(static_cast<Byte>((high << 4) | low));
    }

    out = std::move(bytes);
    return true;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }

    for (char c : str) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }

    return true;
}

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        int high = HexCharToNibble(hex[i * 2]);
        int low = HexCharToNibble(hex[i * 2 + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        result.data_[i] = static_cast<Byte>((high << 4) | low);
    }

    return result;
}

// Explicit template instantiations
template class BaseHash<160>;

// ============================================================================
// Address Parsing
// ============================================================================

bool ParseAddress(const std::string& str, Address& out) {
    std::string hex = str;
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.length() != Address::SIZE * 2 || !IsValidHex(hex)) {
        return false;
    }

    out = Address::FromHex(hex);
    return true;
}

// ============================================================================
// Amount Formatting
// ============================================================================

std::string FormatAmount(Amount amount) {
    std::ostringstream ss;
    if (amount < 0) {
        ss << "-";
    }
    Amount whole = std::llabs(amount / COIN);
    Amount frac = std::llabs(amount % COIN);
    ss << whole;
    if (frac > 0) {
        ss << "." << std::setfill('0') << std::setw(8) << frac;
        std::string s = ss.str();
        s.erase(s.find_last_not_of('0') + 1);
        return s + " SVT";
    }
    return ss.str() + " SVT";
}

} // namespace stakevault
