// STAKEVAULT - Serialization Header
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Little-endian binary encoding for persisted vault records. Integers are
// fixed width, addresses are raw 20 bytes, and element counts use the
// compact size prefix (1, 5 or 9 bytes).

#ifndef STAKEVAULT_CORE_SERIALIZE_H
#define STAKEVAULT_CORE_SERIALIZE_H

#include "stakevault/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace stakevault {

/// Upper bound on a decoded element count
static constexpr uint64_t MAX_RECORD_COUNT = 1u << 24;

// ============================================================================
// DataStream
// ============================================================================

/**
 * Growable byte buffer with a read cursor. Reads past the end throw
 * std::ios_base::failure; decoders catch it and reject the record.
 */
class DataStream {
public:
    DataStream() = default;
    DataStream(const Byte* data, size_t len) : buf_(data, data + len) {}
    explicit DataStream(const std::string& bytes) : buf_(bytes.begin(), bytes.end()) {}

    /// Unread byte count
    size_t size() const { return buf_.size() - pos_; }
    bool empty() const { return pos_ == buf_.size(); }

    /// Unread bytes
    std::vector<Byte> Bytes() const { return std::vector<Byte>(buf_.begin() + pos_, buf_.end()); }
    std::string str() const { return std::string(buf_.begin() + pos_, buf_.end()); }

    void Write(const Byte* src, size_t len) { buf_.insert(buf_.end(), src, src + len); }

    void Read(Byte* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream: truncated record");
        }
        std::memcpy(dst, buf_.data() + pos_, len);
        pos_ += len;
    }

    template<typename T>
    DataStream& operator<<(const T& obj) {
        Serialize(*this, obj);
        return *this;
    }

    template<typename T>
    DataStream& operator>>(T& obj) {
        Unserialize(*this, obj);
        return *this;
    }

private:
    std::vector<Byte> buf_;
    size_t pos_{0};
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

template<size_t N>
void WriteLE(DataStream& s, uint64_t value) {
    Byte out[N];
    for (size_t i = 0; i < N; ++i) {
        out[i] = static_cast<Byte>(value >> (8 * i));
    }
    s.Write(out, N);
}

template<size_t N>
uint64_t ReadLE(DataStream& s) {
    Byte in[N];
    s.Read(in, N);
    uint64_t value = 0;
    for (size_t i = 0; i < N; ++i) {
        value |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return value;
}

inline void Serialize(DataStream& s, uint8_t v) { WriteLE<1>(s, v); }
inline void Serialize(DataStream& s, uint64_t v) { WriteLE<8>(s, v); }
inline void Serialize(DataStream& s, int64_t v) { WriteLE<8>(s, static_cast<uint64_t>(v)); }
inline void Serialize(DataStream& s, bool v) { WriteLE<1>(s, v ? 1 : 0); }

inline void Unserialize(DataStream& s, uint8_t& v) { v = static_cast<uint8_t>(ReadLE<1>(s)); }
inline void Unserialize(DataStream& s, uint64_t& v) { v = ReadLE<8>(s); }
inline void Unserialize(DataStream& s, int64_t& v) { v = static_cast<int64_t>(ReadLE<8>(s)); }

inline void Unserialize(DataStream& s, bool& v) {
    uint64_t raw = ReadLE<1>(s);
    if (raw > 1) {
        throw std::ios_base::failure("DataStream: bad bool");
    }
    v = raw == 1;
}

// ============================================================================
// Addresses
// ============================================================================

inline void Serialize(DataStream& s, const Hash160& hash) {
    s.Write(hash.data(), Hash160::SIZE);
}

inline void Unserialize(DataStream& s, Hash160& hash) {
    s.Read(hash.data(), Hash160::SIZE);
}

// ============================================================================
// Element Counts
// ============================================================================

inline void WriteCompactSize(DataStream& s, uint64_t count) {
    if (count < 0xFD) {
        WriteLE<1>(s, count);
    } else if (count <= 0xFFFFFFFF) {
        WriteLE<1>(s, 0xFE);
        WriteLE<4>(s, count);
    } else {
        WriteLE<1>(s, 0xFF);
        WriteLE<8>(s, count);
    }
}

inline uint64_t ReadCompactSize(DataStream& s) {
    uint64_t marker = ReadLE<1>(s);
    uint64_t count = marker;
    if (marker == 0xFE) {
        count = ReadLE<4>(s);
    } else if (marker == 0xFF) {
        count = ReadLE<8>(s);
    } else if (marker == 0xFD) {
        throw std::ios_base::failure("DataStream: bad count marker");
    }
    if (count > MAX_RECORD_COUNT) {
        throw std::ios_base::failure("DataStream: count too large");
    }
    return count;
}

} // namespace stakevault

#endif // STAKEVAULT_CORE_SERIALIZE_H
