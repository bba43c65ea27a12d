// DADBS - Core Types Header
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Fundamental types shared by every DADBS module.

#ifndef DADBS_CORE_TYPES_H
#define DADBS_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace dadbs {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in base units (the smallest indivisible denomination)
using Amount = uint64_t;

/// Base units per whole token
constexpr Amount BASE_UNITS_PER_TOKEN = 1000000000ULL;

/// Check that a + b does not wrap
inline bool AddWouldOverflow(Amount a, Amount b) {
    return a > UINT64_MAX - b;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque hash value
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

    /// Construct from raw bytes (short input is zero padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

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

    /// Lowercase hex, byte order as stored
    std::string ToHex() const;

    /// Parse from hex (throws std::invalid_argument on bad input)
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;

    Hash256(const BaseHash<256>& other) noexcept  // NOLINT(implicit)
        : BaseHash<256>(other.data(), SIZE) {}
};

} // namespace dadbs

#endif // DADBS_CORE_TYPES_H
