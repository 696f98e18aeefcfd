// STAKEFLOW - Core Types Header
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Fundamental value types shared by every STAKEFLOW module.

#ifndef STAKEFLOW_CORE_TYPES_H
#define STAKEFLOW_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace stakeflow {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in base units
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Fee or rate expressed in basis points
using BasisPoints = uint32_t;

/// Constants
constexpr Amount COIN = 100000000ULL;  // 1 token = 100 million base units
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Basis point denominator (10000 bp = 100%)
constexpr BasisPoints BPS_DENOMINATOR = 10000;

/// Calendar constants (seconds)
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

// ============================================================================
// Address
// ============================================================================

/**
 * 160-bit account identifier.
 *
 * Stakers, the custody account and the fee recipient are all addressed
 * this way. Hex form is 40 lowercase characters, most significant byte
 * first.
 */
class Address {
public:
    static constexpr size_t SIZE = 20;

    /// Null address
    Address() noexcept { data_.fill(0); }

    explicit Address(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Copies up to SIZE bytes; shorter input is zero-padded
    Address(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Short-hand used by tests and the simulator: every byte set to id
    static Address FromId(uint8_t id) noexcept {
        std::array<Byte, SIZE> data;
        data.fill(id);
        return Address(data);
    }

    /// Parse 40 hex characters (optional 0x prefix)
    static Address FromHex(const std::string& hex);

    std::string ToHex() const;

    /// Abbreviated form for log lines
    std::string ToShortString() const;

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return SIZE; }
    const Byte* data() const noexcept { return data_.data(); }

    bool operator==(const Address& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const Address& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Address& other) const noexcept {
        return data_ < other.data_;
    }

private:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Amount Helpers
// ============================================================================

/// Format base units as a decimal token amount ("12.50000000")
std::string FormatAmount(Amount amount);

/// Parse a decimal token amount into base units; throws std::invalid_argument
Amount ParseAmount(const std::string& str);

/// Addition that throws std::overflow_error instead of wrapping
Amount CheckedAdd(Amount a, Amount b);

/// Subtraction that throws std::range_error instead of wrapping
Amount CheckedSub(Amount a, Amount b);

} // namespace stakeflow

#endif // STAKEFLOW_CORE_TYPES_H
