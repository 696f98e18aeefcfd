// STAKEFLOW - Fixed-Point Arithmetic
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Scaled integer arithmetic used by reward accrual.
//
// Values are stored as a 256-bit unsigned integer scaled by 10^18. The
// backing type is Boost.Multiprecision's checked integer, so any overflow,
// negative subtraction or division by zero raises an exception instead of
// silently wrapping:
// - std::overflow_error on overflow and division by zero
// - std::range_error on a subtraction that would go negative

#ifndef STAKEFLOW_CORE_FIXEDPOINT_H
#define STAKEFLOW_CORE_FIXEDPOINT_H

#include <stakeflow/core/types.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>

namespace stakeflow {

/// Checked 256-bit unsigned integer
using uint256 = boost::multiprecision::checked_uint256_t;

/// floor(a * b / c) with a 256-bit intermediate
uint256 MulDiv(const uint256& a, const uint256& b, const uint256& c);

/// Narrow to Amount; throws std::overflow_error if the value does not fit
Amount NarrowToAmount(const uint256& value);

// ============================================================================
// FixedPoint
// ============================================================================

/**
 * Non-negative fixed-point number with 18 decimal places.
 */
class FixedPoint {
public:
    /// Scale factor (10^18)
    static constexpr uint64_t SCALE = 1000000000000000000ULL;

    FixedPoint() = default;

    /// Wrap an already-scaled raw value
    static FixedPoint FromRaw(const uint256& raw) {
        FixedPoint fp;
        fp.raw_ = raw;
        return fp;
    }

    /// Whole number n, stored as n * SCALE
    static FixedPoint FromInteger(uint64_t value);

    /// numerator / denominator, rounded down to 18 decimals
    static FixedPoint FromRatio(const uint256& numerator, const uint256& denominator);

    const uint256& Raw() const { return raw_; }
    bool IsZero() const { return raw_ == 0; }

    FixedPoint operator+(const FixedPoint& other) const {
        return FromRaw(raw_ + other.raw_);
    }

    FixedPoint operator-(const FixedPoint& other) const {
        return FromRaw(raw_ - other.raw_);
    }

    FixedPoint& operator+=(const FixedPoint& other) {
        raw_ += other.raw_;
        return *this;
    }

    bool operator==(const FixedPoint& other) const { return raw_ == other.raw_; }
    bool operator!=(const FixedPoint& other) const { return raw_ != other.raw_; }
    bool operator<(const FixedPoint& other) const { return raw_ < other.raw_; }
    bool operator<=(const FixedPoint& other) const { return raw_ <= other.raw_; }
    bool operator>(const FixedPoint& other) const { return raw_ > other.raw_; }
    bool operator>=(const FixedPoint& other) const { return raw_ >= other.raw_; }

    /// floor(amount * value), narrowed back to Amount
    Amount MulAmount(Amount amount) const;

    /// Raw scaled integer in decimal
    std::string ToString() const { return raw_.str(); }

    /// Human-readable value with all 18 decimals ("1.500000000000000000")
    std::string ToDecimalString() const;

private:
    uint256 raw_{0};
};

} // namespace stakeflow

#endif // STAKEFLOW_CORE_FIXEDPOINT_H
