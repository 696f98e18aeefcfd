// STAKEFLOW - Fixed-Point Arithmetic Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include <stakeflow/core/fixedpoint.h>

#include <stdexcept>

namespace stakeflow {

uint256 MulDiv(const uint256& a, const uint256& b, const uint256& c) {
    if (c == 0) {
        throw std::overflow_error("MulDiv: division by zero");
    }
    return (a * b) / c;
}

Amount NarrowToAmount(const uint256& value) {
    if (value > uint256(MAX_AMOUNT)) {
        throw std::overflow_error("Value " + value.str() + " exceeds amount range");
    }
    return value.convert_to<Amount>();
}

// ============================================================================
// FixedPoint
// ============================================================================

FixedPoint FixedPoint::FromInteger(uint64_t value) {
    return FromRaw(uint256(value) * SCALE);
}

FixedPoint FixedPoint::FromRatio(const uint256& numerator, const uint256& denominator) {
    return FromRaw(MulDiv(numerator, uint256(SCALE), denominator));
}

Amount FixedPoint::MulAmount(Amount amount) const {
    return NarrowToAmount(MulDiv(uint256(amount), raw_, uint256(SCALE)));
}

std::string FixedPoint::ToDecimalString() const {
    uint256 whole = raw_ / SCALE;
    std::string frac = (raw_ % SCALE).str();
    return whole.str() + "." + std::string(18 - frac.size(), '0') + frac;
}

} // namespace stakeflow
