// STAKEFLOW - Core Types Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/core/types.h"
#include "stakeflow/core/hex.h"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace stakeflow {

// ============================================================================
// Address Implementation
// ============================================================================

Address Address::FromHex(const std::string& hex) {
    std::vector<uint8_t> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Address must be " + std::to_string(SIZE * 2) +
                                    " hex characters: '" + hex + "'");
    }
    return Address(bytes.data(), bytes.size());
}

std::string Address::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::string Address::ToShortString() const {
    std::string hex = ToHex();
    return hex.substr(0, 6) + ".." + hex.substr(hex.size() - 4);
}

// ============================================================================
// Amount Helpers
// ============================================================================

std::string FormatAmount(Amount amount) {
    std::ostringstream ss;
    Amount whole = amount / COIN;
    Amount frac = amount % COIN;
    std::string fracStr = std::to_string(frac);
    ss << whole << "." << std::string(8 - fracStr.size(), '0') << fracStr;
    return ss.str();
}

Amount ParseAmount(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Empty amount");
    }

    size_t dot = str.find('.');
    std::string wholePart = str.substr(0, dot);
    std::string fracPart = dot == std::string::npos ? "" : str.substr(dot + 1);

    if (wholePart.empty() && fracPart.empty()) {
        throw std::invalid_argument("Invalid amount: '" + str + "'");
    }
    if (fracPart.size() > 8) {
        throw std::invalid_argument("Too many decimal places: '" + str + "'");
    }
    for (char c : wholePart + fracPart) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid amount: '" + str + "'");
        }
    }

    Amount whole = 0;
    for (char c : wholePart) {
        whole = whole * 10 + static_cast<Amount>(c - '0');
        if (whole > MAX_AMOUNT / COIN) {
            throw std::invalid_argument("Amount out of range: '" + str + "'");
        }
    }

    fracPart.append(8 - fracPart.size(), '0');
    Amount frac = std::stoull(fracPart);
    if (frac > MAX_AMOUNT - whole * COIN) {
        throw std::invalid_argument("Amount out of range: '" + str + "'");
    }
    return whole * COIN + frac;
}

Amount CheckedAdd(Amount a, Amount b) {
    if (a > MAX_AMOUNT - b) {
        throw std::overflow_error("Amount addition overflow");
    }
    return a + b;
}

Amount CheckedSub(Amount a, Amount b) {
    if (b > a) {
        throw std::range_error("Amount subtraction underflow");
    }
    return a - b;
}

} // namespace stakeflow
