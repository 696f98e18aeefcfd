// STAKEFLOW - Staking Errors Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/errors.h"

#include <sstream>

namespace stakeflow {
namespace staking {

const char* StakingErrorToString(StakingError error) {
    switch (error) {
        case StakingError::None:                 return "None";
        case StakingError::InvalidConfiguration: return "InvalidConfiguration";
        case StakingError::BelowMinimumStake:    return "BelowMinimumStake";
        case StakingError::InsufficientBalance:  return "InsufficientBalance";
        case StakingError::ZeroAmount:           return "ZeroAmount";
        case StakingError::Unauthorized:         return "Unauthorized";
        case StakingError::TransferFailed:       return "TransferFailed";
        case StakingError::ReentrantCall:        return "ReentrantCall";
        case StakingError::ArithmeticOverflow:   return "ArithmeticOverflow";
        default:                                 return "Unknown";
    }
}

std::string OperationResult::ToString() const {
    std::ostringstream ss;
    if (IsSuccess()) {
        ss << "OK(amount=" << amount << ", fee=" << fee << ")";
    } else {
        ss << StakingErrorToString(error);
        if (!message.empty()) {
            ss << ": " << message;
        }
    }
    return ss.str();
}

} // namespace staking
} // namespace stakeflow
