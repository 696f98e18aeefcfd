// STAKEFLOW - Staking Notifications Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/events.h"
#include "stakeflow/staking/fees.h"
#include "stakeflow/util/logging.h"
#include "stakeflow/util/time.h"

#include <sstream>

namespace stakeflow {
namespace staking {

// ============================================================================
// Event Formatting
// ============================================================================

std::string StakeEvent::ToString() const {
    std::ostringstream ss;
    ss << "Staked(" << account.ToShortString()
       << ", amount=" << FormatAmount(amount)
       << ", fee=" << FormatAmount(fee)
       << ", net=" << FormatAmount(netAmount)
       << ", balance=" << FormatAmount(newBalance)
       << ", weightedTime=" << weightedStakeTime << ")";
    return ss.str();
}

std::string WithdrawEvent::ToString() const {
    std::ostringstream ss;
    ss << "Withdrawn(" << account.ToShortString()
       << ", amount=" << FormatAmount(amount)
       << ", fee=" << FormatAmount(fee)
       << ", net=" << FormatAmount(netAmount)
       << ", remaining=" << FormatAmount(remainingBalance) << ")";
    return ss.str();
}

std::string RewardClaimedEvent::ToString() const {
    return "RewardClaimed(" + account.ToShortString() + ", " + FormatAmount(reward) + ")";
}

const char* FeeKindToString(FeeKind kind) {
    switch (kind) {
        case FeeKind::Entry: return "entry";
        case FeeKind::Exit:  return "exit";
        default:             return "unknown";
    }
}

std::string FeeDistributedEvent::ToString() const {
    std::ostringstream ss;
    ss << "FeeDistributed(" << FeeKindToString(kind)
       << ", total=" << FormatAmount(totalFee)
       << ", pool=" << FormatAmount(poolShare)
       << ", recipient=" << FormatAmount(recipientShare)
       << " -> " << recipient.ToShortString() << ")";
    return ss.str();
}

std::string DurationFeeEvent::ToString() const {
    std::ostringstream ss;
    ss << "DurationFeeApplied(" << account.ToShortString()
       << ", held=" << util::FormatDuration(util::Seconds(stakeDuration))
       << ", tier=" << FeeSchedule::FormatBps(feeBps)
       << ", fee=" << FormatAmount(fee) << " of " << FormatAmount(amount) << ")";
    return ss.str();
}

std::string RateAdjustedEvent::ToString() const {
    std::ostringstream ss;
    ss << "RewardRateAdjusted(" << oldRate << " -> " << newRate
       << ", reason=" << AdjustmentReasonToString(reason)
       << ", available=" << FormatAmount(availableRewards)
       << ", days=" << sustainabilityDays << ")";
    return ss.str();
}

std::string TargetUpdatedEvent::ToString() const {
    std::ostringstream ss;
    ss << "SustainabilityTargetUpdated(" << oldTarget << "d -> " << newTarget << "d)";
    return ss.str();
}

std::string RewardsFundedEvent::ToString() const {
    std::ostringstream ss;
    ss << "RewardsFunded(" << funder.ToShortString()
       << ", amount=" << FormatAmount(amount)
       << ", available=" << FormatAmount(availableRewards) << ")";
    return ss.str();
}

// ============================================================================
// LoggingNotificationSink
// ============================================================================

void LoggingNotificationSink::OnStake(const StakeEvent& e) {
    LOG_INFO(util::LogCategory::EVENTS) << e.ToString();
}

void LoggingNotificationSink::OnWithdraw(const WithdrawEvent& e) {
    LOG_INFO(util::LogCategory::EVENTS) << e.ToString();
}

void LoggingNotificationSink::OnRewardClaimed(const RewardClaimedEvent& e) {
    LOG_INFO(util::LogCategory::EVENTS) << e.ToString();
}

void LoggingNotificationSink::OnFeeDistributed(const FeeDistributedEvent& e) {
    LOG_DEBUG(util::LogCategory::EVENTS) << e.ToString();
}

void LoggingNotificationSink::OnDurationFeeApplied(const DurationFeeEvent& e) {
    LOG_DEBUG(util::LogCategory::EVENTS) << e.ToString();
}

void LoggingNotificationSink::OnRateAdjusted(const RateAdjustedEvent& e) {
    LOG_INFO(util::LogCategory::EVENTS) << e.ToString();
}

void LoggingNotificationSink::OnTargetUpdated(const TargetUpdatedEvent& e) {
    LOG_INFO(util::LogCategory::EVENTS) << e.ToString();
}

void LoggingNotificationSink::OnRewardsFunded(const RewardsFundedEvent& e) {
    LOG_INFO(util::LogCategory::EVENTS) << e.ToString();
}

} // namespace staking
} // namespace stakeflow
