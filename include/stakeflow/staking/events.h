// STAKEFLOW - Staking Notifications
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Notifications emitted by the engine after an operation commits. Each one
// carries the literal values used in the computation it reports.

#ifndef STAKEFLOW_STAKING_EVENTS_H
#define STAKEFLOW_STAKING_EVENTS_H

#include <stakeflow/core/types.h>
#include <stakeflow/staking/state.h>

#include <cstdint>
#include <string>

namespace stakeflow {
namespace staking {

// ============================================================================
// Event Types
// ============================================================================

struct StakeEvent {
    Address account;
    Amount amount{0};
    Amount fee{0};
    Amount netAmount{0};
    Amount newBalance{0};
    Timestamp weightedStakeTime{0};
    Timestamp time{0};

    std::string ToString() const;
};

struct WithdrawEvent {
    Address account;
    Amount amount{0};
    Amount fee{0};
    Amount netAmount{0};
    Amount remainingBalance{0};
    Timestamp time{0};

    std::string ToString() const;
};

struct RewardClaimedEvent {
    Address account;
    Amount reward{0};
    Timestamp time{0};

    std::string ToString() const;
};

enum class FeeKind { Entry, Exit };

const char* FeeKindToString(FeeKind kind);

struct FeeDistributedEvent {
    FeeKind kind{FeeKind::Entry};
    Address recipient;
    Amount totalFee{0};
    Amount poolShare{0};
    Amount recipientShare{0};
    Timestamp time{0};

    std::string ToString() const;
};

struct DurationFeeEvent {
    Address account;
    int64_t stakeDuration{0};
    BasisPoints feeBps{0};
    Amount amount{0};
    Amount fee{0};
    Timestamp time{0};

    std::string ToString() const;
};

struct RateAdjustedEvent {
    Amount oldRate{0};
    Amount newRate{0};
    AdjustmentReason reason{AdjustmentReason::None};
    Amount availableRewards{0};
    uint64_t sustainabilityDays{0};
    Timestamp time{0};

    std::string ToString() const;
};

struct TargetUpdatedEvent {
    uint64_t oldTarget{0};
    uint64_t newTarget{0};
    Timestamp time{0};

    std::string ToString() const;
};

struct RewardsFundedEvent {
    Address funder;
    Amount amount{0};
    Amount availableRewards{0};
    Timestamp time{0};

    std::string ToString() const;
};

// ============================================================================
// Notification Sink
// ============================================================================

/**
 * Receiver for committed-operation notifications. Handlers default to no-ops
 * so sinks override only what they consume. Calls back into the engine from
 * a handler are rejected as reentrant.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void OnStake(const StakeEvent&) {}
    virtual void OnWithdraw(const WithdrawEvent&) {}
    virtual void OnRewardClaimed(const RewardClaimedEvent&) {}
    virtual void OnFeeDistributed(const FeeDistributedEvent&) {}
    virtual void OnDurationFeeApplied(const DurationFeeEvent&) {}
    virtual void OnRateAdjusted(const RateAdjustedEvent&) {}
    virtual void OnTargetUpdated(const TargetUpdatedEvent&) {}
    virtual void OnRewardsFunded(const RewardsFundedEvent&) {}
};

/// Writes every notification to the logger under the "events" category
class LoggingNotificationSink : public INotificationSink {
public:
    void OnStake(const StakeEvent& e) override;
    void OnWithdraw(const WithdrawEvent& e) override;
    void OnRewardClaimed(const RewardClaimedEvent& e) override;
    void OnFeeDistributed(const FeeDistributedEvent& e) override;
    void OnDurationFeeApplied(const DurationFeeEvent& e) override;
    void OnRateAdjusted(const RateAdjustedEvent& e) override;
    void OnTargetUpdated(const TargetUpdatedEvent& e) override;
    void OnRewardsFunded(const RewardsFundedEvent& e) override;
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_EVENTS_H
