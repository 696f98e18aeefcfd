// STAKEFLOW - Staking Engine
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Facade tying accrual, ledger, fees and the rate controller to the token
// vault, the authorizer and the notification sink.
//
// Every mutating operation:
// 1. is rejected if another mutating operation is in progress
// 2. settles accrual for the account it touches (global for admin calls)
// 3. mutates the ledger
// 4. runs the rate controller if an adjustment period has elapsed, against
//    the custody balance this operation's transfers will leave behind
// 5. moves tokens through the vault
// Any failure rolls back every change made by the operation, including
// vault transfers already performed. Notifications are delivered only after
// the operation commits.

#ifndef STAKEFLOW_STAKING_ENGINE_H
#define STAKEFLOW_STAKING_ENGINE_H

#include <stakeflow/core/fixedpoint.h>
#include <stakeflow/core/types.h>
#include <stakeflow/staking/accrual.h>
#include <stakeflow/staking/authorization.h>
#include <stakeflow/staking/controller.h>
#include <stakeflow/staking/errors.h>
#include <stakeflow/staking/events.h>
#include <stakeflow/staking/fees.h>
#include <stakeflow/staking/ledger.h>
#include <stakeflow/staking/policy.h>
#include <stakeflow/staking/state.h>
#include <stakeflow/staking/vault.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace stakeflow {
namespace staking {

// ============================================================================
// Query Results
// ============================================================================

/// Full view of one staker
struct StakeSnapshot {
    Address account;
    Amount balance{0};
    Amount earned{0};
    Amount pendingReward{0};
    Timestamp weightedStakeTime{0};
    Timestamp firstStakeTime{0};

    /// Seconds since weightedStakeTime; zero with no balance
    int64_t stakeDuration{0};

    /// Exit fee tier that would apply now
    BasisPoints feeBps{0};

    Amount totalClaimed{0};

    std::string ToString() const;
};

/// What a withdrawal of `amount` would pay right now
struct WithdrawalQuote {
    Amount amount{0};
    int64_t stakeDuration{0};
    BasisPoints feeBps{0};
    Amount fee{0};
    Amount netAmount{0};
    FeeSplit split;
};

// ============================================================================
// Staking Engine
// ============================================================================

class StakingEngine {
public:
    /**
     * @param policy Initial parameters; throws std::invalid_argument if invalid
     * @param vault Token custody; must outlive the engine
     * @param authorizer Admin check; must outlive the engine
     */
    StakingEngine(const StakingPolicy& policy, ITokenVault& vault,
                  const IAuthorizer& authorizer);
    ~StakingEngine();

    StakingEngine(const StakingEngine&) = delete;
    StakingEngine& operator=(const StakingEngine&) = delete;

    void SetNotificationSink(std::shared_ptr<INotificationSink> sink);

    // ========================================================================
    // Staker Operations
    // ========================================================================

    /// Deposit `amount`; 1% entry fee, net credited. Result amount = net staked
    OperationResult Stake(const Address& account, Amount amount);

    /// Withdraw `amount` of principal less the duration-tiered exit fee
    OperationResult Withdraw(const Address& account, Amount amount);

    /// Pay out pending reward; zero reward or an unknown account is a successful no-op
    OperationResult Claim(const Address& account);

    /// Withdraw the whole balance and claim, as one operation
    OperationResult Exit(const Address& account);

    /// Add tokens to the reward pool
    OperationResult AddRewards(const Address& funder, Amount amount);

    /// Run the rate controller now if an adjustment period has elapsed
    OperationResult UpdateRewardRate();

    // ========================================================================
    // Administration
    // ========================================================================

    OperationResult SetRewardRate(const Address& caller, Amount rate);
    OperationResult SetMinRewardRate(const Address& caller, Amount rate);
    OperationResult SetRateAdjustmentPeriod(const Address& caller, int64_t seconds);
    OperationResult SetMaxAPR(const Address& caller, uint64_t bps);
    OperationResult SetMinimumStake(const Address& caller, Amount amount);
    OperationResult SetTargetSustainabilityDays(const Address& caller, uint64_t days);

    // ========================================================================
    // Queries
    // ========================================================================

    FixedPoint RewardPerUnit() const;
    Amount Earned(const Address& account) const;

    /// Current APR in basis points
    uint64_t EstimateAPR() const;

    Amount AvailableRewards() const;
    uint64_t SustainabilityDays() const;

    StakeSnapshot GetStakeInfo(const Address& account) const;

    /// nullopt if amount is zero or exceeds the balance
    std::optional<WithdrawalQuote> QuoteWithdrawal(const Address& account,
                                                   Amount amount) const;

    /// What the controller would do if triggered now
    RateProposal PreviewAdjustment() const;

    const GlobalState& GetState() const { return state_; }
    std::optional<Account> GetAccount(const Address& account) const;
    const StakeLedger& GetLedger() const { return ledger_; }

    const Address& Custody() const { return custody_; }
    const Address& FeeRecipient() const { return feeRecipient_; }

    /// totalStaked equals the sum of balances
    bool CheckConservation() const;

private:
    class Transaction;
    using Body = std::function<OperationResult(Transaction&, Timestamp)>;

    /// Guard, journal and exception boundary shared by every mutating call
    OperationResult Execute(const char* name, const Body& body);

    /// Clock reading, never earlier than the last settlement
    Timestamp Now() const;

    std::optional<OperationResult> CheckAdmin(const Address& caller) const;

    /// Principal leaving the ledger, decided before any tokens move
    struct WithdrawalPlan {
        Amount amount{0};
        int64_t duration{0};
        BasisPoints feeBps{0};
        Amount fee{0};
        Amount net{0};
        FeeSplit split;

        /// Tokens this withdrawal takes out of custody
        Amount Outflow() const { return net + split.recipientShare; }
    };

    /// Custody balance after `inflow` arrives and `outflow` leaves
    Amount ProjectedCustody(Amount inflow, Amount outflow) const;

    /// Runs the controller if due; returns true if the rate changed
    bool MaybeAdjust(Transaction& tx, Timestamp now, Amount custodyBalance);

    WithdrawalPlan DebitStake(const SettlementReceipt& receipt, const Address& account,
                              Amount amount, Timestamp now);

    OperationResult PayWithdrawal(Transaction& tx, const Address& account,
                                  const WithdrawalPlan& plan, Timestamp now);

    /**
     * Take the settled reward out of the account.
     * Fails with TransferFailed if the reward pool in `custodyBalance`
     * cannot cover it, so staked principal is never paid out as reward.
     */
    OperationResult CollectReward(const SettlementReceipt& receipt, const Address& account,
                                  Amount custodyBalance);

    OperationResult PayReward(Transaction& tx, const Address& account, Amount reward,
                              Timestamp now);

    GlobalState state_;
    StakeLedger ledger_;
    RewardAccrual accrual_;
    RateController controller_;

    ITokenVault& vault_;
    const IAuthorizer& authorizer_;
    Address custody_;
    Address feeRecipient_;
    std::shared_ptr<INotificationSink> sink_;

    bool entered_{false};
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_ENGINE_H
