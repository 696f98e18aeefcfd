// STAKEFLOW - Staking Engine Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/engine.h"
#include "stakeflow/util/logging.h"
#include "stakeflow/util/time.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace stakeflow {
namespace staking {

using util::LogCategory::CONTROLLER;
using util::LogCategory::FEES;
using util::LogCategory::STAKING;
using util::LogCategory::VAULT;

namespace {

/// Marks a mutating call in progress for the guard's lifetime
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& flag) : flag_(flag), acquired_(!flag) {
        if (acquired_) {
            flag_ = true;
        }
    }

    ~ReentrancyGuard() {
        if (acquired_) {
            flag_ = false;
        }
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool Acquired() const { return acquired_; }

private:
    bool& flag_;
    bool acquired_;
};

} // namespace

// ============================================================================
// Transaction
// ============================================================================

/**
 * Journal for one operation.
 *
 * Holds a copy of GlobalState, the original record of every account touched
 * and each vault transfer performed. Unless committed, destruction restores
 * the state and reverses the transfers in reverse order. Notifications are
 * queued and delivered on commit.
 */
class StakingEngine::Transaction {
public:
    explicit Transaction(StakingEngine& engine)
        : engine_(engine), savedState_(engine.state_) {}

    ~Transaction() {
        if (!committed_) {
            Rollback();
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /// Journal an account before its first change and return it
    Account& Touch(const Address& address) {
        if (savedAccounts_.find(address) == savedAccounts_.end()) {
            savedAccounts_.emplace(address, engine_.ledger_.Snapshot(address));
        }
        return engine_.ledger_.GetOrCreate(address);
    }

    bool PullIn(const Address& from, Amount amount) {
        if (amount == 0) {
            return true;
        }
        if (!engine_.vault_.TransferIn(from, amount)) {
            return false;
        }
        legs_.push_back({Leg::Direction::In, from, amount});
        return true;
    }

    bool PushOut(const Address& to, Amount amount) {
        if (amount == 0) {
            return true;
        }
        if (!engine_.vault_.TransferOut(to, amount)) {
            return false;
        }
        legs_.push_back({Leg::Direction::Out, to, amount});
        return true;
    }

    void Notify(std::function<void(INotificationSink&)> notification) {
        notifications_.push_back(std::move(notification));
    }

    void Commit() {
        committed_ = true;
        if (!engine_.sink_) {
            return;
        }
        for (const auto& notification : notifications_) {
            notification(*engine_.sink_);
        }
    }

private:
    struct Leg {
        enum class Direction { In, Out };
        Direction direction;
        Address counterparty;
        Amount amount;
    };

    void Rollback() {
        for (auto it = legs_.rbegin(); it != legs_.rend(); ++it) {
            bool reversed = it->direction == Leg::Direction::In
                ? engine_.vault_.TransferOut(it->counterparty, it->amount)
                : engine_.vault_.TransferIn(it->counterparty, it->amount);
            if (!reversed) {
                LOG_ERROR(VAULT) << "Failed to reverse transfer of "
                                 << FormatAmount(it->amount)
                                 << (it->direction == Leg::Direction::In ? " from " : " to ")
                                 << it->counterparty.ToShortString();
            }
        }

        engine_.state_ = savedState_;
        for (const auto& [address, snapshot] : savedAccounts_) {
            engine_.ledger_.Restore(address, snapshot);
        }

        if (!legs_.empty()) {
            LOG_DEBUG(VAULT) << "Rolled back " << legs_.size() << " transfer(s)";
        }
    }

    StakingEngine& engine_;
    GlobalState savedState_;
    std::map<Address, std::optional<Account>> savedAccounts_;
    std::vector<Leg> legs_;
    std::vector<std::function<void(INotificationSink&)>> notifications_;
    bool committed_{false};
};

// ============================================================================
// StakeSnapshot
// ============================================================================

std::string StakeSnapshot::ToString() const {
    std::ostringstream ss;
    ss << "Stake(" << account.ToShortString()
       << ", balance=" << FormatAmount(balance)
       << ", earned=" << FormatAmount(earned)
       << ", held=" << util::FormatDuration(util::Seconds(stakeDuration))
       << ", exitFee=" << FeeSchedule::FormatBps(feeBps)
       << ")";
    return ss.str();
}

// ============================================================================
// Construction
// ============================================================================

StakingEngine::StakingEngine(const StakingPolicy& policy, ITokenVault& vault,
                             const IAuthorizer& authorizer)
    : ledger_(state_), accrual_(state_), controller_(state_),
      vault_(vault), authorizer_(authorizer),
      custody_(policy.custody), feeRecipient_(policy.feeRecipient) {
    if (auto error = policy.Validate()) {
        throw std::invalid_argument("Invalid staking policy: " + *error);
    }

    Timestamp now = util::GetTime();
    state_.rewardRate = policy.rewardRate;
    state_.minRewardRate = policy.minRewardRate;
    state_.rateAdjustmentPeriod = policy.rateAdjustmentPeriod;
    state_.maxAPR = policy.maxAPR;
    state_.targetSustainabilityDays = policy.targetSustainabilityDays;
    state_.minimumStake = policy.minimumStake;
    state_.lastUpdateTime = now;
    state_.lastRateAdjustmentTime = now;

    LOG_INFO(STAKING) << "Staking engine started: " << policy.ToString();
}

StakingEngine::~StakingEngine() = default;

void StakingEngine::SetNotificationSink(std::shared_ptr<INotificationSink> sink) {
    sink_ = std::move(sink);
}

// ============================================================================
// Operation Plumbing
// ============================================================================

Timestamp StakingEngine::Now() const {
    return std::max(util::GetTime(), state_.lastUpdateTime);
}

OperationResult StakingEngine::Execute(const char* name, const Body& body) {
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        LOG_WARN(STAKING) << name << " rejected: another operation is in progress";
        return OperationResult::Failure(StakingError::ReentrantCall,
                                        std::string(name) + " called reentrantly");
    }

    Timestamp now = Now();
    OperationResult result;
    {
        Transaction tx(*this);
        try {
            result = body(tx, now);
        } catch (const std::overflow_error& e) {
            result = OperationResult::Failure(StakingError::ArithmeticOverflow, e.what());
        } catch (const std::range_error& e) {
            result = OperationResult::Failure(StakingError::ArithmeticOverflow, e.what());
        }

        if (result.IsSuccess()) {
            tx.Commit();
        }
    }

    if (result.IsSuccess()) {
        LOG_DEBUG(STAKING) << name << " " << result.ToString();
    } else if (result.error == StakingError::ArithmeticOverflow ||
               result.error == StakingError::TransferFailed) {
        LOG_ERROR(STAKING) << name << " rolled back: " << result.ToString();
    } else {
        LOG_WARN(STAKING) << name << " rejected: " << result.ToString();
    }
    return result;
}

std::optional<OperationResult> StakingEngine::CheckAdmin(const Address& caller) const {
    if (authorizer_.IsAuthorized(caller)) {
        return std::nullopt;
    }
    return OperationResult::Failure(StakingError::Unauthorized,
                                    caller.ToShortString() + " is not an administrator");
}

Amount StakingEngine::ProjectedCustody(Amount inflow, Amount outflow) const {
    Amount balance = CheckedAdd(vault_.BalanceOf(custody_), inflow);
    return balance > outflow ? balance - outflow : 0;
}

bool StakingEngine::MaybeAdjust(Transaction& tx, Timestamp now, Amount custodyBalance) {
    if (!controller_.IsAdjustmentDue(now)) {
        return false;
    }

    SettlementReceipt receipt = accrual_.Settle(now);
    RateProposal proposal = controller_.CheckAdjustment(now, custodyBalance);
    if (!controller_.Apply(receipt, proposal)) {
        LOG_DEBUG(CONTROLLER) << "Rate held: " << proposal.ToString();
        return false;
    }

    LOG_INFO(CONTROLLER) << "Reward rate " << proposal.currentRate << " -> "
                         << proposal.proposedRate << " ("
                         << AdjustmentReasonToString(proposal.reason) << ", "
                         << proposal.sustainabilityDays << " days sustainable)";

    RateAdjustedEvent event;
    event.oldRate = proposal.currentRate;
    event.newRate = proposal.proposedRate;
    event.reason = proposal.reason;
    event.availableRewards = proposal.availableRewards;
    event.sustainabilityDays = proposal.sustainabilityDays;
    event.time = now;
    tx.Notify([event](INotificationSink& sink) { sink.OnRateAdjusted(event); });
    return true;
}

// ============================================================================
// Staker Operations
// ============================================================================

OperationResult StakingEngine::Stake(const Address& account, Amount amount) {
    return Execute("stake", [&](Transaction& tx, Timestamp now) -> OperationResult {
        if (amount < state_.minimumStake) {
            return OperationResult::Failure(
                StakingError::BelowMinimumStake,
                FormatAmount(amount) + " is below the minimum stake of " +
                    FormatAmount(state_.minimumStake));
        }

        SettlementReceipt receipt = accrual_.Settle(account, tx.Touch(account), now);

        Amount fee = FeeSchedule::ComputeFee(amount, FeeSchedule::EntryFeeBps());
        Amount net = amount - fee;
        FeeSplit split = FeeSchedule::Split(fee);

        ledger_.Deposit(receipt, account, net);
        state_.totalFeesCollected = CheckedAdd(state_.totalFeesCollected, fee);

        MaybeAdjust(tx, now, ProjectedCustody(amount, split.recipientShare));

        if (!tx.PullIn(account, amount)) {
            return OperationResult::Failure(StakingError::TransferFailed,
                                            "transfer in from " + account.ToShortString() +
                                                " failed");
        }
        if (!tx.PushOut(feeRecipient_, split.recipientShare)) {
            return OperationResult::Failure(StakingError::TransferFailed,
                                            "fee transfer to recipient failed");
        }

        const Account& updated = *ledger_.Find(account);
        StakeEvent stakeEvent{account, amount, fee, net, updated.balance,
                              updated.weightedStakeTime, now};
        tx.Notify([stakeEvent](INotificationSink& sink) { sink.OnStake(stakeEvent); });
        if (fee > 0) {
            FeeDistributedEvent feeEvent{FeeKind::Entry, feeRecipient_, fee,
                                         split.poolShare, split.recipientShare, now};
            tx.Notify([feeEvent](INotificationSink& sink) { sink.OnFeeDistributed(feeEvent); });
        }

        LOG_DEBUG(FEES) << "Entry fee " << FormatAmount(fee) << " (pool "
                        << FormatAmount(split.RetainedInPool()) << ")";
        return OperationResult::Success(net, fee);
    });
}

OperationResult StakingEngine::Withdraw(const Address& account, Amount amount) {
    return Execute("withdraw", [&](Transaction& tx, Timestamp now) -> OperationResult {
        if (amount == 0) {
            return OperationResult::Failure(StakingError::ZeroAmount, "withdraw amount is zero");
        }
        const Account* existing = ledger_.Find(account);
        Amount balance = existing ? existing->balance : 0;
        if (amount > balance) {
            return OperationResult::Failure(
                StakingError::InsufficientBalance,
                "withdraw " + FormatAmount(amount) + " exceeds balance " +
                    FormatAmount(balance));
        }

        SettlementReceipt receipt = accrual_.Settle(account, tx.Touch(account), now);
        WithdrawalPlan plan = DebitStake(receipt, account, amount, now);
        MaybeAdjust(tx, now, ProjectedCustody(0, plan.Outflow()));
        return PayWithdrawal(tx, account, plan, now);
    });
}

OperationResult StakingEngine::Claim(const Address& account) {
    return Execute("claim", [&](Transaction& tx, Timestamp now) -> OperationResult {
        if (!ledger_.Find(account)) {
            return OperationResult::Success();
        }

        SettlementReceipt receipt = accrual_.Settle(account, tx.Touch(account), now);
        OperationResult collected = CollectReward(receipt, account, vault_.BalanceOf(custody_));
        if (!collected.IsSuccess()) {
            return collected;
        }

        MaybeAdjust(tx, now, ProjectedCustody(0, collected.amount));
        return PayReward(tx, account, collected.amount, now);
    });
}

OperationResult StakingEngine::Exit(const Address& account) {
    return Execute("exit", [&](Transaction& tx, Timestamp now) -> OperationResult {
        if (!ledger_.Find(account)) {
            return OperationResult::Success();
        }

        Account& record = tx.Touch(account);
        SettlementReceipt receipt = accrual_.Settle(account, record, now);

        OperationResult collected = CollectReward(receipt, account, vault_.BalanceOf(custody_));
        if (!collected.IsSuccess()) {
            return collected;
        }

        std::optional<WithdrawalPlan> plan;
        if (record.balance > 0) {
            plan = DebitStake(receipt, account, record.balance, now);
        }

        Amount outflow = CheckedAdd(collected.amount, plan ? plan->Outflow() : 0);
        MaybeAdjust(tx, now, ProjectedCustody(0, outflow));

        if (plan) {
            OperationResult paid = PayWithdrawal(tx, account, *plan, now);
            if (!paid.IsSuccess()) {
                return paid;
            }
        }
        OperationResult claimed = PayReward(tx, account, collected.amount, now);
        if (!claimed.IsSuccess()) {
            return claimed;
        }
        return OperationResult::Success(CheckedAdd(plan ? plan->net : 0, collected.amount),
                                        plan ? plan->fee : 0);
    });
}

StakingEngine::WithdrawalPlan StakingEngine::DebitStake(const SettlementReceipt& receipt,
                                                        const Address& account,
                                                        Amount amount, Timestamp now) {
    WithdrawalPlan plan;
    plan.amount = amount;
    plan.duration = now - ledger_.Find(account)->weightedStakeTime;
    plan.feeBps = FeeSchedule::TierFor(plan.duration);
    plan.fee = FeeSchedule::ComputeFee(amount, plan.feeBps);
    plan.net = amount - plan.fee;
    plan.split = FeeSchedule::Split(plan.fee);

    ledger_.Debit(receipt, account, amount);
    state_.totalFeesCollected = CheckedAdd(state_.totalFeesCollected, plan.fee);
    return plan;
}

OperationResult StakingEngine::PayWithdrawal(Transaction& tx, const Address& account,
                                             const WithdrawalPlan& plan, Timestamp now) {
    if (!tx.PushOut(account, plan.net)) {
        return OperationResult::Failure(StakingError::TransferFailed,
                                        "transfer out to " + account.ToShortString() +
                                            " failed");
    }
    if (!tx.PushOut(feeRecipient_, plan.split.recipientShare)) {
        return OperationResult::Failure(StakingError::TransferFailed,
                                        "fee transfer to recipient failed");
    }

    DurationFeeEvent tierEvent{account, plan.duration, plan.feeBps, plan.amount, plan.fee, now};
    tx.Notify([tierEvent](INotificationSink& sink) { sink.OnDurationFeeApplied(tierEvent); });
    WithdrawEvent withdrawEvent{account, plan.amount, plan.fee, plan.net,
                                ledger_.Find(account)->balance, now};
    tx.Notify([withdrawEvent](INotificationSink& sink) { sink.OnWithdraw(withdrawEvent); });
    if (plan.fee > 0) {
        FeeDistributedEvent feeEvent{FeeKind::Exit, feeRecipient_, plan.fee,
                                     plan.split.poolShare, plan.split.recipientShare, now};
        tx.Notify([feeEvent](INotificationSink& sink) { sink.OnFeeDistributed(feeEvent); });
    }

    LOG_DEBUG(FEES) << "Exit fee " << FeeSchedule::FormatBps(plan.feeBps) << " after "
                    << util::FormatDuration(util::Seconds(plan.duration)) << ": "
                    << FormatAmount(plan.fee);
    return OperationResult::Success(plan.net, plan.fee);
}

OperationResult StakingEngine::CollectReward(const SettlementReceipt& receipt,
                                             const Address& account, Amount custodyBalance) {
    Amount pending = ledger_.Find(account)->pendingReward;
    Amount available = RateController::AvailableRewards(custodyBalance, state_.totalStaked);
    if (pending > available) {
        return OperationResult::Failure(
            StakingError::TransferFailed,
            "reward " + FormatAmount(pending) + " exceeds available rewards " +
                FormatAmount(available));
    }

    Amount reward = ledger_.TakeReward(receipt, account);
    state_.totalRewardsDistributed = CheckedAdd(state_.totalRewardsDistributed, reward);
    return OperationResult::Success(reward);
}

OperationResult StakingEngine::PayReward(Transaction& tx, const Address& account,
                                         Amount reward, Timestamp now) {
    if (reward == 0) {
        return OperationResult::Success();
    }
    if (!tx.PushOut(account, reward)) {
        return OperationResult::Failure(StakingError::TransferFailed,
                                        "reward transfer to " + account.ToShortString() +
                                            " failed");
    }

    RewardClaimedEvent event{account, reward, now};
    tx.Notify([event](INotificationSink& sink) { sink.OnRewardClaimed(event); });
    return OperationResult::Success(reward);
}

OperationResult StakingEngine::AddRewards(const Address& funder, Amount amount) {
    return Execute("addRewards", [&](Transaction& tx, Timestamp now) -> OperationResult {
        if (amount == 0) {
            return OperationResult::Failure(StakingError::ZeroAmount, "reward amount is zero");
        }

        accrual_.Settle(now);
        state_.totalRewardsFunded = CheckedAdd(state_.totalRewardsFunded, amount);
        MaybeAdjust(tx, now, ProjectedCustody(amount, 0));

        if (!tx.PullIn(funder, amount)) {
            return OperationResult::Failure(StakingError::TransferFailed,
                                            "transfer in from " + funder.ToShortString() +
                                                " failed");
        }

        RewardsFundedEvent event{funder, amount, AvailableRewards(), now};
        tx.Notify([event](INotificationSink& sink) { sink.OnRewardsFunded(event); });
        return OperationResult::Success(amount);
    });
}

OperationResult StakingEngine::UpdateRewardRate() {
    return Execute("updateRewardRate", [&](Transaction& tx, Timestamp now) -> OperationResult {
        accrual_.Settle(now);
        MaybeAdjust(tx, now, vault_.BalanceOf(custody_));
        return OperationResult::Success(state_.rewardRate);
    });
}

// ============================================================================
// Administration
// ============================================================================

OperationResult StakingEngine::SetRewardRate(const Address& caller, Amount rate) {
    return Execute("setRewardRate", [&](Transaction& tx, Timestamp now) -> OperationResult {
        if (auto denied = CheckAdmin(caller)) {
            return *denied;
        }
        if (!IsValidRewardRate(rate, state_.minRewardRate)) {
            return OperationResult::Failure(
                StakingError::InvalidConfiguration,
                "reward rate must be between " + std::to_string(state_.minRewardRate) +
                    " and " + std::to_string(MAX_REWARD_RATE));
        }

        SettlementReceipt receipt = accrual_.Settle(now);
        MaybeAdjust(tx, now, vault_.BalanceOf(custody_));

        Amount oldRate = state_.rewardRate;
        controller_.SetManualRate(receipt, rate);
        LOG_INFO(CONTROLLER) << "Reward rate set to " << rate << " by "
                             << caller.ToShortString();

        RateAdjustedEvent event;
        event.oldRate = oldRate;
        event.newRate = rate;
        event.reason = AdjustmentReason::Manual;
        event.availableRewards = AvailableRewards();
        event.sustainabilityDays = RateController::SustainabilityDays(event.availableRewards, rate);
        event.time = now;
        tx.Notify([event](INotificationSink& sink) { sink.OnRateAdjusted(event); });
        return OperationResult::Success(rate);
    });
}

OperationResult StakingEngine::SetMinRewardRate(const Address& caller, Amount rate) {
    return Execute("setMinRewardRate", [&](Transaction& tx, Timestamp now) -> OperationResult {
        if (auto denied = CheckAdmin(caller)) {
            return *denied;
        }
        if (!IsValidMinRewardRate(rate)) {
            return OperationResult::Failure(StakingError::InvalidConfiguration,
                                            "minimum reward rate must be positive and at most " +
                                                std::to_string(MAX_REWARD_RATE));
        }

        SettlementReceipt receipt = accrual_.Settle(now);
        Amount oldRate = state_.rewardRate;
        state_.minRewardRate = rate;
        if (controller_.EnforceFloor(receipt)) {
            RateAdjustedEvent event;
            event.oldRate = oldRate;
            event.newRate = state_.rewardRate;
            event.reason = AdjustmentReason::FloorForced;
            event.availableRewards = AvailableRewards();
            event.sustainabilityDays =
                RateController::SustainabilityDays(event.availableRewards, state_.rewardRate);
            event.time = now;
            tx.Notify([event](INotificationSink& sink) { sink.OnRateAdjusted(event); });
        }
        LOG_INFO(CONTROLLER) << "Minimum reward rate set to " << rate;
        return OperationResult::Success(rate);
    });
}

OperationResult StakingEngine::SetRateAdjustmentPeriod(const Address& caller, int64_t seconds) {
    return Execute("setRateAdjustmentPeriod", [&](Transaction&, Timestamp now) -> OperationResult {
        if (auto denied = CheckAdmin(caller)) {
            return *denied;
        }
        if (!IsValidAdjustmentPeriod(seconds)) {
            return OperationResult::Failure(StakingError::InvalidConfiguration,
                                            "adjustment period must be between 1 hour and 30 days");
        }

        accrual_.Settle(now);
        state_.rateAdjustmentPeriod = seconds;
        LOG_INFO(CONTROLLER) << "Adjustment period set to "
                             << util::FormatDuration(util::Seconds(seconds));
        return OperationResult::Success(static_cast<Amount>(seconds));
    });
}

OperationResult StakingEngine::SetMaxAPR(const Address& caller, uint64_t bps) {
    return Execute("setMaxAPR", [&](Transaction&, Timestamp now) -> OperationResult {
        if (auto denied = CheckAdmin(caller)) {
            return *denied;
        }
        if (!IsValidMaxAPR(bps)) {
            return OperationResult::Failure(StakingError::InvalidConfiguration,
                                            "max APR must be between 1 and " +
                                                std::to_string(MAX_MAX_APR) + " bp");
        }

        accrual_.Settle(now);
        state_.maxAPR = bps;
        LOG_INFO(CONTROLLER) << "Max APR set to " << bps << " bp";
        return OperationResult::Success(bps);
    });
}

OperationResult StakingEngine::SetMinimumStake(const Address& caller, Amount amount) {
    return Execute("setMinimumStake", [&](Transaction&, Timestamp now) -> OperationResult {
        if (auto denied = CheckAdmin(caller)) {
            return *denied;
        }
        if (!IsValidMinimumStake(amount)) {
            return OperationResult::Failure(StakingError::InvalidConfiguration,
                                            "minimum stake must be positive");
        }

        accrual_.Settle(now);
        state_.minimumStake = amount;
        LOG_INFO(STAKING) << "Minimum stake set to " << FormatAmount(amount);
        return OperationResult::Success(amount);
    });
}

OperationResult StakingEngine::SetTargetSustainabilityDays(const Address& caller, uint64_t days) {
    return Execute("setTargetSustainabilityDays",
                   [&](Transaction& tx, Timestamp now) -> OperationResult {
        if (auto denied = CheckAdmin(caller)) {
            return *denied;
        }
        if (!IsValidTargetDays(days)) {
            return OperationResult::Failure(StakingError::InvalidConfiguration,
                                            "target must be between 1 and " +
                                                std::to_string(MAX_TARGET_DAYS) + " days");
        }

        accrual_.Settle(now);
        TargetUpdatedEvent event{state_.targetSustainabilityDays, days, now};
        state_.targetSustainabilityDays = days;
        tx.Notify([event](INotificationSink& sink) { sink.OnTargetUpdated(event); });
        LOG_INFO(CONTROLLER) << "Sustainability target " << event.oldTarget << "d -> "
                             << days << "d";
        return OperationResult::Success(days);
    });
}

// ============================================================================
// Queries
// ============================================================================

FixedPoint StakingEngine::RewardPerUnit() const {
    return accrual_.RewardPerUnit(Now());
}

Amount StakingEngine::Earned(const Address& account) const {
    const Account* record = ledger_.Find(account);
    return record ? accrual_.Earned(*record, Now()) : 0;
}

uint64_t StakingEngine::EstimateAPR() const {
    return controller_.EstimateAPR();
}

Amount StakingEngine::AvailableRewards() const {
    return RateController::AvailableRewards(vault_.BalanceOf(custody_), state_.totalStaked);
}

uint64_t StakingEngine::SustainabilityDays() const {
    return RateController::SustainabilityDays(AvailableRewards(), state_.rewardRate);
}

StakeSnapshot StakingEngine::GetStakeInfo(const Address& account) const {
    Timestamp now = Now();
    StakeSnapshot info;
    info.account = account;
    info.feeBps = FeeSchedule::TierFor(0);

    const Account* record = ledger_.Find(account);
    if (!record) {
        return info;
    }

    info.balance = record->balance;
    info.earned = accrual_.Earned(*record, now);
    info.pendingReward = record->pendingReward;
    info.weightedStakeTime = record->weightedStakeTime;
    info.firstStakeTime = record->firstStakeTime;
    info.totalClaimed = record->totalClaimed;
    if (record->balance > 0) {
        info.stakeDuration = now - record->weightedStakeTime;
        info.feeBps = FeeSchedule::TierFor(info.stakeDuration);
    }
    return info;
}

std::optional<WithdrawalQuote> StakingEngine::QuoteWithdrawal(const Address& account,
                                                              Amount amount) const {
    const Account* record = ledger_.Find(account);
    if (!record || amount == 0 || amount > record->balance) {
        return std::nullopt;
    }

    WithdrawalQuote quote;
    quote.amount = amount;
    quote.stakeDuration = Now() - record->weightedStakeTime;
    quote.feeBps = FeeSchedule::TierFor(quote.stakeDuration);
    quote.fee = FeeSchedule::ComputeFee(amount, quote.feeBps);
    quote.netAmount = amount - quote.fee;
    quote.split = FeeSchedule::Split(quote.fee);
    return quote;
}

RateProposal StakingEngine::PreviewAdjustment() const {
    return controller_.CheckAdjustment(Now(), vault_.BalanceOf(custody_));
}

std::optional<Account> StakingEngine::GetAccount(const Address& account) const {
    return ledger_.Snapshot(account);
}

bool StakingEngine::CheckConservation() const {
    return ledger_.SumBalances() == state_.totalStaked;
}

} // namespace staking
} // namespace stakeflow
