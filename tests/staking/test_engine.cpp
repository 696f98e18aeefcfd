// STAKEFLOW - Staking Engine Tests
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include <gtest/gtest.h>
#include <stakeflow/staking/engine.h>
#include <stakeflow/util/time.h>

#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

using namespace stakeflow;
using namespace stakeflow::staking;

namespace {

const Address ADMIN = Address::FromId(0xAD);
const Address ALICE = Address::FromId(0xA1);
const Address BOB = Address::FromId(0xB0);
const Address FUNDER = Address::FromId(0xF0);

/// In-memory vault with injectable failures and hooks run before each transfer
class TestVault : public InMemoryTokenVault {
public:
    using InMemoryTokenVault::InMemoryTokenVault;

    bool TransferIn(const Address& from, Amount amount) override {
        if (onTransferIn) {
            auto hook = std::move(onTransferIn);
            onTransferIn = nullptr;
            hook();
        }
        return InMemoryTokenVault::TransferIn(from, amount);
    }

    bool TransferOut(const Address& to, Amount amount) override {
        if (onTransferOut) {
            auto hook = std::move(onTransferOut);
            onTransferOut = nullptr;
            hook();
        }
        if (failOutTo.count(to) > 0) {
            return false;
        }
        return InMemoryTokenVault::TransferOut(to, amount);
    }

    std::set<Address> failOutTo;
    std::function<void()> onTransferIn;
    std::function<void()> onTransferOut;
};

class RecordingSink : public INotificationSink {
public:
    void OnStake(const StakeEvent& e) override { stakes.push_back(e); }
    void OnWithdraw(const WithdrawEvent& e) override { withdrawals.push_back(e); }
    void OnRewardClaimed(const RewardClaimedEvent& e) override { claims.push_back(e); }
    void OnFeeDistributed(const FeeDistributedEvent& e) override { fees.push_back(e); }
    void OnDurationFeeApplied(const DurationFeeEvent& e) override { tiers.push_back(e); }
    void OnRateAdjusted(const RateAdjustedEvent& e) override { rates.push_back(e); }
    void OnTargetUpdated(const TargetUpdatedEvent& e) override { targets.push_back(e); }
    void OnRewardsFunded(const RewardsFundedEvent& e) override { fundings.push_back(e); }

    size_t Total() const {
        return stakes.size() + withdrawals.size() + claims.size() + fees.size() +
               tiers.size() + rates.size() + targets.size() + fundings.size();
    }

    std::vector<StakeEvent> stakes;
    std::vector<WithdrawEvent> withdrawals;
    std::vector<RewardClaimedEvent> claims;
    std::vector<FeeDistributedEvent> fees;
    std::vector<DurationFeeEvent> tiers;
    std::vector<RateAdjustedEvent> rates;
    std::vector<TargetUpdatedEvent> targets;
    std::vector<RewardsFundedEvent> fundings;
};

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class EngineTest : public ::testing::Test {
protected:
    static constexpr Timestamp START = 1704067200;

    void SetUp() override {
        policy_.rewardRate = 100;
        policy_.minRewardRate = 10;
        policy_.rateAdjustmentPeriod = SECONDS_PER_DAY;
        policy_.maxAPR = 5000;
        policy_.targetSustainabilityDays = 180;
        policy_.minimumStake = 1;

        engine_ = std::make_unique<StakingEngine>(policy_, vault_, authorizer_);
        sink_ = std::make_shared<RecordingSink>();
        engine_->SetNotificationSink(sink_);
    }

    void Advance(int64_t seconds) { clock_.Advance(util::Seconds(seconds)); }

    const Address& Custody() const { return policy_.custody; }
    const Address& Recipient() const { return policy_.feeRecipient; }

    util::ScopedMockTime clock_{START};
    StakingPolicy policy_;
    TestVault vault_{policy_.custody};
    AllowListAuthorizer authorizer_{std::vector<Address>{ADMIN}};
    std::unique_ptr<StakingEngine> engine_;
    std::shared_ptr<RecordingSink> sink_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(EngineTest, StartsFromPolicy) {
    const GlobalState& state = engine_->GetState();
    EXPECT_EQ(state.rewardRate, 100u);
    EXPECT_EQ(state.minRewardRate, 10u);
    EXPECT_EQ(state.totalStaked, 0u);
    EXPECT_EQ(state.lastUpdateTime, START);
    EXPECT_EQ(state.lastRateAdjustmentTime, START);
    EXPECT_EQ(engine_->Custody(), policy_.custody);
    EXPECT_EQ(engine_->FeeRecipient(), policy_.feeRecipient);
}

TEST_F(EngineTest, RejectsInvalidPolicy) {
    StakingPolicy bad = policy_;
    bad.maxAPR = 0;
    EXPECT_THROW(StakingEngine(bad, vault_, authorizer_), std::invalid_argument);
}

// ============================================================================
// Stake and Withdraw
// ============================================================================

TEST_F(EngineTest, StakeChargesEntryFee) {
    vault_.Mint(ALICE, 1000);

    auto result = engine_->Stake(ALICE, 1000);
    ASSERT_TRUE(result.IsSuccess()) << result.ToString();
    EXPECT_EQ(result.amount, 990u);
    EXPECT_EQ(result.fee, 10u);

    EXPECT_EQ(engine_->GetState().totalStaked, 990u);
    EXPECT_EQ(engine_->GetState().totalFeesCollected, 10u);
    EXPECT_EQ(vault_.BalanceOf(ALICE), 0u);
    EXPECT_EQ(vault_.BalanceOf(Recipient()), 3u);
    EXPECT_EQ(vault_.BalanceOf(Custody()), 997u);

    auto account = engine_->GetAccount(ALICE);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->balance, 990u);
    EXPECT_EQ(account->weightedStakeTime, START);
    EXPECT_EQ(account->firstStakeTime, START);

    ASSERT_EQ(sink_->stakes.size(), 1u);
    EXPECT_EQ(sink_->stakes[0].netAmount, 990u);
    EXPECT_EQ(sink_->stakes[0].newBalance, 990u);
    ASSERT_EQ(sink_->fees.size(), 1u);
    EXPECT_EQ(sink_->fees[0].kind, FeeKind::Entry);
    EXPECT_EQ(sink_->fees[0].poolShare, 7u);
    EXPECT_EQ(sink_->fees[0].recipientShare, 3u);
}

TEST_F(EngineTest, WithdrawAfterTenDaysPaysTierFee) {
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(10 * SECONDS_PER_DAY);
    auto result = engine_->Withdraw(ALICE, 990);
    ASSERT_TRUE(result.IsSuccess()) << result.ToString();
    EXPECT_EQ(result.fee, 34u);
    EXPECT_EQ(result.amount, 956u);

    EXPECT_EQ(engine_->GetState().totalStaked, 0u);
    EXPECT_EQ(engine_->GetState().totalFeesCollected, 44u);
    EXPECT_EQ(vault_.BalanceOf(ALICE), 956u);
    EXPECT_EQ(vault_.BalanceOf(Recipient()), 13u);
    EXPECT_EQ(vault_.BalanceOf(Custody()), 31u);

    ASSERT_EQ(sink_->tiers.size(), 1u);
    EXPECT_EQ(sink_->tiers[0].feeBps, 350u);
    EXPECT_EQ(sink_->tiers[0].stakeDuration, 10 * SECONDS_PER_DAY);
    ASSERT_EQ(sink_->withdrawals.size(), 1u);
    EXPECT_EQ(sink_->withdrawals[0].remainingBalance, 0u);
    ASSERT_EQ(sink_->fees.size(), 2u);
    EXPECT_EQ(sink_->fees[1].kind, FeeKind::Exit);
    EXPECT_EQ(sink_->fees[1].poolShare, 23u);
    EXPECT_EQ(sink_->fees[1].recipientShare, 10u);
    EXPECT_TRUE(engine_->CheckConservation());
}

TEST_F(EngineTest, PartialWithdrawKeepsStakeTime) {
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(30 * SECONDS_PER_DAY);
    auto result = engine_->Withdraw(ALICE, 500);
    ASSERT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.fee, 5u);

    auto account = engine_->GetAccount(ALICE);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->balance, 490u);
    EXPECT_EQ(account->weightedStakeTime, START);
    EXPECT_EQ(engine_->GetStakeInfo(ALICE).feeBps, 100u);
}

TEST_F(EngineTest, TopUpBlendsStakeTime) {
    vault_.Mint(ALICE, 2000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(10 * SECONDS_PER_DAY);
    auto before = engine_->QuoteWithdrawal(ALICE, 990);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->feeBps, 350u);

    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());
    auto info = engine_->GetStakeInfo(ALICE);
    EXPECT_EQ(info.balance, 1980u);
    EXPECT_EQ(info.weightedStakeTime, START + 5 * SECONDS_PER_DAY);
    EXPECT_EQ(info.stakeDuration, 5 * SECONDS_PER_DAY);
    EXPECT_EQ(info.firstStakeTime, START);
    EXPECT_EQ(info.feeBps, 500u);
}

TEST_F(EngineTest, StakeValidation) {
    vault_.Mint(ALICE, 1000);

    EXPECT_EQ(engine_->Stake(ALICE, 0).error, StakingError::BelowMinimumStake);

    ASSERT_TRUE(engine_->SetMinimumStake(ADMIN, 500).IsSuccess());
    EXPECT_EQ(engine_->Stake(ALICE, 499).error, StakingError::BelowMinimumStake);
    EXPECT_TRUE(engine_->Stake(ALICE, 500).IsSuccess());

    EXPECT_EQ(engine_->Stake(BOB, 500).error, StakingError::TransferFailed);
    EXPECT_FALSE(engine_->GetAccount(BOB).has_value());
    EXPECT_EQ(engine_->GetState().totalStaked, 495u);
}

TEST_F(EngineTest, WithdrawValidation) {
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    EXPECT_EQ(engine_->Withdraw(ALICE, 0).error, StakingError::ZeroAmount);
    EXPECT_EQ(engine_->Withdraw(ALICE, 991).error, StakingError::InsufficientBalance);
    EXPECT_EQ(engine_->Withdraw(BOB, 1).error, StakingError::InsufficientBalance);
    EXPECT_EQ(engine_->GetAccount(ALICE)->balance, 990u);
    EXPECT_EQ(sink_->withdrawals.size(), 0u);
}

TEST_F(EngineTest, QuoteWithdrawal) {
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    EXPECT_FALSE(engine_->QuoteWithdrawal(ALICE, 0).has_value());
    EXPECT_FALSE(engine_->QuoteWithdrawal(ALICE, 991).has_value());
    EXPECT_FALSE(engine_->QuoteWithdrawal(BOB, 1).has_value());

    Advance(10 * SECONDS_PER_DAY);
    auto quote = engine_->QuoteWithdrawal(ALICE, 990);
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(quote->fee, 34u);
    EXPECT_EQ(quote->netAmount, 956u);
    EXPECT_EQ(quote->split.poolShare, 23u);
    EXPECT_EQ(quote->split.recipientShare, 10u);

    auto result = engine_->Withdraw(ALICE, 990);
    EXPECT_EQ(result.amount, quote->netAmount);
}

TEST_F(EngineTest, StakeInfoForUnknownAccount) {
    auto info = engine_->GetStakeInfo(BOB);
    EXPECT_EQ(info.balance, 0u);
    EXPECT_EQ(info.earned, 0u);
    EXPECT_EQ(info.stakeDuration, 0);
    EXPECT_EQ(info.feeBps, 500u);
}

// ============================================================================
// Rewards
// ============================================================================

TEST_F(EngineTest, EqualStakesEarnEqually) {
    vault_.Mint(ALICE, 1000);
    vault_.Mint(BOB, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());
    ASSERT_TRUE(engine_->Stake(BOB, 1000).IsSuccess());

    Advance(SECONDS_PER_DAY);
    Amount alice = engine_->Earned(ALICE);
    Amount bob = engine_->Earned(BOB);
    EXPECT_EQ(alice, bob);
    EXPECT_NEAR(static_cast<double>(alice), 4320000.0, 1.0);
    EXPECT_LE(alice + bob, static_cast<Amount>(100 * SECONDS_PER_DAY));
}

TEST_F(EngineTest, LaterStakerEarnsNothingRetroactively) {
    vault_.Mint(ALICE, 1000);
    vault_.Mint(BOB, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(1000);
    ASSERT_TRUE(engine_->Stake(BOB, 1000).IsSuccess());
    EXPECT_EQ(engine_->Earned(BOB), 0u);
    EXPECT_NEAR(static_cast<double>(engine_->Earned(ALICE)), 100000.0, 1.0);

    Advance(1000);
    EXPECT_NEAR(static_cast<double>(engine_->Earned(BOB)), 50000.0, 1.0);
    EXPECT_NEAR(static_cast<double>(engine_->Earned(ALICE)), 150000.0, 2.0);
}

TEST_F(EngineTest, RateChangeSettlesFirst) {
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(1000);
    ASSERT_TRUE(engine_->SetRewardRate(ADMIN, 200).IsSuccess());
    Advance(1000);
    EXPECT_NEAR(static_cast<double>(engine_->Earned(ALICE)), 300000.0, 2.0);
}

TEST_F(EngineTest, ClaimPaysFromPool) {
    vault_.Mint(FUNDER, 100 * COIN);
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->AddRewards(FUNDER, 100 * COIN).IsSuccess());
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(SECONDS_PER_DAY);
    Amount earned = engine_->Earned(ALICE);
    ASSERT_GT(earned, 0u);

    auto result = engine_->Claim(ALICE);
    ASSERT_TRUE(result.IsSuccess()) << result.ToString();
    EXPECT_EQ(result.amount, earned);
    EXPECT_EQ(vault_.BalanceOf(ALICE), earned);
    EXPECT_EQ(engine_->Earned(ALICE), 0u);
    EXPECT_EQ(engine_->GetAccount(ALICE)->totalClaimed, earned);
    EXPECT_EQ(engine_->GetState().totalRewardsDistributed, earned);
    ASSERT_EQ(sink_->claims.size(), 1u);
    EXPECT_EQ(sink_->claims[0].reward, earned);
}

TEST_F(EngineTest, ClaimWithNothingEarnedIsNoop) {
    auto result = engine_->Claim(ALICE);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.amount, 0u);
    EXPECT_EQ(sink_->claims.size(), 0u);
}

TEST_F(EngineTest, NonStakerCallsCreateNoAccount) {
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());
    size_t accounts = engine_->GetLedger().AccountCount();

    for (uint8_t id = 1; id <= 3; ++id) {
        EXPECT_TRUE(engine_->Claim(Address::FromId(id)).IsSuccess());
        EXPECT_TRUE(engine_->Exit(Address::FromId(id)).IsSuccess());
    }

    EXPECT_EQ(engine_->GetLedger().AccountCount(), accounts);
    EXPECT_FALSE(engine_->GetAccount(Address::FromId(1)).has_value());
}

TEST_F(EngineTest, ClaimNeverPaysOutPrincipal) {
    vault_.Mint(BOB, 100000);
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->Stake(BOB, 100000).IsSuccess());
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(6 * SECONDS_PER_HOUR);
    ASSERT_GT(engine_->Earned(ALICE), engine_->AvailableRewards());

    auto result = engine_->Claim(ALICE);
    EXPECT_EQ(result.error, StakingError::TransferFailed);
    EXPECT_EQ(vault_.BalanceOf(ALICE), 0u);
    EXPECT_GE(vault_.BalanceOf(Custody()), engine_->GetState().totalStaked);

    EXPECT_EQ(engine_->Exit(ALICE).error, StakingError::TransferFailed);
    EXPECT_EQ(engine_->GetAccount(ALICE)->balance, 990u);

    ASSERT_TRUE(engine_->Withdraw(BOB, 99000).IsSuccess());
    EXPECT_GE(vault_.BalanceOf(Custody()), engine_->GetState().totalStaked);
}

TEST_F(EngineTest, ExitWithdrawsAndClaims) {
    vault_.Mint(FUNDER, 10 * COIN);
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->AddRewards(FUNDER, 10 * COIN).IsSuccess());
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(30 * SECONDS_PER_DAY);
    Amount earned = engine_->Earned(ALICE);

    auto result = engine_->Exit(ALICE);
    ASSERT_TRUE(result.IsSuccess()) << result.ToString();
    EXPECT_EQ(result.fee, 9u);
    EXPECT_EQ(result.amount, 981u + earned);
    EXPECT_EQ(vault_.BalanceOf(ALICE), 981u + earned);

    auto account = engine_->GetAccount(ALICE);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->balance, 0u);
    EXPECT_EQ(account->pendingReward, 0u);
    EXPECT_EQ(engine_->GetState().totalStaked, 0u);
    EXPECT_EQ(sink_->withdrawals.size(), 1u);
    EXPECT_EQ(sink_->claims.size(), 1u);
}

TEST_F(EngineTest, AddRewards) {
    vault_.Mint(FUNDER, 5000);

    EXPECT_EQ(engine_->AddRewards(FUNDER, 0).error, StakingError::ZeroAmount);
    EXPECT_EQ(engine_->AddRewards(FUNDER, 6000).error, StakingError::TransferFailed);
    EXPECT_EQ(engine_->GetState().totalRewardsFunded, 0u);

    ASSERT_TRUE(engine_->AddRewards(FUNDER, 5000).IsSuccess());
    EXPECT_EQ(engine_->GetState().totalRewardsFunded, 5000u);
    EXPECT_EQ(engine_->AvailableRewards(), 5000u);
    ASSERT_EQ(sink_->fundings.size(), 1u);
    EXPECT_EQ(sink_->fundings[0].availableRewards, 5000u);
}

// ============================================================================
// Atomicity
// ============================================================================

TEST_F(EngineTest, FailedTransferRollsBackEverything) {
    vault_.Mint(ALICE, 1000);
    vault_.failOutTo.insert(Recipient());

    auto result = engine_->Stake(ALICE, 1000);
    EXPECT_EQ(result.error, StakingError::TransferFailed);

    EXPECT_EQ(vault_.BalanceOf(ALICE), 1000u);
    EXPECT_EQ(vault_.BalanceOf(Custody()), 0u);
    EXPECT_EQ(engine_->GetState().totalStaked, 0u);
    EXPECT_EQ(engine_->GetState().totalFeesCollected, 0u);
    EXPECT_FALSE(engine_->GetAccount(ALICE).has_value());
    EXPECT_EQ(sink_->Total(), 0u);

    vault_.failOutTo.clear();
    EXPECT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());
}

TEST_F(EngineTest, UnfundedClaimRollsBackSettlement) {
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());
    size_t eventsBefore = sink_->Total();

    Advance(SECONDS_PER_DAY);
    Amount earned = engine_->Earned(ALICE);

    auto result = engine_->Claim(ALICE);
    EXPECT_EQ(result.error, StakingError::TransferFailed);

    const GlobalState& state = engine_->GetState();
    EXPECT_EQ(state.lastUpdateTime, START);
    EXPECT_EQ(state.rewardRate, 100u);
    EXPECT_EQ(state.adjustmentCount, 0u);
    EXPECT_EQ(engine_->GetAccount(ALICE)->pendingReward, 0u);
    EXPECT_EQ(engine_->Earned(ALICE), earned);
    EXPECT_EQ(sink_->Total(), eventsBefore);
}

TEST_F(EngineTest, ReentrantCallRejected) {
    vault_.Mint(ALICE, 1000);
    OperationResult inner;
    vault_.onTransferIn = [&]() { inner = engine_->Claim(BOB); };

    auto outer = engine_->Stake(ALICE, 1000);
    EXPECT_TRUE(outer.IsSuccess());
    EXPECT_EQ(inner.error, StakingError::ReentrantCall);
    EXPECT_FALSE(engine_->GetAccount(BOB).has_value());
}

TEST_F(EngineTest, ReentryDuringPayoutRejected) {
    vault_.Mint(ALICE, 1000);
    vault_.Mint(BOB, 1000);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    OperationResult inner;
    vault_.onTransferOut = [&]() { inner = engine_->Stake(BOB, 1000); };

    auto outer = engine_->Withdraw(ALICE, 990);
    EXPECT_TRUE(outer.IsSuccess()) << outer.ToString();
    EXPECT_EQ(inner.error, StakingError::ReentrantCall);
    EXPECT_FALSE(engine_->GetAccount(BOB).has_value());
    EXPECT_EQ(vault_.BalanceOf(BOB), 1000u);
    EXPECT_EQ(engine_->GetState().totalStaked, 0u);
}

TEST_F(EngineTest, ConservationAcrossOperations) {
    Amount supply = 0;
    for (const auto& who : {ALICE, BOB}) {
        vault_.Mint(who, 50000);
        supply += 50000;
    }
    vault_.Mint(FUNDER, 10 * COIN);
    supply += 10 * COIN;
    ASSERT_TRUE(engine_->AddRewards(FUNDER, 10 * COIN).IsSuccess());

    ASSERT_TRUE(engine_->Stake(ALICE, 20000).IsSuccess());
    Advance(3 * SECONDS_PER_DAY);
    ASSERT_TRUE(engine_->Stake(BOB, 30000).IsSuccess());
    Advance(8 * SECONDS_PER_DAY);
    ASSERT_TRUE(engine_->Withdraw(ALICE, 5000).IsSuccess());
    ASSERT_TRUE(engine_->Claim(BOB).IsSuccess());
    Advance(20 * SECONDS_PER_DAY);
    ASSERT_TRUE(engine_->Exit(ALICE).IsSuccess());

    EXPECT_TRUE(engine_->CheckConservation());
    EXPECT_EQ(vault_.TotalSupply(), supply);
    EXPECT_GE(vault_.BalanceOf(Custody()), engine_->GetState().totalStaked);
}

// ============================================================================
// Rate Controller
// ============================================================================

TEST_F(EngineTest, ControllerWaitsForPeriod) {
    vault_.Mint(FUNDER, COIN);
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->AddRewards(FUNDER, COIN).IsSuccess());
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(SECONDS_PER_DAY - 1);
    EXPECT_FALSE(engine_->PreviewAdjustment().due);
    EXPECT_EQ(engine_->UpdateRewardRate().amount, 100u);
    EXPECT_EQ(engine_->GetState().adjustmentCount, 0u);
}

TEST_F(EngineTest, ControllerDecreasesWhenPoolRunsShort) {
    vault_.Mint(FUNDER, COIN);
    vault_.Mint(ALICE, 1000);
    ASSERT_TRUE(engine_->AddRewards(FUNDER, COIN).IsSuccess());
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());
    EXPECT_EQ(engine_->SustainabilityDays(), 11u);

    Advance(SECONDS_PER_DAY);
    auto preview = engine_->PreviewAdjustment();
    EXPECT_TRUE(preview.due);
    EXPECT_TRUE(preview.shouldAdjust);
    EXPECT_EQ(preview.proposedRate, 90u);

    auto result = engine_->UpdateRewardRate();
    ASSERT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.amount, 90u);

    const GlobalState& state = engine_->GetState();
    EXPECT_EQ(state.rewardRate, 90u);
    EXPECT_EQ(state.lastAdjustmentReason, AdjustmentReason::DecreasedLowSustainability);
    EXPECT_EQ(state.lastRateAdjustmentTime, START + SECONDS_PER_DAY);
    ASSERT_EQ(sink_->rates.size(), 1u);
    EXPECT_EQ(sink_->rates[0].oldRate, 100u);
    EXPECT_EQ(sink_->rates[0].newRate, 90u);
}

TEST_F(EngineTest, ControllerIncreasesWithAmplePool) {
    vault_.Mint(FUNDER, 100 * COIN);
    vault_.Mint(ALICE, 1000 * COIN);
    ASSERT_TRUE(engine_->AddRewards(FUNDER, 100 * COIN).IsSuccess());
    ASSERT_TRUE(engine_->Stake(ALICE, 1000 * COIN).IsSuccess());
    EXPECT_EQ(engine_->EstimateAPR(), 318u);

    Advance(SECONDS_PER_DAY);
    ASSERT_TRUE(engine_->UpdateRewardRate().IsSuccess());
    EXPECT_EQ(engine_->GetState().rewardRate, 110u);
    EXPECT_EQ(engine_->GetState().lastAdjustmentReason,
              AdjustmentReason::IncreasedHighSustainability);
}

TEST_F(EngineTest, FirstStakeAfterIdlePeriodKeepsHealthyRate) {
    vault_.Mint(FUNDER, 100 * COIN);
    vault_.Mint(ALICE, 1000 * COIN);
    ASSERT_TRUE(engine_->AddRewards(FUNDER, 100 * COIN).IsSuccess());

    Advance(SECONDS_PER_DAY);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000 * COIN).IsSuccess());

    const GlobalState& state = engine_->GetState();
    EXPECT_EQ(state.rewardRate, 110u);
    EXPECT_EQ(state.lastAdjustmentReason, AdjustmentReason::IncreasedHighSustainability);
    ASSERT_EQ(sink_->rates.size(), 1u);
    EXPECT_EQ(sink_->rates[0].oldRate, 100u);
    EXPECT_EQ(sink_->rates[0].newRate, 110u);
}

TEST_F(EngineTest, ControllerFloorsWhenNothingStaked) {
    Advance(SECONDS_PER_DAY);
    ASSERT_TRUE(engine_->UpdateRewardRate().IsSuccess());
    EXPECT_EQ(engine_->GetState().rewardRate, 10u);
    EXPECT_EQ(engine_->GetState().lastAdjustmentReason, AdjustmentReason::FloorForced);
}

TEST_F(EngineTest, ControllerRunsInsideStakerOperations) {
    vault_.Mint(FUNDER, COIN);
    vault_.Mint(ALICE, 2000);
    ASSERT_TRUE(engine_->AddRewards(FUNDER, COIN).IsSuccess());
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());

    Advance(SECONDS_PER_DAY);
    ASSERT_TRUE(engine_->Stake(ALICE, 1000).IsSuccess());
    EXPECT_EQ(engine_->GetState().rewardRate, 90u);
    EXPECT_EQ(sink_->rates.size(), 1u);
}

// ============================================================================
// Administration
// ============================================================================

TEST_F(EngineTest, AdminCallsRequireAuthorization) {
    EXPECT_EQ(engine_->SetRewardRate(ALICE, 200).error, StakingError::Unauthorized);
    EXPECT_EQ(engine_->SetRewardRate(ALICE, 0).error, StakingError::Unauthorized);
    EXPECT_EQ(engine_->SetMinRewardRate(ALICE, 20).error, StakingError::Unauthorized);
    EXPECT_EQ(engine_->SetRateAdjustmentPeriod(ALICE, SECONDS_PER_DAY).error,
              StakingError::Unauthorized);
    EXPECT_EQ(engine_->SetMaxAPR(ALICE, 100).error, StakingError::Unauthorized);
    EXPECT_EQ(engine_->SetMinimumStake(ALICE, 5).error, StakingError::Unauthorized);
    EXPECT_EQ(engine_->SetTargetSustainabilityDays(ALICE, 30).error,
              StakingError::Unauthorized);
    EXPECT_EQ(engine_->GetState().rewardRate, 100u);
}

TEST_F(EngineTest, AdminCallsValidateParameters) {
    EXPECT_EQ(engine_->SetRewardRate(ADMIN, 5).error, StakingError::InvalidConfiguration);
    EXPECT_EQ(engine_->SetRewardRate(ADMIN, MAX_REWARD_RATE + 1).error,
              StakingError::InvalidConfiguration);
    EXPECT_EQ(engine_->SetMinRewardRate(ADMIN, 0).error, StakingError::InvalidConfiguration);
    EXPECT_EQ(engine_->SetRateAdjustmentPeriod(ADMIN, 60).error,
              StakingError::InvalidConfiguration);
    EXPECT_EQ(engine_->SetMaxAPR(ADMIN, 0).error, StakingError::InvalidConfiguration);
    EXPECT_EQ(engine_->SetMinimumStake(ADMIN, 0).error, StakingError::InvalidConfiguration);
    EXPECT_EQ(engine_->SetTargetSustainabilityDays(ADMIN, 0).error,
              StakingError::InvalidConfiguration);
}

TEST_F(EngineTest, ManualRateChange) {
    auto result = engine_->SetRewardRate(ADMIN, 250);
    ASSERT_TRUE(result.IsSuccess());
    EXPECT_EQ(engine_->GetState().rewardRate, 250u);
    EXPECT_EQ(engine_->GetState().lastAdjustmentReason, AdjustmentReason::Manual);
    ASSERT_EQ(sink_->rates.size(), 1u);
    EXPECT_EQ(sink_->rates[0].oldRate, 100u);
    EXPECT_EQ(sink_->rates[0].newRate, 250u);
    EXPECT_EQ(sink_->rates[0].reason, AdjustmentReason::Manual);
}

TEST_F(EngineTest, RaisingFloorLiftsRate) {
    ASSERT_TRUE(engine_->SetMinRewardRate(ADMIN, 50).IsSuccess());
    EXPECT_EQ(engine_->GetState().rewardRate, 100u);
    EXPECT_EQ(sink_->rates.size(), 0u);

    ASSERT_TRUE(engine_->SetMinRewardRate(ADMIN, 500).IsSuccess());
    EXPECT_EQ(engine_->GetState().minRewardRate, 500u);
    EXPECT_EQ(engine_->GetState().rewardRate, 500u);
    EXPECT_EQ(engine_->GetState().lastAdjustmentReason, AdjustmentReason::FloorForced);
    ASSERT_EQ(sink_->rates.size(), 1u);
    EXPECT_EQ(sink_->rates[0].newRate, 500u);
}

TEST_F(EngineTest, ParameterSetters) {
    ASSERT_TRUE(engine_->SetRateAdjustmentPeriod(ADMIN, 12 * SECONDS_PER_HOUR).IsSuccess());
    ASSERT_TRUE(engine_->SetMaxAPR(ADMIN, 1200).IsSuccess());
    ASSERT_TRUE(engine_->SetMinimumStake(ADMIN, 25).IsSuccess());
    ASSERT_TRUE(engine_->SetTargetSustainabilityDays(ADMIN, 30).IsSuccess());

    const GlobalState& state = engine_->GetState();
    EXPECT_EQ(state.rateAdjustmentPeriod, 12 * SECONDS_PER_HOUR);
    EXPECT_EQ(state.maxAPR, 1200u);
    EXPECT_EQ(state.minimumStake, 25u);
    EXPECT_EQ(state.targetSustainabilityDays, 30u);

    ASSERT_EQ(sink_->targets.size(), 1u);
    EXPECT_EQ(sink_->targets[0].oldTarget, 180u);
    EXPECT_EQ(sink_->targets[0].newTarget, 30u);
}
