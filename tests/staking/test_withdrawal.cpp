// HYDROSTAKE - Withdrawal Delay Tests
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "hydrostake/ledger/memory_ledger.h"
#include "hydrostake/staking/engine.h"
#include "hydrostake/util/time.h"

#include <memory>

namespace hydrostake {
namespace staking {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

const Address ENGINE = Address::FromId(0xEE);
const Address OWNER = Address::FromId(0x01);
const Address ALICE = Address::FromId(0x0A);
const Address BOB = Address::FromId(0x0B);
const Address CAROL = Address::FromId(0x0C);

constexpr int64_t START_TIME = 1700000000;
constexpr int64_t WEEK = util::SECONDS_PER_WEEK;

Uint256 Tokens(uint64_t n) {
    return Uint256(n) * Uint256(DEFAULT_REWARD_DIVISOR);
}

class WithdrawalTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::SetMockTime(START_TIME);
        util::EnableMockTime();

        hydro_ = std::make_shared<ledger::MemoryTokenLedger>("HYDRO");
        kvs_ = std::make_shared<ledger::MemoryTokenLedger>("KVS");
        nft_ = std::make_shared<ledger::MemoryNftRegistry>();
        engine_ = std::make_unique<StakingEngine>(ENGINE, OWNER, hydro_, kvs_, nft_);

        kvs_->Mint(ENGINE, Tokens(1000000));
        for (const Address& who : {ALICE, BOB, CAROL}) {
            hydro_->Mint(who, Tokens(1000));
            hydro_->Approve(who, ENGINE, Uint256::Max());
            nft_->Mint(who);
        }
    }

    void TearDown() override {
        util::DisableMockTime();
        util::SetMockTime(0);
    }

    void AdvanceMinutes(int64_t minutes) {
        util::AdvanceMockTime(util::Minutes(minutes));
    }

    /// totalStaked equals the sum of every account's stake
    void ExpectTotalMatchesUsers() {
        StateSnapshot snapshot = engine_->ExportState();
        Uint256 sum;
        for (const auto& [addr, rec] : snapshot.users) {
            sum += rec.amount;
        }
        EXPECT_EQ(sum, engine_->GetTotalStaked());
    }

    std::shared_ptr<ledger::MemoryTokenLedger> hydro_;
    std::shared_ptr<ledger::MemoryTokenLedger> kvs_;
    std::shared_ptr<ledger::MemoryNftRegistry> nft_;
    std::unique_ptr<StakingEngine> engine_;
};

// ============================================================================
// Exit
// ============================================================================

TEST_F(WithdrawalTest, ExitAfterAnHour) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    AdvanceMinutes(60);
    const Uint256 accrued = engine_->CheckCurrentRewards(ALICE);
    const int64_t now = START_TIME + 3600;

    StakingResult result = engine_->Exit(ALICE);
    ASSERT_TRUE(result) << result.ToString();
    EXPECT_EQ(result.payout, accrued);
    EXPECT_EQ(kvs_->BalanceOf(ALICE), accrued);

    UserRecord rec = engine_->GetUser(ALICE);
    EXPECT_TRUE(rec.amount.IsZero());
    EXPECT_EQ(rec.checkpoint, now);
    EXPECT_TRUE(rec.withdrawal.pending);
    EXPECT_EQ(rec.withdrawal.amount, Tokens(100));
    EXPECT_EQ(rec.withdrawal.releaseAt, now + WEEK);

    EXPECT_EQ(engine_->GetCurrentRate(), Uint256(DEFAULT_MAX_RATE));
    EXPECT_TRUE(engine_->GetTotalStaked().IsZero());
    EXPECT_EQ(engine_->GetStakerCount(), 0u);
    EXPECT_EQ(hydro_->BalanceOf(ENGINE), Tokens(100));
}

TEST_F(WithdrawalTest, ExitEvents) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    AdvanceMinutes(60);
    engine_->GetEventLog().Clear();

    ASSERT_TRUE(engine_->Exit(ALICE));
    auto events = engine_->GetEventLog().GetEvents();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].kind, EventKind::RewardPaid);
    EXPECT_EQ(events[1].kind, EventKind::WithdrawalRequested);
    EXPECT_EQ(events[1].value, Tokens(100));
    EXPECT_EQ(events[1].extra, Uint256(static_cast<uint64_t>(START_TIME + 3600 + WEEK)));
    EXPECT_EQ(events[2].kind, EventKind::RateSynced);
    EXPECT_EQ(events[2].value, Uint256(DEFAULT_MAX_RATE));
}

TEST_F(WithdrawalTest, ExitWithoutAccrualPaysNothing) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    const size_t kvsTransfers = kvs_->TransferCount();

    StakingResult result = engine_->Exit(ALICE);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.payout.IsZero());
    EXPECT_EQ(kvs_->TransferCount(), kvsTransfers);
    EXPECT_TRUE(engine_->GetEventLog().GetEvents(EventKind::RewardPaid).empty());
}

TEST_F(WithdrawalTest, NonStakerCannotWithdraw) {
    EXPECT_EQ(engine_->Exit(ALICE).error, StakingError::NotStaker);
    EXPECT_EQ(engine_->WithdrawFunds(ALICE, Tokens(1)).error, StakingError::NotStaker);
    EXPECT_EQ(engine_->WithdrawProfit(ALICE, Uint256()).error, StakingError::NotStaker);
}

TEST_F(WithdrawalTest, ExitedUserIsNotStaker) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->Exit(ALICE));
    EXPECT_EQ(engine_->Exit(ALICE).error, StakingError::NotStaker);
    EXPECT_EQ(engine_->WithdrawFunds(ALICE, Tokens(1)).error, StakingError::NotStaker);
    EXPECT_EQ(engine_->WithdrawProfit(ALICE, Uint256()).error, StakingError::NotStaker);
}

TEST_F(WithdrawalTest, ExitRewardFailureChangesNothing) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    AdvanceMinutes(60);
    const UserRecord before = engine_->GetUser(ALICE);
    const Uint256 rateBefore = engine_->GetCurrentRate();
    kvs_->SetFailureMode(ledger::FailureMode::ReturnFalse);

    EXPECT_EQ(engine_->Exit(ALICE).error, StakingError::TransferFailed);
    EXPECT_EQ(engine_->GetUser(ALICE), before);
    EXPECT_EQ(engine_->GetCurrentRate(), rateBefore);
    EXPECT_EQ(engine_->GetTotalStaked(), Tokens(100));
}

// ============================================================================
// Partial Withdrawal
// ============================================================================

TEST_F(WithdrawalTest, PartialWithdrawalKeepsRate) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    const Uint256 rateAfterStake = engine_->GetCurrentRate();
    AdvanceMinutes(30);

    StakingResult result = engine_->WithdrawFunds(ALICE, Tokens(40));
    ASSERT_TRUE(result) << result.ToString();

    UserRecord rec = engine_->GetUser(ALICE);
    EXPECT_EQ(rec.amount, Tokens(60));
    EXPECT_EQ(rec.ratePerMinute, Uint256(DEFAULT_MAX_RATE));
    EXPECT_EQ(rec.withdrawal.amount, Tokens(40));
    EXPECT_EQ(rec.checkpoint, START_TIME + 1800);
    EXPECT_EQ(engine_->GetCurrentRate(), rateAfterStake);
    EXPECT_EQ(engine_->GetTotalStaked(), Tokens(60));
    EXPECT_TRUE(engine_->GetEventLog().GetEvents(EventKind::RateSynced).size() == 1u);
}

TEST_F(WithdrawalTest, WithdrawingWholeStakeStepsRateUp) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->WithdrawFunds(ALICE, Tokens(100)));
    EXPECT_EQ(engine_->GetCurrentRate(), Uint256(DEFAULT_MAX_RATE));
    EXPECT_FALSE(engine_->GetUser(ALICE).IsStaker());
}

TEST_F(WithdrawalTest, WithdrawMoreThanStakeRejected) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    const UserRecord before = engine_->GetUser(ALICE);

    StakingResult result = engine_->WithdrawFunds(ALICE, Tokens(101));
    EXPECT_EQ(result.error, StakingError::InsufficientAmount);
    EXPECT_EQ(engine_->GetUser(ALICE), before);
    EXPECT_EQ(engine_->GetTotalStaked(), Tokens(100));
}

TEST_F(WithdrawalTest, WithdrawZeroRejected) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    EXPECT_EQ(engine_->WithdrawFunds(ALICE, Uint256()).error, StakingError::ZeroAmount);
}

TEST_F(WithdrawalTest, SecondRequestWhilePendingRejected) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->WithdrawFunds(ALICE, Tokens(10)));

    EXPECT_EQ(engine_->WithdrawFunds(ALICE, Tokens(1)).error, StakingError::PendingRequest);
    EXPECT_EQ(engine_->WithdrawFunds(ALICE, Tokens(90)).error, StakingError::PendingRequest);
    EXPECT_EQ(engine_->Exit(ALICE).error, StakingError::PendingRequest);
    EXPECT_EQ(engine_->GetUser(ALICE).amount, Tokens(90));
    EXPECT_EQ(engine_->GetUser(ALICE).withdrawal.amount, Tokens(10));
}

TEST_F(WithdrawalTest, PendingRequestDoesNotBlockStaking) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->WithdrawFunds(ALICE, Tokens(10)));
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(5)));
    EXPECT_EQ(engine_->GetUser(ALICE).amount, Tokens(95));
    EXPECT_TRUE(engine_->GetUser(ALICE).withdrawal.pending);
}

// ============================================================================
// Claim
// ============================================================================

TEST_F(WithdrawalTest, ClaimOnlyAfterDelay) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->Exit(ALICE));

    util::AdvanceMockTime(util::Seconds(WEEK - 1));
    StakingResult early = engine_->ClaimHydro(ALICE);
    EXPECT_EQ(early.error, StakingError::WithdrawalNotReady);
    EXPECT_EQ(hydro_->BalanceOf(ALICE), Tokens(900));

    util::AdvanceMockTime(util::Seconds(1));
    StakingResult claimed = engine_->ClaimHydro(ALICE);
    ASSERT_TRUE(claimed) << claimed.ToString();
    EXPECT_EQ(claimed.payout, Tokens(100));
    EXPECT_EQ(hydro_->BalanceOf(ALICE), Tokens(1000));
    EXPECT_TRUE(hydro_->BalanceOf(ENGINE).IsZero());
    EXPECT_TRUE(engine_->GetUser(ALICE).IsEmpty());

    auto events = engine_->GetEventLog().GetEvents(EventKind::HydroClaimed);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].value, Tokens(100));
}

TEST_F(WithdrawalTest, SecondClaimRejected) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->Exit(ALICE));
    util::AdvanceMockTime(util::Seconds(WEEK));
    ASSERT_TRUE(engine_->ClaimHydro(ALICE));

    EXPECT_EQ(engine_->ClaimHydro(ALICE).error, StakingError::NoPendingRequest);
    EXPECT_EQ(hydro_->BalanceOf(ALICE), Tokens(1000));
}

TEST_F(WithdrawalTest, ClaimWithoutRequestRejected) {
    EXPECT_EQ(engine_->ClaimHydro(CAROL).error, StakingError::NoPendingRequest);
}

TEST_F(WithdrawalTest, FailedClaimRestoresRequest) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->Exit(ALICE));
    util::AdvanceMockTime(util::Seconds(WEEK));
    const WithdrawalRequest request = engine_->GetUser(ALICE).withdrawal;

    hydro_->SetFailureMode(ledger::FailureMode::ReturnFalse);
    EXPECT_EQ(engine_->ClaimHydro(ALICE).error, StakingError::TransferFailed);
    EXPECT_EQ(engine_->GetUser(ALICE).withdrawal, request);

    hydro_->SetFailureMode(ledger::FailureMode::None);
    EXPECT_TRUE(engine_->ClaimHydro(ALICE));
    EXPECT_EQ(hydro_->BalanceOf(ALICE), Tokens(1000));
}

TEST_F(WithdrawalTest, ReentrantClaimPaysOnce) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->Exit(ALICE));
    util::AdvanceMockTime(util::Seconds(WEEK));

    StakingResult inner;
    hydro_->SetTransferHook([&](const Address& from, const Address& to, const Uint256&) {
        if (from == ENGINE && to == ALICE) {
            inner = engine_->ClaimHydro(ALICE);
        }
    });

    ASSERT_TRUE(engine_->ClaimHydro(ALICE));
    EXPECT_EQ(inner.error, StakingError::ReentrantCall);
    EXPECT_EQ(hydro_->BalanceOf(ALICE), Tokens(1000));
    EXPECT_FALSE(engine_->GetUser(ALICE).withdrawal.pending);
}

TEST_F(WithdrawalTest, NewRequestAfterClaim) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->WithdrawFunds(ALICE, Tokens(10)));
    util::AdvanceMockTime(util::Seconds(WEEK));
    ASSERT_TRUE(engine_->ClaimHydro(ALICE));

    ASSERT_TRUE(engine_->WithdrawFunds(ALICE, Tokens(20)));
    EXPECT_EQ(engine_->GetUser(ALICE).withdrawal.amount, Tokens(20));
    EXPECT_EQ(engine_->GetUser(ALICE).amount, Tokens(70));
}

TEST_F(WithdrawalTest, ZeroDelayClaimsImmediately) {
    StakingParams params;
    params.withdrawalDelay = 0;
    StakingEngine engine(ENGINE, OWNER, hydro_, kvs_, nft_, params);

    ASSERT_TRUE(engine.Stake(BOB, Tokens(5)));
    ASSERT_TRUE(engine.Exit(BOB));
    EXPECT_TRUE(engine.ClaimHydro(BOB));
    EXPECT_EQ(hydro_->BalanceOf(BOB), Tokens(1000));
}

// ============================================================================
// Rate Lifecycle
// ============================================================================

TEST_F(WithdrawalTest, RestakeAfterExitFreezesCurrentRate) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(10)));
    ASSERT_TRUE(engine_->Stake(BOB, Tokens(10)));
    ASSERT_TRUE(engine_->Exit(ALICE));
    EXPECT_EQ(engine_->GetCurrentRate(), Uint256(DEFAULT_MAX_RATE - DEFAULT_RATE_STEP));

    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(10)));
    EXPECT_EQ(engine_->GetUser(ALICE).ratePerMinute,
              Uint256(DEFAULT_MAX_RATE - DEFAULT_RATE_STEP));
    EXPECT_EQ(engine_->GetCurrentRate(),
              Uint256(DEFAULT_MAX_RATE - 2 * DEFAULT_RATE_STEP));
    EXPECT_EQ(engine_->GetUser(BOB).ratePerMinute,
              Uint256(DEFAULT_MAX_RATE - DEFAULT_RATE_STEP));
}

TEST_F(WithdrawalTest, RateNeverExceedsMaxOnExit) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(10)));
    ASSERT_TRUE(engine_->SetCurrentRate(OWNER, Uint256(DEFAULT_MAX_RATE)));
    ASSERT_TRUE(engine_->Exit(ALICE));
    EXPECT_EQ(engine_->GetCurrentRate(), Uint256(DEFAULT_MAX_RATE));
}

TEST_F(WithdrawalTest, TotalStakedTracksEveryOperation) {
    ExpectTotalMatchesUsers();
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ExpectTotalMatchesUsers();
    ASSERT_TRUE(engine_->Stake(BOB, Tokens(250)));
    ExpectTotalMatchesUsers();
    AdvanceMinutes(90);
    ASSERT_TRUE(engine_->WithdrawFunds(BOB, Tokens(50)));
    ExpectTotalMatchesUsers();
    ASSERT_TRUE(engine_->Stake(CAROL, Tokens(7)));
    ExpectTotalMatchesUsers();
    EXPECT_FALSE(engine_->WithdrawFunds(CAROL, Tokens(8)));
    ExpectTotalMatchesUsers();
    ASSERT_TRUE(engine_->Exit(ALICE));
    ExpectTotalMatchesUsers();
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(1)));
    ExpectTotalMatchesUsers();
    EXPECT_EQ(engine_->GetTotalStaked(), Tokens(200 + 7 + 1));
}

} // namespace test
} // namespace staking
} // namespace hydrostake
