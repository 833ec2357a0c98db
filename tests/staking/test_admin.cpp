// HYDROSTAKE - Administration and State Transfer Tests
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "hydrostake/ledger/memory_ledger.h"
#include "hydrostake/staking/engine.h"
#include "hydrostake/util/logging.h"
#include "hydrostake/util/time.h"

#include <memory>
#include <vector>

namespace hydrostake {
namespace staking {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

const Address ENGINE = Address::FromId(0xEE);
const Address OWNER = Address::FromId(0x01);
const Address SUCCESSOR = Address::FromId(0x02);
const Address ALICE = Address::FromId(0x0A);
const Address MALLORY = Address::FromId(0x0D);

constexpr int64_t START_TIME = 1700000000;

Uint256 Tokens(uint64_t n) {
    return Uint256(n) * Uint256(DEFAULT_REWARD_DIVISOR);
}

class AdminTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::SetMockTime(START_TIME);
        util::EnableMockTime();

        hydro_ = std::make_shared<ledger::MemoryTokenLedger>("HYDRO");
        kvs_ = std::make_shared<ledger::MemoryTokenLedger>("KVS");
        nft_ = std::make_shared<ledger::MemoryNftRegistry>();
        engine_ = std::make_unique<StakingEngine>(ENGINE, OWNER, hydro_, kvs_, nft_);

        kvs_->Mint(ENGINE, Tokens(5000));
        hydro_->Mint(ALICE, Tokens(1000));
        hydro_->Approve(ALICE, ENGINE, Uint256::Max());
        nft_->Mint(ALICE);
    }

    void TearDown() override {
        util::Logger::Instance().ClearSinks();
        util::Logger::Instance().SetLevel(util::LogLevel::Info);
        util::DisableMockTime();
        util::SetMockTime(0);
    }

    std::unique_ptr<StakingEngine> MakeEngine() {
        return std::make_unique<StakingEngine>(ENGINE, OWNER, hydro_, kvs_, nft_);
    }

    std::shared_ptr<ledger::MemoryTokenLedger> hydro_;
    std::shared_ptr<ledger::MemoryTokenLedger> kvs_;
    std::shared_ptr<ledger::MemoryNftRegistry> nft_;
    std::unique_ptr<StakingEngine> engine_;
};

// ============================================================================
// Staking Gate
// ============================================================================

TEST_F(AdminTest, OwnerTogglesStaking) {
    ASSERT_TRUE(engine_->SetStakeActive(OWNER, false));
    EXPECT_FALSE(engine_->IsStakeActive());
    EXPECT_EQ(engine_->Stake(ALICE, Tokens(1)).error, StakingError::StakingInactive);

    ASSERT_TRUE(engine_->SetStakeActive(OWNER, true));
    EXPECT_TRUE(engine_->Stake(ALICE, Tokens(1)));

    auto toggles = engine_->GetEventLog().GetEvents(EventKind::StakingToggled);
    ASSERT_EQ(toggles.size(), 2u);
    EXPECT_TRUE(toggles[0].value.IsZero());
    EXPECT_EQ(toggles[1].value, Uint256(1));
}

TEST_F(AdminTest, PauseDoesNotTrapStakers) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    ASSERT_TRUE(engine_->SetStakeActive(OWNER, false));
    util::AdvanceMockTime(util::Minutes(10));

    EXPECT_TRUE(engine_->WithdrawProfit(ALICE, Uint256()));
    EXPECT_TRUE(engine_->Exit(ALICE));
}

TEST_F(AdminTest, NonOwnerRejected) {
    EXPECT_EQ(engine_->SetStakeActive(MALLORY, false).error, StakingError::NotOwner);
    EXPECT_EQ(engine_->SetCurrentRate(MALLORY, Uint256(1)).error, StakingError::NotOwner);
    EXPECT_EQ(engine_->Sweep(MALLORY, *kvs_, Tokens(1)).error, StakingError::NotOwner);
    EXPECT_EQ(engine_->TransferOwnership(MALLORY, MALLORY).error, StakingError::NotOwner);
    EXPECT_EQ(engine_->RenounceOwnership(MALLORY).error, StakingError::NotOwner);

    EXPECT_TRUE(engine_->IsStakeActive());
    EXPECT_EQ(engine_->GetCurrentRate(), Uint256(DEFAULT_MAX_RATE));
    EXPECT_EQ(engine_->GetOwner(), OWNER);
    EXPECT_EQ(kvs_->BalanceOf(ENGINE), Tokens(5000));
    EXPECT_EQ(engine_->GetEventLog().Size(), 0u);
}

TEST_F(AdminTest, RejectionsAreLoggedUnderAdmin) {
    std::vector<util::LogEntry> entries;
    auto& logger = util::Logger::Instance();
    logger.SetLevel(util::LogLevel::Warn);
    logger.AddSink(std::make_shared<util::CallbackSink>(
        [&](const util::LogEntry& entry) { entries.push_back(entry); },
        util::LogLevel::Warn));

    engine_->SetStakeActive(MALLORY, false);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, util::LogLevel::Warn);
    EXPECT_EQ(entries[0].category, util::LogCategory::ADMIN);
    EXPECT_NE(entries[0].message.find("NotOwner"), std::string::npos);
}

// ============================================================================
// Rate Override
// ============================================================================

TEST_F(AdminTest, RateOverrideAffectsOnlyNewStakers) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(10)));
    const Uint256 override(1000000);
    ASSERT_TRUE(engine_->SetCurrentRate(OWNER, override));
    EXPECT_EQ(engine_->GetCurrentRate(), override);
    EXPECT_EQ(engine_->GetUser(ALICE).ratePerMinute, Uint256(DEFAULT_MAX_RATE));

    auto events = engine_->GetEventLog().GetEvents(EventKind::RateOverridden);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].value, override);
    EXPECT_EQ(events[0].extra, Uint256(DEFAULT_MAX_RATE - DEFAULT_RATE_STEP));
}

TEST_F(AdminTest, RateOverrideToZeroStopsNewAccrual) {
    ASSERT_TRUE(engine_->SetCurrentRate(OWNER, Uint256()));
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(10)));
    util::AdvanceMockTime(util::Minutes(600));
    EXPECT_TRUE(engine_->CheckCurrentRewards(ALICE).IsZero());
    EXPECT_TRUE(engine_->GetCurrentRate().IsZero());
}

TEST_F(AdminTest, RateOverrideBeyond64BitsRejected) {
    StakingResult result = engine_->SetCurrentRate(OWNER, Uint256(1) << 64);
    EXPECT_EQ(result.error, StakingError::AmountOverflow);
    EXPECT_EQ(engine_->GetCurrentRate(), Uint256(DEFAULT_MAX_RATE));
}

// ============================================================================
// Sweep
// ============================================================================

TEST_F(AdminTest, SweepSendsToOwner) {
    StakingResult result = engine_->Sweep(OWNER, *kvs_, Tokens(1200));
    ASSERT_TRUE(result) << result.ToString();
    EXPECT_EQ(result.payout, Tokens(1200));
    EXPECT_EQ(kvs_->BalanceOf(OWNER), Tokens(1200));
    EXPECT_EQ(kvs_->BalanceOf(ENGINE), Tokens(3800));

    auto events = engine_->GetEventLog().GetEvents(EventKind::TokensSwept);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].value, Tokens(1200));
}

TEST_F(AdminTest, SweepForeignToken) {
    ledger::MemoryTokenLedger stray("STRAY");
    stray.Mint(ENGINE, Uint256(77));
    ASSERT_TRUE(engine_->Sweep(OWNER, stray, Uint256(77)));
    EXPECT_EQ(stray.BalanceOf(OWNER), Uint256(77));
}

TEST_F(AdminTest, SweepBeyondBalanceFails) {
    EXPECT_EQ(engine_->Sweep(OWNER, *kvs_, Tokens(5001)).error, StakingError::TransferFailed);
    EXPECT_EQ(kvs_->BalanceOf(ENGINE), Tokens(5000));
}

// ============================================================================
// Ownership
// ============================================================================

TEST_F(AdminTest, TransferOwnership) {
    ASSERT_TRUE(engine_->TransferOwnership(OWNER, SUCCESSOR));
    EXPECT_EQ(engine_->GetOwner(), SUCCESSOR);
    EXPECT_EQ(engine_->SetStakeActive(OWNER, false).error, StakingError::NotOwner);
    EXPECT_TRUE(engine_->SetStakeActive(SUCCESSOR, false));

    auto events = engine_->GetEventLog().GetEvents(EventKind::OwnershipTransferred);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].account, SUCCESSOR);
    EXPECT_EQ(events[0].counterparty, OWNER);
}

TEST_F(AdminTest, TransferToNullRejected) {
    EXPECT_EQ(engine_->TransferOwnership(OWNER, Address()).error, StakingError::InvalidAddress);
    EXPECT_EQ(engine_->GetOwner(), OWNER);
}

TEST_F(AdminTest, RenounceClosesAdministration) {
    ASSERT_TRUE(engine_->RenounceOwnership(OWNER));
    EXPECT_TRUE(engine_->GetOwner().IsNull());

    EXPECT_EQ(engine_->SetStakeActive(OWNER, false).error, StakingError::NotOwner);
    EXPECT_EQ(engine_->SetStakeActive(Address(), false).error, StakingError::NotOwner);
    EXPECT_EQ(engine_->TransferOwnership(Address(), OWNER).error, StakingError::NotOwner);

    auto events = engine_->GetEventLog().GetEvents(EventKind::OwnershipTransferred);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].account.IsNull());
    EXPECT_EQ(events[0].counterparty, OWNER);
}

TEST_F(AdminTest, UnownedEngineStillServesStakers) {
    ASSERT_TRUE(engine_->RenounceOwnership(OWNER));
    EXPECT_TRUE(engine_->Stake(ALICE, Tokens(1)));
}

// ============================================================================
// State Transfer
// ============================================================================

TEST_F(AdminTest, ExportImportRoundTrip) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    util::AdvanceMockTime(util::Minutes(30));
    ASSERT_TRUE(engine_->WithdrawFunds(ALICE, Tokens(25)));
    ASSERT_TRUE(engine_->SetStakeActive(OWNER, false));

    StateSnapshot snapshot = engine_->ExportState();
    ASSERT_EQ(snapshot.users.size(), 1u);

    auto restored = MakeEngine();
    ASSERT_TRUE(restored->ImportState(snapshot));
    EXPECT_EQ(restored->GetUser(ALICE), engine_->GetUser(ALICE));
    EXPECT_EQ(restored->GetCurrentRate(), engine_->GetCurrentRate());
    EXPECT_EQ(restored->GetTotalStaked(), Tokens(75));
    EXPECT_FALSE(restored->IsStakeActive());
    EXPECT_EQ(restored->GetOwner(), OWNER);

    util::AdvanceMockTime(util::Minutes(10));
    EXPECT_EQ(restored->CheckCurrentRewards(ALICE), engine_->CheckCurrentRewards(ALICE));
}

TEST_F(AdminTest, ImportRejectsMismatchedTotal) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    StateSnapshot snapshot = engine_->ExportState();
    snapshot.global.totalStaked = Tokens(99);

    auto restored = MakeEngine();
    EXPECT_FALSE(restored->ImportState(snapshot));
    EXPECT_TRUE(restored->GetTotalStaked().IsZero());
    EXPECT_TRUE(restored->GetUser(ALICE).IsEmpty());
}

TEST_F(AdminTest, ImportRejectsDuplicateAccounts) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    StateSnapshot snapshot = engine_->ExportState();
    snapshot.users.push_back(snapshot.users.front());
    snapshot.global.totalStaked = Tokens(200);

    EXPECT_FALSE(MakeEngine()->ImportState(snapshot));
}

TEST_F(AdminTest, ImportRejectsOutOfRangeValues) {
    StateSnapshot snapshot = engine_->ExportState();
    snapshot.global.currentRate = Uint256(1) << 64;
    EXPECT_FALSE(MakeEngine()->ImportState(snapshot));

    snapshot = engine_->ExportState();
    UserRecord huge;
    huge.amount = MaxStakeAmount() + Uint256(1);
    snapshot.users.emplace_back(ALICE, huge);
    snapshot.global.totalStaked = huge.amount;
    EXPECT_FALSE(MakeEngine()->ImportState(snapshot));
}

TEST_F(AdminTest, ImportDuringOperationRejected) {
    ASSERT_TRUE(engine_->Stake(ALICE, Tokens(100)));
    util::AdvanceMockTime(util::Minutes(60));
    StateSnapshot empty = MakeEngine()->ExportState();

    bool imported = true;
    kvs_->SetTransferHook([&](const Address&, const Address&, const Uint256&) {
        imported = engine_->ImportState(empty);
    });

    ASSERT_TRUE(engine_->WithdrawProfit(ALICE, Uint256()));
    EXPECT_FALSE(imported);
    EXPECT_EQ(engine_->GetTotalStaked(), Tokens(100));
}

} // namespace test
} // namespace staking
} // namespace hydrostake
