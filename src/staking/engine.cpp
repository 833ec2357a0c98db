// HYDROSTAKE - Staking Engine Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/staking/engine.h"
#include "hydrostake/staking/guard.h"
#include "hydrostake/staking/rewards.h"
#include "hydrostake/util/logging.h"
#include "hydrostake/util/time.h"

#include <limits>
#include <stdexcept>

namespace hydrostake {
namespace staking {

// ============================================================================
// Construction
// ============================================================================

StakingEngine::StakingEngine(const Address& self, const Address& owner,
                             std::shared_ptr<ledger::ITokenLedger> stakeToken,
                             std::shared_ptr<ledger::ITokenLedger> rewardToken,
                             std::shared_ptr<ledger::INftOwnership> gatingNft,
                             const StakingParams& params)
    : self_(self)
    , params_(params)
    , stakeToken_(std::move(stakeToken))
    , rewardToken_(std::move(rewardToken))
    , gatingNft_(std::move(gatingNft)) {
    if (!stakeToken_ || !rewardToken_ || !gatingNft_) {
        throw std::invalid_argument("StakingEngine: ledger and NFT oracle are required");
    }
    if (self_.IsNull()) {
        throw std::invalid_argument("StakingEngine: engine address must not be null");
    }
    if (auto problem = params_.Validate()) {
        throw std::invalid_argument("StakingEngine: " + *problem);
    }

    state_.currentRate = params_.maxRate;
    state_.stakeActive = params_.stakeActive;
    state_.owner = owner;

    LOG_INFO(util::LogCategory::STAKING) << "Staking engine " << self_.ToString()
        << " staking " << stakeToken_->Symbol()
        << " for " << rewardToken_->Symbol()
        << ", owner " << owner.ToString()
        << ", rate " << state_.currentRate;
}

StakingEngine::~StakingEngine() = default;

// ============================================================================
// Helpers
// ============================================================================

const UserRecord* StakingEngine::FindUserLocked(const Address& user) const {
    auto it = users_.find(user);
    return it == users_.end() ? nullptr : &it->second;
}

Uint256 StakingEngine::PendingRewardLocked(const UserRecord& rec, Timestamp now) const {
    int64_t minutes = ElapsedMinutes(rec.checkpoint, now);
    return CalculateReward(rec.amount, rec.ratePerMinute, minutes, params_.rewardDivisor);
}

bool StakingEngine::IsOwnerLocked(const Address& caller) const {
    return !state_.owner.IsNull() && caller == state_.owner;
}

StakingResult StakingEngine::Reject(const char* op, const Address& caller,
                                    StakingError err, const std::string& msg) const {
    bool admin = (err == StakingError::NotOwner || err == StakingError::InvalidAddress);
    LOG_WARN(admin ? util::LogCategory::ADMIN : util::LogCategory::STAKING)
        << op << " by " << caller.ToString() << " rejected: "
        << StakingErrorToString(err) << " (" << msg << ")";
    return StakingResult::Error(err, msg);
}

bool StakingEngine::SendTokens(ledger::ITokenLedger& token, const Address& to,
                               const Uint256& amount, std::string& failure) {
    try {
        if (token.Transfer(self_, to, amount)) {
            return true;
        }
        failure = token.Symbol() + " transfer of " + amount.ToString() +
                  " to " + to.ToString() + " refused";
    } catch (const std::exception& e) {
        failure = token.Symbol() + " transfer to " + to.ToString() + " threw: " + e.what();
    }
    return false;
}

bool StakingEngine::PullTokens(ledger::ITokenLedger& token, const Address& from,
                               const Uint256& amount, std::string& failure) {
    try {
        if (token.TransferFrom(self_, from, self_, amount)) {
            return true;
        }
        failure = token.Symbol() + " transferFrom of " + amount.ToString() +
                  " from " + from.ToString() + " refused";
    } catch (const std::exception& e) {
        failure = token.Symbol() + " transferFrom " + from.ToString() + " threw: " + e.what();
    }
    return false;
}

bool StakingEngine::PayReward(const Address& user, const Uint256& amount,
                              std::string& failure) {
    if (amount.IsZero()) {
        return true;
    }
    return SendTokens(*rewardToken_, user, amount, failure);
}

StakingResult StakingEngine::CreditUnrefundedStake(const Address& caller, const Uint256& amount,
                                                   const std::string& failure) {
    // Only top-ups reach here, so the record exists and the sums were checked
    UserRecord& rec = users_[caller];
    rec.amount += amount;
    state_.totalStaked += amount;

    const Timestamp now = util::GetTime();
    events_.Emit(EventKind::Staked, caller, amount, rec.amount, now);

    LOG_ERROR(util::LogCategory::STAKING) << "stake: credited " << amount << " to "
        << caller.ToString() << " after reward payout and refund failed: " << failure;
    return {StakingError::OK, "stake credited, reward still owed: " + failure, Uint256()};
}

// ============================================================================
// User Operations
// ============================================================================

StakingResult StakingEngine::Stake(const Address& caller, const Uint256& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(inCall_);
    if (!guard.Acquired()) {
        return Reject("stake", caller, StakingError::ReentrantCall,
                      "re-entered during a ledger call");
    }

    uint64_t held = 0;
    try {
        held = gatingNft_->BalanceOf(caller);
    } catch (const std::exception& e) {
        return Reject("stake", caller, StakingError::NoGatingNft,
                      std::string("ownership lookup failed: ") + e.what());
    }
    if (held == 0) {
        return Reject("stake", caller, StakingError::NoGatingNft,
                      "caller holds no gating NFT");
    }
    if (!state_.stakeActive) {
        return Reject("stake", caller, StakingError::StakingInactive, "staking is paused");
    }
    if (amount.IsZero()) {
        return Reject("stake", caller, StakingError::ZeroAmount, "nothing to stake");
    }

    const Timestamp now = util::GetTime();
    UserRecord rec;
    if (const UserRecord* existing = FindUserLocked(caller)) {
        rec = *existing;
    }

    auto newAmount = Uint256::TryAdd(rec.amount, amount);
    if (!newAmount || *newAmount > MaxStakeAmount()) {
        return Reject("stake", caller, StakingError::AmountOverflow,
                      "stake would exceed " + MaxStakeAmount().ToString());
    }
    auto newTotal = Uint256::TryAdd(state_.totalStaked, amount);
    if (!newTotal) {
        return Reject("stake", caller, StakingError::AmountOverflow,
                      "total stake would overflow");
    }

    const bool firstStake = !rec.IsStaker();
    const Uint256 reward = firstStake ? Uint256() : PendingRewardLocked(rec, now);
    const Uint256 frozenRate = state_.currentRate;

    std::string failure;
    if (!reward.IsZero()) {
        Uint256 funds;
        try {
            funds = rewardToken_->BalanceOf(self_);
        } catch (const std::exception& e) {
            return Reject("stake", caller, StakingError::TransferFailed,
                          std::string("reward balance lookup failed: ") + e.what());
        }
        if (funds < reward) {
            return Reject("stake", caller, StakingError::TransferFailed,
                          "reward pool holds " + funds.ToString() + " < owed " + reward.ToString());
        }
    }
    if (!PullTokens(*stakeToken_, caller, amount, failure)) {
        return Reject("stake", caller, StakingError::TransferFailed, failure);
    }
    if (!PayReward(caller, reward, failure)) {
        std::string refundFailure;
        if (SendTokens(*stakeToken_, caller, amount, refundFailure)) {
            return Reject("stake", caller, StakingError::TransferFailed, failure);
        }
        return CreditUnrefundedStake(caller, amount, failure + "; " + refundFailure);
    }

    const Uint256 steppedFrom = state_.currentRate;
    if (firstStake) {
        rec.ratePerMinute = frozenRate;
        state_.currentRate = StepRate(steppedFrom, false, params_);
    }
    rec.amount = *newAmount;
    rec.checkpoint = now;
    users_[caller] = rec;
    state_.totalStaked = *newTotal;

    events_.Emit(EventKind::Staked, caller, amount, rec.amount, now);
    if (!reward.IsZero()) {
        events_.Emit(EventKind::RewardPaid, caller, reward, Uint256(), now);
    }
    if (firstStake) {
        events_.Emit(EventKind::RateSynced, caller, state_.currentRate, steppedFrom, now);
        LOG_DEBUG(util::LogCategory::STAKING) << "Rate stepped down " << steppedFrom
                                              << " -> " << state_.currentRate;
    }

    LOG_INFO(util::LogCategory::STAKING) << caller.ToString() << " staked " << amount
        << " (total " << rec.amount << ", rate " << rec.ratePerMinute
        << ", reward paid " << reward << ")";
    return StakingResult::Success(reward);
}

Uint256 StakingEngine::CheckCurrentRewards(const Address& user) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const UserRecord* rec = FindUserLocked(user);
    if (!rec || !rec->IsStaker()) {
        throw std::logic_error("CheckCurrentRewards: " + user.ToString() + " has no stake");
    }
    return PendingRewardLocked(*rec, util::GetTime());
}

StakingResult StakingEngine::WithdrawProfit(const Address& caller, const Uint256& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(inCall_);
    if (!guard.Acquired()) {
        return Reject("withdrawProfit", caller, StakingError::ReentrantCall,
                      "re-entered during a ledger call");
    }

    const UserRecord* rec = FindUserLocked(caller);
    if (!rec || !rec->IsStaker()) {
        return Reject("withdrawProfit", caller, StakingError::NotStaker, "nothing staked");
    }

    const Timestamp now = util::GetTime();
    const Uint256 reward = PendingRewardLocked(*rec, now);
    if (reward < amount) {
        return Reject("withdrawProfit", caller, StakingError::InsufficientAmount,
                      "accrued " + reward.ToString() + " < requested " + amount.ToString());
    }

    std::string failure;
    if (!PayReward(caller, reward, failure)) {
        return Reject("withdrawProfit", caller, StakingError::TransferFailed, failure);
    }

    users_[caller].checkpoint = now;
    if (!reward.IsZero()) {
        events_.Emit(EventKind::RewardPaid, caller, reward, Uint256(), now);
    }

    LOG_INFO(util::LogCategory::STAKING) << caller.ToString() << " withdrew profit " << reward;
    return StakingResult::Success(reward);
}

StakingResult StakingEngine::Exit(const Address& caller) {
    return RequestWithdrawal("exit", caller, Uint256(), true);
}

StakingResult StakingEngine::WithdrawFunds(const Address& caller, const Uint256& amount) {
    return RequestWithdrawal("withdrawFunds", caller, amount, false);
}

StakingResult StakingEngine::RequestWithdrawal(const char* op, const Address& caller,
                                               const Uint256& amount, bool wholeStake) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(inCall_);
    if (!guard.Acquired()) {
        return Reject(op, caller, StakingError::ReentrantCall,
                      "re-entered during a ledger call");
    }

    const UserRecord* existing = FindUserLocked(caller);
    if (!existing || !existing->IsStaker()) {
        return Reject(op, caller, StakingError::NotStaker, "nothing staked");
    }
    UserRecord rec = *existing;

    const Uint256 requested = wholeStake ? rec.amount : amount;
    if (!wholeStake) {
        if (requested.IsZero()) {
            return Reject(op, caller, StakingError::ZeroAmount, "nothing to withdraw");
        }
        if (requested > rec.amount) {
            return Reject(op, caller, StakingError::InsufficientAmount,
                          "stake " + rec.amount.ToString() + " < requested " +
                          requested.ToString());
        }
    }
    if (rec.withdrawal.pending) {
        return Reject(op, caller, StakingError::PendingRequest,
                      "request of " + rec.withdrawal.amount.ToString() + " outstanding");
    }

    const Timestamp now = util::GetTime();
    if (now > std::numeric_limits<Timestamp>::max() - params_.withdrawalDelay) {
        return Reject(op, caller, StakingError::AmountOverflow,
                      "release time out of range");
    }
    const Timestamp releaseAt = now + params_.withdrawalDelay;
    const Uint256 reward = PendingRewardLocked(rec, now);

    std::string failure;
    if (!PayReward(caller, reward, failure)) {
        return Reject(op, caller, StakingError::TransferFailed, failure);
    }

    rec.amount -= requested;
    rec.checkpoint = now;
    rec.withdrawal.amount = requested;
    rec.withdrawal.pending = true;
    rec.withdrawal.releaseAt = releaseAt;

    const bool leaving = rec.amount.IsZero();
    const Uint256 oldRate = state_.currentRate;
    if (leaving) {
        state_.currentRate = StepRate(oldRate, true, params_);
    }
    state_.totalStaked -= requested;
    users_[caller] = rec;

    if (!reward.IsZero()) {
        events_.Emit(EventKind::RewardPaid, caller, reward, Uint256(), now);
    }
    events_.Emit(EventKind::WithdrawalRequested, caller, requested,
                 Uint256(static_cast<uint64_t>(releaseAt)), now);
    if (leaving) {
        events_.Emit(EventKind::RateSynced, caller, state_.currentRate, oldRate, now);
        LOG_DEBUG(util::LogCategory::STAKING) << "Rate stepped up " << oldRate
                                              << " -> " << state_.currentRate;
    }

    LOG_INFO(util::LogCategory::STAKING) << caller.ToString() << " requested withdrawal of "
        << requested << ", claimable " << util::FormatISO8601(releaseAt)
        << " (reward paid " << reward << ")";
    return StakingResult::Success(reward);
}

StakingResult StakingEngine::ClaimHydro(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(inCall_);
    if (!guard.Acquired()) {
        return Reject("claimHydro", caller, StakingError::ReentrantCall,
                      "re-entered during a ledger call");
    }

    const UserRecord* rec = FindUserLocked(caller);
    if (!rec || !rec->withdrawal.pending) {
        return Reject("claimHydro", caller, StakingError::NoPendingRequest,
                      "no withdrawal request");
    }

    const Timestamp now = util::GetTime();
    if (!rec->withdrawal.IsMature(now)) {
        return Reject("claimHydro", caller, StakingError::WithdrawalNotReady,
                      "claimable in " + util::FormatDuration(
                          util::Seconds(rec->withdrawal.releaseAt - now)));
    }

    const WithdrawalRequest saved = rec->withdrawal;
    users_[caller].withdrawal.Clear();

    std::string failure;
    if (!SendTokens(*stakeToken_, caller, saved.amount, failure)) {
        users_[caller].withdrawal = saved;
        return Reject("claimHydro", caller, StakingError::TransferFailed, failure);
    }

    events_.Emit(EventKind::HydroClaimed, caller, saved.amount, Uint256(), now);

    LOG_INFO(util::LogCategory::STAKING) << caller.ToString() << " claimed " << saved.amount;
    return StakingResult::Success(saved.amount);
}

// ============================================================================
// Administration
// ============================================================================

StakingResult StakingEngine::SetStakeActive(const Address& caller, bool active) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!IsOwnerLocked(caller)) {
        return Reject("setStakeActive", caller, StakingError::NotOwner, "caller is not the owner");
    }

    state_.stakeActive = active;
    events_.Emit(EventKind::StakingToggled, caller, Uint256(active ? 1 : 0), Uint256(),
                 util::GetTime());

    LOG_INFO(util::LogCategory::ADMIN) << "Staking " << (active ? "enabled" : "paused");
    return StakingResult::Success();
}

StakingResult StakingEngine::SetCurrentRate(const Address& caller, const Uint256& rate) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!IsOwnerLocked(caller)) {
        return Reject("setCurrentRate", caller, StakingError::NotOwner, "caller is not the owner");
    }
    if (rate > MaxRateValue()) {
        return Reject("setCurrentRate", caller, StakingError::AmountOverflow,
                      "rate " + rate.ToString() + " exceeds 64 bits");
    }

    const Uint256 oldRate = state_.currentRate;
    state_.currentRate = rate;
    events_.Emit(EventKind::RateOverridden, caller, rate, oldRate, util::GetTime());

    LOG_INFO(util::LogCategory::ADMIN) << "Rate overridden " << oldRate << " -> " << rate;
    return StakingResult::Success();
}

StakingResult StakingEngine::Sweep(const Address& caller, ledger::ITokenLedger& token,
                                   const Uint256& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(inCall_);
    if (!guard.Acquired()) {
        return Reject("sweep", caller, StakingError::ReentrantCall,
                      "re-entered during a ledger call");
    }
    if (!IsOwnerLocked(caller)) {
        return Reject("sweep", caller, StakingError::NotOwner, "caller is not the owner");
    }

    std::string failure;
    if (!SendTokens(token, state_.owner, amount, failure)) {
        return Reject("sweep", caller, StakingError::TransferFailed, failure);
    }

    events_.Emit(EventKind::TokensSwept, caller, amount, Uint256(), util::GetTime());

    LOG_INFO(util::LogCategory::ADMIN) << "Swept " << amount << " " << token.Symbol()
                                       << " to " << state_.owner.ToString();
    return StakingResult::Success(amount);
}

StakingResult StakingEngine::TransferOwnership(const Address& caller, const Address& newOwner) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!IsOwnerLocked(caller)) {
        return Reject("transferOwnership", caller, StakingError::NotOwner,
                      "caller is not the owner");
    }
    if (newOwner.IsNull()) {
        return Reject("transferOwnership", caller, StakingError::InvalidAddress,
                      "new owner is the null address");
    }

    const Address previous = state_.owner;
    state_.owner = newOwner;
    events_.Emit(EventKind::OwnershipTransferred, newOwner, Uint256(), Uint256(),
                 util::GetTime(), previous);

    LOG_INFO(util::LogCategory::ADMIN) << "Ownership " << previous.ToString()
                                       << " -> " << newOwner.ToString();
    return StakingResult::Success();
}

StakingResult StakingEngine::RenounceOwnership(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!IsOwnerLocked(caller)) {
        return Reject("renounceOwnership", caller, StakingError::NotOwner,
                      "caller is not the owner");
    }

    const Address previous = state_.owner;
    state_.owner.SetNull();
    events_.Emit(EventKind::OwnershipTransferred, Address(), Uint256(), Uint256(),
                 util::GetTime(), previous);

    LOG_WARN(util::LogCategory::ADMIN) << "Ownership renounced by " << previous.ToString();
    return StakingResult::Success();
}

// ============================================================================
// Views
// ============================================================================

Uint256 StakingEngine::GetCurrentRate() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.currentRate;
}

Uint256 StakingEngine::GetTotalStaked() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.totalStaked;
}

bool StakingEngine::IsStakeActive() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.stakeActive;
}

Address StakingEngine::GetOwner() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.owner;
}

UserRecord StakingEngine::GetUser(const Address& user) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const UserRecord* rec = FindUserLocked(user);
    return rec ? *rec : UserRecord();
}

Uint256 StakingEngine::GetApy() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return CalculateApy(state_.currentRate, params_);
}

size_t StakingEngine::GetStakerCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [addr, rec] : users_) {
        if (rec.IsStaker()) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// State Transfer
// ============================================================================

StateSnapshot StakingEngine::ExportState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StateSnapshot snapshot;
    snapshot.global = state_;
    snapshot.users.assign(users_.begin(), users_.end());
    return snapshot;
}

bool StakingEngine::ImportState(const StateSnapshot& snapshot) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (inCall_) {
        LOG_ERROR(util::LogCategory::STAKING) << "ImportState called during an operation";
        return false;
    }

    if (snapshot.global.currentRate > MaxRateValue()) {
        LOG_ERROR(util::LogCategory::STAKING) << "ImportState: rate "
            << snapshot.global.currentRate << " out of range";
        return false;
    }

    std::map<Address, UserRecord> users;
    Uint256 sum;
    for (const auto& [addr, rec] : snapshot.users) {
        if (rec.amount > MaxStakeAmount() || rec.ratePerMinute > MaxRateValue()) {
            LOG_ERROR(util::LogCategory::STAKING) << "ImportState: record of "
                << addr.ToString() << " out of range";
            return false;
        }
        auto next = Uint256::TryAdd(sum, rec.amount);
        if (!next) {
            LOG_ERROR(util::LogCategory::STAKING) << "ImportState: stakes overflow";
            return false;
        }
        sum = *next;
        if (!users.emplace(addr, rec).second) {
            LOG_ERROR(util::LogCategory::STAKING) << "ImportState: duplicate record for "
                << addr.ToString();
            return false;
        }
    }
    if (sum != snapshot.global.totalStaked) {
        LOG_ERROR(util::LogCategory::STAKING) << "ImportState: stakes sum to " << sum
            << " but total is " << snapshot.global.totalStaked;
        return false;
    }

    state_ = snapshot.global;
    users_ = std::move(users);

    LOG_INFO(util::LogCategory::STAKING) << "Imported state: " << users_.size()
        << " accounts, total staked " << state_.totalStaked;
    return true;
}

} // namespace staking
} // namespace hydrostake
