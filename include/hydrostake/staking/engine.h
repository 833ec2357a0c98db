// HYDROSTAKE - Staking Engine
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// NFT-gated single-asset staking. Holders of the gating collection lock
// stake tokens and accrue reward tokens at a per-minute rate frozen on entry.
// The global rate falls one step per new staker and rises one step per
// departure. Principal leaves through a delayed withdrawal request.

#ifndef HYDROSTAKE_STAKING_ENGINE_H
#define HYDROSTAKE_STAKING_ENGINE_H

#include "hydrostake/core/types.h"
#include "hydrostake/core/uint256.h"
#include "hydrostake/ledger/ledger.h"
#include "hydrostake/staking/errors.h"
#include "hydrostake/staking/events.h"
#include "hydrostake/staking/params.h"
#include "hydrostake/staking/types.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace hydrostake {
namespace staking {

/**
 * Staking engine.
 *
 * Every operation is serialized on an internal mutex. Value-moving
 * operations additionally hold a reentrancy latch across their ledger
 * calls: a ledger callback that re-enters any of them on the same thread
 * gets ReentrantCall. A rejected operation leaves state, balances and the
 * event log exactly as they were.
 *
 * Time is read from util::GetTime(), so mock time drives accrual in tests.
 */
class StakingEngine {
public:
    /**
     * @param self        Address the engine holds tokens under
     * @param owner       Initial administrator
     * @param stakeToken  Token users lock ("Hydro")
     * @param rewardToken Token rewards are paid in ("KVS"); the engine must be funded
     * @param gatingNft   Collection whose holders may stake
     *
     * Throws std::invalid_argument on a null ledger, null self address or
     * invalid params. The starting rate is params.maxRate.
     */
    StakingEngine(const Address& self, const Address& owner,
                  std::shared_ptr<ledger::ITokenLedger> stakeToken,
                  std::shared_ptr<ledger::ITokenLedger> rewardToken,
                  std::shared_ptr<ledger::INftOwnership> gatingNft,
                  const StakingParams& params = StakingParams());

    ~StakingEngine();

    StakingEngine(const StakingEngine&) = delete;
    StakingEngine& operator=(const StakingEngine&) = delete;

    // ========================================================================
    // User Operations
    // ========================================================================

    /**
     * Lock amount stake tokens pulled from caller (needs an allowance).
     *
     * An existing staker is first paid the reward accrued so far. A first
     * stake freezes the current rate for the caller and steps the global
     * rate down. If that payout fails the principal is returned; should the
     * return fail too, the principal is credited and the reward stays owed.
     */
    StakingResult Stake(const Address& caller, const Uint256& amount);

    /// Pay out all accrued reward, provided it is at least amount
    StakingResult WithdrawProfit(const Address& caller, const Uint256& amount);

    /// Pay the reward and move the whole stake into a withdrawal request
    StakingResult Exit(const Address& caller);

    /// Pay the reward and move amount of the stake into a withdrawal request
    StakingResult WithdrawFunds(const Address& caller, const Uint256& amount);

    /// Release matured principal to caller
    StakingResult ClaimHydro(const Address& caller);

    /**
     * Reward accrued by user since its checkpoint.
     *
     * Throws std::logic_error if user has nothing staked or the clock is
     * behind its checkpoint.
     */
    Uint256 CheckCurrentRewards(const Address& user) const;

    // ========================================================================
    // Administration (owner only)
    // ========================================================================

    StakingResult SetStakeActive(const Address& caller, bool active);

    /// Override the global rate; rate must fit in 64 bits
    StakingResult SetCurrentRate(const Address& caller, const Uint256& rate);

    /// Send amount of token held by the engine to the owner
    StakingResult Sweep(const Address& caller, ledger::ITokenLedger& token,
                        const Uint256& amount);

    StakingResult TransferOwnership(const Address& caller, const Address& newOwner);

    /// Leave the engine without an owner; administration is then closed
    StakingResult RenounceOwnership(const Address& caller);

    // ========================================================================
    // Views
    // ========================================================================

    const Address& GetAddress() const { return self_; }
    const StakingParams& GetParams() const { return params_; }

    Uint256 GetCurrentRate() const;
    Uint256 GetTotalStaked() const;
    bool IsStakeActive() const;
    Address GetOwner() const;

    /// Record of user; all-zero for unknown accounts
    UserRecord GetUser(const Address& user) const;

    /// Annual yield of the current rate in basis points
    Uint256 GetApy() const;

    /// Accounts with a positive stake
    size_t GetStakerCount() const;

    EventLog& GetEventLog() { return events_; }
    const EventLog& GetEventLog() const { return events_; }

    // ========================================================================
    // State Transfer
    // ========================================================================

    StateSnapshot ExportState() const;

    /**
     * Replace all state with snapshot.
     *
     * Returns false, leaving state unchanged, if the snapshot is internally
     * inconsistent (stakes not summing to totalStaked, values out of range,
     * duplicate accounts).
     */
    bool ImportState(const StateSnapshot& snapshot);

private:
    const UserRecord* FindUserLocked(const Address& user) const;

    /// Reward owed to rec at now
    Uint256 PendingRewardLocked(const UserRecord& rec, Timestamp now) const;

    bool IsOwnerLocked(const Address& caller) const;

    /// Log the rejection and build the result
    StakingResult Reject(const char* op, const Address& caller,
                         StakingError err, const std::string& msg) const;

    /// Ledger call wrappers; false on a false return or an exception
    bool SendTokens(ledger::ITokenLedger& token, const Address& to,
                    const Uint256& amount, std::string& failure);
    bool PullTokens(ledger::ITokenLedger& token, const Address& from,
                    const Uint256& amount, std::string& failure);

    /// Pay reward tokens to user; no ledger call for a zero amount
    bool PayReward(const Address& user, const Uint256& amount, std::string& failure);

    /// Keep a top-up whose reward payout and refund both failed; checkpoint stays put
    StakingResult CreditUnrefundedStake(const Address& caller, const Uint256& amount,
                                        const std::string& failure);

    /// Shared body of Exit and WithdrawFunds
    StakingResult RequestWithdrawal(const char* op, const Address& caller,
                                    const Uint256& amount, bool wholeStake);

    const Address self_;
    const StakingParams params_;
    std::shared_ptr<ledger::ITokenLedger> stakeToken_;
    std::shared_ptr<ledger::ITokenLedger> rewardToken_;
    std::shared_ptr<ledger::INftOwnership> gatingNft_;

    GlobalState state_;
    std::map<Address, UserRecord> users_;
    EventLog events_;

    bool inCall_{false};
    mutable std::recursive_mutex mutex_;
};

} // namespace staking
} // namespace hydrostake

#endif // HYDROSTAKE_STAKING_ENGINE_H
