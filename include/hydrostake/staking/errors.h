// HYDROSTAKE - Staking Errors
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#ifndef HYDROSTAKE_STAKING_ERRORS_H
#define HYDROSTAKE_STAKING_ERRORS_H

#include "hydrostake/core/uint256.h"

#include <string>

namespace hydrostake {
namespace staking {

/// Reasons a staking operation is rejected. Any non-OK result left state untouched.
enum class StakingError {
    OK = 0,

    // User-facing
    TransferFailed,      ///< A ledger call returned false or threw
    NotStaker,           ///< Caller has nothing staked
    InsufficientAmount,  ///< Requested more than the stake or accrued reward
    PendingRequest,      ///< A withdrawal request is already outstanding
    NoGatingNft,         ///< Caller holds none of the gating collection
    ZeroAmount,
    AmountOverflow,      ///< Result would exceed the field's bound
    WithdrawalNotReady,  ///< Release time not reached
    NoPendingRequest,

    // Gates
    StakingInactive,
    NotOwner,
    ReentrantCall,
    InvalidAddress,
};

const char* StakingErrorToString(StakingError err);

/**
 * Outcome of a staking operation.
 *
 * payout is what the operation sent to the caller: reward tokens for
 * Stake/WithdrawProfit/Exit/WithdrawFunds, stake tokens for ClaimHydro.
 */
struct StakingResult {
    StakingError error{StakingError::OK};
    std::string message;
    Uint256 payout;

    bool IsOk() const { return error == StakingError::OK; }
    explicit operator bool() const { return IsOk(); }

    static StakingResult Success(const Uint256& payout = Uint256()) {
        return {StakingError::OK, "", payout};
    }

    static StakingResult Error(StakingError err, const std::string& msg) {
        return {err, msg, Uint256()};
    }

    /// "OK" or "<error>: <message>"
    std::string ToString() const;
};

} // namespace staking
} // namespace hydrostake

#endif // HYDROSTAKE_STAKING_ERRORS_H
