// HYDROSTAKE - Reward Arithmetic
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Pure functions behind the engine's reward and rate bookkeeping.

#ifndef HYDROSTAKE_STAKING_REWARDS_H
#define HYDROSTAKE_STAKING_REWARDS_H

#include "hydrostake/core/types.h"
#include "hydrostake/core/uint256.h"
#include "hydrostake/staking/params.h"

#include <cstdint>
#include <string>

namespace hydrostake {
namespace staking {

/// Whole minutes from checkpoint to now; throws std::logic_error if now < checkpoint
int64_t ElapsedMinutes(Timestamp checkpoint, Timestamp now);

/**
 * Simple-interest reward: rate * minutes * amount / divisor, rounded down.
 *
 * Throws std::overflow_error if the product does not fit in 256 bits and
 * std::domain_error on a zero divisor.
 */
Uint256 CalculateReward(const Uint256& amount, const Uint256& ratePerMinute,
                        int64_t elapsedMinutes, const Uint256& divisor);

/**
 * Rate after one staker enters (exiting = false) or leaves (exiting = true).
 *
 * Entering lowers the rate by one step, saturating at zero. Leaving raises
 * it by one step, saturating at params.maxRate.
 */
Uint256 StepRate(const Uint256& current, bool exiting, const StakingParams& params);

/// Annual yield in basis points for a per-minute rate
Uint256 CalculateApy(const Uint256& ratePerMinute, const StakingParams& params);

// ============================================================================
// Display Helpers
// ============================================================================

/// Base units to a decimal string, trailing zeros trimmed ("1.5", "2000")
std::string FormatTokenAmount(const Uint256& amount, unsigned decimals = TOKEN_DECIMALS);

/// Decimal string ("1.5") to base units; throws std::invalid_argument or std::overflow_error
Uint256 ParseTokenAmount(const std::string& str, unsigned decimals = TOKEN_DECIMALS);

/// Basis points as a percentage ("20.00%")
std::string FormatBasisPoints(const Uint256& bps);

} // namespace staking
} // namespace hydrostake

#endif // HYDROSTAKE_STAKING_REWARDS_H
