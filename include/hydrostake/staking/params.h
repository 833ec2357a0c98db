// HYDROSTAKE - Staking Parameters
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#ifndef HYDROSTAKE_STAKING_PARAMS_H
#define HYDROSTAKE_STAKING_PARAMS_H

#include "hydrostake/core/uint256.h"
#include "hydrostake/util/config.h"
#include "hydrostake/util/time.h"

#include <cstdint>
#include <optional>
#include <string>

namespace hydrostake {
namespace staking {

// ============================================================================
// Staking Constants
// ============================================================================

/// Ceiling of the per-minute rate: 20% simple annual, scaled by 1e18
constexpr uint64_t DEFAULT_MAX_RATE = 380517503805ULL;

/// Rate change per staker entering or leaving (MAX_RATE / 100)
constexpr uint64_t DEFAULT_RATE_STEP = 3805175038ULL;

/// Fixed-point scale of the rate
constexpr uint64_t DEFAULT_REWARD_DIVISOR = 1000000000000000000ULL;

/// Minutes per year times basis points per unit
constexpr uint64_t DEFAULT_APY_SCALE = 525600ULL * 10000ULL;

/// Principal is claimable this long after a withdrawal request
constexpr int64_t DEFAULT_WITHDRAWAL_DELAY = util::SECONDS_PER_WEEK;

/// Staked amounts are bounded to 128 bits
constexpr unsigned MAX_STAKE_AMOUNT_BITS = 128;

/// Rates (global and per-user) are bounded to 64 bits
constexpr unsigned MAX_RATE_VALUE_BITS = 64;

/// Base units per whole token
constexpr unsigned TOKEN_DECIMALS = 18;

// ============================================================================
// Parameters
// ============================================================================

/// Engine parameters, fixed at construction
struct StakingParams {
    Uint256 maxRate{DEFAULT_MAX_RATE};
    Uint256 rateStep{DEFAULT_RATE_STEP};
    Uint256 rewardDivisor{DEFAULT_REWARD_DIVISOR};
    Uint256 apyScale{DEFAULT_APY_SCALE};
    int64_t withdrawalDelay{DEFAULT_WITHDRAWAL_DELAY};

    /// Initial state of the staking gate
    bool stakeActive{true};

    /// Description of the first violated constraint, if any
    std::optional<std::string> Validate() const;
};

/**
 * Read the [staking] section of a configuration.
 *
 * Missing keys keep their defaults. Unknown keys, malformed numbers and
 * values failing StakingParams::Validate() produce an error result.
 */
util::ConfigParseResult LoadStakingParams(const util::ConfigManager& config,
                                          StakingParams& params);

} // namespace staking
} // namespace hydrostake

#endif // HYDROSTAKE_STAKING_PARAMS_H
