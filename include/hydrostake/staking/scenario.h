// HYDROSTAKE - Deploy-and-Stake Scenario
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#ifndef HYDROSTAKE_STAKING_SCENARIO_H
#define HYDROSTAKE_STAKING_SCENARIO_H

#include "hydrostake/core/types.h"
#include "hydrostake/core/uint256.h"
#include "hydrostake/staking/params.h"
#include "hydrostake/staking/types.h"
#include "hydrostake/util/time.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace hydrostake {
namespace staking {

/// Longest run whose duration still fits util::Seconds
constexpr int64_t MAX_SCENARIO_MINUTES =
    std::numeric_limits<int64_t>::max() / util::SECONDS_PER_MINUTE;

/// Fixed scenario accounts
extern const Address SCENARIO_DEPLOYER;
extern const Address SCENARIO_HOLDER;
extern const Address SCENARIO_ENGINE;

struct ScenarioConfig {
    Uint256 stake;
    int64_t minutes{60};
    StakingParams params;
};

/// Outcome of RunScenario; the figures are only meaningful on success
struct ScenarioReport {
    bool success{false};
    std::string error;

    Uint256 staked;
    Uint256 reward;
    Uint256 frozenRate;
    Uint256 currentRate;
    Uint256 apy;
    Uint256 totalStaked;
    size_t events{0};
    StateSnapshot snapshot;
};

/**
 * Deploy in-memory HYDRO, KVS and NFT ledgers plus an engine, fund the
 * holder and the reward pool, stake config.stake for the holder and advance
 * the clock config.minutes.
 *
 * Runs on the mock clock. If mock time was off it is switched on for the
 * run and off again afterwards.
 */
ScenarioReport RunScenario(const ScenarioConfig& config);

} // namespace staking
} // namespace hydrostake

#endif // HYDROSTAKE_STAKING_SCENARIO_H
