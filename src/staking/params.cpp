// HYDROSTAKE - Staking Parameters
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/staking/params.h"
#include "hydrostake/util/logging.h"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace hydrostake {
namespace staking {

namespace {

constexpr const char* KEY_MAX_RATE = "max_rate";
constexpr const char* KEY_RATE_STEP = "rate_step";
constexpr const char* KEY_REWARD_DIVISOR = "reward_divisor";
constexpr const char* KEY_APY_SCALE = "apy_scale";
constexpr const char* KEY_WITHDRAWAL_DELAY = "withdrawal_delay";
constexpr const char* KEY_STAKE_ACTIVE = "stake_active";

const std::array<const char*, 6> KNOWN_KEYS = {
    KEY_MAX_RATE, KEY_RATE_STEP, KEY_REWARD_DIVISOR,
    KEY_APY_SCALE, KEY_WITHDRAWAL_DELAY, KEY_STAKE_ACTIVE,
};

/// Parse a decimal Uint256 value if the key is present
bool ReadAmount(const util::ConfigManager& config, const char* key,
                Uint256& out, std::string& error) {
    auto value = config.TryGetString(key, util::ConfigKeys::STAKING_SECTION);
    if (!value) {
        return true;
    }
    try {
        out = Uint256::FromDecimal(*value);
    } catch (const std::exception& e) {
        error = std::string("staking.") + key + ": " + e.what();
        return false;
    }
    return true;
}

} // namespace

std::optional<std::string> StakingParams::Validate() const {
    if (maxRate.IsZero()) {
        return std::string("max_rate must be positive");
    }
    if (!maxRate.FitsInBits(MAX_RATE_VALUE_BITS)) {
        return std::string("max_rate exceeds 64 bits");
    }
    if (rateStep > maxRate) {
        return std::string("rate_step exceeds max_rate");
    }
    if (rewardDivisor.IsZero()) {
        return std::string("reward_divisor must be positive");
    }
    if (apyScale.IsZero()) {
        return std::string("apy_scale must be positive");
    }
    if (withdrawalDelay < 0) {
        return std::string("withdrawal_delay must not be negative");
    }
    return std::nullopt;
}

util::ConfigParseResult LoadStakingParams(const util::ConfigManager& config,
                                          StakingParams& params) {
    const std::string section = util::ConfigKeys::STAKING_SECTION;

    for (const auto& key : config.GetKeys(section)) {
        bool known = std::any_of(KNOWN_KEYS.begin(), KNOWN_KEYS.end(),
                                 [&](const char* k) { return key == k; });
        if (!known) {
            return util::ConfigParseResult::Error("unknown key in [staking]: " + key);
        }
    }

    StakingParams loaded = params;
    std::string error;
    if (!ReadAmount(config, KEY_MAX_RATE, loaded.maxRate, error) ||
        !ReadAmount(config, KEY_RATE_STEP, loaded.rateStep, error) ||
        !ReadAmount(config, KEY_REWARD_DIVISOR, loaded.rewardDivisor, error) ||
        !ReadAmount(config, KEY_APY_SCALE, loaded.apyScale, error)) {
        return util::ConfigParseResult::Error(error);
    }

    if (config.HasKey(KEY_WITHDRAWAL_DELAY, section)) {
        auto delay = config.TryGetInt(KEY_WITHDRAWAL_DELAY, section);
        if (!delay) {
            return util::ConfigParseResult::Error(
                "staking.withdrawal_delay: not an integer");
        }
        loaded.withdrawalDelay = *delay;
    }

    if (config.HasKey(KEY_STAKE_ACTIVE, section)) {
        auto active = config.TryGetBool(KEY_STAKE_ACTIVE, section);
        if (!active) {
            return util::ConfigParseResult::Error(
                "staking.stake_active: not a boolean");
        }
        loaded.stakeActive = *active;
    }

    if (auto problem = loaded.Validate()) {
        return util::ConfigParseResult::Error("invalid staking parameters: " + *problem);
    }

    params = loaded;
    LOG_DEBUG(util::LogCategory::CONFIG) << "Staking parameters: max_rate=" << params.maxRate
                                         << " rate_step=" << params.rateStep
                                         << " withdrawal_delay=" << params.withdrawalDelay;
    return util::ConfigParseResult::Success();
}

} // namespace staking
} // namespace hydrostake
