// HYDROSTAKE - Reward Arithmetic
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/staking/rewards.h"
#include "hydrostake/util/time.h"

#include <cctype>
#include <stdexcept>

namespace hydrostake {
namespace staking {

namespace {

Uint256 PowerOfTen(unsigned exponent) {
    Uint256 result(1);
    for (unsigned i = 0; i < exponent; ++i) {
        result *= Uint256(10);
    }
    return result;
}

} // namespace

int64_t ElapsedMinutes(Timestamp checkpoint, Timestamp now) {
    if (now < checkpoint) {
        throw std::logic_error("reward checkpoint " + std::to_string(checkpoint) +
                               " is in the future (now " + std::to_string(now) + ")");
    }
    return (now - checkpoint) / util::SECONDS_PER_MINUTE;
}

Uint256 CalculateReward(const Uint256& amount, const Uint256& ratePerMinute,
                        int64_t elapsedMinutes, const Uint256& divisor) {
    if (elapsedMinutes <= 0 || amount.IsZero() || ratePerMinute.IsZero()) {
        return Uint256();
    }
    Uint256 accrued = ratePerMinute * Uint256(static_cast<uint64_t>(elapsedMinutes));
    return accrued * amount / divisor;
}

Uint256 StepRate(const Uint256& current, bool exiting, const StakingParams& params) {
    if (exiting) {
        auto raised = Uint256::TryAdd(current, params.rateStep);
        if (!raised || *raised > params.maxRate) {
            return current > params.maxRate ? current : params.maxRate;
        }
        return *raised;
    }
    if (current < params.rateStep) {
        return Uint256();
    }
    return current - params.rateStep;
}

Uint256 CalculateApy(const Uint256& ratePerMinute, const StakingParams& params) {
    return ratePerMinute * params.apyScale / params.rewardDivisor;
}

// ============================================================================
// Display Helpers
// ============================================================================

std::string FormatTokenAmount(const Uint256& amount, unsigned decimals) {
    if (decimals == 0) {
        return amount.ToString();
    }

    Uint256 unit = PowerOfTen(decimals);
    Uint256 whole = amount / unit;
    Uint256 frac = amount % unit;

    std::string result = whole.ToString();
    if (frac.IsZero()) {
        return result;
    }

    std::string fracStr = frac.ToString();
    fracStr.insert(0, decimals - fracStr.size(), '0');
    size_t lastNonZero = fracStr.find_last_not_of('0');
    return result + "." + fracStr.substr(0, lastNonZero + 1);
}

Uint256 ParseTokenAmount(const std::string& str, unsigned decimals) {
    if (str.empty()) {
        throw std::invalid_argument("empty token amount");
    }

    size_t dot = str.find('.');
    std::string wholeStr = str.substr(0, dot);
    std::string fracStr = (dot == std::string::npos) ? "" : str.substr(dot + 1);

    if (wholeStr.empty() && fracStr.empty()) {
        throw std::invalid_argument("invalid token amount: " + str);
    }
    for (char c : wholeStr + fracStr) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("invalid token amount: " + str);
        }
    }
    if (fracStr.size() > decimals) {
        throw std::invalid_argument("token amount has more than " +
                                    std::to_string(decimals) + " decimals: " + str);
    }

    fracStr.append(decimals - fracStr.size(), '0');
    Uint256 whole = wholeStr.empty() ? Uint256() : Uint256::FromDecimal(wholeStr);
    Uint256 frac = fracStr.empty() ? Uint256() : Uint256::FromDecimal(fracStr);
    return whole * PowerOfTen(decimals) + frac;
}

std::string FormatBasisPoints(const Uint256& bps) {
    Uint256 whole = bps / Uint256(100);
    uint64_t cents = (bps % Uint256(100)).GetLow64();
    std::string result = whole.ToString() + ".";
    if (cents < 10) {
        result += "0";
    }
    return result + std::to_string(cents) + "%";
}

} // namespace staking
} // namespace hydrostake
