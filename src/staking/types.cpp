// HYDROSTAKE - Staking State Types
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/staking/types.h"
#include "hydrostake/staking/params.h"

#include <sstream>

namespace hydrostake {
namespace staking {

Uint256 MaxStakeAmount() {
    static const Uint256 max = Uint256::MaxForBits(MAX_STAKE_AMOUNT_BITS);
    return max;
}

Uint256 MaxRateValue() {
    static const Uint256 max = Uint256::MaxForBits(MAX_RATE_VALUE_BITS);
    return max;
}

std::string UserRecord::ToString() const {
    std::ostringstream ss;
    ss << "UserRecord(amount=" << amount
       << ", checkpoint=" << checkpoint
       << ", rate=" << ratePerMinute;
    if (withdrawal.pending) {
        ss << ", pending=" << withdrawal.amount << "@" << withdrawal.releaseAt;
    }
    ss << ")";
    return ss.str();
}

} // namespace staking
} // namespace hydrostake
