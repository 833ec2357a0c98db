// HYDROSTAKE - Staking Errors
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/staking/errors.h"

namespace hydrostake {
namespace staking {

const char* StakingErrorToString(StakingError err) {
    switch (err) {
        case StakingError::OK: return "OK";
        case StakingError::TransferFailed: return "TransferFailed";
        case StakingError::NotStaker: return "NotStaker";
        case StakingError::InsufficientAmount: return "InsufficientAmount";
        case StakingError::PendingRequest: return "PendingRequest";
        case StakingError::NoGatingNft: return "NoGatingNft";
        case StakingError::ZeroAmount: return "ZeroAmount";
        case StakingError::AmountOverflow: return "AmountOverflow";
        case StakingError::WithdrawalNotReady: return "WithdrawalNotReady";
        case StakingError::NoPendingRequest: return "NoPendingRequest";
        case StakingError::StakingInactive: return "StakingInactive";
        case StakingError::NotOwner: return "NotOwner";
        case StakingError::ReentrantCall: return "ReentrantCall";
        case StakingError::InvalidAddress: return "InvalidAddress";
    }
    return "Unknown";
}

std::string StakingResult::ToString() const {
    if (IsOk()) {
        return "OK";
    }
    std::string out = StakingErrorToString(error);
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

} // namespace staking
} // namespace hydrostake
