// HYDROSTAKE - Staking State Types
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#ifndef HYDROSTAKE_STAKING_TYPES_H
#define HYDROSTAKE_STAKING_TYPES_H

#include "hydrostake/core/serialize.h"
#include "hydrostake/core/types.h"
#include "hydrostake/core/uint256.h"

#include <string>
#include <utility>
#include <vector>

namespace hydrostake {
namespace staking {

/// Largest stake a single account may hold (2^128 - 1)
Uint256 MaxStakeAmount();

/// Largest rate value (2^64 - 1)
Uint256 MaxRateValue();

// ============================================================================
// Per-User Records
// ============================================================================

/// Principal waiting out the withdrawal delay
struct WithdrawalRequest {
    Uint256 amount;
    bool pending{false};
    Timestamp releaseAt{0};

    bool IsMature(Timestamp now) const { return pending && now >= releaseAt; }

    void Clear() {
        amount = Uint256();
        pending = false;
        releaseAt = 0;
    }

    bool operator==(const WithdrawalRequest& other) const {
        return amount == other.amount && pending == other.pending &&
               releaseAt == other.releaseAt;
    }
};

/**
 * Staking record of one account.
 *
 * ratePerMinute is frozen when the account goes from zero to a positive
 * stake and is kept until it next reaches zero and stakes again.
 */
struct UserRecord {
    Uint256 amount;
    Timestamp checkpoint{0};
    Uint256 ratePerMinute;
    WithdrawalRequest withdrawal;

    bool IsStaker() const { return !amount.IsZero(); }

    /// Nothing staked and nothing owed
    bool IsEmpty() const { return amount.IsZero() && !withdrawal.pending; }

    bool operator==(const UserRecord& other) const {
        return amount == other.amount && checkpoint == other.checkpoint &&
               ratePerMinute == other.ratePerMinute && withdrawal == other.withdrawal;
    }

    std::string ToString() const;
};

// ============================================================================
// Global State
// ============================================================================

struct GlobalState {
    Uint256 currentRate;
    Uint256 totalStaked;
    bool stakeActive{true};
    Address owner;

    bool operator==(const GlobalState& other) const {
        return currentRate == other.currentRate && totalStaked == other.totalStaked &&
               stakeActive == other.stakeActive && owner == other.owner;
    }
};

/// Full engine state, users ordered by address
struct StateSnapshot {
    GlobalState global;
    std::vector<std::pair<Address, UserRecord>> users;
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const WithdrawalRequest& req) {
    using hydrostake::Serialize;
    Serialize(s, req.amount);
    Serialize(s, req.pending);
    Serialize(s, req.releaseAt);
}

template<typename Stream>
void Unserialize(Stream& s, WithdrawalRequest& req) {
    using hydrostake::Unserialize;
    Unserialize(s, req.amount);
    Unserialize(s, req.pending);
    Unserialize(s, req.releaseAt);
}

template<typename Stream>
void Serialize(Stream& s, const UserRecord& rec) {
    using hydrostake::Serialize;
    Serialize(s, rec.amount);
    Serialize(s, rec.checkpoint);
    Serialize(s, rec.ratePerMinute);
    Serialize(s, rec.withdrawal);
}

template<typename Stream>
void Unserialize(Stream& s, UserRecord& rec) {
    using hydrostake::Unserialize;
    Unserialize(s, rec.amount);
    Unserialize(s, rec.checkpoint);
    Unserialize(s, rec.ratePerMinute);
    Unserialize(s, rec.withdrawal);
}

template<typename Stream>
void Serialize(Stream& s, const GlobalState& state) {
    using hydrostake::Serialize;
    Serialize(s, state.currentRate);
    Serialize(s, state.totalStaked);
    Serialize(s, state.stakeActive);
    Serialize(s, state.owner);
}

template<typename Stream>
void Unserialize(Stream& s, GlobalState& state) {
    using hydrostake::Unserialize;
    Unserialize(s, state.currentRate);
    Unserialize(s, state.totalStaked);
    Unserialize(s, state.stakeActive);
    Unserialize(s, state.owner);
}

} // namespace staking
} // namespace hydrostake

#endif // HYDROSTAKE_STAKING_TYPES_H
