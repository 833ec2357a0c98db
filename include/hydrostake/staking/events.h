// HYDROSTAKE - Staking Events
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Append-only record of committed state changes. Each event carries a topic
// derived from its signature string so off-process consumers can filter on it.

#ifndef HYDROSTAKE_STAKING_EVENTS_H
#define HYDROSTAKE_STAKING_EVENTS_H

#include "hydrostake/core/types.h"
#include "hydrostake/core/uint256.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hydrostake {
namespace staking {

enum class EventKind {
    Staked,               ///< account, value = amount, extra = resulting stake
    RewardPaid,           ///< account, value = reward
    WithdrawalRequested,  ///< account, value = amount, extra = release time
    HydroClaimed,         ///< account, value = amount
    RateSynced,           ///< account = trigger, value = new rate, extra = old rate
    StakingToggled,       ///< account = owner, value = 1 if active
    RateOverridden,       ///< account = owner, value = new rate, extra = old rate
    TokensSwept,          ///< account = owner, value = amount
    OwnershipTransferred  ///< account = new owner, counterparty = previous owner
};

const char* EventKindToString(EventKind kind);

/// Canonical signature, e.g. "Staked(address,uint256)"
const char* EventSignature(EventKind kind);

/// SHA-256 of the signature
Hash256 EventTopic(EventKind kind);

struct StakingEvent {
    EventKind kind{EventKind::Staked};
    Hash256 topic;
    Address account;
    Address counterparty;
    Uint256 value;
    Uint256 extra;
    Timestamp timestamp{0};
    uint64_t sequence{0};

    std::string ToString() const;
};

/**
 * Thread-safe event sink.
 *
 * Listeners are called synchronously, in subscription order, after the
 * event has been appended.
 */
class EventLog {
public:
    using Listener = std::function<void(const StakingEvent&)>;
    using ListenerId = uint64_t;

    EventLog() = default;

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    /// Append an event and notify listeners; returns its sequence number
    uint64_t Emit(EventKind kind, const Address& account, const Uint256& value,
                  const Uint256& extra, Timestamp timestamp,
                  const Address& counterparty = Address());

    ListenerId Subscribe(Listener listener);
    bool Unsubscribe(ListenerId id);

    std::vector<StakingEvent> GetEvents() const;
    std::vector<StakingEvent> GetEvents(EventKind kind) const;
    std::vector<StakingEvent> GetEventsFor(const Address& account) const;

    size_t Size() const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::vector<StakingEvent> events_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId nextListenerId_{1};
    uint64_t nextSequence_{0};
};

} // namespace staking
} // namespace hydrostake

#endif // HYDROSTAKE_STAKING_EVENTS_H
