// HYDROSTAKE - Staking Events
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/staking/events.h"
#include "hydrostake/crypto/digest.h"
#include "hydrostake/util/time.h"

#include <sstream>

namespace hydrostake {
namespace staking {

const char* EventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::Staked: return "Staked";
        case EventKind::RewardPaid: return "RewardPaid";
        case EventKind::WithdrawalRequested: return "WithdrawalRequested";
        case EventKind::HydroClaimed: return "HydroClaimed";
        case EventKind::RateSynced: return "RateSynced";
        case EventKind::StakingToggled: return "StakingToggled";
        case EventKind::RateOverridden: return "RateOverridden";
        case EventKind::TokensSwept: return "TokensSwept";
        case EventKind::OwnershipTransferred: return "OwnershipTransferred";
    }
    return "Unknown";
}

const char* EventSignature(EventKind kind) {
    switch (kind) {
        case EventKind::Staked: return "Staked(address,uint256)";
        case EventKind::RewardPaid: return "RewardPaid(address,uint256)";
        case EventKind::WithdrawalRequested: return "WithdrawalRequested(address,uint256,uint256)";
        case EventKind::HydroClaimed: return "HydroClaimed(address,uint256)";
        case EventKind::RateSynced: return "RateSynced(uint256,uint256)";
        case EventKind::StakingToggled: return "StakingToggled(bool)";
        case EventKind::RateOverridden: return "RateOverridden(uint256,uint256)";
        case EventKind::TokensSwept: return "TokensSwept(address,uint256)";
        case EventKind::OwnershipTransferred: return "OwnershipTransferred(address,address)";
    }
    return "";
}

Hash256 EventTopic(EventKind kind) {
    return crypto::SHA256Hash(std::string(EventSignature(kind)));
}

std::string StakingEvent::ToString() const {
    std::ostringstream ss;
    ss << "#" << sequence << " " << EventKindToString(kind)
       << " account=" << account.ToString()
       << " value=" << value;
    if (!extra.IsZero()) {
        ss << " extra=" << extra;
    }
    if (!counterparty.IsNull()) {
        ss << " counterparty=" << counterparty.ToString();
    }
    ss << " at " << util::FormatISO8601(timestamp);
    return ss.str();
}

uint64_t EventLog::Emit(EventKind kind, const Address& account, const Uint256& value,
                        const Uint256& extra, Timestamp timestamp,
                        const Address& counterparty) {
    StakingEvent event;
    event.kind = kind;
    event.topic = EventTopic(kind);
    event.account = account;
    event.counterparty = counterparty;
    event.value = value;
    event.extra = extra;
    event.timestamp = timestamp;

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.sequence = nextSequence_++;
        events_.push_back(event);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        listener(event);
    }
    return event.sequence;
}

EventLog::ListenerId EventLog::Subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = nextListenerId_++;
    listeners_[id] = std::move(listener);
    return id;
}

bool EventLog::Unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(id) > 0;
}

std::vector<StakingEvent> EventLog::GetEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<StakingEvent> EventLog::GetEvents(EventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StakingEvent> result;
    for (const auto& event : events_) {
        if (event.kind == kind) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<StakingEvent> EventLog::GetEventsFor(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StakingEvent> result;
    for (const auto& event : events_) {
        if (event.account == account) {
            result.push_back(event);
        }
    }
    return result;
}

size_t EventLog::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void EventLog::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

} // namespace staking
} // namespace hydrostake
