// HYDROSTAKE - In-Memory Ledgers Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/ledger/memory_ledger.h"
#include "hydrostake/util/logging.h"

#include <stdexcept>

namespace hydrostake {
namespace ledger {

// ============================================================================
// MemoryTokenLedger
// ============================================================================

MemoryTokenLedger::MemoryTokenLedger(std::string symbol)
    : symbol_(std::move(symbol)) {}

bool MemoryTokenLedger::CheckFailure(const char* op) const {
    switch (failureMode_) {
        case FailureMode::None:
            return true;
        case FailureMode::ReturnFalse:
            LOG_DEBUG(util::LogCategory::LEDGER) << symbol_ << " " << op
                                                 << " rejected (forced failure)";
            return false;
        case FailureMode::Throw:
            throw std::runtime_error(symbol_ + " " + op + ": forced failure");
    }
    return false;
}

bool MemoryTokenLedger::MoveLocked(const Address& from, const Address& to,
                                   const Uint256& amount) {
    auto it = balances_.find(from);
    Uint256 available = (it == balances_.end()) ? Uint256() : it->second;
    if (available < amount) {
        return false;
    }
    if (amount.IsZero() || from == to) {
        return true;
    }
    it->second = available - amount;
    balances_[to] += amount;
    return true;
}

void MemoryTokenLedger::RunHook(const Address& from, const Address& to,
                                const Uint256& amount,
                                const std::optional<Address>& spender) {
    TransferHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = hook_;
    }
    if (!hook) {
        return;
    }

    try {
        hook(from, to, amount);
    } catch (...) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!MoveLocked(to, from, amount)) {
            LOG_ERROR(util::LogCategory::LEDGER) << symbol_
                << " hook failed and recipient no longer holds " << amount;
        }
        if (spender) {
            allowances_[{from, *spender}] += amount;
        }
        --transferCount_;
        throw;
    }
}

bool MemoryTokenLedger::Transfer(const Address& from, const Address& to,
                                 const Uint256& amount) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!CheckFailure("transfer")) {
            return false;
        }
        if (!MoveLocked(from, to, amount)) {
            LOG_DEBUG(util::LogCategory::LEDGER) << symbol_ << " transfer of " << amount
                                                 << " from " << from.ToString()
                                                 << " exceeds balance";
            return false;
        }
        ++transferCount_;
    }

    RunHook(from, to, amount, std::nullopt);
    return true;
}

bool MemoryTokenLedger::TransferFrom(const Address& spender, const Address& from,
                                     const Address& to, const Uint256& amount) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!CheckFailure("transferFrom")) {
            return false;
        }

        auto allowanceIt = allowances_.find({from, spender});
        Uint256 allowed = (allowanceIt == allowances_.end()) ? Uint256() : allowanceIt->second;
        if (allowed < amount) {
            LOG_DEBUG(util::LogCategory::LEDGER) << symbol_ << " transferFrom of " << amount
                                                 << " exceeds allowance " << allowed;
            return false;
        }
        if (!MoveLocked(from, to, amount)) {
            return false;
        }
        if (allowanceIt != allowances_.end()) {
            allowanceIt->second = allowed - amount;
        }
        ++transferCount_;
    }

    RunHook(from, to, amount, spender);
    return true;
}

Uint256 MemoryTokenLedger::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? Uint256() : it->second;
}

void MemoryTokenLedger::Mint(const Address& to, const Uint256& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    totalSupply_ += amount;
    balances_[to] += amount;
}

bool MemoryTokenLedger::Burn(const Address& from, const Uint256& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    totalSupply_ -= amount;
    return true;
}

void MemoryTokenLedger::Approve(const Address& owner, const Address& spender,
                                const Uint256& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    allowances_[{owner, spender}] = amount;
}

Uint256 MemoryTokenLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? Uint256() : it->second;
}

Uint256 MemoryTokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

void MemoryTokenLedger::SetTransferHook(TransferHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

void MemoryTokenLedger::SetFailureMode(FailureMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    failureMode_ = mode;
}

size_t MemoryTokenLedger::TransferCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferCount_;
}

// ============================================================================
// MemoryNftRegistry
// ============================================================================

uint64_t MemoryNftRegistry::BalanceOf(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(owner);
    return it == balances_.end() ? 0 : it->second;
}

uint64_t MemoryNftRegistry::Mint(const Address& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = nextTokenId_++;
    owners_[id] = owner;
    ++balances_[owner];
    return id;
}

bool MemoryNftRegistry::Transfer(const Address& from, const Address& to, uint64_t tokenId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(tokenId);
    if (it == owners_.end() || it->second != from) {
        return false;
    }
    it->second = to;
    --balances_[from];
    ++balances_[to];
    return true;
}

bool MemoryNftRegistry::Burn(const Address& owner, uint64_t tokenId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(tokenId);
    if (it == owners_.end() || it->second != owner) {
        return false;
    }
    owners_.erase(it);
    --balances_[owner];
    return true;
}

std::optional<Address> MemoryNftRegistry::OwnerOf(uint64_t tokenId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(tokenId);
    if (it == owners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MemoryNftRegistry::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.size();
}

} // namespace ledger
} // namespace hydrostake
