// HYDROSTAKE - In-Memory Ledgers
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Reference token and NFT ledgers held in process memory. They host the
// engine in the simulator and in tests.

#ifndef HYDROSTAKE_LEDGER_MEMORY_LEDGER_H
#define HYDROSTAKE_LEDGER_MEMORY_LEDGER_H

#include "hydrostake/ledger/ledger.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace hydrostake {
namespace ledger {

// ============================================================================
// Token Ledger
// ============================================================================

/// How forced transfer failures surface
enum class FailureMode {
    None,         ///< Transfers behave normally
    ReturnFalse,  ///< Every transfer returns false
    Throw         ///< Every transfer throws std::runtime_error
};

/**
 * Mintable token with balances and allowances.
 *
 * After a successful movement the transfer hook (if any) is invoked with the
 * ledger unlocked, so it may call back into the ledger or into whoever
 * initiated the transfer. An exception escaping the hook undoes the movement
 * and is rethrown.
 */
class MemoryTokenLedger : public ITokenLedger {
public:
    using TransferHook = std::function<void(const Address& from, const Address& to,
                                            const Uint256& amount)>;

    explicit MemoryTokenLedger(std::string symbol);

    std::string Symbol() const override { return symbol_; }

    bool Transfer(const Address& from, const Address& to,
                  const Uint256& amount) override;

    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, const Uint256& amount) override;

    Uint256 BalanceOf(const Address& account) const override;

    // ========================================================================
    // Token Administration
    // ========================================================================

    /// Create new supply; throws std::overflow_error past 2^256 - 1
    void Mint(const Address& to, const Uint256& amount);

    /// Destroy supply; false if the balance is too small
    bool Burn(const Address& from, const Uint256& amount);

    /// Set (not add to) the spender's allowance over owner's balance
    void Approve(const Address& owner, const Address& spender, const Uint256& amount);

    Uint256 Allowance(const Address& owner, const Address& spender) const;

    Uint256 TotalSupply() const;

    // ========================================================================
    // Test Controls
    // ========================================================================

    void SetTransferHook(TransferHook hook);

    void SetFailureMode(FailureMode mode);

    /// Number of successful movements so far
    size_t TransferCount() const;

private:
    /// Moves balance under the lock; false if 'from' cannot cover amount
    bool MoveLocked(const Address& from, const Address& to, const Uint256& amount);

    /// Shared tail of Transfer/TransferFrom: hook, rollback on throw
    void RunHook(const Address& from, const Address& to, const Uint256& amount,
                 const std::optional<Address>& spender);

    bool CheckFailure(const char* op) const;

    std::string symbol_;
    std::unordered_map<Address, Uint256, AddressHasher> balances_;
    std::map<std::pair<Address, Address>, Uint256> allowances_;
    Uint256 totalSupply_;
    TransferHook hook_;
    FailureMode failureMode_{FailureMode::None};
    size_t transferCount_{0};
    mutable std::mutex mutex_;
};

// ============================================================================
// NFT Registry
// ============================================================================

/// Sequentially numbered NFT collection
class MemoryNftRegistry : public INftOwnership {
public:
    MemoryNftRegistry() = default;

    uint64_t BalanceOf(const Address& owner) const override;

    /// Mint the next token id to owner and return it
    uint64_t Mint(const Address& owner);

    /// False unless 'from' currently owns tokenId
    bool Transfer(const Address& from, const Address& to, uint64_t tokenId);

    /// False unless 'owner' currently owns tokenId
    bool Burn(const Address& owner, uint64_t tokenId);

    std::optional<Address> OwnerOf(uint64_t tokenId) const;

    size_t TotalSupply() const;

private:
    std::map<uint64_t, Address> owners_;
    std::unordered_map<Address, uint64_t, AddressHasher> balances_;
    uint64_t nextTokenId_{1};
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace hydrostake

#endif // HYDROSTAKE_LEDGER_MEMORY_LEDGER_H
