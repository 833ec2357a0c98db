// HYDROSTAKE - Ledger Interfaces
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Narrow views of the external contracts the staking engine talks to: a
// fungible token ledger and an NFT ownership oracle. The caller is always
// passed explicitly.

#ifndef HYDROSTAKE_LEDGER_LEDGER_H
#define HYDROSTAKE_LEDGER_LEDGER_H

#include "hydrostake/core/types.h"
#include "hydrostake/core/uint256.h"

#include <cstdint>
#include <string>

namespace hydrostake {
namespace ledger {

/**
 * Fungible token ledger.
 *
 * A false return or an exception from Transfer/TransferFrom means nothing
 * moved.
 */
class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    /// Ticker used in log lines
    virtual std::string Symbol() const = 0;

    /// Move amount from the caller's own balance
    virtual bool Transfer(const Address& from, const Address& to,
                          const Uint256& amount) = 0;

    /// Move amount from 'from' using the allowance granted to 'spender'
    virtual bool TransferFrom(const Address& spender, const Address& from,
                              const Address& to, const Uint256& amount) = 0;

    virtual Uint256 BalanceOf(const Address& account) const = 0;
};

/// Answers "how many tokens of the collection does this account hold"
class INftOwnership {
public:
    virtual ~INftOwnership() = default;

    virtual uint64_t BalanceOf(const Address& owner) const = 0;
};

} // namespace ledger
} // namespace hydrostake

#endif // HYDROSTAKE_LEDGER_LEDGER_H
