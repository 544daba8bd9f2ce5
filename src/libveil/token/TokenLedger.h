#pragma once

#include <libveil/basics/Types.h>

namespace veil {

/**
 * Fungible token the pool and markets move stakes with.
 *
 * Calls follow ERC-20 semantics: transfer moves the caller's own funds,
 * transferFrom spends an allowance granted by the owner. A false return
 * means nothing moved; callers treat it as fatal.
 */
class TokenLedger
{
public:
    virtual ~TokenLedger() = default;

    virtual bool
    transfer(AccountID const& from, AccountID const& to, Amount amount) = 0;

    virtual bool
    transferFrom(
        AccountID const& spender,
        AccountID const& from,
        AccountID const& to,
        Amount amount) = 0;
};

}  // namespace veil
