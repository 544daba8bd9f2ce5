#pragma once

#include <libveil/token/TokenLedger.h>

#include <map>
#include <utility>

namespace veil {

/** TokenLedger kept in process memory. */
class MemoryTokenLedger : public TokenLedger
{
public:
    bool
    transfer(AccountID const& from, AccountID const& to, Amount amount)
        override;

    bool
    transferFrom(
        AccountID const& spender,
        AccountID const& from,
        AccountID const& to,
        Amount amount) override;

    void
    mint(AccountID const& to, Amount amount);

    void
    approve(AccountID const& owner, AccountID const& spender, Amount amount);

    Amount
    balanceOf(AccountID const& account) const;

    Amount
    allowance(AccountID const& owner, AccountID const& spender) const;

    // While set, every transfer reports failure without moving funds.
    void
    setFailing(bool failing)
    {
        failing_ = failing;
    }

private:
    std::map<AccountID, Amount> balances_;
    std::map<std::pair<AccountID, AccountID>, Amount> allowances_;
    bool failing_ = false;

    bool
    move(AccountID const& from, AccountID const& to, Amount amount);
};

}  // namespace veil
