#include <libveil/token/MemoryTokenLedger.h>

namespace veil {

bool
MemoryTokenLedger::move(AccountID const& from, AccountID const& to, Amount amount)
{
    if (failing_)
        return false;

    auto const it = balances_.find(from);
    if (it == balances_.end() || it->second < amount)
        return false;

    it->second -= amount;
    balances_[to] += amount;
    return true;
}

bool
MemoryTokenLedger::transfer(
    AccountID const& from,
    AccountID const& to,
    Amount amount)
{
    return move(from, to, amount);
}

bool
MemoryTokenLedger::transferFrom(
    AccountID const& spender,
    AccountID const& from,
    AccountID const& to,
    Amount amount)
{
    if (failing_)
        return false;

    auto const it = allowances_.find({from, spender});
    if (it == allowances_.end() || it->second < amount)
        return false;

    if (!move(from, to, amount))
        return false;

    it->second -= amount;
    return true;
}

void
MemoryTokenLedger::mint(AccountID const& to, Amount amount)
{
    balances_[to] += amount;
}

void
MemoryTokenLedger::approve(
    AccountID const& owner,
    AccountID const& spender,
    Amount amount)
{
    allowances_[{owner, spender}] = amount;
}

Amount
MemoryTokenLedger::balanceOf(AccountID const& account) const
{
    auto const it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount
MemoryTokenLedger::allowance(AccountID const& owner, AccountID const& spender)
    const
{
    auto const it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

}  // namespace veil
