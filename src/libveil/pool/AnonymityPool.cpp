#include <libveil/pool/AnonymityPool.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

#include <limits>
#include <stdexcept>

namespace veil {

bool
stakesFit(Amount amount, std::size_t treeDepth)
{
    return amount <= (std::numeric_limits<Amount>::max() >> treeDepth);
}

AnonymityPool::AnonymityPool(
    PoolParams const& params,
    AccountID const& owner,
    AccountID const& account,
    TokenLedger& token,
    beast::Journal journal)
    : params_(params)
    , owner_(owner)
    , account_(account)
    , token_(token)
    , j_(journal)
{
    for (auto const amount : params_.tierAmounts)
    {
        if (amount == 0)
            ripple::Throw<std::invalid_argument>("Tier amount must be positive");
        if (!stakesFit(amount, params_.treeDepth))
            ripple::Throw<std::invalid_argument>(
                "Tier amount too large for tree depth");
    }

    tiers_.reserve(NUM_TIERS);
    for (std::size_t i = 0; i < NUM_TIERS; ++i)
        tiers_.emplace_back(params_.treeDepth);

    JLOG(j_.info()) << "Anonymity pool created, depth " << params_.treeDepth
                    << ", empty root " << tiers_[0].tree.root();
}

Expected<std::uint32_t>
AnonymityPool::deposit(
    AccountID const& depositor,
    uint256 const& commitment,
    PoolTier t,
    NetClock::time_point now)
{
    auto& tr = tier(t);

    if (commitment == tr.tree.emptyHash(0))
    {
        JLOG(j_.debug()) << "Deposit rejected: empty commitment";
        return Unexpected(Code::emptyCommitment);
    }

    if (tr.commitments.count(commitment))
    {
        JLOG(j_.debug()) << "Deposit rejected: duplicate commitment "
                         << commitment;
        return Unexpected(Code::duplicateCommitment);
    }

    if (tr.tree.full())
    {
        JLOG(j_.warn()) << "Deposit rejected: " << to_string(t)
                        << " tree is full";
        return Unexpected(Code::treeFull);
    }

    // Funds move before any local write so a failed transfer leaves the
    // tree untouched.
    if (!token_.transferFrom(account_, depositor, account_, getTierAmount(t)))
    {
        JLOG(j_.warn()) << "Deposit rejected: transfer of "
                        << getTierAmount(t) << " failed";
        return Unexpected(Code::transferFailed);
    }

    auto const leafIndex = static_cast<std::uint32_t>(tr.tree.append(commitment));
    tr.commitments.insert(commitment);

    events_.emit(Deposited{t, leafIndex, commitment, now});

    JLOG(j_.debug()) << "Deposit into " << to_string(t) << " tier at leaf "
                     << leafIndex << ", new root " << tr.tree.root();

    return leafIndex;
}

uint256
AnonymityPool::getMerkleRoot(PoolTier t) const
{
    return tier(t).tree.root();
}

std::uint32_t
AnonymityPool::getDepositCount(PoolTier t) const
{
    return static_cast<std::uint32_t>(tier(t).tree.size());
}

Expected<uint256>
AnonymityPool::getLeaf(PoolTier t, std::uint32_t index) const
{
    auto const& tr = tier(t);
    if (index >= tr.tree.size())
        return Unexpected(Code::unknownLeaf);
    return tr.tree.leaf(index);
}

Amount
AnonymityPool::getTierAmount(PoolTier t) const
{
    return params_.tierAmounts[tierIndex(t)];
}

Expected<std::vector<uint256>>
AnonymityPool::getAuthPath(PoolTier t, std::uint32_t index) const
{
    auto const& tr = tier(t);
    if (index >= tr.tree.size())
        return Unexpected(Code::unknownLeaf);
    return tr.tree.authPath(index);
}

bool
AnonymityPool::isNullifierUsed(uint256 const& nullifier) const
{
    return nullifiers_.contains(nullifier);
}

Expected<void>
AnonymityPool::useNullifier(AccountID const& caller, uint256 const& nullifier)
{
    if (!isAuthorized(caller))
    {
        JLOG(j_.warn()) << "Nullifier use by unauthorized caller "
                        << ripple::toBase58(caller);
        return Unexpected(Code::notAuthorized);
    }

    if (auto const r = nullifiers_.consume(nullifier); !r)
    {
        JLOG(j_.warn()) << "Nullifier reuse: " << nullifier;
        return Unexpected(r.error());
    }

    events_.emit(NullifierUsed{nullifier});
    return {};
}

Expected<void>
AnonymityPool::releaseStake(
    AccountID const& caller,
    uint256 const& nullifier,
    PoolTier t)
{
    if (!isAuthorized(caller))
    {
        JLOG(j_.warn()) << "Stake release to unauthorized caller "
                        << ripple::toBase58(caller);
        return Unexpected(Code::notAuthorized);
    }

    if (nullifiers_.contains(nullifier))
    {
        JLOG(j_.warn()) << "Nullifier reuse: " << nullifier;
        return Unexpected(Code::nullifierUsed);
    }

    auto const amount = getTierAmount(t);
    if (!token_.transfer(account_, caller, amount))
    {
        JLOG(j_.warn()) << "Stake release of " << amount << " to "
                        << ripple::toBase58(caller) << " failed";
        return Unexpected(Code::transferFailed);
    }

    // Checked above; cannot fail.
    if (auto const r = nullifiers_.consume(nullifier); !r)
        return Unexpected(r.error());

    events_.emit(NullifierUsed{nullifier});
    events_.emit(StakeReleased{caller, t, amount});

    JLOG(j_.debug()) << "Released " << amount << " from " << to_string(t)
                     << " tier to " << ripple::toBase58(caller);
    return {};
}

Expected<void>
AnonymityPool::authorizeMarket(AccountID const& caller, AccountID const& market)
{
    if (caller != owner_)
        return Unexpected(Code::notOwner);

    if (authorized_.insert(market).second)
    {
        events_.emit(MarketAuthorized{market});
        JLOG(j_.info()) << "Market authorized: " << ripple::toBase58(market);
    }
    return {};
}

Expected<void>
AnonymityPool::revokeMarket(AccountID const& caller, AccountID const& market)
{
    if (caller != owner_)
        return Unexpected(Code::notOwner);

    if (authorized_.erase(market))
    {
        events_.emit(MarketRevoked{market});
        JLOG(j_.info()) << "Market revoked: " << ripple::toBase58(market);
    }
    return {};
}

bool
AnonymityPool::isAuthorized(AccountID const& market) const
{
    return authorized_.count(market) != 0;
}

}  // namespace veil
