#pragma once

#include <libveil/basics/Code.h>
#include <libveil/basics/EventLog.h>
#include <libveil/basics/Types.h>
#include <libveil/pool/MerkleAccumulator.h>
#include <libveil/pool/NullifierRegistry.h>
#include <libveil/token/TokenLedger.h>

#include <xrpl/beast/utility/Journal.h>

#include <array>
#include <cstdint>
#include <set>
#include <vector>

namespace veil {

/** Fixed parameters of a pool, normally produced by setup_PoolParams. */
struct PoolParams
{
    std::size_t treeDepth = MerkleAccumulator::DEFAULT_DEPTH;

    // Stake per deposit, indexed by PoolTier
    std::array<Amount, NUM_TIERS> tierAmounts{10, 100, 1000};
};

/** True if a full tree of such stakes can be summed without overflow. */
bool
stakesFit(Amount amount, std::size_t treeDepth);

struct Deposited
{
    PoolTier tier;
    std::uint32_t leafIndex;
    uint256 commitment;
    NetClock::time_point timestamp;
};

struct NullifierUsed
{
    uint256 nullifier;
};

struct StakeReleased
{
    AccountID market;
    PoolTier tier;
    Amount amount;
};

struct MarketAuthorized
{
    AccountID market;
};

struct MarketRevoked
{
    AccountID market;
};

using PoolEvents = EventLog<
    Deposited,
    NullifierUsed,
    StakeReleased,
    MarketAuthorized,
    MarketRevoked>;

/**
 * Shared deposit pool providing set membership and double-spend
 * protection to every market.
 *
 * Each tier keeps its own Merkle tree of deposit commitments. A market
 * proves, in zero knowledge, that its bettor knows the pre-image of some
 * leaf under the tier's current root, and then spends a nullifier here so
 * the same deposit cannot bet twice. Only markets the owner has
 * authorized may spend nullifiers.
 *
 * Deposits move the tier amount from the depositor to the pool account
 * with transferFrom; the depositor must have approved the pool account.
 */
class AnonymityPool
{
public:
    AnonymityPool(
        PoolParams const& params,
        AccountID const& owner,
        AccountID const& account,
        TokenLedger& token,
        beast::Journal journal);

    AnonymityPool(AnonymityPool const&) = delete;
    AnonymityPool&
    operator=(AnonymityPool const&) = delete;

    /** Add a commitment to the tier's tree, returning its leaf index. */
    Expected<std::uint32_t>
    deposit(
        AccountID const& depositor,
        uint256 const& commitment,
        PoolTier tier,
        NetClock::time_point now);

    uint256
    getMerkleRoot(PoolTier tier) const;

    std::uint32_t
    getDepositCount(PoolTier tier) const;

    Expected<uint256>
    getLeaf(PoolTier tier, std::uint32_t index) const;

    Amount
    getTierAmount(PoolTier tier) const;

    /** Sibling path a depositor feeds into the membership circuit. */
    Expected<std::vector<uint256>>
    getAuthPath(PoolTier tier, std::uint32_t index) const;

    bool
    isNullifierUsed(uint256 const& nullifier) const;

    /** Spend a nullifier on behalf of an authorized market. */
    Expected<void>
    useNullifier(AccountID const& caller, uint256 const& nullifier);

    /** Spend a bet nullifier and move one stake of the tier from the
        pool account to the calling market's escrow account.
        Either both happen or neither does.
    */
    Expected<void>
    releaseStake(
        AccountID const& caller,
        uint256 const& nullifier,
        PoolTier tier);

    Expected<void>
    authorizeMarket(AccountID const& caller, AccountID const& market);

    Expected<void>
    revokeMarket(AccountID const& caller, AccountID const& market);

    bool
    isAuthorized(AccountID const& market) const;

    AccountID const&
    owner() const
    {
        return owner_;
    }

    AccountID const&
    account() const
    {
        return account_;
    }

    std::size_t
    treeDepth() const
    {
        return params_.treeDepth;
    }

    PoolEvents const&
    events() const
    {
        return events_;
    }

private:
    struct Tier
    {
        explicit Tier(std::size_t depth) : tree(depth)
        {
        }

        MerkleAccumulator tree;
        std::set<uint256> commitments;
    };

    PoolParams const params_;
    AccountID const owner_;
    AccountID const account_;
    TokenLedger& token_;
    beast::Journal const j_;

    std::vector<Tier> tiers_;
    NullifierRegistry nullifiers_;
    std::set<AccountID> authorized_;
    PoolEvents events_;

    Tier&
    tier(PoolTier t)
    {
        return tiers_[tierIndex(t)];
    }

    Tier const&
    tier(PoolTier t) const
    {
        return tiers_[tierIndex(t)];
    }
};

}  // namespace veil
