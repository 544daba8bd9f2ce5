#pragma once

#include <test/support/StubVerifier.h>

#include <libveil/crypto/Hash.h>
#include <libveil/market/MarketRegistry.h>
#include <libveil/pool/AnonymityPool.h>
#include <libveil/token/MemoryTokenLedger.h>
#include <libveil/zk/PublicInputs.h>

#include <xrpl/basics/Slice.h>
#include <xrpl/beast/utility/Journal.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace veil {
namespace test {

using namespace std::chrono_literals;

/** Secrets a depositor keeps off-chain. */
struct Depositor
{
    AccountID wallet;
    PoolTier tier;
    uint256 secret;
    uint256 nullifierSecret;
    std::uint32_t leafIndex = 0;

    uint256
    commitment() const
    {
        return depositCommitment(secret, nullifierSecret);
    }
};

/** A hidden bet: the pair revealed later and its commitment. */
struct Ticket
{
    Outcome outcome;
    uint256 nonce;

    uint256
    commitment() const
    {
        return betCommitment(outcome, nonce);
    }
};

/**
 * Pool, token, stub verifiers and registry wired together, with the
 * client-side steps (deposit, build proof inputs) that tests need.
 */
class MarketEnv
{
public:
    AccountID const owner{1};
    AccountID const poolAccount{2};
    AccountID const creator{3};
    AccountID const oracle{4};

    NetClock::time_point const start{NetClock::duration{10000}};
    NetClock::time_point const betDeadline = start + 100s;
    NetClock::time_point const revealDeadline = start + 200s;
    NetClock::time_point const disputeDeadline = start + 300s;

    beast::Journal journal{beast::Journal::getNullSink()};
    MemoryTokenLedger token;
    StubVerifier betVerifier;
    StubVerifier claimVerifier;
    AnonymityPool pool;
    MarketRegistry registry;

    explicit MarketEnv(PoolParams const& params = PoolParams{})
        : pool(params, owner, poolAccount, token, journal)
        , registry(
              MarketContext{pool, betVerifier, claimVerifier, token},
              journal)
    {
    }

    MarketConfig
    config(
        PoolTier tier = PoolTier::Medium,
        ResolutionSource source = ResolutionSource::CreatorResolve) const
    {
        MarketConfig c;
        c.creator = creator;
        c.betDeadline = betDeadline;
        c.revealDeadline = revealDeadline;
        c.disputeDeadline = disputeDeadline;
        c.resolutionSource = source;
        c.poolTier = tier;
        c.oracle.oracle = oracle;
        c.oracle.feedId = uint256{7};
        c.oracle.targetPrice = 50000;
        return c;
    }

    /** Create a market and have the pool owner authorize it. */
    Market&
    createMarket(MarketConfig const& c)
    {
        auto const m =
            registry.createMarket(c, "Will it rain tomorrow?", start);
        if (!m)
            throw std::runtime_error(transHuman(m.error()));
        auto const ok = pool.authorizeMarket(owner, (*m)->account());
        if (!ok)
            throw std::runtime_error(transHuman(ok.error()));
        return **m;
    }

    Market&
    createMarket(PoolTier tier = PoolTier::Medium)
    {
        return createMarket(config(tier));
    }

    /** Fund a fresh wallet and deposit one stake into the tier. */
    Depositor
    deposit(PoolTier tier)
    {
        Depositor d;
        d.wallet = AccountID{1000 + ++wallets_};
        d.tier = tier;
        d.secret = randomFieldElement();
        d.nullifierSecret = randomFieldElement();

        token.mint(d.wallet, pool.getTierAmount(tier));
        token.approve(d.wallet, poolAccount, pool.getTierAmount(tier));

        auto const leaf = pool.deposit(d.wallet, d.commitment(), tier, start);
        if (!leaf)
            throw std::runtime_error(transHuman(leaf.error()));
        d.leafIndex = *leaf;
        return d;
    }

    ripple::Blob
    betProof(Market const& m, Depositor const& d, uint256 const& betCommitment)
        const
    {
        return StubVerifier::encode(
            MembershipInputs{
                pool.getMerkleRoot(m.config().poolTier),
                betNullifier(d.nullifierSecret, m.id()),
                betCommitment,
                m.id()}
                .encode());
    }

    ripple::Blob
    claimProof(Market const& m, Depositor const& d, uint256 const& betCommitment)
        const
    {
        return StubVerifier::encode(
            ClaimInputs{
                betCommitment,
                outcomeToField(m.resolvedOutcome()),
                m.id(),
                claimNullifier(d.nullifierSecret, m.id())}
                .encode());
    }

    /** Deposit and bet in one go; returns the depositor. */
    Depositor
    placeBet(Market& m, Ticket const& ticket)
    {
        auto d = deposit(m.config().poolTier);
        auto const proof = betProof(m, d, ticket.commitment());
        auto const r = m.placeBet(
            ripple::makeSlice(proof),
            ticket.commitment(),
            betNullifier(d.nullifierSecret, m.id()),
            start + 10s);
        if (!r)
            throw std::runtime_error(transHuman(r.error()));
        return d;
    }

private:
    std::uint64_t wallets_ = 0;
};

inline Ticket
makeTicket(Outcome outcome)
{
    return Ticket{outcome, randomFieldElement()};
}

}  // namespace test
}  // namespace veil
