#pragma once

#include <libveil/basics/Code.h>
#include <libveil/basics/EventLog.h>
#include <libveil/basics/Types.h>
#include <libveil/market/MarketConfig.h>
#include <libveil/market/PriceFeed.h>
#include <libveil/market/Settlement.h>
#include <libveil/pool/AnonymityPool.h>
#include <libveil/token/TokenLedger.h>
#include <libveil/zk/ProofVerifier.h>

#include <xrpl/basics/Slice.h>
#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace veil {

struct Bet
{
    // hash(outcome, nonce), not the deposit commitment
    uint256 commitment;
    bool revealed = false;
    Outcome outcome = Outcome::Pending;
    bool claimed = false;
};

struct BetPlaced
{
    uint256 commitment;
    NetClock::time_point timestamp;
};

struct BetRevealed
{
    uint256 commitment;
    Outcome outcome;
};

struct MarketResolved
{
    Outcome outcome;
    ResolutionSource source;
};

struct WinningsClaimed
{
    uint256 commitment;
    AccountID recipient;
};

struct MarketDisputed
{
    AccountID caller;
    NetClock::time_point timestamp;
};

using MarketEvents = EventLog<
    BetPlaced,
    BetRevealed,
    MarketResolved,
    WinningsClaimed,
    MarketDisputed>;

/** Services a market calls but does not own. */
struct MarketContext
{
    AnonymityPool& pool;
    ProofVerifier const& betVerifier;
    ProofVerifier const& claimVerifier;
    TokenLedger& token;
    // Only consulted by OracleFeed markets; may be null.
    PriceFeed const* priceFeed = nullptr;
};

/**
 * One binary prediction market.
 *
 * Lifecycle, forward only:
 *
 *   Open      --(now > bet deadline)-->     Revealing
 *   Revealing --(now > reveal deadline)-->  Resolving
 *   Resolving --(resolve)-->                Resolved
 *   Resolved  --(dispute, creator markets)--> Disputed
 *
 * The stored status is a cache of what the clock implies: every
 * operation first applies any time-driven transition, then checks its
 * own precondition.
 *
 * Bettors place a bet with a membership proof against the pool root and
 * a hiding commitment hash(outcome, nonce), reveal the pair after betting
 * closes, and after resolution claim to an arbitrary recipient with a
 * claim proof. Each accepted bet pulls one stake from the pool into the
 * market's escrow account, and payouts come from there.
 *
 * Failed operations change nothing.
 */
class Market
{
public:
    Market(
        MarketConfig const& config,
        std::string question,
        uint256 const& id,
        AccountID const& account,
        MarketContext const& context,
        beast::Journal journal);

    Market(Market const&) = delete;
    Market&
    operator=(Market const&) = delete;

    Expected<void>
    placeBet(
        ripple::Slice proof,
        uint256 const& betCommitment,
        uint256 const& nullifier,
        NetClock::time_point now);

    Expected<void>
    revealBet(
        uint256 const& betCommitment,
        Outcome outcome,
        uint256 const& nonce,
        NetClock::time_point now);

    /** Settle the market.

        Creator markets take the outcome from the creator. Oracle markets
        take it from the price feed when one is wired, ignoring the
        argument, and otherwise from the oracle account's argument.
    */
    Expected<void>
    resolve(
        AccountID const& caller,
        Outcome outcome,
        NetClock::time_point now);

    /** Pay a winning bet to recipient; returns the amount paid. */
    Expected<Amount>
    claim(
        ripple::Slice proof,
        uint256 const& betCommitment,
        AccountID const& recipient,
        NetClock::time_point now);

    Expected<void>
    dispute(AccountID const& caller, NetClock::time_point now);

    // Apply time-driven transitions only.
    void
    advance(NetClock::time_point now);

    MarketStatus
    status() const
    {
        return status_;
    }

    // Status the clock implies, without recording it.
    MarketStatus
    statusAt(NetClock::time_point now) const;

    std::optional<Bet>
    getBet(uint256 const& betCommitment) const;

    Settlement
    settlement() const;

    uint256 const&
    id() const
    {
        return id_;
    }

    AccountID const&
    account() const
    {
        return account_;
    }

    MarketConfig const&
    config() const
    {
        return config_;
    }

    std::string const&
    question() const
    {
        return question_;
    }

    std::uint32_t
    totalBets() const
    {
        return totalBets_;
    }

    std::uint32_t
    totalRevealed() const
    {
        return totalRevealed_;
    }

    std::uint32_t
    yesCount() const
    {
        return yesCount_;
    }

    std::uint32_t
    noCount() const
    {
        return noCount_;
    }

    std::uint32_t
    forfeitedCount() const
    {
        return forfeitedCount_;
    }

    Outcome
    resolvedOutcome() const
    {
        return resolvedOutcome_;
    }

    MarketEvents const&
    events() const
    {
        return events_;
    }

private:
    MarketConfig const config_;
    std::string const question_;
    uint256 const id_;
    AccountID const account_;
    MarketContext const ctx_;
    beast::Journal const j_;

    MarketStatus status_ = MarketStatus::Open;
    std::map<uint256, Bet> bets_;
    std::uint32_t totalBets_ = 0;
    std::uint32_t totalRevealed_ = 0;
    std::uint32_t yesCount_ = 0;
    std::uint32_t noCount_ = 0;
    std::uint32_t forfeitedCount_ = 0;
    Outcome resolvedOutcome_ = Outcome::Pending;
    MarketEvents events_;

    Expected<Outcome>
    decideOutcome(AccountID const& caller, Outcome proposed) const;
};

}  // namespace veil
