#include <libveil/market/Market.h>

#include <libveil/crypto/Hash.h>
#include <libveil/zk/PublicInputs.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

#include <stdexcept>
#include <utility>

namespace veil {

Market::Market(
    MarketConfig const& config,
    std::string question,
    uint256 const& id,
    AccountID const& account,
    MarketContext const& context,
    beast::Journal journal)
    : config_(config)
    , question_(std::move(question))
    , id_(id)
    , account_(account)
    , ctx_(context)
    , j_(journal)
{
    if (!config_.checkDeadlines())
        ripple::Throw<std::invalid_argument>(
            "Market deadlines must satisfy bet < reveal < dispute");
}

MarketStatus
Market::statusAt(NetClock::time_point now) const
{
    auto s = status_;
    if (s == MarketStatus::Open && now > config_.betDeadline)
        s = MarketStatus::Revealing;
    if (s == MarketStatus::Revealing && now > config_.revealDeadline)
        s = MarketStatus::Resolving;
    return s;
}

void
Market::advance(NetClock::time_point now)
{
    auto const next = statusAt(now);
    if (next == status_)
        return;

    JLOG(j_.info()) << "Market " << id_ << ": " << to_string(status_)
                    << " -> " << to_string(next);
    status_ = next;
}

Expected<void>
Market::placeBet(
    ripple::Slice proof,
    uint256 const& betCommitment,
    uint256 const& nullifier,
    NetClock::time_point now)
{
    advance(now);
    if (status_ != MarketStatus::Open)
        return Unexpected(Code::notOpen);

    // A replayed nullifier fails as such, whatever else the call carries.
    if (ctx_.pool.isNullifierUsed(nullifier))
    {
        JLOG(j_.warn()) << "Bet rejected: nullifier reuse " << nullifier;
        return Unexpected(Code::nullifierUsed);
    }

    if (betCommitment.isZero())
        return Unexpected(Code::emptyCommitment);

    if (bets_.count(betCommitment))
        return Unexpected(Code::duplicateCommitment);

    auto const verified = ctx_.betVerifier.verify(proof);
    if (!verified)
    {
        JLOG(j_.warn()) << "Bet rejected: " << transHuman(verified.error());
        return Unexpected(verified.error());
    }

    auto const inputs = MembershipInputs::decode(*verified);
    if (!inputs)
        return Unexpected(inputs.error());

    if (inputs->merkleRoot != ctx_.pool.getMerkleRoot(config_.poolTier))
    {
        JLOG(j_.warn()) << "Bet rejected: stale or foreign root "
                        << inputs->merkleRoot;
        return Unexpected(Code::rootMismatch);
    }
    if (inputs->nullifier != nullifier)
        return Unexpected(Code::nullifierMismatch);
    if (inputs->betCommitment != betCommitment)
        return Unexpected(Code::betCommitmentMismatch);
    if (inputs->marketId != id_)
        return Unexpected(Code::marketIdMismatch);

    // Spends the nullifier and moves the stake into this market's escrow,
    // which is what claims pay from. Last fallible step; nothing has been
    // written yet.
    if (auto const r =
            ctx_.pool.releaseStake(account_, nullifier, config_.poolTier);
        !r)
        return Unexpected(r.error());

    bets_.emplace(betCommitment, Bet{betCommitment});
    ++totalBets_;
    events_.emit(BetPlaced{betCommitment, now});

    JLOG(j_.debug()) << "Bet placed on " << id_ << ": " << betCommitment;
    return {};
}

Expected<void>
Market::revealBet(
    uint256 const& betCommitment,
    Outcome outcome,
    uint256 const& nonce,
    NetClock::time_point now)
{
    advance(now);
    if (status_ != MarketStatus::Revealing)
        return Unexpected(Code::notRevealing);

    auto const it = bets_.find(betCommitment);
    if (it == bets_.end())
        return Unexpected(Code::unknownBet);

    auto& bet = it->second;
    if (bet.revealed)
        return Unexpected(Code::alreadyRevealed);

    if (outcome != Outcome::Yes && outcome != Outcome::No)
        return Unexpected(Code::invalidOutcome);

    if (veil::betCommitment(outcome, nonce) != betCommitment)
    {
        JLOG(j_.warn()) << "Reveal rejected: commitment mismatch for "
                        << betCommitment;
        return Unexpected(Code::commitmentMismatch);
    }

    bet.revealed = true;
    bet.outcome = outcome;
    ++totalRevealed_;
    if (outcome == Outcome::Yes)
        ++yesCount_;
    else
        ++noCount_;

    events_.emit(BetRevealed{betCommitment, outcome});

    JLOG(j_.debug()) << "Bet revealed on " << id_ << ": " << betCommitment
                     << " -> " << to_string(outcome);
    return {};
}

Expected<Outcome>
Market::decideOutcome(AccountID const& caller, Outcome proposed) const
{
    if (config_.resolutionSource == ResolutionSource::CreatorResolve)
    {
        if (caller != config_.creator)
            return Unexpected(Code::notCreator);
        return proposed;
    }

    if (caller != config_.oracle.oracle)
        return Unexpected(Code::notOracle);

    if (!ctx_.priceFeed)
        return proposed;

    auto const price = ctx_.priceFeed->latestPrice(config_.oracle.feedId);
    if (!price)
        return Unexpected(Code::feedUnavailable);

    JLOG(j_.debug()) << "Feed price " << *price << ", target "
                     << config_.oracle.targetPrice;

    return *price >= config_.oracle.targetPrice ? Outcome::Yes : Outcome::No;
}

Expected<void>
Market::resolve(
    AccountID const& caller,
    Outcome outcome,
    NetClock::time_point now)
{
    advance(now);
    if (status_ != MarketStatus::Resolving)
        return Unexpected(Code::notResolving);

    auto const decided = decideOutcome(caller, outcome);
    if (!decided)
    {
        JLOG(j_.warn()) << "Resolve rejected: " << transHuman(decided.error());
        return Unexpected(decided.error());
    }

    if (*decided == Outcome::Pending)
        return Unexpected(Code::invalidOutcome);

    resolvedOutcome_ = *decided;
    forfeitedCount_ = totalBets_ - totalRevealed_;
    status_ = MarketStatus::Resolved;

    events_.emit(MarketResolved{resolvedOutcome_, config_.resolutionSource});

    JLOG(j_.info()) << "Market " << id_ << " resolved "
                    << to_string(resolvedOutcome_) << " by "
                    << to_string(config_.resolutionSource) << ", "
                    << forfeitedCount_ << " of " << totalBets_
                    << " bets forfeited";
    return {};
}

Expected<Amount>
Market::claim(
    ripple::Slice proof,
    uint256 const& betCommitment,
    AccountID const& recipient,
    NetClock::time_point now)
{
    advance(now);
    if (status_ != MarketStatus::Resolved)
        return Unexpected(Code::notResolved);

    auto const it = bets_.find(betCommitment);
    if (it == bets_.end())
        return Unexpected(Code::unknownBet);

    auto& bet = it->second;
    if (!bet.revealed)
        return Unexpected(Code::notRevealed);
    if (bet.claimed)
        return Unexpected(Code::alreadyClaimed);
    if (bet.outcome != resolvedOutcome_)
        return Unexpected(Code::notWinner);

    auto const verified = ctx_.claimVerifier.verify(proof);
    if (!verified)
    {
        JLOG(j_.warn()) << "Claim rejected: " << transHuman(verified.error());
        return Unexpected(verified.error());
    }

    auto const inputs = ClaimInputs::decode(*verified);
    if (!inputs)
        return Unexpected(inputs.error());

    if (inputs->betCommitment != betCommitment)
        return Unexpected(Code::betCommitmentMismatch);
    if (inputs->winningOutcome != outcomeToField(resolvedOutcome_))
        return Unexpected(Code::outcomeMismatch);
    if (inputs->marketId != id_)
        return Unexpected(Code::marketIdMismatch);
    if (ctx_.pool.isNullifierUsed(inputs->nullifier))
    {
        JLOG(j_.warn()) << "Claim rejected: nullifier reuse "
                        << inputs->nullifier;
        return Unexpected(Code::nullifierUsed);
    }
    if (!ctx_.pool.isAuthorized(account_))
        return Unexpected(Code::notAuthorized);

    auto const payout = settlement().payoutPerWinner;

    // With the nullifier and authorization checked above, the transfer is
    // the only step left that can fail, so it goes first.
    if (payout > 0 && !ctx_.token.transfer(account_, recipient, payout))
    {
        JLOG(j_.warn()) << "Claim rejected: payout transfer of " << payout
                        << " failed";
        return Unexpected(Code::transferFailed);
    }

    if (auto const r = ctx_.pool.useNullifier(account_, inputs->nullifier); !r)
    {
        JLOG(j_.error()) << "Claim nullifier refused after payout: "
                         << transHuman(r.error());
        return Unexpected(r.error());
    }

    bet.claimed = true;
    events_.emit(WinningsClaimed{betCommitment, recipient});

    JLOG(j_.debug()) << "Claim on " << id_ << ": " << payout << " to "
                     << ripple::toBase58(recipient);
    return payout;
}

Expected<void>
Market::dispute(AccountID const& caller, NetClock::time_point now)
{
    advance(now);
    if (config_.resolutionSource != ResolutionSource::CreatorResolve)
        return Unexpected(Code::disputeNotAllowed);
    if (status_ != MarketStatus::Resolved)
        return Unexpected(Code::notResolved);
    if (now > config_.disputeDeadline)
        return Unexpected(Code::disputeWindowClosed);

    status_ = MarketStatus::Disputed;
    events_.emit(MarketDisputed{caller, now});

    JLOG(j_.info()) << "Market " << id_ << " disputed by "
                    << ripple::toBase58(caller);
    return {};
}

std::optional<Bet>
Market::getBet(uint256 const& betCommitment) const
{
    auto const it = bets_.find(betCommitment);
    if (it == bets_.end())
        return std::nullopt;
    return it->second;
}

Settlement
Market::settlement() const
{
    return computeSettlement(
        ctx_.pool.getTierAmount(config_.poolTier),
        totalBets_,
        yesCount_,
        noCount_,
        resolvedOutcome_);
}

}  // namespace veil
