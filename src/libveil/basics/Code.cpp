#include <libveil/basics/Code.h>

#include <unordered_map>
#include <utility>

namespace veil {

namespace {

std::unordered_map<Code, std::pair<char const*, char const*>> const&
codeInfo()
{
    static std::unordered_map<Code, std::pair<char const*, char const*>> const
        results{
            {Code::emptyCommitment,
             {"emptyCommitment", "Commitment equals the empty leaf value."}},
            {Code::duplicateCommitment,
             {"duplicateCommitment", "Commitment has already been used."}},
            {Code::invalidOutcome,
             {"invalidOutcome", "Outcome must be Yes or No."}},
            {Code::badProofShape,
             {"badProofShape", "Proof blob or public inputs are malformed."}},
            {Code::emptyQuestion,
             {"emptyQuestion", "Market question must not be empty."}},
            {Code::unknownLeaf,
             {"unknownLeaf", "No leaf at this index in the tier tree."}},

            {Code::notOpen, {"notOpen", "Market is not accepting bets."}},
            {Code::notRevealing,
             {"notRevealing", "Market is not in the reveal phase."}},
            {Code::notResolving,
             {"notResolving", "Market is not awaiting resolution."}},
            {Code::notResolved, {"notResolved", "Market is not resolved."}},
            {Code::badDeadlines,
             {"badDeadlines",
              "Deadlines must satisfy now < bet < reveal < dispute."}},
            {Code::disputeWindowClosed,
             {"disputeWindowClosed", "Dispute deadline has passed."}},
            {Code::disputeNotAllowed,
             {"disputeNotAllowed",
              "Only creator-resolved markets can be disputed."}},
            {Code::unknownBet, {"unknownBet", "No bet with this commitment."}},
            {Code::alreadyRevealed,
             {"alreadyRevealed", "Bet has already been revealed."}},
            {Code::notRevealed, {"notRevealed", "Bet was never revealed."}},
            {Code::alreadyClaimed,
             {"alreadyClaimed", "Winnings have already been claimed."}},
            {Code::notWinner,
             {"notWinner", "Bet outcome differs from the resolved outcome."}},

            {Code::notCreator,
             {"notCreator", "Only the market creator may resolve."}},
            {Code::notOracle,
             {"notOracle", "Only the configured oracle may resolve."}},
            {Code::notOwner, {"notOwner", "Only the pool owner may do this."}},
            {Code::notAuthorized,
             {"notAuthorized", "Caller may not consume nullifiers."}},

            {Code::commitmentMismatch,
             {"commitmentMismatch",
              "Revealed outcome and nonce do not match the commitment."}},
            {Code::rootMismatch,
             {"rootMismatch", "Proof Merkle root is not the current root."}},
            {Code::nullifierMismatch,
             {"nullifierMismatch",
              "Proof nullifier differs from the supplied nullifier."}},
            {Code::betCommitmentMismatch,
             {"betCommitmentMismatch",
              "Proof bet commitment differs from the supplied one."}},
            {Code::marketIdMismatch,
             {"marketIdMismatch", "Proof is bound to a different market."}},
            {Code::outcomeMismatch,
             {"outcomeMismatch",
              "Proof outcome differs from the resolved outcome."}},
            {Code::nullifierUsed,
             {"nullifierUsed", "Nullifier has already been consumed."}},
            {Code::treeFull, {"treeFull", "Tier Merkle tree is at capacity."}},

            {Code::transferFailed,
             {"transferFailed", "Token transfer did not succeed."}},
            {Code::proofRejected,
             {"proofRejected", "Proof failed verification."}},
            {Code::feedUnavailable,
             {"feedUnavailable", "Price feed returned no value."}},
        };
    return results;
}

}  // namespace

Category
categoryOf(Code code)
{
    auto const v = static_cast<int>(code);
    if (v < 200)
        return Category::validation;
    if (v < 300)
        return Category::state;
    if (v < 400)
        return Category::authorization;
    if (v < 500)
        return Category::integrity;
    return Category::external;
}

std::string
transToken(Code code)
{
    auto const& info = codeInfo();
    if (auto const it = info.find(code); it != info.end())
        return it->second.first;
    return "-";
}

std::string
transHuman(Code code)
{
    auto const& info = codeInfo();
    if (auto const it = info.find(code); it != info.end())
        return it->second.second;
    return "-";
}

std::string
to_string(Category category)
{
    switch (category)
    {
        case Category::validation:
            return "validation";
        case Category::state:
            return "state";
        case Category::authorization:
            return "authorization";
        case Category::integrity:
            return "integrity";
        case Category::external:
            return "external";
    }
    return "unknown";
}

}  // namespace veil
