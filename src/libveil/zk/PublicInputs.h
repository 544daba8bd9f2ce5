#pragma once

#include <libveil/zk/ProofVerifier.h>

namespace veil {

// Both circuits expose exactly four public inputs.
constexpr std::size_t MEMBERSHIP_INPUT_COUNT = 4;
constexpr std::size_t CLAIM_INPUT_COUNT = 4;

/** Public inputs of the membership (betting) circuit. */
struct MembershipInputs
{
    uint256 merkleRoot;
    uint256 nullifier;
    uint256 betCommitment;
    uint256 marketId;

    static Expected<MembershipInputs>
    decode(PublicInputs const& inputs);

    PublicInputs
    encode() const;
};

/** Public inputs of the claim circuit. */
struct ClaimInputs
{
    uint256 betCommitment;
    uint256 winningOutcome;
    uint256 marketId;
    uint256 nullifier;

    static Expected<ClaimInputs>
    decode(PublicInputs const& inputs);

    PublicInputs
    encode() const;
};

}  // namespace veil
