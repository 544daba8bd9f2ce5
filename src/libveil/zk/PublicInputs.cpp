#include <libveil/zk/PublicInputs.h>

namespace veil {

Expected<MembershipInputs>
MembershipInputs::decode(PublicInputs const& inputs)
{
    if (inputs.size() != MEMBERSHIP_INPUT_COUNT)
        return Unexpected(Code::badProofShape);

    return MembershipInputs{inputs[0], inputs[1], inputs[2], inputs[3]};
}

PublicInputs
MembershipInputs::encode() const
{
    return {merkleRoot, nullifier, betCommitment, marketId};
}

Expected<ClaimInputs>
ClaimInputs::decode(PublicInputs const& inputs)
{
    if (inputs.size() != CLAIM_INPUT_COUNT)
        return Unexpected(Code::badProofShape);

    return ClaimInputs{inputs[0], inputs[1], inputs[2], inputs[3]};
}

PublicInputs
ClaimInputs::encode() const
{
    return {betCommitment, winningOutcome, marketId, nullifier};
}

}  // namespace veil
