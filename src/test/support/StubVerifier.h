#pragma once

#include <libveil/zk/ProofVerifier.h>

#include <xrpl/basics/Blob.h>

namespace veil {
namespace test {

/**
 * ProofVerifier that trusts its input.
 *
 * The blob is just the public inputs, 32 bytes each, so tests can hand
 * the market any inputs they like. setRejecting makes every proof fail
 * verification.
 */
class StubVerifier : public ProofVerifier
{
public:
    Expected<PublicInputs>
    verify(ripple::Slice proof) const override
    {
        ++calls_;
        if (rejecting_)
            return Unexpected(Code::proofRejected);
        if (proof.size() % uint256::bytes != 0)
            return Unexpected(Code::badProofShape);

        PublicInputs inputs;
        for (std::size_t off = 0; off < proof.size(); off += uint256::bytes)
            inputs.push_back(uint256::fromVoid(proof.data() + off));
        return inputs;
    }

    static ripple::Blob
    encode(PublicInputs const& inputs)
    {
        ripple::Blob blob;
        for (auto const& input : inputs)
            blob.insert(blob.end(), input.begin(), input.end());
        return blob;
    }

    void
    setRejecting(bool rejecting)
    {
        rejecting_ = rejecting;
    }

    std::size_t
    calls() const
    {
        return calls_;
    }

private:
    bool rejecting_ = false;
    mutable std::size_t calls_ = 0;
};

}  // namespace test
}  // namespace veil
