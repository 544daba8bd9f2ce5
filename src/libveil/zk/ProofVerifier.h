#pragma once

#include <libveil/basics/Code.h>
#include <libveil/basics/Types.h>

#include <xrpl/basics/Slice.h>

#include <vector>

namespace veil {

using PublicInputs = std::vector<uint256>;

/**
 * Verifier for one circuit.
 *
 * Given a proof blob, returns the public inputs the proof is valid for,
 * in circuit order. A successful return only says the proof is well
 * formed for *some* inputs; callers must compare each input against the
 * values they expect.
 */
class ProofVerifier
{
public:
    virtual ~ProofVerifier() = default;

    virtual Expected<PublicInputs>
    verify(ripple::Slice proof) const = 0;
};

}  // namespace veil
