#pragma once

#include <libveil/zk/ProofVerifier.h>

#include <xrpl/basics/Blob.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <string>

namespace veil {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;
using VerificationKey = libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;
using GrothProof = libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>;

/** Field element from a big-endian 32-byte value below the modulus. */
FieldT
uint256ToFieldElement(uint256 const& value);

uint256
fieldElementToUint256(FieldT const& element);

/**
 * Groth16 verifier over alt_bn128 (libsnark r1cs_gg_ppzksnark).
 *
 * Proof blob layout:
 *
 *   u32 (big-endian)   number of public inputs N
 *   N x 32 bytes       public inputs, big-endian field elements
 *   remainder          proof as written by libsnark's operator<<
 *
 * The inputs are carried inside the blob so the verifier can hand them
 * back to the caller, which then checks them against its own state.
 */
class GrothVerifier : public ProofVerifier
{
public:
    explicit GrothVerifier(VerificationKey vk);

    /** Read a verification key written with operator<<.
        Throws std::runtime_error if the file cannot be read.
    */
    static GrothVerifier
    load(std::string const& path);

    Expected<PublicInputs>
    verify(ripple::Slice proof) const override;

    /** Number of public inputs the key was generated for. */
    std::size_t
    inputCount() const;

    static ripple::Blob
    encodeBlob(PublicInputs const& inputs, GrothProof const& proof);

    // Curve parameters must be set up once per process before any
    // key, proof or field element is touched.
    static void
    initialize();

private:
    libsnark::r1cs_gg_ppzksnark_processed_verification_key<DefaultCurve> pvk_;
    std::size_t inputCount_;
};

}  // namespace veil
