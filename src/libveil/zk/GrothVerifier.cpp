#include <libveil/zk/GrothVerifier.h>

#include <libveil/crypto/Hash.h>

#include <xrpl/basics/contract.h>

#include <libff/common/profiling.hpp>

#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace veil {

namespace {

constexpr std::size_t countBytes = 4;

}  // namespace

FieldT
uint256ToFieldElement(uint256 const& value)
{
    libff::bigint<FieldT::num_limbs> bigint;
    constexpr std::size_t limbBytes = sizeof(bigint.data[0]);

    for (std::size_t i = 0; i < uint256::bytes; ++i)
    {
        std::size_t const fromLow = uint256::bytes - 1 - i;
        std::size_t const limb = fromLow / limbBytes;
        if (limb >= static_cast<std::size_t>(FieldT::num_limbs))
            continue;
        bigint.data[limb] |= static_cast<mp_limb_t>(value.data()[i])
            << ((fromLow % limbBytes) * 8);
    }

    return FieldT(bigint);
}

uint256
fieldElementToUint256(FieldT const& element)
{
    uint256 result;

    auto const bigint = element.as_bigint();
    constexpr std::size_t limbBytes = sizeof(bigint.data[0]);

    for (std::size_t i = 0; i < uint256::bytes; ++i)
    {
        std::size_t const fromLow = uint256::bytes - 1 - i;
        std::size_t const limb = fromLow / limbBytes;
        if (limb >= static_cast<std::size_t>(FieldT::num_limbs))
            continue;
        result.data()[i] = static_cast<std::uint8_t>(
            (bigint.data[limb] >> ((fromLow % limbBytes) * 8)) & 0xFF);
    }

    return result;
}

void
GrothVerifier::initialize()
{
    static std::once_flag once;
    std::call_once(once, [] {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        DefaultCurve::init_public_params();
    });
}

GrothVerifier::GrothVerifier(VerificationKey vk)
    : pvk_((initialize(),
            libsnark::r1cs_gg_ppzksnark_verifier_process_vk<DefaultCurve>(vk)))
    , inputCount_(vk.gamma_ABC_g1.domain_size())
{
}

GrothVerifier
GrothVerifier::load(std::string const& path)
{
    initialize();

    std::ifstream file(path, std::ios::binary);
    if (!file.good())
        ripple::Throw<std::runtime_error>(
            "Cannot open verification key: " + path);

    VerificationKey vk;
    file >> vk;
    if (file.fail())
        ripple::Throw<std::runtime_error>(
            "Malformed verification key: " + path);

    return GrothVerifier(std::move(vk));
}

std::size_t
GrothVerifier::inputCount() const
{
    return inputCount_;
}

ripple::Blob
GrothVerifier::encodeBlob(PublicInputs const& inputs, GrothProof const& proof)
{
    ripple::Blob blob;
    blob.reserve(countBytes + inputs.size() * uint256::bytes);

    auto const n = static_cast<std::uint32_t>(inputs.size());
    for (int shift = 24; shift >= 0; shift -= 8)
        blob.push_back(static_cast<std::uint8_t>((n >> shift) & 0xFF));

    for (auto const& input : inputs)
        blob.insert(blob.end(), input.begin(), input.end());

    std::ostringstream oss;
    oss << proof;
    auto const str = oss.str();
    blob.insert(blob.end(), str.begin(), str.end());

    return blob;
}

Expected<PublicInputs>
GrothVerifier::verify(ripple::Slice proof) const
{
    if (proof.size() < countBytes)
        return Unexpected(Code::badProofShape);

    std::uint32_t n = 0;
    for (std::size_t i = 0; i < countBytes; ++i)
        n = (n << 8) | proof[i];

    if (n != inputCount_)
        return Unexpected(Code::badProofShape);

    std::size_t const inputsEnd = countBytes + n * uint256::bytes;
    if (proof.size() <= inputsEnd)
        return Unexpected(Code::badProofShape);

    PublicInputs inputs;
    libsnark::r1cs_primary_input<FieldT> primary;
    inputs.reserve(n);
    primary.reserve(n);

    for (std::size_t i = 0; i < n; ++i)
    {
        auto const value =
            uint256::fromVoid(proof.data() + countBytes + i * uint256::bytes);
        if (!inField(value))
            return Unexpected(Code::badProofShape);

        inputs.push_back(value);
        primary.push_back(uint256ToFieldElement(value));
    }

    GrothProof snark;
    {
        std::string const str(
            reinterpret_cast<char const*>(proof.data() + inputsEnd),
            proof.size() - inputsEnd);
        std::istringstream iss(str);
        iss >> snark;
        if (iss.fail() || !snark.is_well_formed())
            return Unexpected(Code::badProofShape);
    }

    if (!libsnark::r1cs_gg_ppzksnark_online_verifier_strong_IC<DefaultCurve>(
            pvk_, primary, snark))
        return Unexpected(Code::proofRejected);

    return inputs;
}

}  // namespace veil
