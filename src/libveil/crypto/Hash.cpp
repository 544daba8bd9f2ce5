#include <libveil/crypto/Hash.h>

#include <xrpl/basics/contract.h>

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cstring>
#include <stdexcept>
#include <vector>

namespace veil {

namespace {

// Domain tags separating the two nullifier namespaces.
uint256 const betTag{0x62657400ULL};    // "bet"
uint256 const claimTag{0x636c6d00ULL};  // "clm"

constexpr std::uint8_t fieldMask = 0x1f;

}  // namespace

uint256
fieldHash(std::uint8_t const* data, std::size_t size)
{
    uint256 result;
    SHA256(data, size, result.data());
    result.data()[0] &= fieldMask;
    return result;
}

uint256
fieldHash(std::initializer_list<uint256> words)
{
    std::vector<std::uint8_t> input(words.size() * uint256::bytes);

    std::size_t offset = 0;
    for (auto const& w : words)
    {
        std::memcpy(&input[offset], w.data(), uint256::bytes);
        offset += uint256::bytes;
    }

    return fieldHash(input.data(), input.size());
}

bool
inField(uint256 const& value)
{
    return (value.data()[0] & ~fieldMask) == 0;
}

uint256
hashPair(uint256 const& left, uint256 const& right)
{
    return fieldHash({left, right});
}

uint256
depositCommitment(uint256 const& secret, uint256 const& nullifierSecret)
{
    return fieldHash({secret, nullifierSecret});
}

uint256
betNullifier(uint256 const& nullifierSecret, uint256 const& marketId)
{
    return fieldHash({betTag, nullifierSecret, marketId});
}

uint256
claimNullifier(uint256 const& nullifierSecret, uint256 const& marketId)
{
    return fieldHash({claimTag, nullifierSecret, marketId});
}

uint256
betCommitment(Outcome outcome, uint256 const& nonce)
{
    return fieldHash({outcomeToField(outcome), nonce});
}

uint256
randomFieldElement()
{
    uint256 result;
    if (RAND_bytes(result.data(), static_cast<int>(uint256::bytes)) != 1)
        ripple::Throw<std::runtime_error>("RAND_bytes failed");
    result.data()[0] &= fieldMask;
    return result;
}

}  // namespace veil
