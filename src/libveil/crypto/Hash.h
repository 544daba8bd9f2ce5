#pragma once

#include <libveil/basics/Types.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>

namespace veil {

/**
 * SHA-256 reduced into the BN254 scalar field.
 *
 * The three most significant bits of the big-endian digest are cleared,
 * so every result is below 2^253 and fits an alt_bn128 public input
 * unchanged. All commitments, nullifiers, roots and market ids in the
 * system are produced this way.
 */
uint256
fieldHash(std::uint8_t const* data, std::size_t size);

/** fieldHash over the concatenation of the given 32-byte words. */
uint256
fieldHash(std::initializer_list<uint256> words);

/** True if the value is a valid field element under fieldHash's bound. */
bool
inField(uint256 const& value);

// Parent node of two Merkle children.
uint256
hashPair(uint256 const& left, uint256 const& right);

// Client-side derivations. The market only ever recomputes betCommitment;
// the others are what the membership and claim circuits prove knowledge of.

/** Deposit leaf: hash(secret, nullifier_secret). */
uint256
depositCommitment(uint256 const& secret, uint256 const& nullifierSecret);

/** Nullifier spent when betting in a market. */
uint256
betNullifier(uint256 const& nullifierSecret, uint256 const& marketId);

/** Nullifier spent when claiming; separate domain from betNullifier. */
uint256
claimNullifier(uint256 const& nullifierSecret, uint256 const& marketId);

/** Commit-reveal binding: hash(outcome, nonce). */
uint256
betCommitment(Outcome outcome, uint256 const& nonce);

/** Random field element from the OpenSSL CSPRNG. */
uint256
randomFieldElement();

}  // namespace veil
