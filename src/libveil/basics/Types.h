#pragma once

#include <xrpl/basics/base_uint.h>
#include <xrpl/basics/chrono.h>
#include <xrpl/protocol/AccountID.h>

#include <cstdint>
#include <string>

namespace veil {

using ripple::AccountID;
using ripple::NetClock;
using ripple::uint256;

// Token amounts, in the smallest unit of the pool token.
using Amount = std::uint64_t;

enum class PoolTier : std::uint8_t { Small = 0, Medium = 1, Large = 2 };

constexpr std::size_t NUM_TIERS = 3;

// The numeric value doubles as the field encoding used in proofs and
// in the reveal commitment.
enum class Outcome : std::uint8_t { Pending = 0, Yes = 1, No = 2 };

enum class MarketStatus : std::uint8_t {
    Open = 0,
    Revealing = 1,
    Resolving = 2,
    Resolved = 3,
    Disputed = 4
};

enum class ResolutionSource : std::uint8_t { CreatorResolve = 0, OracleFeed = 1 };

inline std::size_t
tierIndex(PoolTier tier)
{
    return static_cast<std::size_t>(tier);
}

// Field encoding of an outcome as it appears among proof public inputs.
inline uint256
outcomeToField(Outcome outcome)
{
    return uint256{static_cast<std::uint64_t>(outcome)};
}

std::string
to_string(PoolTier tier);

std::string
to_string(Outcome outcome);

std::string
to_string(MarketStatus status);

std::string
to_string(ResolutionSource source);

}  // namespace veil
