#pragma once

#include <libveil/basics/Code.h>
#include <libveil/basics/Types.h>

#include <cstdint>

namespace veil {

/** Parameters for markets resolved from a price feed. */
struct OracleParams
{
    // Account allowed to trigger resolution.
    AccountID oracle;
    uint256 feedId;
    // Yes when the feed price is at or above this value.
    std::int64_t targetPrice = 0;
};

/** Immutable terms of a market, fixed at creation. */
struct MarketConfig
{
    AccountID creator;
    NetClock::time_point betDeadline;
    NetClock::time_point revealDeadline;
    NetClock::time_point disputeDeadline;
    ResolutionSource resolutionSource = ResolutionSource::CreatorResolve;
    PoolTier poolTier = PoolTier::Medium;
    OracleParams oracle;

    /** Deadlines must be strictly increasing: bet < reveal < dispute. */
    Expected<void>
    checkDeadlines() const;

    /** As checkDeadlines, and betting must still be open at now. */
    Expected<void>
    checkDeadlines(NetClock::time_point now) const;
};

}  // namespace veil
