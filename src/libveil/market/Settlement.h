#pragma once

#include <libveil/basics/Types.h>

#include <cstdint>

namespace veil {

/**
 * Parimutuel split of a resolved market.
 *
 * Every bet carries the same stake, so the pool is stake * totalBets.
 * Unrevealed bets stay in the pool and so go to the revealed winners.
 * The division floors; the remainder, and the whole pool when nobody
 * won, stays in the market escrow.
 */
struct Settlement
{
    Amount totalPool = 0;
    std::uint32_t winnerCount = 0;
    Amount payoutPerWinner = 0;
    Amount remainder = 0;
};

Settlement
computeSettlement(
    Amount stake,
    std::uint32_t totalBets,
    std::uint32_t yesCount,
    std::uint32_t noCount,
    Outcome resolvedOutcome);

}  // namespace veil
