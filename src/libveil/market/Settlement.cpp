#include <libveil/market/Settlement.h>

namespace veil {

Settlement
computeSettlement(
    Amount stake,
    std::uint32_t totalBets,
    std::uint32_t yesCount,
    std::uint32_t noCount,
    Outcome resolvedOutcome)
{
    Settlement s;
    s.totalPool = stake * totalBets;

    switch (resolvedOutcome)
    {
        case Outcome::Yes:
            s.winnerCount = yesCount;
            break;
        case Outcome::No:
            s.winnerCount = noCount;
            break;
        case Outcome::Pending:
            s.winnerCount = 0;
            break;
    }

    if (s.winnerCount == 0)
    {
        s.remainder = s.totalPool;
        return s;
    }

    s.payoutPerWinner = s.totalPool / s.winnerCount;
    s.remainder = s.totalPool - s.payoutPerWinner * s.winnerCount;
    return s;
}

}  // namespace veil
