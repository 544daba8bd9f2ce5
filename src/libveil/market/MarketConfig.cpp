#include <libveil/market/MarketConfig.h>

namespace veil {

Expected<void>
MarketConfig::checkDeadlines() const
{
    if (betDeadline >= revealDeadline || revealDeadline >= disputeDeadline)
        return Unexpected(Code::badDeadlines);
    return {};
}

Expected<void>
MarketConfig::checkDeadlines(NetClock::time_point now) const
{
    if (now >= betDeadline)
        return Unexpected(Code::badDeadlines);
    return checkDeadlines();
}

}  // namespace veil
