#include <libveil/basics/Types.h>

namespace veil {

std::string
to_string(PoolTier tier)
{
    switch (tier)
    {
        case PoolTier::Small:
            return "small";
        case PoolTier::Medium:
            return "medium";
        case PoolTier::Large:
            return "large";
    }
    return "unknown";
}

std::string
to_string(Outcome outcome)
{
    switch (outcome)
    {
        case Outcome::Pending:
            return "pending";
        case Outcome::Yes:
            return "yes";
        case Outcome::No:
            return "no";
    }
    return "unknown";
}

std::string
to_string(MarketStatus status)
{
    switch (status)
    {
        case MarketStatus::Open:
            return "open";
        case MarketStatus::Revealing:
            return "revealing";
        case MarketStatus::Resolving:
            return "resolving";
        case MarketStatus::Resolved:
            return "resolved";
        case MarketStatus::Disputed:
            return "disputed";
    }
    return "unknown";
}

std::string
to_string(ResolutionSource source)
{
    switch (source)
    {
        case ResolutionSource::CreatorResolve:
            return "creator";
        case ResolutionSource::OracleFeed:
            return "oracle";
    }
    return "unknown";
}

}  // namespace veil
