#pragma once

#include <libveil/basics/Types.h>

#include <cstdint>
#include <optional>

namespace veil {

/** External price oracle consulted by OracleFeed markets. */
class PriceFeed
{
public:
    virtual ~PriceFeed() = default;

    // Latest price for the feed, or nothing if the feed has no value.
    virtual std::optional<std::int64_t>
    latestPrice(uint256 const& feedId) const = 0;
};

}  // namespace veil
