#pragma once

#include <libveil/basics/Code.h>
#include <libveil/basics/EventLog.h>
#include <libveil/market/Market.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace veil {

/** What the registry remembers about a market it created. */
struct MarketInfo
{
    uint256 id;
    AccountID creator;
    PoolTier tier;
    NetClock::time_point createdAt;
    std::string question;
};

struct MarketCreated
{
    uint256 id;
    AccountID creator;
    PoolTier tier;
    std::string question;
    NetClock::time_point timestamp;
};

using RegistryEvents = EventLog<MarketCreated>;

/**
 * Creates markets and indexes them.
 *
 * Every market shares the registry's pool, verifiers and token. A new
 * market still needs the pool owner to authorize its account before it
 * can take bets.
 */
class MarketRegistry
{
public:
    MarketRegistry(MarketContext const& context, beast::Journal journal);

    Expected<Market*>
    createMarket(
        MarketConfig const& config,
        std::string const& question,
        NetClock::time_point now);

    Market*
    find(uint256 const& id);

    Market const*
    find(uint256 const& id) const;

    MarketInfo const*
    info(uint256 const& id) const;

    std::vector<uint256>
    marketsByCreator(AccountID const& creator) const;

    std::size_t
    size() const
    {
        return markets_.size();
    }

    RegistryEvents const&
    events() const
    {
        return events_;
    }

private:
    struct Entry
    {
        MarketInfo info;
        std::unique_ptr<Market> market;
    };

    MarketContext const ctx_;
    beast::Journal const j_;

    std::uint64_t sequence_ = 0;
    std::map<uint256, Entry> markets_;
    RegistryEvents events_;
};

}  // namespace veil
