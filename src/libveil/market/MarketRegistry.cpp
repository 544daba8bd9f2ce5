#include <libveil/market/MarketRegistry.h>

#include <libveil/crypto/Hash.h>

#include <xrpl/basics/Log.h>

#include <cstring>
#include <utility>

namespace veil {

MarketRegistry::MarketRegistry(
    MarketContext const& context,
    beast::Journal journal)
    : ctx_(context), j_(journal)
{
}

Expected<Market*>
MarketRegistry::createMarket(
    MarketConfig const& config,
    std::string const& question,
    NetClock::time_point now)
{
    if (question.empty())
        return Unexpected(Code::emptyQuestion);

    if (auto const r = config.checkDeadlines(now); !r)
    {
        JLOG(j_.debug()) << "Market rejected: " << transHuman(r.error());
        return Unexpected(r.error());
    }

    uint256 creatorWord;
    std::memcpy(
        creatorWord.data() + uint256::bytes - AccountID::bytes,
        config.creator.data(),
        AccountID::bytes);

    auto const id = fieldHash({uint256{++sequence_}, creatorWord});
    // The market's escrow account is the low 20 bytes of its id.
    auto const account =
        AccountID::fromVoid(id.data() + uint256::bytes - AccountID::bytes);

    auto market =
        std::make_unique<Market>(config, question, id, account, ctx_, j_);
    auto* const raw = market.get();

    MarketInfo info{id, config.creator, config.poolTier, now, question};
    markets_.emplace(id, Entry{std::move(info), std::move(market)});

    events_.emit(
        MarketCreated{id, config.creator, config.poolTier, question, now});

    JLOG(j_.info()) << "Market " << id << " created by "
                    << ripple::toBase58(config.creator) << " in "
                    << to_string(config.poolTier) << " tier: " << question;
    return raw;
}

Market*
MarketRegistry::find(uint256 const& id)
{
    auto const it = markets_.find(id);
    return it == markets_.end() ? nullptr : it->second.market.get();
}

Market const*
MarketRegistry::find(uint256 const& id) const
{
    auto const it = markets_.find(id);
    return it == markets_.end() ? nullptr : it->second.market.get();
}

MarketInfo const*
MarketRegistry::info(uint256 const& id) const
{
    auto const it = markets_.find(id);
    return it == markets_.end() ? nullptr : &it->second.info;
}

std::vector<uint256>
MarketRegistry::marketsByCreator(AccountID const& creator) const
{
    std::vector<uint256> result;
    for (auto const& [id, entry] : markets_)
    {
        if (entry.info.creator == creator)
            result.push_back(id);
    }
    return result;
}

}  // namespace veil
