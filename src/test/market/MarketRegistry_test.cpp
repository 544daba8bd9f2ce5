#include <test/support/MarketEnv.h>

#include <libveil/market/MarketRegistry.h>

#include <xrpl/beast/unit_test.h>

#include <algorithm>
#include <variant>

namespace veil {
namespace test {

class MarketRegistry_test : public beast::unit_test::suite
{
    void
    testCreate()
    {
        testcase("create");

        MarketEnv env;
        BEAST_EXPECT(env.registry.size() == 0);

        auto const r = env.registry.createMarket(
            env.config(PoolTier::Large), "Will the launch slip?", env.start);
        if (!BEAST_EXPECT(r))
            return;

        Market& m = **r;
        BEAST_EXPECT(m.status() == MarketStatus::Open);
        BEAST_EXPECT(m.config().creator == env.creator);
        BEAST_EXPECT(m.config().poolTier == PoolTier::Large);
        BEAST_EXPECT(m.question() == "Will the launch slip?");
        BEAST_EXPECT(inField(m.id()));
        BEAST_EXPECT(m.totalBets() == 0);

        BEAST_EXPECT(env.registry.size() == 1);
        BEAST_EXPECT(env.registry.find(m.id()) == &m);
        BEAST_EXPECT(!env.registry.find(fieldHash({uint256{1}})));

        auto const* info = env.registry.info(m.id());
        if (BEAST_EXPECT(info))
        {
            BEAST_EXPECT(info->id == m.id());
            BEAST_EXPECT(info->creator == env.creator);
            BEAST_EXPECT(info->tier == PoolTier::Large);
            BEAST_EXPECT(info->createdAt == env.start);
            BEAST_EXPECT(info->question == m.question());
        }

        BEAST_EXPECT(env.registry.events().size() == 1);
        auto const& e = std::get<MarketCreated>(env.registry.events().back());
        BEAST_EXPECT(e.id == m.id());
        BEAST_EXPECT(e.creator == env.creator);
        BEAST_EXPECT(e.tier == PoolTier::Large);
        BEAST_EXPECT(e.timestamp == env.start);

        // New markets wait for the pool owner.
        BEAST_EXPECT(!env.pool.isAuthorized(m.account()));
    }

    void
    testIdentity()
    {
        testcase("identity");

        MarketEnv env;
        auto const config = env.config();

        auto const a = env.registry.createMarket(config, "Same?", env.start);
        auto const b = env.registry.createMarket(config, "Same?", env.start);
        if (!BEAST_EXPECT(a && b))
            return;

        BEAST_EXPECT((*a)->id() != (*b)->id());
        BEAST_EXPECT((*a)->account() != (*b)->account());
        BEAST_EXPECT((*a)->account() != env.pool.account());

        auto other = env.config();
        other.creator = AccountID{77};
        auto const c = env.registry.createMarket(other, "Mine", env.start);
        if (!BEAST_EXPECT(c))
            return;

        auto const byCreator = env.registry.marketsByCreator(env.creator);
        BEAST_EXPECT(byCreator.size() == 2);
        BEAST_EXPECT(
            std::count(byCreator.begin(), byCreator.end(), (*a)->id()) == 1);
        BEAST_EXPECT(
            std::count(byCreator.begin(), byCreator.end(), (*b)->id()) == 1);

        auto const mine = env.registry.marketsByCreator(AccountID{77});
        BEAST_EXPECT(mine.size() == 1 && mine[0] == (*c)->id());
        BEAST_EXPECT(env.registry.marketsByCreator(AccountID{78}).empty());
    }

    void
    testRejected()
    {
        testcase("rejected");

        MarketEnv env;

        auto r = env.registry.createMarket(env.config(), "", env.start);
        BEAST_EXPECT(!r && r.error() == Code::emptyQuestion);

        auto config = env.config();
        config.revealDeadline = config.disputeDeadline;
        r = env.registry.createMarket(config, "Bad", env.start);
        BEAST_EXPECT(!r && r.error() == Code::badDeadlines);

        config = env.config();
        config.betDeadline = config.revealDeadline + 1s;
        r = env.registry.createMarket(config, "Bad", env.start);
        BEAST_EXPECT(!r && r.error() == Code::badDeadlines);

        // Betting would already be over
        r = env.registry.createMarket(env.config(), "Late", env.betDeadline);
        BEAST_EXPECT(!r && r.error() == Code::badDeadlines);

        BEAST_EXPECT(env.registry.size() == 0);
        BEAST_EXPECT(env.registry.events().empty());
    }

    void
    testSharedPool()
    {
        testcase("markets share the pool");

        MarketEnv env;
        auto& small = env.createMarket(PoolTier::Small);
        auto& large = env.createMarket(PoolTier::Large);

        env.placeBet(small, makeTicket(Outcome::Yes));
        env.placeBet(large, makeTicket(Outcome::No));
        env.placeBet(large, makeTicket(Outcome::Yes));

        BEAST_EXPECT(env.pool.getDepositCount(PoolTier::Small) == 1);
        BEAST_EXPECT(env.pool.getDepositCount(PoolTier::Large) == 2);
        BEAST_EXPECT(small.totalBets() == 1);
        BEAST_EXPECT(large.totalBets() == 2);
        BEAST_EXPECT(env.pool.events().count<NullifierUsed>() == 3);
        BEAST_EXPECT(env.pool.events().count<StakeReleased>() == 3);
        BEAST_EXPECT(env.token.balanceOf(env.poolAccount) == 0);
        BEAST_EXPECT(env.token.balanceOf(small.account()) == 10);
        BEAST_EXPECT(env.token.balanceOf(large.account()) == 2000);
    }

public:
    void
    run() override
    {
        testCreate();
        testIdentity();
        testRejected();
        testSharedPool();
    }
};

BEAST_DEFINE_TESTSUITE(MarketRegistry, market, veil);

}  // namespace test
}  // namespace veil
