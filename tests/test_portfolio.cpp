#include <gtest/gtest.h>
#include "test_support.h"

using namespace cryptotrade;
using namespace cryptotrade::core;
using cryptotrade::test::units;

class PortfolioTest : public test::GameTest {
protected:
    void SetUp() override {
        test::GameTest::SetUp();
        alice = newAccount("tg:alice");
        bob = newAccount("tg:bob");
        carol = newAccount("tg:carol");
        ASSERT_TRUE(game->executeOrder(alice, TradingPair{"BTC", "USDT"}, TradeSide::BUY,
                                       units(0.1), 50000.0).ok());
        prices = {{"BTC", 60000.0}, {"ETH", 3000.0}};
    }

    AccountId alice = 0;
    AccountId bob = 0;
    AccountId carol = 0;
    PriceMap prices;
};

TEST_F(PortfolioTest, ValueUsesSpendableBalances) {
    auto value = game->portfolioValue(alice, prices);
    ASSERT_TRUE(value.ok()) << value.error().message;
    EXPECT_EQ(value.value().accountId, alice);
    EXPECT_NEAR(value.value().total, 4995.0 + 6000.0, 1e-6);

    const auto& breakdown = value.value().breakdown;
    ASSERT_EQ(breakdown.size(), 2u);
    EXPECT_EQ(breakdown[0].currency, "BTC");
    EXPECT_NEAR(breakdown[0].value, 6000.0, 1e-6);
    EXPECT_DOUBLE_EQ(breakdown[0].price, 60000.0);
    EXPECT_EQ(breakdown[1].currency, "USDT");
    EXPECT_DOUBLE_EQ(breakdown[1].price, 1.0);
    EXPECT_NEAR(breakdown[1].value, 4995.0, 1e-6);
}

TEST_F(PortfolioTest, LockedFundsAreListedButNotValued) {
    ASSERT_TRUE(game->createOffer(alice, "BTC", units(0.05), "USDT", units(3000)).ok());
    auto value = game->portfolioValue(alice, prices);
    ASSERT_TRUE(value.ok());
    EXPECT_NEAR(value.value().total, 4995.0 + 3000.0, 1e-6);

    const Holding* btc = nullptr;
    for (const auto& h : value.value().breakdown) {
        if (h.currency == "BTC") btc = &h;
    }
    ASSERT_NE(btc, nullptr);
    EXPECT_EQ(btc->balance, units(0.05));
    EXPECT_EQ(btc->lockedBalance, units(0.05));
}

TEST_F(PortfolioTest, MissingPriceCountsAsZero) {
    auto value = game->portfolioValue(alice, PriceMap{});
    ASSERT_TRUE(value.ok());
    EXPECT_NEAR(value.value().total, 4995.0, 1e-6);
    ASSERT_EQ(value.value().breakdown.size(), 2u);
    EXPECT_EQ(value.value().breakdown[0].currency, "USDT");
    EXPECT_EQ(value.value().breakdown[1].currency, "BTC");
    EXPECT_DOUBLE_EQ(value.value().breakdown[1].value, 0.0);

    PriceMap bad = {{"BTC", -1.0}};
    EXPECT_NEAR(game->portfolioValue(alice, bad).value().total, 4995.0, 1e-6);
    EXPECT_EQ(game->portfolioValue(999, prices).code(), ErrorCode::NOT_FOUND);
}

TEST_F(PortfolioTest, LeaderboardOrdersByValueThenId) {
    auto board = game->leaderboard(prices);
    ASSERT_TRUE(board.ok());
    ASSERT_EQ(board.value().size(), 3u);
    EXPECT_EQ(board.value()[0].accountId, alice);
    EXPECT_EQ(board.value()[0].rank, 1u);
    EXPECT_EQ(board.value()[0].displayName, "tg:alice name");
    EXPECT_EQ(board.value()[1].accountId, bob);
    EXPECT_EQ(board.value()[1].rank, 2u);
    EXPECT_EQ(board.value()[2].accountId, carol);
    EXPECT_EQ(board.value()[2].rank, 3u);
    EXPECT_NEAR(board.value()[1].totalValue, 10000.0, 1e-6);

    // BTC falls: alice drops below the untouched accounts.
    PriceMap crash = {{"BTC", 10000.0}};
    auto after = game->leaderboard(crash);
    ASSERT_TRUE(after.ok());
    EXPECT_EQ(after.value()[0].accountId, bob);
    EXPECT_EQ(after.value()[1].accountId, carol);
    EXPECT_EQ(after.value()[2].accountId, alice);

    auto top = game->leaderboard(prices, 2);
    ASSERT_EQ(top.value().size(), 2u);
    EXPECT_EQ(top.value()[1].accountId, bob);
}

TEST_F(PortfolioTest, RankAndPercentile) {
    auto first = game->portfolio().rankOf(alice, prices);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value().rank, 1u);
    EXPECT_EQ(first.value().totalAccounts, 3u);
    EXPECT_NEAR(first.value().percentile, 200.0 / 3.0, 1e-9);

    auto last = game->portfolio().rankOf(carol, prices);
    ASSERT_TRUE(last.ok());
    EXPECT_EQ(last.value().rank, 3u);
    EXPECT_DOUBLE_EQ(last.value().percentile, 0.0);

    EXPECT_EQ(game->portfolio().rankOf(999, prices).code(), ErrorCode::NOT_FOUND);
}

TEST_F(PortfolioTest, CoinLeaderboard) {
    ASSERT_TRUE(game->executeOrder(carol, TradingPair{"BTC", "USDT"}, TradeSide::BUY,
                                   units(0.02), 50000.0).ok());
    auto board = game->portfolio().coinLeaderboard("BTC");
    ASSERT_TRUE(board.ok());
    ASSERT_EQ(board.value().size(), 3u);
    EXPECT_EQ(board.value()[0].accountId, alice);
    EXPECT_EQ(board.value()[0].balance, units(0.1));
    EXPECT_EQ(board.value()[1].accountId, carol);
    EXPECT_EQ(board.value()[2].accountId, bob);
    EXPECT_EQ(board.value()[2].balance, 0);
    EXPECT_EQ(board.value()[2].rank, 3u);

    EXPECT_EQ(game->portfolio().coinLeaderboard("BTC", 1).value().size(), 1u);
    EXPECT_EQ(game->portfolio().coinLeaderboard("XYZ").code(), ErrorCode::INVALID_OPERATION);
}

TEST_F(PortfolioTest, SnapshotsAreRecorded) {
    auto snap = game->portfolio().recordSnapshot(alice, prices);
    ASSERT_TRUE(snap.ok());
    EXPECT_NEAR(snap.value().totalValue, 10995.0, 1e-6);
    EXPECT_EQ(snap.value().recordedAt, clock.now());

    clock.advance(3600);
    PriceMap lower = {{"BTC", 55000.0}};
    ASSERT_TRUE(game->portfolio().recordSnapshot(alice, lower).ok());

    auto history = game->portfolio().history(alice);
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history.value().size(), 2u);
    EXPECT_NEAR(history.value()[0].totalValue, 10495.0, 1e-6);
    EXPECT_EQ(history.value()[0].recordedAt, clock.now());
    EXPECT_TRUE(game->portfolio().history(bob).value().empty());
    EXPECT_EQ(game->portfolio().recordSnapshot(999, prices).code(), ErrorCode::NOT_FOUND);
}
