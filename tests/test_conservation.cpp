#include <gtest/gtest.h>
#include "test_support.h"
#include <map>
#include <thread>
#include <vector>

using namespace cryptotrade;
using namespace cryptotrade::core;
using cryptotrade::test::units;

class ConservationTest : public test::GameTest {
protected:
    void configure(utils::GameConfig& cfg) override {
        cfg.supportedCurrencies = {"USDT", "BTC", "ETH"};
    }

    // Expected per-currency supply rebuilt from seeds, bonuses and the trade log.
    std::map<std::string, Amount> expectedSupply(const std::vector<AccountId>& ids) {
        std::map<std::string, Amount> supply;
        supply["USDT"] = game->store().journalTotal("USDT", EntryReason::SEED).value() +
                         game->store().journalTotal("USDT", EntryReason::BONUS).value();
        for (AccountId id : ids) {
            auto history = game->market().history(id, std::nullopt, 1000);
            EXPECT_TRUE(history.ok());
            for (const auto& tx : history.value()) {
                TradingPair pair;
                EXPECT_TRUE(TradingPair::parse(tx.pair, pair));
                if (tx.kind == TradeSide::BUY) {
                    supply[pair.base] += tx.amount;
                    supply[pair.quote] -= tx.total + tx.fee;
                } else {
                    supply[pair.base] -= tx.amount;
                    supply[pair.quote] += tx.total - tx.fee;
                }
            }
        }
        return supply;
    }

    void expectConsistent(const std::vector<AccountId>& ids) {
        auto supply = expectedSupply(ids);
        for (const auto& currency : config.supportedCurrencies) {
            EXPECT_EQ(game->store().currencyTotal(currency).value(), supply[currency]) << currency;
            EXPECT_EQ(game->store().journalTotal(currency, EntryReason::SETTLEMENT).value(), 0) << currency;
            EXPECT_EQ(game->store().journalTotal(currency, EntryReason::ESCROW_LOCK).value(), 0) << currency;
            EXPECT_EQ(game->store().journalTotal(currency, EntryReason::ESCROW_UNLOCK).value(), 0) << currency;
        }
        for (AccountId id : ids) {
            for (const auto& w : game->getWallets(id).value()) {
                EXPECT_GE(w.balance, 0);
                EXPECT_GE(w.lockedBalance, 0);
            }
        }
        auto mismatches = game->store().verifyJournal();
        ASSERT_TRUE(mismatches.ok());
        EXPECT_TRUE(mismatches.value().empty());
    }
};

TEST_F(ConservationTest, MixedSequencePreservesSupply) {
    AccountId a = newAccount("tg:a");
    AccountId b = newAccount("tg:b");
    AccountId c = newAccount("tg:c");
    std::vector<AccountId> ids = {a, b, c};

    ASSERT_TRUE(game->executeOrder(a, TradingPair{"BTC", "USDT"}, TradeSide::BUY, units(0.1), 50000.0).ok());
    ASSERT_TRUE(game->executeOrder(b, TradingPair{"ETH", "USDT"}, TradeSide::BUY, units(1.5), 2999.99).ok());
    ASSERT_TRUE(game->executeOrder(c, TradingPair{"ETH", "BTC"}, TradeSide::BUY, units(0.5), 0.06).code() ==
                ErrorCode::INSUFFICIENT_FUNDS);
    ASSERT_TRUE(game->claimBonus(a).ok());
    ASSERT_TRUE(game->claimBonus(c).ok());
    expectConsistent(ids);

    auto offer = game->createOffer(a, "BTC", units(0.04), "ETH", units(0.7));
    ASSERT_TRUE(offer.ok());
    auto cancelled = game->createOffer(b, "USDT", units(1234.5), "BTC", units(0.02));
    ASSERT_TRUE(cancelled.ok());
    expectConsistent(ids);

    ASSERT_TRUE(game->acceptOffer(b, offer.value().id).ok());
    ASSERT_TRUE(game->cancelOffer(b, cancelled.value().id).ok());
    ASSERT_TRUE(game->executeOrder(b, TradingPair{"BTC", "USDT"}, TradeSide::SELL, units(0.013), 51234.5678).ok());
    ASSERT_TRUE(game->executeOrder(a, TradingPair{"ETH", "BTC"}, TradeSide::SELL, units(0.7), 0.0585).ok());
    clock.advance(86400);
    ASSERT_TRUE(game->claimBonus(a).ok());
    expectConsistent(ids);

    EXPECT_EQ(balance(b, "BTC"), units(0.04) - units(0.013));
    EXPECT_EQ(locked(a, "BTC"), 0);
    EXPECT_EQ(locked(b, "USDT"), 0);
}

TEST_F(ConservationTest, FeesAreRemovedFromSupply) {
    AccountId a = newAccount("tg:a");
    ASSERT_TRUE(game->executeOrder(a, TradingPair{"BTC", "USDT"}, TradeSide::BUY, units(0.1), 50000.0).ok());
    ASSERT_TRUE(game->executeOrder(a, TradingPair{"BTC", "USDT"}, TradeSide::SELL, units(0.1), 50000.0).ok());

    Amount fees = -game->store().journalTotal("USDT", EntryReason::FEE).value();
    EXPECT_EQ(fees, units(10));
    EXPECT_EQ(game->store().currencyTotal("USDT").value(), units(10000) - fees);
    EXPECT_EQ(game->store().currencyTotal("BTC").value(), 0);

    Amount logged = 0;
    for (const auto& tx : game->market().history(a).value()) logged += tx.fee;
    EXPECT_EQ(logged, fees);
}

TEST_F(ConservationTest, ConcurrentTradingPreservesSupply) {
    std::vector<AccountId> ids;
    for (int i = 0; i < 4; i++) ids.push_back(newAccount("tg:user" + std::to_string(i)));
    auto offer = game->createOffer(ids[0], "USDT", units(2000), "ETH", units(0.5));
    ASSERT_TRUE(offer.ok());

    std::vector<std::thread> threads;
    for (size_t t = 0; t < ids.size(); t++) {
        AccountId id = ids[t];
        threads.emplace_back([&, id, t] {
            for (int i = 0; i < 5; i++) {
                game->executeOrder(id, TradingPair{"ETH", "USDT"}, TradeSide::BUY, units(0.3), 3000.0 + i);
                game->executeOrder(id, TradingPair{"ETH", "USDT"}, TradeSide::SELL, units(0.1), 3010.0);
                if (i == 2 && t > 0) game->acceptOffer(id, offer.value().id);
                game->claimBonus(id);
            }
        });
    }
    for (auto& t : threads) t.join();

    expectConsistent(ids);
    auto settled = game->escrow().getOffer(offer.value().id);
    ASSERT_TRUE(settled.ok());
    EXPECT_EQ(settled.value().status, OfferStatus::COMPLETED);
    EXPECT_EQ(game->escrow().settlementHistory(ids[0]).value().size(), 1u);
    EXPECT_EQ(game->store().journalTotal("USDT", EntryReason::BONUS).value(), 4 * units(50));
}
