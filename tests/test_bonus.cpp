#include <gtest/gtest.h>
#include "test_support.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace cryptotrade;
using namespace cryptotrade::core;
using cryptotrade::test::units;

class BonusTest : public test::GameTest {
protected:
    void SetUp() override {
        test::GameTest::SetUp();
        alice = newAccount("tg:alice");
    }

    AccountId alice = 0;
};

TEST_F(BonusTest, FirstClaimCreditsBaseCurrency) {
    auto grant = game->claimBonus(alice);
    ASSERT_TRUE(grant.ok()) << grant.error().message;
    EXPECT_GT(grant.value().claimId, 0);
    EXPECT_EQ(grant.value().amount, units(50));
    EXPECT_EQ(grant.value().newBalance, units(10050));
    EXPECT_EQ(grant.value().claimedAt, clock.now());
    EXPECT_EQ(grant.value().day.size(), 10u);
    EXPECT_EQ(balance(alice, "USDT"), units(10050));

    auto entries = game->store().entries(alice, "USDT").value();
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries[0].reason, EntryReason::BONUS);
    EXPECT_EQ(entries[0].reference, grant.value().claimId);

    auto account = game->accounts().getAccount(alice).value();
    ASSERT_TRUE(account.lastBonusClaim.has_value());
    EXPECT_EQ(*account.lastBonusClaim, clock.now());
}

TEST_F(BonusTest, SecondClaimWithinCooldownIsTooEarly) {
    ASSERT_TRUE(game->claimBonus(alice).ok());
    clock.advance(3600);

    auto again = game->claimBonus(alice);
    ASSERT_EQ(again.code(), ErrorCode::TOO_EARLY);
    EXPECT_EQ(again.error().retryAfter, 86400u - 3600u);
    EXPECT_EQ(balance(alice, "USDT"), units(10050));
    EXPECT_EQ(game->bonus().history(alice).value().size(), 1u);
}

TEST_F(BonusTest, EligibleExactlyAtCooldownBoundary) {
    ASSERT_TRUE(game->claimBonus(alice).ok());

    clock.advance(86399);
    auto early = game->claimBonus(alice);
    ASSERT_EQ(early.code(), ErrorCode::TOO_EARLY);
    EXPECT_EQ(early.error().retryAfter, 1u);

    clock.advance(1);
    auto grant = game->claimBonus(alice);
    ASSERT_TRUE(grant.ok()) << grant.error().message;
    EXPECT_EQ(balance(alice, "USDT"), units(10100));

    auto history = game->bonus().history(alice).value();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].claimedAt, clock.now());
    EXPECT_EQ(history[0].amount, units(50));
}

TEST_F(BonusTest, ConcurrentClaimsGrantOnce) {
    const int kThreads = 8;
    std::atomic<int> granted{0};
    std::atomic<int> tooEarly{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([&] {
            auto res = game->claimBonus(alice);
            if (res.ok()) granted++;
            else if (res.code() == ErrorCode::TOO_EARLY) tooEarly++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(granted.load(), 1);
    EXPECT_EQ(tooEarly.load(), kThreads - 1);
    EXPECT_EQ(balance(alice, "USDT"), units(10050));
    EXPECT_EQ(game->bonus().history(alice).value().size(), 1u);
    EXPECT_EQ(game->store().journalTotal("USDT", EntryReason::BONUS).value(), units(50));
}

TEST_F(BonusTest, StatusReportsRemainingTime) {
    auto fresh = game->bonus().status(alice);
    ASSERT_TRUE(fresh.ok());
    EXPECT_TRUE(fresh.value().eligible);
    EXPECT_FALSE(fresh.value().lastClaim.has_value());
    EXPECT_EQ(fresh.value().amount, units(50));

    ASSERT_TRUE(game->claimBonus(alice).ok());
    clock.advance(600);
    auto waiting = game->bonus().status(alice);
    ASSERT_TRUE(waiting.ok());
    EXPECT_FALSE(waiting.value().eligible);
    EXPECT_EQ(waiting.value().secondsRemaining, 86400u - 600u);

    clock.advance(86400);
    EXPECT_TRUE(game->bonus().status(alice).value().eligible);
}

TEST_F(BonusTest, AccountsAreIndependent) {
    AccountId bob = newAccount("tg:bob");
    ASSERT_TRUE(game->claimBonus(alice).ok());
    ASSERT_TRUE(game->claimBonus(bob).ok());
    EXPECT_EQ(balance(bob, "USDT"), units(10050));
}

TEST_F(BonusTest, UnknownAccount) {
    EXPECT_EQ(game->claimBonus(999).code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(game->bonus().status(999).code(), ErrorCode::NOT_FOUND);
}

class ShortCooldownBonusTest : public test::GameTest {
protected:
    void configure(utils::GameConfig& cfg) override {
        cfg.bonusAmount = 5.0;
        cfg.bonusCooldownSeconds = 60;
    }
};

TEST_F(ShortCooldownBonusTest, UsesConfiguredAmountAndCooldown) {
    AccountId id = newAccount("tg:short");
    ASSERT_TRUE(game->claimBonus(id).ok());
    clock.advance(59);
    EXPECT_EQ(game->claimBonus(id).code(), ErrorCode::TOO_EARLY);
    clock.advance(1);
    ASSERT_TRUE(game->claimBonus(id).ok());
    EXPECT_EQ(balance(id, "USDT"), units(10010));
}
