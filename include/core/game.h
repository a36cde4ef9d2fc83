#pragma once

#include "core/ledger.h"
#include "core/accounts.h"
#include "core/market.h"
#include "core/escrow.h"
#include "core/bonus.h"
#include "core/portfolio.h"
#include <memory>

namespace cryptotrade {
namespace core {

// Owns the store and wires every component to it.
class TradingGame {
public:
    TradingGame(utils::StorageConfig storage, utils::GameConfig game, Clock clock = systemClock);
    ~TradingGame();
    
    Result<void> open();
    void close();
    bool isOpen() const;
    
    Result<AccountHandle> createOrGetAccount(const std::string& externalId, const std::string& displayName);
    Result<std::vector<Wallet>> getWallets(AccountId account);
    Result<OrderReceipt> executeOrder(AccountId account, const TradingPair& pair, TradeSide side,
                                      Amount amount, std::optional<double> price);
    Result<TradeOffer> createOffer(AccountId account, const std::string& offerCurrency, Amount offerAmount,
                                   const std::string& wantCurrency, Amount wantAmount);
    Result<std::vector<TradeOffer>> listActiveOffers(std::optional<AccountId> exclude = std::nullopt);
    Result<SettlementReceipt> acceptOffer(AccountId account, OfferId offerId);
    Result<TradeOffer> cancelOffer(AccountId account, OfferId offerId);
    Result<BonusGrant> claimBonus(AccountId account);
    Result<PortfolioValue> portfolioValue(AccountId account, const PriceMap& prices);
    Result<std::vector<LeaderboardEntry>> leaderboard(const PriceMap& prices, size_t limit = 100);
    
    LedgerStore& store() { return *store_; }
    AccountRegistry& accounts() { return *accounts_; }
    MarketOrderExecutor& market() { return *market_; }
    EscrowEngine& escrow() { return *escrow_; }
    BonusScheduler& bonus() { return *bonus_; }
    PortfolioService& portfolio() { return *portfolio_; }
    
private:
    std::unique_ptr<LedgerStore> store_;
    std::unique_ptr<AccountRegistry> accounts_;
    std::unique_ptr<MarketOrderExecutor> market_;
    std::unique_ptr<EscrowEngine> escrow_;
    std::unique_ptr<BonusScheduler> bonus_;
    std::unique_ptr<PortfolioService> portfolio_;
};

}
}
