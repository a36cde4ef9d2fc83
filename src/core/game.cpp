#include "core/game.h"
#include <utility>

namespace cryptotrade {
namespace core {

TradingGame::TradingGame(utils::StorageConfig storage, utils::GameConfig game, Clock clock)
    : store_(std::make_unique<LedgerStore>(std::move(storage), std::move(game), std::move(clock))),
      accounts_(std::make_unique<AccountRegistry>(*store_)),
      market_(std::make_unique<MarketOrderExecutor>(*store_)),
      escrow_(std::make_unique<EscrowEngine>(*store_)),
      bonus_(std::make_unique<BonusScheduler>(*store_)),
      portfolio_(std::make_unique<PortfolioService>(*store_)) {}

TradingGame::~TradingGame() {
    close();
}

Result<void> TradingGame::open() { return store_->open(); }
void TradingGame::close() { store_->close(); }
bool TradingGame::isOpen() const { return store_->isOpen(); }

Result<AccountHandle> TradingGame::createOrGetAccount(const std::string& externalId,
                                                      const std::string& displayName) {
    return accounts_->resolveOrCreate(externalId, displayName);
}

Result<std::vector<Wallet>> TradingGame::getWallets(AccountId account) {
    return store_->getWallets(account);
}

Result<OrderReceipt> TradingGame::executeOrder(AccountId account, const TradingPair& pair, TradeSide side,
                                               Amount amount, std::optional<double> price) {
    return market_->execute(account, pair, side, amount, price);
}

Result<TradeOffer> TradingGame::createOffer(AccountId account, const std::string& offerCurrency,
                                            Amount offerAmount, const std::string& wantCurrency,
                                            Amount wantAmount) {
    return escrow_->createOffer(account, offerCurrency, offerAmount, wantCurrency, wantAmount);
}

Result<std::vector<TradeOffer>> TradingGame::listActiveOffers(std::optional<AccountId> exclude) {
    return escrow_->listActiveOffers(exclude);
}

Result<SettlementReceipt> TradingGame::acceptOffer(AccountId account, OfferId offerId) {
    return escrow_->acceptOffer(account, offerId);
}

Result<TradeOffer> TradingGame::cancelOffer(AccountId account, OfferId offerId) {
    return escrow_->cancelOffer(account, offerId);
}

Result<BonusGrant> TradingGame::claimBonus(AccountId account) {
    return bonus_->claim(account);
}

Result<PortfolioValue> TradingGame::portfolioValue(AccountId account, const PriceMap& prices) {
    return portfolio_->portfolioValue(account, prices);
}

Result<std::vector<LeaderboardEntry>> TradingGame::leaderboard(const PriceMap& prices, size_t limit) {
    return portfolio_->leaderboard(prices, limit);
}

}
}
