#pragma once

#include "core/ledger.h"
#include <string>
#include <vector>

namespace cryptotrade {
namespace core {

struct Holding {
    std::string currency;
    Amount balance = 0;
    Amount lockedBalance = 0;
    double price = 0.0;
    // Spendable balance valued in the base currency.
    double value = 0.0;
};

struct PortfolioValue {
    AccountId accountId = 0;
    double total = 0.0;
    std::vector<Holding> breakdown;
};

struct LeaderboardEntry {
    uint32_t rank = 0;
    AccountId accountId = 0;
    std::string displayName;
    double totalValue = 0.0;
};

struct RankInfo {
    uint32_t rank = 0;
    size_t totalAccounts = 0;
    double percentile = 0.0;
    double totalValue = 0.0;
};

struct CoinHolding {
    uint32_t rank = 0;
    AccountId accountId = 0;
    std::string displayName;
    Amount balance = 0;
};

struct PortfolioSnapshot {
    int64_t id = 0;
    AccountId accountId = 0;
    double totalValue = 0.0;
    uint64_t recordedAt = 0;
};

// Read-side aggregation over wallets. Prices map currency -> base-currency
// price; the base currency is always worth 1 and a missing price counts as 0.
class PortfolioService {
public:
    explicit PortfolioService(LedgerStore& store);
    
    Result<PortfolioValue> portfolioValue(AccountId account, const PriceMap& prices);
    // Sorted by value descending, then account id; ranks run 1..N.
    Result<std::vector<LeaderboardEntry>> leaderboard(const PriceMap& prices, size_t limit = 100);
    Result<RankInfo> rankOf(AccountId account, const PriceMap& prices);
    Result<std::vector<CoinHolding>> coinLeaderboard(const std::string& currency, size_t limit = 100);
    
    Result<PortfolioSnapshot> recordSnapshot(AccountId account, const PriceMap& prices);
    Result<std::vector<PortfolioSnapshot>> history(AccountId account, size_t limit = 100);
    
    double priceOf(const std::string& currency, const PriceMap& prices) const;
    
private:
    Result<std::vector<LeaderboardEntry>> rankAll(const PriceMap& prices);
    
    LedgerStore& store_;
};

}
}
