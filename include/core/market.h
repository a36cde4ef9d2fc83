#pragma once

#include "core/ledger.h"
#include "core/oracle.h"
#include <string>
#include <vector>
#include <optional>

namespace cryptotrade {
namespace core {

struct OrderReceipt {
    Transaction transaction;
    std::string debitCurrency;
    Amount debited = 0;
    std::string creditCurrency;
    Amount credited = 0;
};

// Executes instant market orders at a caller-supplied price. All legs and
// the transaction record commit in one write transaction.
class MarketOrderExecutor {
public:
    explicit MarketOrderExecutor(LedgerStore& store);
    
    Result<OrderReceipt> execute(AccountId account, const TradingPair& pair, TradeSide side,
                                 Amount amount, std::optional<double> price);
    // Reads the oracle first, then executes; the oracle is never consulted mid-transaction.
    Result<OrderReceipt> executeAtMarket(AccountId account, const TradingPair& pair, TradeSide side,
                                         Amount amount, const PriceOracle& oracle);
    
    Result<std::vector<Transaction>> history(AccountId account,
                                             const std::optional<std::string>& pair = std::nullopt,
                                             size_t limit = 100);
    
    uint32_t feePpm() const { return feePpm_; }
    
private:
    Result<void> validate(const TradingPair& pair, Amount amount) const;
    
    LedgerStore& store_;
    uint32_t feePpm_;
};

}
}
