#pragma once

#include "core/types.h"
#include <string>
#include <optional>
#include <mutex>

namespace cryptotrade {
namespace core {

// External price collaborator. Prices are fetched before any ledger
// transaction begins and passed into the core.
class PriceOracle {
public:
    virtual ~PriceOracle() = default;
    
    // Units of pair.quote per one unit of pair.base, or nullopt when unknown.
    virtual std::optional<double> price(const TradingPair& pair) const = 0;
};

// Map-backed oracle: every price is quoted in one reference currency and
// cross rates are derived from it.
class StaticPriceOracle : public PriceOracle {
public:
    explicit StaticPriceOracle(std::string referenceCurrency = "USDT");
    StaticPriceOracle(PriceMap prices, std::string referenceCurrency = "USDT");
    
    std::optional<double> price(const TradingPair& pair) const override;
    std::optional<double> priceOf(const std::string& currency) const;
    
    void setPrice(const std::string& currency, double price);
    void removePrice(const std::string& currency);
    void clear();
    
    PriceMap prices() const;
    const std::string& referenceCurrency() const { return reference_; }
    
private:
    mutable std::mutex mtx_;
    PriceMap prices_;
    std::string reference_;
};

}
}
