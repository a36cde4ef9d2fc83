#include "core/oracle.h"
#include <cmath>
#include <utility>

namespace cryptotrade {
namespace core {

static bool usablePrice(double p) {
    return std::isfinite(p) && p > 0.0;
}

StaticPriceOracle::StaticPriceOracle(std::string referenceCurrency)
    : reference_(std::move(referenceCurrency)) {}

StaticPriceOracle::StaticPriceOracle(PriceMap prices, std::string referenceCurrency)
    : prices_(std::move(prices)), reference_(std::move(referenceCurrency)) {}

std::optional<double> StaticPriceOracle::priceOf(const std::string& currency) const {
    if (currency == reference_) return 1.0;
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = prices_.find(currency);
    if (it == prices_.end() || !usablePrice(it->second)) return std::nullopt;
    return it->second;
}

std::optional<double> StaticPriceOracle::price(const TradingPair& pair) const {
    auto base = priceOf(pair.base);
    auto quote = priceOf(pair.quote);
    if (!base || !quote) return std::nullopt;
    double p = *base / *quote;
    if (!usablePrice(p)) return std::nullopt;
    return p;
}

void StaticPriceOracle::setPrice(const std::string& currency, double price) {
    std::lock_guard<std::mutex> lock(mtx_);
    prices_[currency] = price;
}

void StaticPriceOracle::removePrice(const std::string& currency) {
    std::lock_guard<std::mutex> lock(mtx_);
    prices_.erase(currency);
}

void StaticPriceOracle::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    prices_.clear();
}

PriceMap StaticPriceOracle::prices() const {
    std::lock_guard<std::mutex> lock(mtx_);
    PriceMap out = prices_;
    out[reference_] = 1.0;
    return out;
}

}
}
