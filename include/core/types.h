#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <cstdint>

namespace cryptotrade {
namespace core {

// Balances are fixed-point integers with eight decimals (1 unit = 1e8 atoms).
using Amount = int64_t;
using AccountId = int64_t;
using OfferId = int64_t;

static constexpr Amount AMOUNT_SCALE = 100000000;
static constexpr int AMOUNT_DECIMALS = 8;
static constexpr uint32_t FEE_PPM_SCALE = 1000000;

// Unix seconds. Injected so tests can move time.
using Clock = std::function<uint64_t()>;
uint64_t systemClock();

// Currency -> unit price expressed in the base currency.
using PriceMap = std::map<std::string, double>;

Amount toAmount(double units);
double toUnits(Amount atoms);
bool parseAmount(const std::string& text, Amount& out);
std::string formatAmount(Amount atoms);

// round(amount * price); PRICE_UNAVAILABLE for a non-positive price, INVALID_OPERATION on overflow.
Result<Amount> quoteValue(Amount amount, double price);
uint32_t feeRateToPpm(double rate);
// value * ppm / 1e6, rounded half up.
Amount feeOf(Amount value, uint32_t feePpm);

enum class TradeSide : uint8_t {
    BUY = 0,
    SELL = 1
};

enum class OfferStatus : uint8_t {
    ACTIVE = 0,
    COMPLETED = 1,
    CANCELLED = 2
};

enum class EntryReason : uint8_t {
    SEED = 0,
    ORDER = 1,
    FEE = 2,
    ESCROW_LOCK = 3,
    ESCROW_UNLOCK = 4,
    SETTLEMENT = 5,
    BONUS = 6,
    ADJUSTMENT = 7
};

const char* toString(TradeSide side);
const char* toString(OfferStatus status);
const char* toString(EntryReason reason);
bool parseTradeSide(const std::string& text, TradeSide& out);
bool parseOfferStatus(const std::string& text, OfferStatus& out);
bool parseEntryReason(const std::string& text, EntryReason& out);

struct TradingPair {
    std::string base;
    std::string quote;
    
    static bool parse(const std::string& text, TradingPair& out);
    std::string str() const { return base + "/" + quote; }
};

struct Account {
    AccountId id = 0;
    std::string externalId;
    std::string displayName;
    uint64_t createdAt = 0;
    uint64_t lastLogin = 0;
    std::optional<uint64_t> lastBonusClaim;
};

struct Wallet {
    AccountId accountId = 0;
    std::string currency;
    Amount balance = 0;
    Amount lockedBalance = 0;
    uint64_t updatedAt = 0;
    
    Amount total() const { return balance + lockedBalance; }
};

struct Transaction {
    int64_t id = 0;
    AccountId accountId = 0;
    std::string pair;
    TradeSide kind = TradeSide::BUY;
    Amount amount = 0;
    double price = 0.0;
    // Quote leg before fee: spend for a buy, proceeds for a sell.
    Amount total = 0;
    Amount fee = 0;
    uint64_t timestamp = 0;
};

struct TradeOffer {
    OfferId id = 0;
    AccountId creatorId = 0;
    std::string creatorName;
    std::string offeringCurrency;
    Amount offeringAmount = 0;
    std::string requestingCurrency;
    Amount requestingAmount = 0;
    OfferStatus status = OfferStatus::ACTIVE;
    uint64_t createdAt = 0;
    uint64_t updatedAt = 0;
};

struct P2PSettlement {
    int64_t id = 0;
    OfferId offerId = 0;
    AccountId creatorId = 0;
    AccountId acceptorId = 0;
    std::string offeringCurrency;
    Amount offeringAmount = 0;
    std::string requestingCurrency;
    Amount requestingAmount = 0;
    uint64_t timestamp = 0;
};

struct LedgerEntry {
    int64_t id = 0;
    AccountId accountId = 0;
    std::string currency;
    Amount balanceDelta = 0;
    Amount lockedDelta = 0;
    EntryReason reason = EntryReason::ADJUSTMENT;
    int64_t reference = 0;
    uint64_t timestamp = 0;
};

struct BonusClaim {
    int64_t id = 0;
    AccountId accountId = 0;
    std::string day;
    Amount amount = 0;
    uint64_t claimedAt = 0;
};

}
}
