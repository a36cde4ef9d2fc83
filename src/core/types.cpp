#include "core/types.h"
#include "utils/utils.h"
#include <cmath>
#include <ctime>
#include <limits>

namespace cryptotrade {
namespace core {

uint64_t systemClock() {
    return static_cast<uint64_t>(std::time(nullptr));
}

Amount toAmount(double units) {
    return static_cast<Amount>(std::llround(units * static_cast<double>(AMOUNT_SCALE)));
}

double toUnits(Amount atoms) {
    return static_cast<double>(atoms) / static_cast<double>(AMOUNT_SCALE);
}

bool parseAmount(const std::string& text, Amount& out) {
    std::string t = utils::Formatter::trim(text);
    if (t.empty()) return false;
    size_t dot = t.find('.');
    std::string intPart = dot == std::string::npos ? t : t.substr(0, dot);
    std::string fracPart = dot == std::string::npos ? "" : t.substr(dot + 1);
    if (intPart.empty() && fracPart.empty()) return false;
    if (intPart.empty()) intPart = "0";
    if (fracPart.size() > static_cast<size_t>(AMOUNT_DECIMALS)) return false;
    unsigned __int128 iv = 0;
    for (char c : intPart) {
        if (c < '0' || c > '9') return false;
        iv = iv * 10 + static_cast<unsigned>(c - '0');
        if (iv > static_cast<unsigned __int128>(std::numeric_limits<Amount>::max())) return false;
    }
    unsigned __int128 fv = 0;
    for (char c : fracPart) {
        if (c < '0' || c > '9') return false;
        fv = fv * 10 + static_cast<unsigned>(c - '0');
    }
    for (size_t i = fracPart.size(); i < static_cast<size_t>(AMOUNT_DECIMALS); ++i) fv *= 10;
    unsigned __int128 total = iv * static_cast<unsigned __int128>(AMOUNT_SCALE) + fv;
    if (total > static_cast<unsigned __int128>(std::numeric_limits<Amount>::max())) return false;
    out = static_cast<Amount>(total);
    return true;
}

std::string formatAmount(Amount atoms) {
    return utils::Formatter::formatAmount(atoms, AMOUNT_DECIMALS);
}

Result<Amount> quoteValue(Amount amount, double price) {
    if (!std::isfinite(price) || price <= 0.0) {
        return makeError(ErrorCode::PRICE_UNAVAILABLE, "price must be a positive finite number");
    }
    long double v = static_cast<long double>(amount) * static_cast<long double>(price);
    if (!(v >= 0.0L) || v >= static_cast<long double>(std::numeric_limits<Amount>::max() / 2)) {
        return makeError(ErrorCode::INVALID_OPERATION, "order value out of range");
    }
    return static_cast<Amount>(std::llround(v));
}

uint32_t feeRateToPpm(double rate) {
    if (!(rate > 0.0)) return 0;
    if (rate >= 1.0) return FEE_PPM_SCALE;
    return static_cast<uint32_t>(std::llround(rate * FEE_PPM_SCALE));
}

Amount feeOf(Amount value, uint32_t feePpm) {
    if (value <= 0 || feePpm == 0) return 0;
    __int128 scaled = static_cast<__int128>(value) * feePpm + FEE_PPM_SCALE / 2;
    return static_cast<Amount>(scaled / FEE_PPM_SCALE);
}

const char* toString(TradeSide side) {
    switch (side) {
        case TradeSide::BUY: return "buy";
        case TradeSide::SELL: return "sell";
    }
    return "unknown";
}

const char* toString(OfferStatus status) {
    switch (status) {
        case OfferStatus::ACTIVE: return "active";
        case OfferStatus::COMPLETED: return "completed";
        case OfferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* toString(EntryReason reason) {
    switch (reason) {
        case EntryReason::SEED: return "seed";
        case EntryReason::ORDER: return "order";
        case EntryReason::FEE: return "fee";
        case EntryReason::ESCROW_LOCK: return "escrow_lock";
        case EntryReason::ESCROW_UNLOCK: return "escrow_unlock";
        case EntryReason::SETTLEMENT: return "settlement";
        case EntryReason::BONUS: return "bonus";
        case EntryReason::ADJUSTMENT: return "adjustment";
    }
    return "unknown";
}

bool parseTradeSide(const std::string& text, TradeSide& out) {
    std::string s = utils::Formatter::toLower(text);
    if (s == "buy") { out = TradeSide::BUY; return true; }
    if (s == "sell") { out = TradeSide::SELL; return true; }
    return false;
}

bool parseOfferStatus(const std::string& text, OfferStatus& out) {
    std::string s = utils::Formatter::toLower(text);
    if (s == "active") { out = OfferStatus::ACTIVE; return true; }
    if (s == "completed") { out = OfferStatus::COMPLETED; return true; }
    if (s == "cancelled") { out = OfferStatus::CANCELLED; return true; }
    return false;
}

bool parseEntryReason(const std::string& text, EntryReason& out) {
    static const EntryReason all[] = {
        EntryReason::SEED, EntryReason::ORDER, EntryReason::FEE, EntryReason::ESCROW_LOCK,
        EntryReason::ESCROW_UNLOCK, EntryReason::SETTLEMENT, EntryReason::BONUS,
        EntryReason::ADJUSTMENT
    };
    for (EntryReason r : all) {
        if (text == toString(r)) { out = r; return true; }
    }
    return false;
}

bool TradingPair::parse(const std::string& text, TradingPair& out) {
    auto parts = utils::Formatter::split(text, '/');
    if (parts.size() != 2) return false;
    std::string base = utils::Formatter::toUpper(utils::Formatter::trim(parts[0]));
    std::string quote = utils::Formatter::toUpper(utils::Formatter::trim(parts[1]));
    if (base.empty() || quote.empty()) return false;
    out.base = base;
    out.quote = quote;
    return true;
}

}
}
