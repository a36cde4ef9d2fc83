#include "core/portfolio.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace cryptotrade {
namespace core {

PortfolioService::PortfolioService(LedgerStore& store) : store_(store) {}

double PortfolioService::priceOf(const std::string& currency, const PriceMap& prices) const {
    if (currency == store_.config().baseCurrency) return 1.0;
    auto it = prices.find(currency);
    if (it == prices.end() || !std::isfinite(it->second) || it->second <= 0.0) return 0.0;
    return it->second;
}

Result<PortfolioValue> PortfolioService::portfolioValue(AccountId account, const PriceMap& prices) {
    auto wallets = store_.getWallets(account);
    if (wallets.failed()) return wallets.error();
    
    PortfolioValue out;
    out.accountId = account;
    for (const auto& w : wallets.value()) {
        double price = priceOf(w.currency, prices);
        double value = toUnits(w.balance) * price;
        out.total += value;
        if (w.balance > 0 || w.lockedBalance > 0) {
            Holding h;
            h.currency = w.currency;
            h.balance = w.balance;
            h.lockedBalance = w.lockedBalance;
            h.price = price;
            h.value = value;
            out.breakdown.push_back(h);
        }
    }
    std::sort(out.breakdown.begin(), out.breakdown.end(), [](const Holding& a, const Holding& b) {
        if (a.value != b.value) return a.value > b.value;
        return a.currency < b.currency;
    });
    return out;
}

Result<std::vector<LeaderboardEntry>> PortfolioService::rankAll(const PriceMap& prices) {
    std::map<AccountId, LeaderboardEntry> byAccount;
    auto res = store_.runRead("leaderboard", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT a.id, a.display_name, w.currency, w.balance "
                               "FROM accounts a LEFT JOIN wallets w ON w.account_id = a.id "
                               "ORDER BY a.id, w.currency;");
        while (stmt.step()) {
            AccountId id = stmt.columnInt64(0);
            auto& entry = byAccount[id];
            entry.accountId = id;
            entry.displayName = stmt.columnText(1);
            if (stmt.columnIsNull(2)) continue;
            entry.totalValue += toUnits(stmt.columnInt64(3)) * priceOf(stmt.columnText(2), prices);
        }
    });
    if (res.failed()) return res.error();
    
    std::vector<LeaderboardEntry> ranked;
    ranked.reserve(byAccount.size());
    for (auto& kv : byAccount) ranked.push_back(std::move(kv.second));
    std::sort(ranked.begin(), ranked.end(), [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
        if (a.totalValue != b.totalValue) return a.totalValue > b.totalValue;
        return a.accountId < b.accountId;
    });
    for (size_t i = 0; i < ranked.size(); i++) {
        ranked[i].rank = static_cast<uint32_t>(i + 1);
    }
    return ranked;
}

Result<std::vector<LeaderboardEntry>> PortfolioService::leaderboard(const PriceMap& prices, size_t limit) {
    auto ranked = rankAll(prices);
    if (ranked.failed()) return ranked.error();
    auto out = std::move(ranked.value());
    if (out.size() > limit) out.resize(limit);
    return out;
}

Result<RankInfo> PortfolioService::rankOf(AccountId account, const PriceMap& prices) {
    auto ranked = rankAll(prices);
    if (ranked.failed()) return ranked.error();
    const auto& all = ranked.value();
    for (const auto& entry : all) {
        if (entry.accountId != account) continue;
        RankInfo info;
        info.rank = entry.rank;
        info.totalAccounts = all.size();
        info.totalValue = entry.totalValue;
        info.percentile = static_cast<double>(all.size() - entry.rank) /
                          static_cast<double>(all.size()) * 100.0;
        return info;
    }
    return makeError(ErrorCode::NOT_FOUND, "unknown account " + std::to_string(account));
}

Result<std::vector<CoinHolding>> PortfolioService::coinLeaderboard(const std::string& currency, size_t limit) {
    if (!store_.config().isSupported(currency)) {
        return makeError(ErrorCode::INVALID_OPERATION, "unsupported currency " + currency);
    }
    std::vector<CoinHolding> out;
    auto res = store_.runRead("coin_leaderboard", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT a.id, a.display_name, w.balance FROM wallets w "
                               "JOIN accounts a ON a.id = w.account_id WHERE w.currency = ?1 "
                               "ORDER BY w.balance DESC, a.id ASC LIMIT ?2;");
        stmt.bind(1, currency).bind(2, static_cast<int64_t>(limit));
        while (stmt.step()) {
            CoinHolding h;
            h.rank = static_cast<uint32_t>(out.size() + 1);
            h.accountId = stmt.columnInt64(0);
            h.displayName = stmt.columnText(1);
            h.balance = stmt.columnInt64(2);
            out.push_back(h);
        }
    });
    if (res.failed()) return res.error();
    return out;
}

Result<PortfolioSnapshot> PortfolioService::recordSnapshot(AccountId account, const PriceMap& prices) {
    auto value = portfolioValue(account, prices);
    if (value.failed()) return value.error();
    
    PortfolioSnapshot snap;
    snap.accountId = account;
    snap.totalValue = value.value().total;
    auto res = store_.runTransaction("record_snapshot", [&](LedgerTxn& txn) {
        snap.recordedAt = txn.now();
        auto stmt = txn.db().prepare("INSERT INTO portfolio_history(account_id, total_value, recorded_at) "
                                     "VALUES(?1, ?2, ?3);");
        stmt.bind(1, account).bind(2, snap.totalValue).bind(3, snap.recordedAt);
        stmt.execute();
        snap.id = txn.db().lastInsertId();
    });
    if (res.failed()) return res.error();
    
    LOG_CAT(DEBUG, "portfolio", "snapshot account " + std::to_string(account) + " = " +
            utils::Formatter::formatValue(snap.totalValue));
    return snap;
}

Result<std::vector<PortfolioSnapshot>> PortfolioService::history(AccountId account, size_t limit) {
    std::vector<PortfolioSnapshot> out;
    auto res = store_.runRead("portfolio_history", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT id, account_id, total_value, recorded_at FROM portfolio_history "
                               "WHERE account_id = ?1 ORDER BY id DESC LIMIT ?2;");
        stmt.bind(1, account).bind(2, static_cast<int64_t>(limit));
        while (stmt.step()) {
            PortfolioSnapshot s;
            s.id = stmt.columnInt64(0);
            s.accountId = stmt.columnInt64(1);
            s.totalValue = stmt.columnDouble(2);
            s.recordedAt = static_cast<uint64_t>(stmt.columnInt64(3));
            out.push_back(s);
        }
    });
    if (res.failed()) return res.error();
    return out;
}

}
}
