#include "core/market.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace cryptotrade {
namespace core {

static Transaction readTransaction(database::Statement& stmt) {
    Transaction t;
    t.id = stmt.columnInt64(0);
    t.accountId = stmt.columnInt64(1);
    t.pair = stmt.columnText(2);
    parseTradeSide(stmt.columnText(3), t.kind);
    t.amount = stmt.columnInt64(4);
    t.price = stmt.columnDouble(5);
    t.total = stmt.columnInt64(6);
    t.fee = stmt.columnInt64(7);
    t.timestamp = static_cast<uint64_t>(stmt.columnInt64(8));
    return t;
}

MarketOrderExecutor::MarketOrderExecutor(LedgerStore& store)
    : store_(store), feePpm_(feeRateToPpm(store.config().feeRate)) {}

Result<void> MarketOrderExecutor::validate(const TradingPair& pair, Amount amount) const {
    const auto& config = store_.config();
    if (!config.isSupported(pair.base) || !config.isSupported(pair.quote)) {
        return makeError(ErrorCode::INVALID_OPERATION, "unsupported pair " + pair.str());
    }
    if (pair.base == pair.quote) {
        return makeError(ErrorCode::INVALID_OPERATION, "pair currencies must differ");
    }
    if (amount <= 0) {
        return makeError(ErrorCode::INVALID_OPERATION, "order amount must be positive");
    }
    return Result<void>();
}

Result<OrderReceipt> MarketOrderExecutor::execute(AccountId account, const TradingPair& pair,
                                                  TradeSide side, Amount amount,
                                                  std::optional<double> price) {
    auto valid = validate(pair, amount);
    if (valid.failed()) {
        LOG_CAT(DEBUG, "market", "order rejected: " + valid.error().message);
        return valid.error();
    }
    if (!price) {
        LOG_CAT(WARN, "market", "no price for " + pair.str());
        return makeError(ErrorCode::PRICE_UNAVAILABLE, "no price available for " + pair.str());
    }
    auto value = quoteValue(amount, *price);
    if (value.failed()) return value.error();
    if (value.value() == 0) {
        return makeError(ErrorCode::INVALID_OPERATION, "order value rounds to zero");
    }
    
    OrderReceipt receipt;
    Transaction& tx = receipt.transaction;
    tx.accountId = account;
    tx.pair = pair.str();
    tx.kind = side;
    tx.amount = amount;
    tx.price = *price;
    tx.total = value.value();
    tx.fee = feeOf(tx.total, feePpm_);
    
    if (side == TradeSide::BUY) {
        receipt.debitCurrency = pair.quote;
        receipt.debited = tx.total + tx.fee;
        receipt.creditCurrency = pair.base;
        receipt.credited = amount;
    } else {
        receipt.debitCurrency = pair.base;
        receipt.debited = amount;
        receipt.creditCurrency = pair.quote;
        receipt.credited = tx.total - tx.fee;
    }
    
    auto res = store_.runTransaction("execute_order", [&](LedgerTxn& txn) {
        Wallet source = txn.wallet(account, receipt.debitCurrency);
        if (source.balance < receipt.debited) {
            CRYPTOTRADE_FAIL(ErrorCode::INSUFFICIENT_FUNDS,
                             "insufficient " + receipt.debitCurrency + ": available " +
                             formatAmount(source.balance) + ", required " +
                             formatAmount(receipt.debited));
        }
        
        tx.timestamp = txn.now();
        auto insert = txn.db().prepare("INSERT INTO transactions(account_id, pair, kind, amount, price, "
                                       "total, fee, created_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
        insert.bind(1, tx.accountId)
            .bind(2, tx.pair)
            .bind(3, std::string(toString(tx.kind)))
            .bind(4, tx.amount)
            .bind(5, tx.price)
            .bind(6, tx.total)
            .bind(7, tx.fee)
            .bind(8, tx.timestamp);
        insert.execute();
        tx.id = txn.db().lastInsertId();
        
        if (side == TradeSide::BUY) {
            txn.transfer(account, pair.quote, -tx.total, EntryReason::ORDER, tx.id);
            if (tx.fee > 0) txn.transfer(account, pair.quote, -tx.fee, EntryReason::FEE, tx.id);
            txn.transfer(account, pair.base, amount, EntryReason::ORDER, tx.id);
        } else {
            txn.transfer(account, pair.base, -amount, EntryReason::ORDER, tx.id);
            txn.transfer(account, pair.quote, tx.total, EntryReason::ORDER, tx.id);
            if (tx.fee > 0) txn.transfer(account, pair.quote, -tx.fee, EntryReason::FEE, tx.id);
        }
    });
    if (res.failed()) return res.error();
    
    LOG_CAT(INFO, "market", "tx " + std::to_string(tx.id) + " account " + std::to_string(account) +
            " " + toString(side) + " " + formatAmount(amount) + " " + tx.pair + " @ " +
            utils::Formatter::formatValue(tx.price, 8) + " total " + formatAmount(tx.total) +
            " fee " + formatAmount(tx.fee));
    return receipt;
}

Result<OrderReceipt> MarketOrderExecutor::executeAtMarket(AccountId account, const TradingPair& pair,
                                                          TradeSide side, Amount amount,
                                                          const PriceOracle& oracle) {
    return execute(account, pair, side, amount, oracle.price(pair));
}

Result<std::vector<Transaction>> MarketOrderExecutor::history(AccountId account,
                                                              const std::optional<std::string>& pair,
                                                              size_t limit) {
    std::vector<Transaction> out;
    auto res = store_.runRead("transaction_history", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT id, account_id, pair, kind, amount, price, total, fee, created_at "
                               "FROM transactions WHERE account_id = ?1 AND (?2 = '' OR pair = ?2) "
                               "ORDER BY id DESC LIMIT ?3;");
        stmt.bind(1, account).bind(2, pair.value_or("")).bind(3, static_cast<int64_t>(limit));
        while (stmt.step()) out.push_back(readTransaction(stmt));
    });
    if (res.failed()) return res.error();
    return out;
}

}
}
