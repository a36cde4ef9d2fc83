#include "core/ledger.h"
#include "database/schema.h"
#include "utils/logger.h"
#include <utility>

namespace cryptotrade {
namespace core {

using database::DatabaseError;
using database::Statement;
using database::TransactionGuard;
using database::TransactionMode;

Wallet readWallet(Statement& stmt) {
    Wallet w;
    w.accountId = stmt.columnInt64(0);
    w.currency = stmt.columnText(1);
    w.balance = stmt.columnInt64(2);
    w.lockedBalance = stmt.columnInt64(3);
    w.updatedAt = static_cast<uint64_t>(stmt.columnInt64(4));
    return w;
}

static LedgerEntry readEntry(Statement& stmt) {
    LedgerEntry e;
    e.id = stmt.columnInt64(0);
    e.accountId = stmt.columnInt64(1);
    e.currency = stmt.columnText(2);
    e.balanceDelta = stmt.columnInt64(3);
    e.lockedDelta = stmt.columnInt64(4);
    parseEntryReason(stmt.columnText(5), e.reason);
    e.reference = stmt.columnInt64(6);
    e.timestamp = static_cast<uint64_t>(stmt.columnInt64(7));
    return e;
}

static std::string walletTag(AccountId account, const std::string& currency) {
    return "account " + std::to_string(account) + " " + currency;
}

Error mapDatabaseError(const DatabaseError& e, const std::string& context) {
    if (e.transient()) {
        Error err = makeError(ErrorCode::STORAGE_UNAVAILABLE, e.what(), context);
        err.severity = ErrorSeverity::WARNING;
        return err;
    }
    if (e.constraint()) {
        return reportInvariantViolation(std::string("constraint failed: ") + e.what(), context,
                                        __FILE__, __LINE__);
    }
    return makeError(ErrorCode::DATABASE_ERROR, e.what(), context);
}

LedgerTxn::LedgerTxn(database::Database& db, const utils::GameConfig& config, uint64_t now)
    : db_(db), config_(config), now_(now) {}

void LedgerTxn::requireCurrency(const std::string& currency) const {
    if (!config_.isSupported(currency)) {
        CRYPTOTRADE_FAIL(ErrorCode::INVALID_OPERATION, "unsupported currency " + currency);
    }
}

bool LedgerTxn::accountExists(AccountId account) {
    auto stmt = db_.prepare("SELECT 1 FROM accounts WHERE id = ?1;");
    stmt.bind(1, account);
    return stmt.step();
}

Wallet LedgerTxn::wallet(AccountId account, const std::string& currency) {
    requireCurrency(currency);
    auto stmt = db_.prepare("SELECT account_id, currency, balance, locked_balance, updated_at "
                            "FROM wallets WHERE account_id = ?1 AND currency = ?2;");
    stmt.bind(1, account).bind(2, currency);
    if (stmt.step()) return readWallet(stmt);
    
    if (!accountExists(account)) {
        CRYPTOTRADE_FAIL(ErrorCode::NOT_FOUND, "unknown account " + std::to_string(account));
    }
    CRYPTOTRADE_INVARIANT("missing wallet row", walletTag(account, currency));
}

std::vector<Wallet> LedgerTxn::wallets(AccountId account) {
    std::vector<Wallet> out;
    auto stmt = db_.prepare("SELECT account_id, currency, balance, locked_balance, updated_at "
                            "FROM wallets WHERE account_id = ?1 ORDER BY currency;");
    stmt.bind(1, account);
    while (stmt.step()) out.push_back(readWallet(stmt));
    if (out.empty() && !accountExists(account)) {
        CRYPTOTRADE_FAIL(ErrorCode::NOT_FOUND, "unknown account " + std::to_string(account));
    }
    return out;
}

void LedgerTxn::journal(AccountId account, const std::string& currency, Amount balanceDelta,
                        Amount lockedDelta, EntryReason reason, int64_t reference) {
    auto stmt = db_.prepare("INSERT INTO ledger_entries(account_id, currency, balance_delta, "
                            "locked_delta, reason, reference, created_at) "
                            "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7);");
    stmt.bind(1, account)
        .bind(2, currency)
        .bind(3, balanceDelta)
        .bind(4, lockedDelta)
        .bind(5, std::string(toString(reason)))
        .bind(6, reference)
        .bind(7, now_);
    stmt.execute();
}

void LedgerTxn::transfer(AccountId account, const std::string& currency, Amount delta,
                         EntryReason reason, int64_t reference) {
    requireCurrency(currency);
    if (delta == 0) {
        wallet(account, currency);
        return;
    }
    
    auto stmt = db_.prepare("UPDATE wallets SET balance = balance + ?1, updated_at = ?2 "
                            "WHERE account_id = ?3 AND currency = ?4 AND balance + ?1 >= 0;");
    stmt.bind(1, delta).bind(2, now_).bind(3, account).bind(4, currency);
    if (stmt.execute() == 0) {
        Wallet w = wallet(account, currency);
        CRYPTOTRADE_FAIL(ErrorCode::INSUFFICIENT_FUNDS,
                         "insufficient " + currency + ": available " + formatAmount(w.balance) +
                         ", required " + formatAmount(-delta));
    }
    journal(account, currency, delta, 0, reason, reference);
}

void LedgerTxn::lock(AccountId account, const std::string& currency, Amount amount,
                     EntryReason reason, int64_t reference) {
    requireCurrency(currency);
    if (amount <= 0) {
        CRYPTOTRADE_FAIL(ErrorCode::INVALID_OPERATION, "lock amount must be positive");
    }
    
    auto stmt = db_.prepare("UPDATE wallets SET balance = balance - ?1, "
                            "locked_balance = locked_balance + ?1, updated_at = ?2 "
                            "WHERE account_id = ?3 AND currency = ?4 AND balance >= ?1;");
    stmt.bind(1, amount).bind(2, now_).bind(3, account).bind(4, currency);
    if (stmt.execute() == 0) {
        Wallet w = wallet(account, currency);
        CRYPTOTRADE_FAIL(ErrorCode::INSUFFICIENT_FUNDS,
                         "insufficient " + currency + " to lock: available " +
                         formatAmount(w.balance) + ", required " + formatAmount(amount));
    }
    journal(account, currency, -amount, amount, reason, reference);
}

void LedgerTxn::unlock(AccountId account, const std::string& currency, Amount amount,
                       EntryReason reason, int64_t reference) {
    requireCurrency(currency);
    if (amount <= 0) {
        CRYPTOTRADE_FAIL(ErrorCode::INVALID_OPERATION, "unlock amount must be positive");
    }
    
    auto stmt = db_.prepare("UPDATE wallets SET balance = balance + ?1, "
                            "locked_balance = locked_balance - ?1, updated_at = ?2 "
                            "WHERE account_id = ?3 AND currency = ?4 AND locked_balance >= ?1;");
    stmt.bind(1, amount).bind(2, now_).bind(3, account).bind(4, currency);
    if (stmt.execute() == 0) {
        Wallet w = wallet(account, currency);
        CRYPTOTRADE_INVARIANT("unlock of " + formatAmount(amount) + " exceeds locked balance " +
                              formatAmount(w.lockedBalance),
                              walletTag(account, currency));
    }
    journal(account, currency, amount, -amount, reason, reference);
}

struct LedgerStore::Impl {
    utils::StorageConfig storage;
    utils::GameConfig game;
    Clock clock;
    std::unique_ptr<database::ConnectionPool> pool;
    
    Error fail(const DatabaseError& e, const std::string& label) {
        LOG_CAT(ERROR, "db", label + ": " + e.what());
        return mapDatabaseError(e, label);
    }
    
    Error reject(const ErrorException& e, const std::string& label) {
        Error err = e.error();
        if (err.context.empty()) err.context = label;
        if (err.code != ErrorCode::INVARIANT_VIOLATION) {
            LOG_CAT(DEBUG, "ledger", label + " rejected: " + errorName(err.code) + ": " + err.message);
        }
        return err;
    }
};

LedgerStore::LedgerStore(utils::StorageConfig storage, utils::GameConfig game, Clock clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->storage = std::move(storage);
    impl_->game = std::move(game);
    impl_->clock = clock ? std::move(clock) : Clock(systemClock);
}

LedgerStore::~LedgerStore() {
    close();
}

Result<void> LedgerStore::open() {
    if (impl_->pool) {
        return makeError(ErrorCode::INVALID_OPERATION, "ledger store already open");
    }
    auto valid = impl_->game.validate();
    if (valid.failed()) return valid.error();
    if (impl_->storage.databasePath.empty()) {
        return makeError(ErrorCode::INVALID_CONFIG, "storage.database is not set");
    }
    
    impl_->pool = std::make_unique<database::ConnectionPool>(
        impl_->storage.databasePath, impl_->storage.poolSize, impl_->storage.busyTimeoutMs);
    
    int added = 0;
    try {
        auto conn = impl_->pool->acquire();
        TransactionGuard guard(*conn, TransactionMode::IMMEDIATE);
        database::createSchema(*conn);
        
        auto backfill = conn->prepare("INSERT OR IGNORE INTO wallets(account_id, currency, balance, "
                                      "locked_balance, updated_at) "
                                      "SELECT id, ?1, 0, 0, ?2 FROM accounts;");
        uint64_t ts = now();
        for (const auto& currency : impl_->game.supportedCurrencies) {
            backfill.bind(1, currency).bind(2, ts);
            added += backfill.execute();
        }
        guard.commit();
    } catch (const DatabaseError& e) {
        Error err = impl_->fail(e, "open");
        impl_->pool.reset();
        return err;
    }
    
    if (added > 0) {
        LOG_CAT(INFO, "ledger", "backfilled " + std::to_string(added) + " wallet rows");
    }
    LOG_CAT(INFO, "ledger", "opened " + impl_->storage.databasePath);
    return Result<void>();
}

void LedgerStore::close() {
    if (!impl_->pool) return;
    impl_->pool->close();
    impl_->pool.reset();
    LOG_CAT(DEBUG, "ledger", "closed " + impl_->storage.databasePath);
}

bool LedgerStore::isOpen() const {
    return impl_->pool != nullptr;
}

const utils::GameConfig& LedgerStore::config() const {
    return impl_->game;
}

const utils::StorageConfig& LedgerStore::storageConfig() const {
    return impl_->storage;
}

uint64_t LedgerStore::now() const {
    return impl_->clock();
}

Result<void> LedgerStore::runTransaction(const std::string& label,
                                         const std::function<void(LedgerTxn&)>& body) {
    if (!impl_->pool) {
        return makeError(ErrorCode::STORAGE_UNAVAILABLE, "ledger store is not open", label);
    }
    try {
        auto conn = impl_->pool->acquire();
        TransactionGuard guard(*conn, TransactionMode::IMMEDIATE);
        LedgerTxn txn(*conn, impl_->game, now());
        body(txn);
        guard.commit();
    } catch (const ErrorException& e) {
        return impl_->reject(e, label);
    } catch (const DatabaseError& e) {
        return impl_->fail(e, label);
    }
    return Result<void>();
}

Result<void> LedgerStore::runRead(const std::string& label,
                                  const std::function<void(database::Database&)>& body) {
    if (!impl_->pool) {
        return makeError(ErrorCode::STORAGE_UNAVAILABLE, "ledger store is not open", label);
    }
    try {
        auto conn = impl_->pool->acquire();
        TransactionGuard guard(*conn, TransactionMode::DEFERRED);
        body(*conn);
        guard.commit();
    } catch (const ErrorException& e) {
        return impl_->reject(e, label);
    } catch (const DatabaseError& e) {
        return impl_->fail(e, label);
    }
    return Result<void>();
}

Result<void> LedgerStore::transfer(AccountId account, const std::string& currency, Amount delta,
                                   EntryReason reason, int64_t reference) {
    auto res = runTransaction("transfer", [&](LedgerTxn& txn) {
        txn.transfer(account, currency, delta, reason, reference);
    });
    if (res.ok()) {
        LOG_CAT(INFO, "ledger", "transfer " + walletTag(account, currency) + " " +
                formatAmount(delta) + " (" + toString(reason) + ")");
    }
    return res;
}

Result<void> LedgerStore::lock(AccountId account, const std::string& currency, Amount amount) {
    auto res = runTransaction("lock", [&](LedgerTxn& txn) {
        txn.lock(account, currency, amount, EntryReason::ESCROW_LOCK, 0);
    });
    if (res.ok()) {
        LOG_CAT(INFO, "ledger", "lock " + walletTag(account, currency) + " " + formatAmount(amount));
    }
    return res;
}

Result<void> LedgerStore::unlock(AccountId account, const std::string& currency, Amount amount) {
    auto res = runTransaction("unlock", [&](LedgerTxn& txn) {
        txn.unlock(account, currency, amount, EntryReason::ESCROW_UNLOCK, 0);
    });
    if (res.ok()) {
        LOG_CAT(INFO, "ledger", "unlock " + walletTag(account, currency) + " " + formatAmount(amount));
    }
    return res;
}

Result<Wallet> LedgerStore::getWallet(AccountId account, const std::string& currency) {
    Wallet out;
    auto res = runRead("get_wallet", [&](database::Database& db) {
        LedgerTxn view(db, impl_->game, 0);
        out = view.wallet(account, currency);
    });
    if (res.failed()) return res.error();
    return out;
}

Result<std::vector<Wallet>> LedgerStore::getWallets(AccountId account) {
    std::vector<Wallet> out;
    auto res = runRead("get_wallets", [&](database::Database& db) {
        LedgerTxn view(db, impl_->game, 0);
        out = view.wallets(account);
    });
    if (res.failed()) return res.error();
    return out;
}

Result<Amount> LedgerStore::currencyTotal(const std::string& currency) {
    Amount total = 0;
    auto res = runRead("currency_total", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT COALESCE(SUM(balance + locked_balance), 0) "
                               "FROM wallets WHERE currency = ?1;");
        stmt.bind(1, currency);
        if (stmt.step()) total = stmt.columnInt64(0);
    });
    if (res.failed()) return res.error();
    return total;
}

Result<Amount> LedgerStore::journalTotal(const std::string& currency, EntryReason reason) {
    Amount total = 0;
    auto res = runRead("journal_total", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT COALESCE(SUM(balance_delta + locked_delta), 0) "
                               "FROM ledger_entries WHERE currency = ?1 AND reason = ?2;");
        stmt.bind(1, currency).bind(2, std::string(toString(reason)));
        if (stmt.step()) total = stmt.columnInt64(0);
    });
    if (res.failed()) return res.error();
    return total;
}

Result<std::vector<LedgerEntry>> LedgerStore::entries(AccountId account, const std::string& currency,
                                                      size_t limit) {
    std::vector<LedgerEntry> out;
    auto res = runRead("entries", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT id, account_id, currency, balance_delta, locked_delta, reason, "
                               "reference, created_at FROM ledger_entries "
                               "WHERE account_id = ?1 AND (?2 = '' OR currency = ?2) "
                               "ORDER BY id DESC LIMIT ?3;");
        stmt.bind(1, account).bind(2, currency).bind(3, static_cast<int64_t>(limit));
        while (stmt.step()) out.push_back(readEntry(stmt));
    });
    if (res.failed()) return res.error();
    return out;
}

Result<std::vector<JournalMismatch>> LedgerStore::verifyJournal() {
    std::vector<JournalMismatch> out;
    auto res = runRead("verify_journal", [&](database::Database& db) {
        auto stmt = db.prepare(
            "SELECT w.account_id, w.currency, w.balance, w.locked_balance, "
            "COALESCE(SUM(e.balance_delta), 0) AS jb, COALESCE(SUM(e.locked_delta), 0) AS jl "
            "FROM wallets w LEFT JOIN ledger_entries e "
            "ON e.account_id = w.account_id AND e.currency = w.currency "
            "GROUP BY w.account_id, w.currency "
            "HAVING w.balance <> jb OR w.locked_balance <> jl "
            "ORDER BY w.account_id, w.currency;");
        while (stmt.step()) {
            JournalMismatch m;
            m.accountId = stmt.columnInt64(0);
            m.currency = stmt.columnText(1);
            m.balance = stmt.columnInt64(2);
            m.lockedBalance = stmt.columnInt64(3);
            m.journalBalance = stmt.columnInt64(4);
            m.journalLocked = stmt.columnInt64(5);
            out.push_back(m);
        }
    });
    if (res.failed()) return res.error();
    for (const auto& m : out) {
        LOG_CAT(ERROR, "ledger", "journal mismatch " + walletTag(m.accountId, m.currency) +
                ": stored " + formatAmount(m.balance) + "/" + formatAmount(m.lockedBalance) +
                ", journal " + formatAmount(m.journalBalance) + "/" + formatAmount(m.journalLocked));
    }
    return out;
}

}
}
