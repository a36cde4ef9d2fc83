#pragma once

#include "core/types.h"
#include "database/database.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace cryptotrade {
namespace core {

// Balance primitives bound to one open write transaction. Every primitive
// appends a ledger_entries row so no wallet changes without a record.
// A failing primitive throws ErrorException; LedgerStore::runTransaction
// turns that into a rolled-back Result.
class LedgerTxn {
public:
    LedgerTxn(database::Database& db, const utils::GameConfig& config, uint64_t now);
    
    Wallet wallet(AccountId account, const std::string& currency);
    std::vector<Wallet> wallets(AccountId account);
    bool accountExists(AccountId account);
    
    // balance += delta; fails INSUFFICIENT_FUNDS if the result would be negative.
    void transfer(AccountId account, const std::string& currency, Amount delta,
                  EntryReason reason, int64_t reference);
    // balance -> locked_balance; fails INSUFFICIENT_FUNDS if balance < amount.
    void lock(AccountId account, const std::string& currency, Amount amount,
              EntryReason reason, int64_t reference);
    // locked_balance -> balance; fails INVARIANT_VIOLATION if locked_balance < amount.
    void unlock(AccountId account, const std::string& currency, Amount amount,
                EntryReason reason, int64_t reference);
    
    database::Database& db() { return db_; }
    const utils::GameConfig& config() const { return config_; }
    uint64_t now() const { return now_; }
    
private:
    void requireCurrency(const std::string& currency) const;
    void journal(AccountId account, const std::string& currency, Amount balanceDelta,
                 Amount lockedDelta, EntryReason reason, int64_t reference);
    
    database::Database& db_;
    const utils::GameConfig& config_;
    uint64_t now_;
};

struct JournalMismatch {
    AccountId accountId = 0;
    std::string currency;
    Amount balance = 0;
    Amount lockedBalance = 0;
    Amount journalBalance = 0;
    Amount journalLocked = 0;
};

Error mapDatabaseError(const database::DatabaseError& e, const std::string& context);
Wallet readWallet(database::Statement& stmt);

class LedgerStore {
public:
    LedgerStore(utils::StorageConfig storage, utils::GameConfig game, Clock clock = systemClock);
    ~LedgerStore();
    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;
    
    Result<void> open();
    void close();
    bool isOpen() const;
    
    const utils::GameConfig& config() const;
    const utils::StorageConfig& storageConfig() const;
    uint64_t now() const;
    
    // Runs body inside one BEGIN IMMEDIATE transaction: all legs commit or none do.
    Result<void> runTransaction(const std::string& label, const std::function<void(LedgerTxn&)>& body);
    // Snapshot read; never takes the write lock.
    Result<void> runRead(const std::string& label, const std::function<void(database::Database&)>& body);
    
    Result<void> transfer(AccountId account, const std::string& currency, Amount delta,
                          EntryReason reason = EntryReason::ADJUSTMENT, int64_t reference = 0);
    Result<void> lock(AccountId account, const std::string& currency, Amount amount);
    Result<void> unlock(AccountId account, const std::string& currency, Amount amount);
    
    Result<Wallet> getWallet(AccountId account, const std::string& currency);
    Result<std::vector<Wallet>> getWallets(AccountId account);
    
    // Sum of balance + locked_balance over every account.
    Result<Amount> currencyTotal(const std::string& currency);
    // Sum of journal balance deltas for one reason, across all accounts.
    Result<Amount> journalTotal(const std::string& currency, EntryReason reason);
    Result<std::vector<LedgerEntry>> entries(AccountId account, const std::string& currency = "",
                                             size_t limit = 100);
    // Wallets whose stored balances differ from the sum of their journal entries.
    Result<std::vector<JournalMismatch>> verifyJournal();
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
