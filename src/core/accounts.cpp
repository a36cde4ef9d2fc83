#include "core/accounts.h"
#include "utils/logger.h"

namespace cryptotrade {
namespace core {

const char* const ACCOUNT_COLUMNS =
    "id, external_id, display_name, created_at, last_login, last_bonus_claim";

Account readAccount(database::Statement& stmt) {
    Account a;
    a.id = stmt.columnInt64(0);
    a.externalId = stmt.columnText(1);
    a.displayName = stmt.columnText(2);
    a.createdAt = static_cast<uint64_t>(stmt.columnInt64(3));
    a.lastLogin = static_cast<uint64_t>(stmt.columnInt64(4));
    if (!stmt.columnIsNull(5)) {
        a.lastBonusClaim = static_cast<uint64_t>(stmt.columnInt64(5));
    }
    return a;
}

AccountRegistry::AccountRegistry(LedgerStore& store) : store_(store) {}

Result<AccountHandle> AccountRegistry::resolveOrCreate(const std::string& externalId,
                                                       const std::string& displayName) {
    if (externalId.empty()) {
        return makeError(ErrorCode::INVALID_OPERATION, "external id must not be empty");
    }
    std::string name = displayName.empty() ? externalId : displayName;
    
    AccountHandle handle;
    auto res = store_.runTransaction("resolve_or_create", [&](LedgerTxn& txn) {
        auto& db = txn.db();
        auto insert = db.prepare("INSERT OR IGNORE INTO accounts(external_id, display_name, "
                                 "created_at, last_login) VALUES(?1, ?2, ?3, ?3);");
        insert.bind(1, externalId).bind(2, name).bind(3, txn.now());
        handle.created = insert.execute() == 1;
        
        if (handle.created) {
            AccountId id = db.lastInsertId();
            auto wallet = db.prepare("INSERT INTO wallets(account_id, currency, balance, "
                                     "locked_balance, updated_at) VALUES(?1, ?2, 0, 0, ?3);");
            for (const auto& currency : txn.config().supportedCurrencies) {
                wallet.bind(1, id).bind(2, currency).bind(3, txn.now());
                wallet.execute();
            }
            Amount seed = toAmount(txn.config().initialBalance);
            if (seed > 0) {
                txn.transfer(id, txn.config().baseCurrency, seed, EntryReason::SEED, id);
            }
        } else {
            auto touch = db.prepare("UPDATE accounts SET last_login = ?1 WHERE external_id = ?2;");
            touch.bind(1, txn.now()).bind(2, externalId);
            touch.execute();
        }
        
        auto select = db.prepare(std::string("SELECT ") + ACCOUNT_COLUMNS +
                                 " FROM accounts WHERE external_id = ?1;");
        select.bind(1, externalId);
        if (!select.step()) {
            CRYPTOTRADE_INVARIANT("account row vanished", externalId);
        }
        handle.account = readAccount(select);
    });
    if (res.failed()) return res.error();
    
    if (handle.created) {
        LOG_CAT(INFO, "accounts", "created account " + std::to_string(handle.account.id) +
                " for " + externalId + " (" + handle.account.displayName + ")");
    } else {
        LOG_CAT(DEBUG, "accounts", "login account " + std::to_string(handle.account.id));
    }
    return handle;
}

Result<AccountHandle> AccountRegistry::login(IdentityProvider& identity) {
    auto who = identity.authenticate();
    if (!who) {
        LOG_CAT(WARN, "accounts", "authentication failed");
        return makeError(ErrorCode::INVALID_OPERATION, "authentication failed");
    }
    return resolveOrCreate(who->externalId, who->displayName);
}

Result<Account> AccountRegistry::getAccount(AccountId id) {
    Account out;
    auto res = store_.runRead("get_account", [&](database::Database& db) {
        auto stmt = db.prepare(std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts WHERE id = ?1;");
        stmt.bind(1, id);
        if (!stmt.step()) {
            CRYPTOTRADE_FAIL(ErrorCode::NOT_FOUND, "unknown account " + std::to_string(id));
        }
        out = readAccount(stmt);
    });
    if (res.failed()) return res.error();
    return out;
}

Result<Account> AccountRegistry::findByExternalId(const std::string& externalId) {
    Account out;
    auto res = store_.runRead("find_account", [&](database::Database& db) {
        auto stmt = db.prepare(std::string("SELECT ") + ACCOUNT_COLUMNS +
                               " FROM accounts WHERE external_id = ?1;");
        stmt.bind(1, externalId);
        if (!stmt.step()) {
            CRYPTOTRADE_FAIL(ErrorCode::NOT_FOUND, "no account for " + externalId);
        }
        out = readAccount(stmt);
    });
    if (res.failed()) return res.error();
    return out;
}

Result<std::vector<Account>> AccountRegistry::listAccounts() {
    std::vector<Account> out;
    auto res = store_.runRead("list_accounts", [&](database::Database& db) {
        auto stmt = db.prepare(std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts ORDER BY id;");
        while (stmt.step()) out.push_back(readAccount(stmt));
    });
    if (res.failed()) return res.error();
    return out;
}

Result<size_t> AccountRegistry::count() {
    size_t n = 0;
    auto res = store_.runRead("count_accounts", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT COUNT(*) FROM accounts;");
        if (stmt.step()) n = static_cast<size_t>(stmt.columnInt64(0));
    });
    if (res.failed()) return res.error();
    return n;
}

}
}
