#include "database/schema.h"

namespace cryptotrade {
namespace database {

static const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS accounts (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    external_id TEXT NOT NULL UNIQUE,
    display_name TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    last_login INTEGER NOT NULL,
    last_bonus_claim INTEGER
);

CREATE TABLE IF NOT EXISTS wallets (
    account_id INTEGER NOT NULL REFERENCES accounts(id),
    currency TEXT NOT NULL,
    balance INTEGER NOT NULL DEFAULT 0 CHECK (balance >= 0),
    locked_balance INTEGER NOT NULL DEFAULT 0 CHECK (locked_balance >= 0),
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (account_id, currency)
);

CREATE TABLE IF NOT EXISTS ledger_entries (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    account_id INTEGER NOT NULL REFERENCES accounts(id),
    currency TEXT NOT NULL,
    balance_delta INTEGER NOT NULL,
    locked_delta INTEGER NOT NULL,
    reason TEXT NOT NULL,
    reference INTEGER NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_entries_wallet ON ledger_entries(account_id, currency);
CREATE INDEX IF NOT EXISTS idx_entries_reason ON ledger_entries(reason, currency);

CREATE TABLE IF NOT EXISTS transactions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    account_id INTEGER NOT NULL REFERENCES accounts(id),
    pair TEXT NOT NULL,
    kind TEXT NOT NULL CHECK (kind IN ('buy', 'sell')),
    amount INTEGER NOT NULL CHECK (amount > 0),
    price REAL NOT NULL CHECK (price > 0),
    total INTEGER NOT NULL CHECK (total > 0),
    fee INTEGER NOT NULL CHECK (fee >= 0),
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_transactions_account ON transactions(account_id, id);

CREATE TABLE IF NOT EXISTS trade_offers (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    creator_id INTEGER NOT NULL REFERENCES accounts(id),
    offering_currency TEXT NOT NULL,
    offering_amount INTEGER NOT NULL CHECK (offering_amount > 0),
    requesting_currency TEXT NOT NULL,
    requesting_amount INTEGER NOT NULL CHECK (requesting_amount > 0),
    status TEXT NOT NULL CHECK (status IN ('active', 'completed', 'cancelled')),
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    CHECK (offering_currency <> requesting_currency)
);
CREATE INDEX IF NOT EXISTS idx_offers_status ON trade_offers(status, id);
CREATE INDEX IF NOT EXISTS idx_offers_creator ON trade_offers(creator_id, id);

CREATE TABLE IF NOT EXISTS p2p_settlements (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    offer_id INTEGER NOT NULL UNIQUE REFERENCES trade_offers(id),
    creator_id INTEGER NOT NULL REFERENCES accounts(id),
    acceptor_id INTEGER NOT NULL REFERENCES accounts(id),
    offering_currency TEXT NOT NULL,
    offering_amount INTEGER NOT NULL,
    requesting_currency TEXT NOT NULL,
    requesting_amount INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    CHECK (creator_id <> acceptor_id)
);
CREATE INDEX IF NOT EXISTS idx_settlements_creator ON p2p_settlements(creator_id);
CREATE INDEX IF NOT EXISTS idx_settlements_acceptor ON p2p_settlements(acceptor_id);

CREATE TABLE IF NOT EXISTS bonus_claims (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    account_id INTEGER NOT NULL REFERENCES accounts(id),
    claim_day TEXT NOT NULL,
    amount INTEGER NOT NULL,
    claimed_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_bonus_account ON bonus_claims(account_id, id);

CREATE TABLE IF NOT EXISTS portfolio_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    account_id INTEGER NOT NULL REFERENCES accounts(id),
    total_value REAL NOT NULL,
    recorded_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_portfolio_account ON portfolio_history(account_id, id);
)SQL";

void createSchema(Database& db) {
    db.exec(SCHEMA_SQL);
    
    auto stmt = db.prepare("INSERT OR IGNORE INTO meta(key, value) VALUES('schema_version', ?1);");
    stmt.bind(1, std::to_string(SCHEMA_VERSION));
    stmt.execute();
}

int schemaVersion(Database& db) {
    auto stmt = db.prepare("SELECT value FROM meta WHERE key = 'schema_version';");
    if (!stmt.step()) return 0;
    try {
        return std::stoi(stmt.columnText(0));
    } catch (const std::exception&) {
        return 0;
    }
}

std::vector<std::string> tableNames(Database& db) {
    std::vector<std::string> names;
    auto stmt = db.prepare("SELECT name FROM sqlite_master WHERE type = 'table' "
                           "AND name NOT LIKE 'sqlite_%' ORDER BY name;");
    while (stmt.step()) names.push_back(stmt.columnText(0));
    return names;
}

}
}
