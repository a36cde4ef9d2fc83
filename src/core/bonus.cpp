#include "core/bonus.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace cryptotrade {
namespace core {

BonusScheduler::BonusScheduler(LedgerStore& store) : store_(store) {}

uint64_t BonusScheduler::remaining(uint64_t lastClaim, uint64_t now) const {
    uint64_t cooldown = store_.config().bonusCooldownSeconds;
    if (now < lastClaim) return cooldown;
    uint64_t elapsed = now - lastClaim;
    return elapsed >= cooldown ? 0 : cooldown - elapsed;
}

Result<BonusGrant> BonusScheduler::claim(AccountId account) {
    const auto& config = store_.config();
    BonusGrant grant;
    grant.amount = toAmount(config.bonusAmount);
    
    auto res = store_.runTransaction("claim_bonus", [&](LedgerTxn& txn) {
        uint64_t now = txn.now();
        auto gate = txn.db().prepare("UPDATE accounts SET last_bonus_claim = ?1 WHERE id = ?2 "
                                     "AND (last_bonus_claim IS NULL OR last_bonus_claim <= ?1 - ?3);");
        gate.bind(1, now).bind(2, account).bind(3, config.bonusCooldownSeconds);
        if (gate.execute() == 0) {
            auto last = txn.db().prepare("SELECT last_bonus_claim FROM accounts WHERE id = ?1;");
            last.bind(1, account);
            if (!last.step()) {
                CRYPTOTRADE_FAIL(ErrorCode::NOT_FOUND, "unknown account " + std::to_string(account));
            }
            uint64_t wait = remaining(static_cast<uint64_t>(last.columnInt64(0)), now);
            Error err = makeError(ErrorCode::TOO_EARLY,
                                  "bonus already claimed, next bonus in " +
                                  utils::Formatter::formatDuration(wait));
            err.severity = ErrorSeverity::INFO;
            err.retryAfter = wait;
            throw ErrorException(err);
        }
        
        grant.claimedAt = now;
        grant.day = utils::Formatter::formatDate(now);
        auto audit = txn.db().prepare("INSERT INTO bonus_claims(account_id, claim_day, amount, claimed_at) "
                                      "VALUES(?1, ?2, ?3, ?4);");
        audit.bind(1, account).bind(2, grant.day).bind(3, grant.amount).bind(4, now);
        audit.execute();
        grant.claimId = txn.db().lastInsertId();
        
        txn.transfer(account, config.baseCurrency, grant.amount, EntryReason::BONUS, grant.claimId);
        grant.newBalance = txn.wallet(account, config.baseCurrency).balance;
    });
    if (res.failed()) return res.error();
    
    LOG_CAT(INFO, "bonus", "account " + std::to_string(account) + " claimed " +
            formatAmount(grant.amount) + " " + config.baseCurrency);
    return grant;
}

Result<BonusStatus> BonusScheduler::status(AccountId account) {
    BonusStatus out;
    out.amount = toAmount(store_.config().bonusAmount);
    uint64_t now = store_.now();
    auto res = store_.runRead("bonus_status", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT last_bonus_claim FROM accounts WHERE id = ?1;");
        stmt.bind(1, account);
        if (!stmt.step()) {
            CRYPTOTRADE_FAIL(ErrorCode::NOT_FOUND, "unknown account " + std::to_string(account));
        }
        if (!stmt.columnIsNull(0)) {
            out.lastClaim = static_cast<uint64_t>(stmt.columnInt64(0));
        }
    });
    if (res.failed()) return res.error();
    
    out.secondsRemaining = out.lastClaim ? remaining(*out.lastClaim, now) : 0;
    out.eligible = out.secondsRemaining == 0;
    return out;
}

Result<std::vector<BonusClaim>> BonusScheduler::history(AccountId account, size_t limit) {
    std::vector<BonusClaim> out;
    auto res = store_.runRead("bonus_history", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT id, account_id, claim_day, amount, claimed_at FROM bonus_claims "
                               "WHERE account_id = ?1 ORDER BY id DESC LIMIT ?2;");
        stmt.bind(1, account).bind(2, static_cast<int64_t>(limit));
        while (stmt.step()) {
            BonusClaim c;
            c.id = stmt.columnInt64(0);
            c.accountId = stmt.columnInt64(1);
            c.day = stmt.columnText(2);
            c.amount = stmt.columnInt64(3);
            c.claimedAt = static_cast<uint64_t>(stmt.columnInt64(4));
            out.push_back(c);
        }
    });
    if (res.failed()) return res.error();
    return out;
}

}
}
