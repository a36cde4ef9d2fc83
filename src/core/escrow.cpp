#include "core/escrow.h"
#include "utils/logger.h"

namespace cryptotrade {
namespace core {

static const char* OFFER_SELECT =
    "SELECT o.id, o.creator_id, a.display_name, o.offering_currency, o.offering_amount, "
    "o.requesting_currency, o.requesting_amount, o.status, o.created_at, o.updated_at "
    "FROM trade_offers o JOIN accounts a ON a.id = o.creator_id ";

static TradeOffer readOffer(database::Statement& stmt) {
    TradeOffer o;
    o.id = stmt.columnInt64(0);
    o.creatorId = stmt.columnInt64(1);
    o.creatorName = stmt.columnText(2);
    o.offeringCurrency = stmt.columnText(3);
    o.offeringAmount = stmt.columnInt64(4);
    o.requestingCurrency = stmt.columnText(5);
    o.requestingAmount = stmt.columnInt64(6);
    parseOfferStatus(stmt.columnText(7), o.status);
    o.createdAt = static_cast<uint64_t>(stmt.columnInt64(8));
    o.updatedAt = static_cast<uint64_t>(stmt.columnInt64(9));
    return o;
}

static P2PSettlement readSettlement(database::Statement& stmt) {
    P2PSettlement s;
    s.id = stmt.columnInt64(0);
    s.offerId = stmt.columnInt64(1);
    s.creatorId = stmt.columnInt64(2);
    s.acceptorId = stmt.columnInt64(3);
    s.offeringCurrency = stmt.columnText(4);
    s.offeringAmount = stmt.columnInt64(5);
    s.requestingCurrency = stmt.columnText(6);
    s.requestingAmount = stmt.columnInt64(7);
    s.timestamp = static_cast<uint64_t>(stmt.columnInt64(8));
    return s;
}

static TradeOffer loadOffer(database::Database& db, OfferId offerId) {
    auto stmt = db.prepare(std::string(OFFER_SELECT) + "WHERE o.id = ?1;");
    stmt.bind(1, offerId);
    if (!stmt.step()) {
        CRYPTOTRADE_FAIL(ErrorCode::NOT_FOUND, "unknown offer " + std::to_string(offerId));
    }
    return readOffer(stmt);
}

static void closeOffer(LedgerTxn& txn, OfferId offerId, OfferStatus status) {
    auto stmt = txn.db().prepare("UPDATE trade_offers SET status = ?1, updated_at = ?2 "
                                 "WHERE id = ?3 AND status = 'active';");
    stmt.bind(1, std::string(toString(status))).bind(2, txn.now()).bind(3, offerId);
    if (stmt.execute() != 1) {
        CRYPTOTRADE_INVARIANT("offer left active state concurrently", "offer " + std::to_string(offerId));
    }
}

static std::string describe(const TradeOffer& o) {
    return formatAmount(o.offeringAmount) + " " + o.offeringCurrency + " for " +
           formatAmount(o.requestingAmount) + " " + o.requestingCurrency;
}

EscrowEngine::EscrowEngine(LedgerStore& store) : store_(store) {}

Result<TradeOffer> EscrowEngine::createOffer(AccountId creator,
                                             const std::string& offeringCurrency, Amount offeringAmount,
                                             const std::string& requestingCurrency, Amount requestingAmount) {
    const auto& config = store_.config();
    if (!config.isSupported(offeringCurrency) || !config.isSupported(requestingCurrency)) {
        return makeError(ErrorCode::INVALID_OPERATION,
                         "unsupported currency in offer " + offeringCurrency + "/" + requestingCurrency);
    }
    if (offeringCurrency == requestingCurrency) {
        return makeError(ErrorCode::INVALID_OPERATION, "offer currencies must differ");
    }
    if (offeringAmount <= 0 || requestingAmount <= 0) {
        return makeError(ErrorCode::INVALID_OPERATION, "offer amounts must be positive");
    }
    
    TradeOffer offer;
    auto res = store_.runTransaction("create_offer", [&](LedgerTxn& txn) {
        Wallet source = txn.wallet(creator, offeringCurrency);
        if (source.balance < offeringAmount) {
            CRYPTOTRADE_FAIL(ErrorCode::INSUFFICIENT_FUNDS,
                             "insufficient " + offeringCurrency + ": available " +
                             formatAmount(source.balance) + ", required " + formatAmount(offeringAmount));
        }
        
        auto insert = txn.db().prepare("INSERT INTO trade_offers(creator_id, offering_currency, "
                                       "offering_amount, requesting_currency, requesting_amount, "
                                       "status, created_at, updated_at) "
                                       "VALUES(?1, ?2, ?3, ?4, ?5, 'active', ?6, ?6);");
        insert.bind(1, creator)
            .bind(2, offeringCurrency)
            .bind(3, offeringAmount)
            .bind(4, requestingCurrency)
            .bind(5, requestingAmount)
            .bind(6, txn.now());
        insert.execute();
        OfferId id = txn.db().lastInsertId();
        
        txn.lock(creator, offeringCurrency, offeringAmount, EntryReason::ESCROW_LOCK, id);
        offer = loadOffer(txn.db(), id);
    });
    if (res.failed()) return res.error();
    
    LOG_CAT(INFO, "escrow", "offer " + std::to_string(offer.id) + " created by account " +
            std::to_string(creator) + ": " + describe(offer));
    return offer;
}

Result<SettlementReceipt> EscrowEngine::acceptOffer(AccountId acceptor, OfferId offerId) {
    SettlementReceipt receipt;
    auto res = store_.runTransaction("accept_offer", [&](LedgerTxn& txn) {
        TradeOffer offer = loadOffer(txn.db(), offerId);
        if (offer.creatorId == acceptor) {
            CRYPTOTRADE_FAIL(ErrorCode::INVALID_OPERATION, "cannot accept your own offer");
        }
        if (offer.status != OfferStatus::ACTIVE) {
            CRYPTOTRADE_FAIL(ErrorCode::OFFER_NOT_ACTIVE,
                             "offer " + std::to_string(offerId) + " is " + toString(offer.status));
        }
        Wallet payer = txn.wallet(acceptor, offer.requestingCurrency);
        if (payer.balance < offer.requestingAmount) {
            CRYPTOTRADE_FAIL(ErrorCode::INSUFFICIENT_FUNDS,
                             "insufficient " + offer.requestingCurrency + ": available " +
                             formatAmount(payer.balance) + ", required " +
                             formatAmount(offer.requestingAmount));
        }
        
        P2PSettlement& s = receipt.settlement;
        s.offerId = offer.id;
        s.creatorId = offer.creatorId;
        s.acceptorId = acceptor;
        s.offeringCurrency = offer.offeringCurrency;
        s.offeringAmount = offer.offeringAmount;
        s.requestingCurrency = offer.requestingCurrency;
        s.requestingAmount = offer.requestingAmount;
        s.timestamp = txn.now();
        
        auto insert = txn.db().prepare("INSERT INTO p2p_settlements(offer_id, creator_id, acceptor_id, "
                                       "offering_currency, offering_amount, requesting_currency, "
                                       "requesting_amount, created_at) "
                                       "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
        insert.bind(1, s.offerId)
            .bind(2, s.creatorId)
            .bind(3, s.acceptorId)
            .bind(4, s.offeringCurrency)
            .bind(5, s.offeringAmount)
            .bind(6, s.requestingCurrency)
            .bind(7, s.requestingAmount)
            .bind(8, s.timestamp);
        insert.execute();
        s.id = txn.db().lastInsertId();
        
        txn.transfer(acceptor, offer.requestingCurrency, -offer.requestingAmount,
                     EntryReason::SETTLEMENT, offer.id);
        txn.transfer(acceptor, offer.offeringCurrency, offer.offeringAmount,
                     EntryReason::SETTLEMENT, offer.id);
        txn.unlock(offer.creatorId, offer.offeringCurrency, offer.offeringAmount,
                   EntryReason::ESCROW_UNLOCK, offer.id);
        txn.transfer(offer.creatorId, offer.offeringCurrency, -offer.offeringAmount,
                     EntryReason::SETTLEMENT, offer.id);
        txn.transfer(offer.creatorId, offer.requestingCurrency, offer.requestingAmount,
                     EntryReason::SETTLEMENT, offer.id);
        
        closeOffer(txn, offer.id, OfferStatus::COMPLETED);
        receipt.offer = loadOffer(txn.db(), offer.id);
    });
    if (res.failed()) return res.error();
    
    LOG_CAT(INFO, "escrow", "offer " + std::to_string(offerId) + " accepted by account " +
            std::to_string(acceptor) + ": " + describe(receipt.offer));
    return receipt;
}

Result<TradeOffer> EscrowEngine::cancelOffer(AccountId account, OfferId offerId) {
    TradeOffer offer;
    auto res = store_.runTransaction("cancel_offer", [&](LedgerTxn& txn) {
        offer = loadOffer(txn.db(), offerId);
        if (offer.creatorId != account) {
            CRYPTOTRADE_FAIL(ErrorCode::INVALID_OPERATION, "only the creator can cancel an offer");
        }
        if (offer.status != OfferStatus::ACTIVE) {
            CRYPTOTRADE_FAIL(ErrorCode::OFFER_NOT_ACTIVE,
                             "offer " + std::to_string(offerId) + " is " + toString(offer.status));
        }
        txn.unlock(offer.creatorId, offer.offeringCurrency, offer.offeringAmount,
                   EntryReason::ESCROW_UNLOCK, offer.id);
        closeOffer(txn, offer.id, OfferStatus::CANCELLED);
        offer = loadOffer(txn.db(), offer.id);
    });
    if (res.failed()) return res.error();
    
    LOG_CAT(INFO, "escrow", "offer " + std::to_string(offerId) + " cancelled: " + describe(offer));
    return offer;
}

Result<std::vector<TradeOffer>> EscrowEngine::listActiveOffers(std::optional<AccountId> exclude) {
    std::vector<TradeOffer> out;
    auto res = store_.runRead("list_active_offers", [&](database::Database& db) {
        auto stmt = db.prepare(std::string(OFFER_SELECT) +
                               "WHERE o.status = 'active' AND (?1 IS NULL OR o.creator_id <> ?1) "
                               "ORDER BY o.id DESC;");
        if (exclude) stmt.bind(1, *exclude);
        else stmt.bindNull(1);
        while (stmt.step()) out.push_back(readOffer(stmt));
    });
    if (res.failed()) return res.error();
    return out;
}

Result<std::vector<TradeOffer>> EscrowEngine::listOffersByCreator(AccountId creator,
                                                                  std::optional<OfferStatus> status) {
    std::vector<TradeOffer> out;
    auto res = store_.runRead("list_offers_by_creator", [&](database::Database& db) {
        auto stmt = db.prepare(std::string(OFFER_SELECT) +
                               "WHERE o.creator_id = ?1 AND (?2 IS NULL OR o.status = ?2) "
                               "ORDER BY o.id DESC;");
        stmt.bind(1, creator);
        if (status) stmt.bind(2, std::string(toString(*status)));
        else stmt.bindNull(2);
        while (stmt.step()) out.push_back(readOffer(stmt));
    });
    if (res.failed()) return res.error();
    return out;
}

Result<TradeOffer> EscrowEngine::getOffer(OfferId offerId) {
    TradeOffer out;
    auto res = store_.runRead("get_offer", [&](database::Database& db) {
        out = loadOffer(db, offerId);
    });
    if (res.failed()) return res.error();
    return out;
}

Result<std::vector<P2PSettlement>> EscrowEngine::settlementHistory(AccountId account, size_t limit) {
    std::vector<P2PSettlement> out;
    auto res = store_.runRead("settlement_history", [&](database::Database& db) {
        auto stmt = db.prepare("SELECT id, offer_id, creator_id, acceptor_id, offering_currency, "
                               "offering_amount, requesting_currency, requesting_amount, created_at "
                               "FROM p2p_settlements WHERE creator_id = ?1 OR acceptor_id = ?1 "
                               "ORDER BY id DESC LIMIT ?2;");
        stmt.bind(1, account).bind(2, static_cast<int64_t>(limit));
        while (stmt.step()) out.push_back(readSettlement(stmt));
    });
    if (res.failed()) return res.error();
    return out;
}

}
}
