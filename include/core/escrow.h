#pragma once

#include "core/ledger.h"
#include <string>
#include <vector>
#include <optional>

namespace cryptotrade {
namespace core {

struct SettlementReceipt {
    P2PSettlement settlement;
    TradeOffer offer;
};

// Peer offers: active -> completed (accept) or active -> cancelled (cancel).
// The offered amount stays locked in the creator's wallet while active.
class EscrowEngine {
public:
    explicit EscrowEngine(LedgerStore& store);
    
    Result<TradeOffer> createOffer(AccountId creator,
                                   const std::string& offeringCurrency, Amount offeringAmount,
                                   const std::string& requestingCurrency, Amount requestingAmount);
    Result<SettlementReceipt> acceptOffer(AccountId acceptor, OfferId offerId);
    Result<TradeOffer> cancelOffer(AccountId account, OfferId offerId);
    
    // Newest first.
    Result<std::vector<TradeOffer>> listActiveOffers(std::optional<AccountId> exclude = std::nullopt);
    Result<std::vector<TradeOffer>> listOffersByCreator(AccountId creator,
                                                        std::optional<OfferStatus> status = std::nullopt);
    Result<TradeOffer> getOffer(OfferId offerId);
    Result<std::vector<P2PSettlement>> settlementHistory(AccountId account, size_t limit = 100);
    
private:
    LedgerStore& store_;
};

}
}
