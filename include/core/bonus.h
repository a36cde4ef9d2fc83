#pragma once

#include "core/ledger.h"
#include <string>
#include <vector>
#include <optional>

namespace cryptotrade {
namespace core {

struct BonusGrant {
    int64_t claimId = 0;
    Amount amount = 0;
    Amount newBalance = 0;
    std::string day;
    uint64_t claimedAt = 0;
};

struct BonusStatus {
    bool eligible = false;
    uint64_t secondsRemaining = 0;
    std::optional<uint64_t> lastClaim;
    Amount amount = 0;
};

// Rolling-cooldown bonus. The conditional UPDATE of last_bonus_claim is the
// only gate; the bonus_claims table is an audit record written alongside it.
class BonusScheduler {
public:
    explicit BonusScheduler(LedgerStore& store);
    
    // TOO_EARLY carries the remaining wait in Error::retryAfter.
    Result<BonusGrant> claim(AccountId account);
    Result<BonusStatus> status(AccountId account);
    Result<std::vector<BonusClaim>> history(AccountId account, size_t limit = 30);
    
private:
    uint64_t remaining(uint64_t lastClaim, uint64_t now) const;
    
    LedgerStore& store_;
};

}
}
