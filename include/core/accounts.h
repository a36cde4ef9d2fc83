#pragma once

#include "core/ledger.h"
#include "core/identity.h"
#include <string>
#include <vector>

namespace cryptotrade {
namespace core {

struct AccountHandle {
    Account account;
    bool created = false;
};

// Maps external identities to internal accounts. The UNIQUE constraint on
// external_id, not a lookup, decides which caller creates the account.
class AccountRegistry {
public:
    explicit AccountRegistry(LedgerStore& store);
    
    // Creates the account with one wallet per supported currency and the
    // base currency seeded, or refreshes last_login on an existing one.
    Result<AccountHandle> resolveOrCreate(const std::string& externalId, const std::string& displayName);
    Result<AccountHandle> login(IdentityProvider& identity);
    
    Result<Account> getAccount(AccountId id);
    Result<Account> findByExternalId(const std::string& externalId);
    Result<std::vector<Account>> listAccounts();
    Result<size_t> count();
    
private:
    LedgerStore& store_;
};

Account readAccount(database::Statement& stmt);
extern const char* const ACCOUNT_COLUMNS;

}
}
