#pragma once

#include <string>
#include <optional>
#include <utility>

namespace cryptotrade {
namespace core {

struct Identity {
    std::string externalId;
    std::string displayName;
};

// Opaque authentication collaborator; only the account registry consumes it.
class IdentityProvider {
public:
    virtual ~IdentityProvider() = default;
    virtual std::optional<Identity> authenticate() = 0;
};

class StaticIdentityProvider : public IdentityProvider {
public:
    StaticIdentityProvider(std::string externalId, std::string displayName)
        : identity_{std::move(externalId), std::move(displayName)} {}
    
    std::optional<Identity> authenticate() override {
        if (identity_.externalId.empty()) return std::nullopt;
        return identity_;
    }
    
private:
    Identity identity_;
};

}
}
