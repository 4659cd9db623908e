#pragma once

#include "Config.h"
#include "Constants.h"
#include "IIdentityResolver.h"
#include "IdentityClaims.h"
#include "KeyRing.h"
#include "NamedKeyRegistry.h"
#include "OperationContext.h"
#include "PublicKeyPublisher.h"
#include "Result.h"
#include <json/json.h>
#include <chrono>
#include <string>
#include <vector>

namespace Signet {

/**
 * @brief Fixed values stamped into every issued token
 */
struct IssuerOptions {
    std::string issuer = defaults::TOKEN_ISSUER;
    std::string audience = defaults::TOKEN_AUDIENCE;
    std::chrono::seconds tokenTtl = defaults::TOKEN_TTL;

    /**
     * @brief Read oidc.issuer, oidc.audience and oidc.token_ttl
     *
     * Values that are missing or do not parse keep their defaults.
     */
    static IssuerOptions fromConfig(const Config& config);
};

/**
 * @brief Signed token plus the keys a verifier needs
 */
struct IssuedToken {
    std::string token;
    std::vector<ExpireableKey> keys;

    Json::Value jwks() const { return PublicKeyPublisher::toJwks(keys); }
};

/**
 * @brief Builds identity claims for a caller and signs them with a named key
 */
class TokenIssuer {
public:
    /**
     * @param registry Named keys (non-owning)
     * @param publisher Verification key set (non-owning)
     * @param resolver Caller identity lookup (non-owning)
     */
    TokenIssuer(NamedKeyRegistry* registry, PublicKeyPublisher* publisher, IIdentityResolver* resolver,
                IssuerOptions options = {}, KeyRing::Clock clock = SystemClock::now);

    /**
     * @return UnresolvedIdentity if the credential has no entity,
     *         NotFound if keyName is not configured
     */
    Result<IssuedToken> issue(const CallerCredential& credential, const std::string& keyName,
                              const OperationContext& ctx = {});

    /**
     * @brief Claims for an identity at a given instant, truncated to seconds
     */
    IdentityClaims buildClaims(const ResolvedIdentity& identity, TimePoint now) const;

    const IssuerOptions& options() const { return options_; }

private:
    NamedKeyRegistry* registry_;       // non-owning
    PublicKeyPublisher* publisher_;    // non-owning
    IIdentityResolver* resolver_;      // non-owning
    IssuerOptions options_;
    KeyRing::Clock clock_;
};

} // namespace Signet
