#include "TokenIssuer.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "TimeUtils.h"

namespace Signet {

IssuerOptions IssuerOptions::fromConfig(const Config& config) {
    IssuerOptions options;
    options.issuer = config.get("oidc.issuer", options.issuer);
    options.audience = config.get("oidc.audience", options.audience);

    std::string ttlText = config.get("oidc.token_ttl");
    if (!ttlText.empty()) {
        auto ttl = TimeUtils::parseDuration(ttlText, "oidc.token_ttl");
        if (ttl) {
            options.tokenTtl = *ttl;
        } else {
            LOG_WARN_COMP(ttl.error().message + ", keeping "
                          + std::to_string(options.tokenTtl.count()) + "s", "TokenIssuer");
        }
    }
    return options;
}

TokenIssuer::TokenIssuer(NamedKeyRegistry* registry, PublicKeyPublisher* publisher,
                         IIdentityResolver* resolver, IssuerOptions options, KeyRing::Clock clock)
    : registry_(registry),
      publisher_(publisher),
      resolver_(resolver),
      options_(std::move(options)),
      clock_(clock ? std::move(clock) : KeyRing::Clock(SystemClock::now)) {}

IdentityClaims TokenIssuer::buildClaims(const ResolvedIdentity& identity, TimePoint now) const {
    TimePoint issuedAt = TimeUtils::floorSeconds(now);

    IdentityClaims claims;
    claims.issuer = options_.issuer;
    claims.subject = identity.entityId;
    claims.audience = {options_.audience};
    claims.issuedAt = issuedAt;
    claims.expiry = issuedAt + options_.tokenTtl;
    claims.authTime = issuedAt;
    claims.claims.displayName = identity.displayName;
    claims.claims.policies = identity.policies;
    claims.claims.authPath = identity.authPath;
    claims.claims.namespaceId = identity.namespaceId;
    return claims;
}

Result<IssuedToken> TokenIssuer::issue(const CallerCredential& credential, const std::string& keyName,
                                       const OperationContext& ctx) {
    auto identity = resolver_->resolve(credential);
    if (!identity || identity->entityId.empty()) {
        return Error{ErrorCode::UnresolvedIdentity, "no entity is associated with the request's token"};
    }

    auto ring = registry_->keyRing(keyName);
    if (!ring) {
        return ring.error();
    }

    IdentityClaims claims = buildClaims(*identity, clock_());
    auto token = (*ring)->sign(claims, ctx);
    if (!token) {
        return token.error();
    }

    IssuedToken issued;
    issued.token = std::move(*token);
    issued.keys = publisher_->currentSet(clock_());

    LOG_INFO_COMP_IF("Issued token for entity " + identity->entityId + " with key "
                     + (*ring)->currentKeyId(), "TokenIssuer");
    return issued;
}

} // namespace Signet
