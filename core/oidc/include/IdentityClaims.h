#pragma once

#include "Result.h"
#include "TimeUtils.h"
#include <json/json.h>
#include <string>
#include <vector>

namespace Signet {

/**
 * @brief Caller attributes carried under the "claims" member
 */
struct TokenClaims {
    std::string displayName;
    std::vector<std::string> policies;
    std::string authPath;
    std::string namespaceId;

    Json::Value toJson() const;
    static TokenClaims fromJson(const Json::Value& json);

    bool operator==(const TokenClaims& other) const;
};

/**
 * @brief Payload of an identity token
 *
 * Timestamps are serialized as whole Unix seconds.
 */
struct IdentityClaims {
    std::string issuer;
    std::string subject;
    std::vector<std::string> audience;
    TimePoint issuedAt;
    TimePoint expiry;
    TimePoint authTime;
    TokenClaims claims;

    Json::Value toJson() const;

    /**
     * @brief Canonical JSON form that gets signed
     * @return SerializationFailed if iss or sub is empty or exp precedes iat
     */
    Result<std::string> serialize() const;

    static Result<IdentityClaims> fromJson(const Json::Value& json);

    /**
     * @brief Decode the payload of a compact token without verifying it
     */
    static Result<IdentityClaims> fromToken(const std::string& token);
};

} // namespace Signet
