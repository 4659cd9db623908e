#include "IdentityClaims.h"
#include "Jose.h"

namespace Signet {

namespace {

Json::Value stringArray(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

std::vector<std::string> readStringArray(const Json::Value& json) {
    std::vector<std::string> out;
    if (json.isString()) {
        out.push_back(json.asString());
    } else if (json.isArray()) {
        for (const auto& item : json) {
            if (item.isString()) {
                out.push_back(item.asString());
            }
        }
    }
    return out;
}

TimePoint fromUnixSeconds(const Json::Value& json) {
    return TimeUtils::fromUnixMillis(json.asInt64() * 1000);
}

} // namespace

Json::Value TokenClaims::toJson() const {
    Json::Value json(Json::objectValue);
    json["display_name"] = displayName;
    json["policies"] = stringArray(policies);
    json["auth_path"] = authPath;
    json["namespace_id"] = namespaceId;
    return json;
}

TokenClaims TokenClaims::fromJson(const Json::Value& json) {
    TokenClaims claims;
    if (!json.isObject()) {
        return claims;
    }
    claims.displayName = json.get("display_name", "").asString();
    claims.policies = readStringArray(json["policies"]);
    claims.authPath = json.get("auth_path", "").asString();
    claims.namespaceId = json.get("namespace_id", "").asString();
    return claims;
}

bool TokenClaims::operator==(const TokenClaims& other) const {
    return displayName == other.displayName && policies == other.policies
        && authPath == other.authPath && namespaceId == other.namespaceId;
}

Json::Value IdentityClaims::toJson() const {
    Json::Value json(Json::objectValue);
    json["iss"] = issuer;
    json["sub"] = subject;
    json["aud"] = stringArray(audience);
    json["iat"] = static_cast<Json::Int64>(TimeUtils::toUnixSeconds(issuedAt));
    json["exp"] = static_cast<Json::Int64>(TimeUtils::toUnixSeconds(expiry));
    json["auth_time"] = static_cast<Json::Int64>(TimeUtils::toUnixSeconds(authTime));
    json["claims"] = claims.toJson();
    return json;
}

Result<std::string> IdentityClaims::serialize() const {
    if (issuer.empty()) {
        return Error{ErrorCode::SerializationFailed, "claims have no issuer"};
    }
    if (subject.empty()) {
        return Error{ErrorCode::SerializationFailed, "claims have no subject"};
    }
    if (expiry < issuedAt) {
        return Error{ErrorCode::SerializationFailed, "claims expire before they are issued"};
    }
    return Jose::toCanonicalJson(toJson());
}

Result<IdentityClaims> IdentityClaims::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        return Error{ErrorCode::SerializationFailed, "claims are not a JSON object"};
    }
    for (const char* field : {"iat", "exp"}) {
        if (!json[field].isIntegral()) {
            return Error{ErrorCode::SerializationFailed, std::string("claims are missing ") + field};
        }
    }

    IdentityClaims claims;
    claims.issuer = json.get("iss", "").asString();
    claims.subject = json.get("sub", "").asString();
    claims.audience = readStringArray(json["aud"]);
    claims.issuedAt = fromUnixSeconds(json["iat"]);
    claims.expiry = fromUnixSeconds(json["exp"]);
    claims.authTime = json["auth_time"].isIntegral() ? fromUnixSeconds(json["auth_time"]) : claims.issuedAt;
    claims.claims = TokenClaims::fromJson(json["claims"]);
    return claims;
}

Result<IdentityClaims> IdentityClaims::fromToken(const std::string& token) {
    auto parts = Jose::splitCompact(token);
    if (!parts) {
        return parts.error();
    }
    auto payload = Jose::parseJson(parts->payload);
    if (!payload) {
        return payload.error();
    }
    return fromJson(*payload);
}

} // namespace Signet
