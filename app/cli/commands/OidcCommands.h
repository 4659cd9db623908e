#pragma once

#include "KeyRing.h"
#include <json/json.h>
#include <string>

namespace Signet {

class NamedKeyRegistry;
class PublicKeyPublisher;
class TokenIssuer;

/**
 * @brief Subsystems the OIDC commands operate on
 */
struct OidcCommandContext {
    NamedKeyRegistry* registry{nullptr};
    PublicKeyPublisher* publisher{nullptr};
    TokenIssuer* issuer{nullptr};
    KeyRing::Clock clock;
};

/**
 * @brief JSON request/response adapter over the registry and issuer
 *
 * Every handler returns {"success": true, "payload": ...} or
 * {"success": false, "error": <message>, "code": <error code>}.
 */
class OidcCommands {
public:
    explicit OidcCommands(const OidcCommandContext& ctx) : ctx_(ctx) {}

    /**
     * @brief name, rotation_period ("6h"), verification_ttl, algorithm ("RS256")
     */
    Json::Value createKey(const Json::Value& data);

    /**
     * @brief name -> rotation_period, verification_ttl, algorithm, key_ring
     */
    Json::Value readKey(const Json::Value& data);

    Json::Value rotateKey(const Json::Value& data);

    Json::Value listKeys(const Json::Value& data);

    /**
     * @brief accessor, key -> token and the JWKS verifiers need
     */
    Json::Value issueToken(const Json::Value& data);

    Json::Value jwks(const Json::Value& data);

    /**
     * @brief Route a command name ("create-key", "issue-token", ...) to its handler
     */
    Json::Value dispatch(const std::string& command, const Json::Value& data);

private:
    const OidcCommandContext& ctx_;
};

} // namespace Signet
