#pragma once

#include "Result.h"
#include "SigningAlgorithm.h"
#include "SigningKey.h"
#include <json/json.h>
#include <cstdint>
#include <string>
#include <vector>

namespace Signet {

/**
 * @brief Public signing key in RFC 7517 JWK form
 */
struct PublicJwk {
    std::string kty = "RSA";
    std::string use = "sig";
    std::string alg;
    std::string kid;
    std::string n;      // base64url modulus
    std::string e;      // base64url exponent

    Json::Value toJson() const;
    static Result<PublicJwk> fromJson(const Json::Value& json);

    /**
     * @brief Derive the JWK for a private key
     */
    static Result<PublicJwk> fromSigningKey(const SigningKey& key, const std::string& keyId,
                                            SigningAlgorithm algorithm);

    bool operator==(const PublicJwk& other) const;
    bool operator!=(const PublicJwk& other) const { return !(*this == other); }
};

namespace Jose {

std::string base64UrlEncode(const std::string& data);
std::string base64UrlEncode(const std::vector<uint8_t>& data);

/**
 * @brief Decode unpadded base64url
 * @return InvalidInput on characters outside the alphabet or a bad length
 */
Result<std::string> base64UrlDecode(const std::string& text);

/**
 * @brief Compact JSON with object keys in sorted order
 */
std::string toCanonicalJson(const Json::Value& value);

Result<Json::Value> parseJson(const std::string& text);

/**
 * @brief Produce header.payload.signature for a JSON payload
 *
 * The protected header is {"alg":<alg>,"kid":<keyId>,"typ":"JWT"}.
 */
Result<std::string> signCompact(const std::string& payload, const SigningKey& key,
                                const std::string& keyId, SigningAlgorithm algorithm);

/**
 * @brief Split a compact token into its three decoded parts
 */
struct CompactParts {
    Json::Value header;
    std::string payload;
    std::string signingInput;
    std::vector<uint8_t> signature;
};

Result<CompactParts> splitCompact(const std::string& token);

/**
 * @brief Check a compact token's signature against a published key
 *
 * Fails with InvalidInput when the token is malformed, its kid or alg do
 * not match the key, or the signature does not verify.
 */
Result<void> verifyCompact(const std::string& token, const PublicJwk& jwk);

} // namespace Jose

} // namespace Signet
