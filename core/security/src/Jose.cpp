/**
 * @file Jose.cpp
 * @brief base64url, JWK and compact JWS helpers
 */

#include "Jose.h"
#include <openssl/evp.h>
#include <algorithm>
#include <memory>
#include <sstream>

namespace Signet {

namespace Jose {

namespace {

std::string encodeBytes(const unsigned char* data, size_t len) {
    if (len == 0) {
        return "";
    }
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

bool isBase64UrlChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '-' || c == '_';
}

} // namespace

std::string base64UrlEncode(const std::string& data) {
    return encodeBytes(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string base64UrlEncode(const std::vector<uint8_t>& data) {
    return encodeBytes(data.data(), data.size());
}

Result<std::string> base64UrlDecode(const std::string& text) {
    if (text.empty()) {
        return std::string();
    }
    if (text.size() % 4 == 1) {
        return Error{ErrorCode::InvalidInput, "invalid base64url length"};
    }

    std::string padded;
    padded.reserve(text.size() + 3);
    for (char c : text) {
        if (!isBase64UrlChar(c)) {
            return Error{ErrorCode::InvalidInput, "invalid base64url character"};
        }
        padded.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
    }
    size_t padding = (4 - padded.size() % 4) % 4;
    padded.append(padding, '=');

    std::string out(padded.size() / 4 * 3, '\0');
    int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              reinterpret_cast<const unsigned char*>(padded.data()),
                              static_cast<int>(padded.size()));
    if (len < 0) {
        return Error{ErrorCode::InvalidInput, "invalid base64url data"};
    }
    // EVP_DecodeBlock counts the zero bytes produced by '=' padding
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

std::string toCanonicalJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["commentStyle"] = "None";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

Result<Json::Value> parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Error{ErrorCode::SerializationFailed, "invalid JSON: " + errors};
    }
    return root;
}

Result<std::string> signCompact(const std::string& payload, const SigningKey& key,
                                const std::string& keyId, SigningAlgorithm algorithm) {
    Json::Value header(Json::objectValue);
    header["alg"] = signingAlgorithmName(algorithm);
    header["kid"] = keyId;
    header["typ"] = "JWT";

    std::string signingInput = base64UrlEncode(toCanonicalJson(header)) + "." + base64UrlEncode(payload);

    auto signature = key.sign(signingInput, algorithm);
    if (!signature) {
        return signature.error();
    }
    return signingInput + "." + base64UrlEncode(*signature);
}

Result<CompactParts> splitCompact(const std::string& token) {
    size_t first = token.find('.');
    size_t second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return Error{ErrorCode::InvalidInput, "token is not in compact serialization"};
    }

    auto headerBytes = base64UrlDecode(token.substr(0, first));
    if (!headerBytes) return headerBytes.error();
    auto payload = base64UrlDecode(token.substr(first + 1, second - first - 1));
    if (!payload) return payload.error();
    auto signature = base64UrlDecode(token.substr(second + 1));
    if (!signature) return signature.error();

    auto header = parseJson(*headerBytes);
    if (!header || !header->isObject()) {
        return Error{ErrorCode::InvalidInput, "token header is not a JSON object"};
    }

    CompactParts parts;
    parts.header = std::move(*header);
    parts.payload = std::move(*payload);
    parts.signingInput = token.substr(0, second);
    parts.signature.assign(signature->begin(), signature->end());
    return parts;
}

Result<void> verifyCompact(const std::string& token, const PublicJwk& jwk) {
    auto parts = splitCompact(token);
    if (!parts) return parts.error();

    const auto& header = parts->header;
    if (header["kid"].asString() != jwk.kid) {
        return Error{ErrorCode::InvalidInput, "token kid does not match key " + jwk.kid};
    }
    if (header["alg"].asString() != jwk.alg) {
        return Error{ErrorCode::InvalidInput, "token alg does not match key algorithm"};
    }

    auto algorithm = parseSigningAlgorithm(jwk.alg);
    if (!algorithm) return algorithm.error();

    auto n = base64UrlDecode(jwk.n);
    if (!n) return n.error();
    auto e = base64UrlDecode(jwk.e);
    if (!e) return e.error();

    RsaPublicNumbers numbers;
    numbers.modulus.assign(n->begin(), n->end());
    numbers.exponent.assign(e->begin(), e->end());
    auto publicKey = rsaPublicKeyFromNumbers(numbers);
    if (!publicKey) return publicKey.error();

    if (!verifySignature(publicKey->get(), parts->signingInput, parts->signature, *algorithm)) {
        return Error{ErrorCode::InvalidInput, "signature verification failed"};
    }
    return Ok();
}

} // namespace Jose

Json::Value PublicJwk::toJson() const {
    Json::Value json(Json::objectValue);
    json["kty"] = kty;
    json["use"] = use;
    json["alg"] = alg;
    json["kid"] = kid;
    json["n"] = n;
    json["e"] = e;
    return json;
}

Result<PublicJwk> PublicJwk::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        return Error{ErrorCode::SerializationFailed, "JWK is not an object"};
    }
    for (const char* field : {"kty", "kid", "alg", "n", "e"}) {
        if (!json[field].isString() || json[field].asString().empty()) {
            return Error{ErrorCode::SerializationFailed, std::string("JWK is missing ") + field};
        }
    }

    PublicJwk jwk;
    jwk.kty = json["kty"].asString();
    jwk.use = json.get("use", "sig").asString();
    jwk.alg = json["alg"].asString();
    jwk.kid = json["kid"].asString();
    jwk.n = json["n"].asString();
    jwk.e = json["e"].asString();
    if (jwk.kty != "RSA") {
        return Error{ErrorCode::SerializationFailed, "unsupported JWK key type " + jwk.kty};
    }
    return jwk;
}

Result<PublicJwk> PublicJwk::fromSigningKey(const SigningKey& key, const std::string& keyId,
                                            SigningAlgorithm algorithm) {
    auto numbers = key.publicNumbers();
    if (!numbers) return numbers.error();

    PublicJwk jwk;
    jwk.alg = signingAlgorithmName(algorithm);
    jwk.kid = keyId;
    jwk.n = Jose::base64UrlEncode(numbers->modulus);
    jwk.e = Jose::base64UrlEncode(numbers->exponent);
    return jwk;
}

bool PublicJwk::operator==(const PublicJwk& other) const {
    return kty == other.kty && use == other.use && alg == other.alg
        && kid == other.kid && n == other.n && e == other.e;
}

} // namespace Signet
