#include "OidcCommands.h"
#include "NamedKeyRegistry.h"
#include "PublicKeyPublisher.h"
#include "TokenIssuer.h"
#include "Logger.h"

namespace Signet {

namespace {

Json::Value failure(const Error& error) {
    Json::Value response(Json::objectValue);
    response["success"] = false;
    response["error"] = error.message;
    response["code"] = errorCodeToString(error.code);
    return response;
}

Json::Value failure(const std::string& message) {
    return failure(Error{ErrorCode::InvalidInput, message});
}

Json::Value success(const Json::Value& payload) {
    Json::Value response(Json::objectValue);
    response["success"] = true;
    response["payload"] = payload;
    return response;
}

// Optional string field; a present non-string value is rejected
bool readString(const Json::Value& data, const char* field, std::string& out, std::string& error) {
    if (!data.isObject() || !data.isMember(field) || data[field].isNull()) {
        return true;
    }
    if (!data[field].isString()) {
        error = std::string(field) + " must be a string";
        return false;
    }
    out = data[field].asString();
    return true;
}

TimePoint nowFrom(const OidcCommandContext& ctx) {
    return ctx.clock ? ctx.clock() : SystemClock::now();
}

} // namespace

Json::Value OidcCommands::createKey(const Json::Value& data) {
    CreateKeyRequest request;
    std::string error;
    if (!readString(data, "name", request.name, error)
        || !readString(data, "rotation_period", request.rotationPeriod, error)
        || !readString(data, "verification_ttl", request.verificationTtl, error)
        || !readString(data, "algorithm", request.algorithm, error)) {
        return failure(error);
    }

    auto created = ctx_.registry->create(request);
    if (!created) {
        return failure(created.error());
    }
    return success(created->toJson());
}

Json::Value OidcCommands::readKey(const Json::Value& data) {
    std::string name;
    std::string error;
    if (!readString(data, "name", name, error)) {
        return failure(error);
    }

    auto config = ctx_.registry->get(name);
    if (!config) {
        return failure(config.error());
    }
    return success(config->toJson());
}

Json::Value OidcCommands::rotateKey(const Json::Value& data) {
    std::string name;
    std::string error;
    if (!readString(data, "name", name, error)) {
        return failure(error);
    }

    auto config = ctx_.registry->rotate(name);
    if (!config) {
        return failure(config.error());
    }
    Logger::instance().log(LogLevel::INFO, "Rotated named key " + name + " on request", "OidcCommands");
    return success(config->toJson());
}

Json::Value OidcCommands::listKeys(const Json::Value&) {
    auto names = ctx_.registry->list();
    if (!names) {
        return failure(names.error());
    }

    Json::Value payload(Json::objectValue);
    payload["keys"] = Json::Value(Json::arrayValue);
    for (const auto& name : *names) {
        payload["keys"].append(name);
    }
    return success(payload);
}

Json::Value OidcCommands::issueToken(const Json::Value& data) {
    CallerCredential credential;
    std::string keyName;
    std::string error;
    if (!readString(data, "accessor", credential.accessor, error)
        || !readString(data, "key", keyName, error)) {
        return failure(error);
    }

    auto issued = ctx_.issuer->issue(credential, keyName);
    if (!issued) {
        return failure(issued.error());
    }

    Json::Value payload(Json::objectValue);
    payload["token"] = issued->token;
    payload["keys"] = issued->jwks();
    return success(payload);
}

Json::Value OidcCommands::jwks(const Json::Value&) {
    // Readers must see a signer that sign() would use next
    auto rotated = ctx_.registry->rotateIfDue();
    if (!rotated) {
        return failure(rotated.error());
    }
    return success(ctx_.publisher->jwks(nowFrom(ctx_)));
}

Json::Value OidcCommands::dispatch(const std::string& command, const Json::Value& data) {
    if (command == "create-key") return createKey(data);
    if (command == "read-key") return readKey(data);
    if (command == "rotate-key") return rotateKey(data);
    if (command == "list-keys") return listKeys(data);
    if (command == "issue-token") return issueToken(data);
    if (command == "jwks") return jwks(data);
    return failure("unknown command: " + command);
}

} // namespace Signet
