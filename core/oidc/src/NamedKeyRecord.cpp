#include "NamedKeyRecord.h"
#include "Constants.h"
#include "Jose.h"
#include "Logger.h"

namespace Signet {

std::string NamedKeyRecord::storageKey(const std::string& name) {
    return std::string(defaults::NAMED_KEY_PREFIX) + name;
}

Result<std::string> NamedKeyRecord::encode() const {
    Json::Value json(Json::objectValue);
    json["name"] = name;
    json["signing_algorithm"] = signingAlgorithmName(algorithm);
    json["rotation_period"] = rotationPeriod;
    json["verification_ttl"] = verificationTtl;
    json["capacity"] = static_cast<Json::UInt64>(capacity);
    json["current_index"] = ring.current;

    json["key_ring"] = Json::Value(Json::arrayValue);
    for (const auto& id : ring.keyIds()) {
        json["key_ring"].append(id);
    }

    const KeyEntry* current = ring.currentEntry();
    json["signing_key"] = current ? current->keyId : "";

    json["keys"] = Json::Value(Json::arrayValue);
    for (size_t slot = 0; slot < ring.slots.size(); ++slot) {
        const auto& entry = ring.slots[slot];
        if (!entry) {
            continue;
        }
        auto pem = entry->key->privatePem();
        if (!pem) {
            return pem.error();
        }

        Json::Value key(Json::objectValue);
        key["id"] = entry->keyId;
        key["created_at_ms"] = static_cast<Json::Int64>(TimeUtils::toUnixMillis(entry->createdAt));
        key["private_key_pem"] = *pem;
        key["slot"] = static_cast<Json::UInt64>(slot);
        json["keys"].append(key);
    }

    return Jose::toCanonicalJson(json);
}

Result<NamedKeyRecord> NamedKeyRecord::decode(const std::string& text) {
    auto parsed = Jose::parseJson(text);
    if (!parsed) {
        return parsed.error();
    }
    const Json::Value& json = *parsed;
    if (!json.isObject()) {
        return Error{ErrorCode::SerializationFailed, "named key record is not an object"};
    }

    NamedKeyRecord record;
    record.name = json.get("name", "").asString();
    if (record.name.empty()) {
        return Error{ErrorCode::SerializationFailed, "named key record has no name"};
    }

    auto algorithm = parseSigningAlgorithm(json.get("signing_algorithm", "").asString());
    if (!algorithm) {
        return algorithm.error();
    }
    record.algorithm = *algorithm;
    record.rotationPeriod = json.get("rotation_period", "").asString();
    record.verificationTtl = json.get("verification_ttl", "").asString();

    if (!json["capacity"].isIntegral() || json["capacity"].asInt64() <= 0) {
        return Error{ErrorCode::SerializationFailed, "named key record has an invalid capacity"};
    }
    record.capacity = static_cast<size_t>(json["capacity"].asUInt64());
    record.ring.slots.resize(record.capacity);
    record.ring.current = json.get("current_index", -1).asInt();

    for (const auto& item : json["keys"]) {
        Json::Value::UInt64 slot = item.get("slot", Json::Value::maxUInt64).asUInt64();
        if (slot >= record.capacity) {
            return Error{ErrorCode::SerializationFailed, "named key record has a key outside the ring"};
        }

        auto key = SigningKey::fromPrivatePem(item.get("private_key_pem", "").asString());
        if (!key) {
            return key.error();
        }

        KeyEntry entry;
        entry.keyId = item.get("id", "").asString();
        entry.createdAt = TimeUtils::fromUnixMillis(item.get("created_at_ms", 0).asInt64());
        entry.key = *key;

        auto jwk = PublicJwk::fromSigningKey(*entry.key, entry.keyId, record.algorithm);
        if (!jwk) {
            return jwk.error();
        }
        entry.jwk = std::move(*jwk);
        record.ring.slots[slot] = std::move(entry);
    }

    const KeyEntry* current = record.ring.currentEntry();
    std::string signingKey = json.get("signing_key", "").asString();
    if ((current ? current->keyId : std::string()) != signingKey) {
        return Error{ErrorCode::SerializationFailed, "named key record signing key does not match its ring"};
    }
    return record;
}

NamedKeyRecordStore::NamedKeyRecordStore(IKeyValueStore* store, NamedKeyRecord header)
    : store_(store), header_(std::move(header)) {
    header_.ring = RingSnapshot{};
}

Result<void> NamedKeyRecordStore::save(const RingSnapshot& snapshot) {
    std::string key = NamedKeyRecord::storageKey(header_.name);
    if (snapshot.empty()) {
        return store_->remove(key);
    }

    NamedKeyRecord record = header_;
    record.ring = snapshot;
    auto encoded = record.encode();
    if (!encoded) {
        return encoded.error();
    }
    return store_->put(key, *encoded);
}

} // namespace Signet
