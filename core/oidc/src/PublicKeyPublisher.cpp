#include "PublicKeyPublisher.h"
#include "Constants.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace Signet {

Json::Value ExpireableKey::toJson() const {
    Json::Value json(Json::objectValue);
    json["key"] = key.toJson();
    json["expirable"] = expirable;
    json["expire_at"] = expirable ? TimeUtils::formatRfc3339(expireAt) : "";
    return json;
}

Result<ExpireableKey> ExpireableKey::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        return Error{ErrorCode::SerializationFailed, "published key is not an object"};
    }

    auto jwk = PublicJwk::fromJson(json["key"]);
    if (!jwk) {
        return jwk.error();
    }

    ExpireableKey out;
    out.key = std::move(*jwk);
    out.expirable = json.get("expirable", false).asBool();
    if (out.expirable) {
        auto expireAt = TimeUtils::parseRfc3339(json.get("expire_at", "").asString());
        if (!expireAt) {
            return expireAt.error();
        }
        out.expireAt = *expireAt;
    }
    return out;
}

PublicKeyPublisher::PublicKeyPublisher(IKeyValueStore* store)
    : store_(store), keys_(std::make_shared<const KeyMap>()) {}

std::shared_ptr<const PublicKeyPublisher::KeyMap> PublicKeyPublisher::snapshot() const {
    return std::atomic_load(&keys_);
}

Result<void> PublicKeyPublisher::load() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!store_) {
        return Ok();
    }

    auto stored = store_->get(defaults::PUBLIC_KEYS_PATH);
    if (!stored) {
        return stored.error();
    }

    auto next = std::make_shared<KeyMap>();
    if (stored->has_value()) {
        auto parsed = Jose::parseJson(**stored);
        if (!parsed) {
            return parsed.error();
        }
        if (!parsed->isArray()) {
            return Error{ErrorCode::SerializationFailed, "published key set is not an array"};
        }
        for (const auto& item : *parsed) {
            auto key = ExpireableKey::fromJson(item);
            if (!key) {
                return key.error();
            }
            (*next)[key->key.kid] = std::move(*key);
        }
    }

    std::atomic_store(&keys_, std::shared_ptr<const KeyMap>(std::move(next)));
    LOG_INFO_COMP_IF("Loaded " + std::to_string(snapshot()->size()) + " published keys", "Publisher");
    return Ok();
}

// Called with writeMutex_ held
Result<void> PublicKeyPublisher::commit(std::shared_ptr<const KeyMap> next) {
    if (store_) {
        Json::Value array(Json::arrayValue);
        for (const auto& entry : *next) {
            array.append(entry.second.toJson());
        }
        auto written = store_->put(defaults::PUBLIC_KEYS_PATH, Jose::toCanonicalJson(array));
        if (!written) {
            Logger::instance().log(LogLevel::ERROR,
                "Failed to persist published keys: " + written.error().message, "Publisher");
            return written.error();
        }
    }
    std::atomic_store(&keys_, std::move(next));
    return Ok();
}

Result<void> PublicKeyPublisher::publish(const ExpireableKey& key) {
    return publish(std::vector<ExpireableKey>{key});
}

Result<void> PublicKeyPublisher::publish(const std::vector<ExpireableKey>& keys) {
    if (keys.empty()) {
        return Ok();
    }
    for (const auto& key : keys) {
        if (key.key.kid.empty()) {
            return Error{ErrorCode::InvalidInput, "published key has no kid"};
        }
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    auto next = std::make_shared<KeyMap>(*snapshot());
    for (const auto& key : keys) {
        (*next)[key.key.kid] = key;
    }

    auto committed = commit(std::move(next));
    if (!committed) {
        return committed;
    }

    for (const auto& key : keys) {
        if (key.expirable) {
            LOG_DEBUG_COMP_IF("Published retired key " + key.key.kid + " until "
                              + TimeUtils::formatRfc3339(key.expireAt), "Publisher");
        } else {
            LOG_DEBUG_COMP_IF("Published signing key " + key.key.kid, "Publisher");
        }
    }
    return Ok();
}

std::vector<ExpireableKey> PublicKeyPublisher::currentSet(TimePoint now) const {
    auto keys = snapshot();
    std::vector<ExpireableKey> out;
    out.reserve(keys->size());
    for (const auto& entry : *keys) {
        if (entry.second.visibleAt(now)) {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::optional<ExpireableKey> PublicKeyPublisher::find(const std::string& kid) const {
    auto keys = snapshot();
    auto it = keys->find(kid);
    if (it == keys->end()) {
        return std::nullopt;
    }
    return it->second;
}

Json::Value PublicKeyPublisher::toJwks(const std::vector<ExpireableKey>& keys) {
    Json::Value set(Json::objectValue);
    set["keys"] = Json::Value(Json::arrayValue);
    for (const auto& key : keys) {
        set["keys"].append(key.key.toJson());
    }
    return set;
}

Json::Value PublicKeyPublisher::jwks(TimePoint now) const {
    return toJwks(currentSet(now));
}

Result<size_t> PublicKeyPublisher::sweepExpired(TimePoint now) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto current = snapshot();
    auto next = std::make_shared<KeyMap>();
    for (const auto& entry : *current) {
        if (entry.second.visibleAt(now)) {
            next->insert(entry);
        }
    }

    size_t removed = current->size() - next->size();
    if (removed == 0) {
        return size_t{0};
    }

    auto committed = commit(std::move(next));
    if (!committed) {
        return committed.error();
    }
    Logger::instance().log(LogLevel::INFO,
        "Swept " + std::to_string(removed) + " expired keys", "Publisher");
    return removed;
}

size_t PublicKeyPublisher::size() const {
    return snapshot()->size();
}

} // namespace Signet
