#pragma once

#include "IKeyValueStore.h"
#include "Jose.h"
#include "Result.h"
#include "TimeUtils.h"
#include <json/json.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Signet {

/**
 * @brief Public key published for verification
 *
 * The active signer is published with expirable=false. Once retired it is
 * republished with expirable=true and expireAt set to retirement time plus
 * the verification TTL.
 */
struct ExpireableKey {
    PublicJwk key;
    bool expirable = false;
    TimePoint expireAt{};

    bool visibleAt(TimePoint now) const { return !expirable || expireAt > now; }

    Json::Value toJson() const;
    static Result<ExpireableKey> fromJson(const Json::Value& json);
};

/**
 * @brief Process-wide set of verification keys
 *
 * Readers take a point-in-time snapshot and never wait on writers. Writers
 * serialize on a mutex, persist the complete new set and only then make it
 * visible. Expired keys are filtered at read time; sweepExpired drops them
 * eagerly.
 */
class PublicKeyPublisher {
public:
    /**
     * @param store Backing store (non-owning); nullptr keeps keys in memory only
     */
    explicit PublicKeyPublisher(IKeyValueStore* store = nullptr);

    /**
     * @brief Replace the in-memory set with the persisted one
     */
    Result<void> load();

    /**
     * @brief Add or overwrite one key, keyed by kid
     */
    Result<void> publish(const ExpireableKey& key);

    /**
     * @brief Add or overwrite several keys in one persisted update
     */
    Result<void> publish(const std::vector<ExpireableKey>& keys);

    /**
     * @brief Keys that are not expirable or expire after now, ordered by kid
     */
    std::vector<ExpireableKey> currentSet(TimePoint now) const;

    std::optional<ExpireableKey> find(const std::string& kid) const;

    /**
     * @brief JSON Web Key Set of the keys visible at now
     */
    Json::Value jwks(TimePoint now) const;

    /**
     * @brief Remove keys whose expiry has passed
     * @return Number of keys removed
     */
    Result<size_t> sweepExpired(TimePoint now);

    size_t size() const;

    static Json::Value toJwks(const std::vector<ExpireableKey>& keys);

private:
    using KeyMap = std::map<std::string, ExpireableKey>;

    std::shared_ptr<const KeyMap> snapshot() const;
    Result<void> commit(std::shared_ptr<const KeyMap> next);

    IKeyValueStore* store_;    // non-owning
    std::shared_ptr<const KeyMap> keys_;
    std::mutex writeMutex_;
};

} // namespace Signet
