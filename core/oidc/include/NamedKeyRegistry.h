#pragma once

#include "Constants.h"
#include "IKeyValueStore.h"
#include "KeyGenerator.h"
#include "KeyRing.h"
#include "NamedKeyRecord.h"
#include "OperationContext.h"
#include "PublicKeyPublisher.h"
#include "Result.h"
#include <json/json.h>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Signet {

/**
 * @brief Parameters of create-key
 *
 * An empty verificationTtl defaults to the rotation period.
 */
struct CreateKeyRequest {
    std::string name;
    std::string rotationPeriod = defaults::ROTATION_PERIOD;
    std::string verificationTtl;
    std::string algorithm = defaults::SIGNING_ALGORITHM;
};

/**
 * @brief Caller-visible view of a named key; never carries private keys
 */
struct NamedKeyConfig {
    std::string name;
    SigningAlgorithm algorithm = SigningAlgorithm::RS256;
    std::string rotationPeriod;
    std::string verificationTtl;
    std::vector<std::string> keyRing;   // oldest to newest
    std::string signingKeyId;

    Json::Value toJson() const;
};

/**
 * @brief Named key configurations and their rings
 *
 * The registry mutex only guards the name map. Ring work runs under each
 * ring's own lock, so unrelated names never contend.
 */
class NamedKeyRegistry {
public:
    /**
     * @param store Record store (non-owning)
     * @param publisher Verification key set (non-owning)
     * @param generator Key source for every ring (non-owning)
     * @param minimumCapacity Smallest ring size handed out
     * @param maximumCapacity Largest ring size create will accept
     */
    NamedKeyRegistry(IKeyValueStore* store, PublicKeyPublisher* publisher, IKeyGenerator* generator,
                     KeyRing::Clock clock = SystemClock::now,
                     size_t minimumCapacity = defaults::RING_CAPACITY,
                     size_t maximumCapacity = defaults::RING_MAX_CAPACITY);

    /**
     * @brief Validate, generate the first key, persist and publish it
     *
     * @return InvalidInput for a bad name or a verification TTL that would
     *         need more than maximumCapacity keys, InvalidDuration for a
     *         duration that does not parse, UnsupportedAlgorithm,
     *         AlreadyExists, or the error of the failed generation, save or
     *         publish. On failure nothing is stored or published.
     */
    Result<NamedKeyConfig> create(const CreateKeyRequest& request, const OperationContext& ctx = {});

    /**
     * @return NotFound if no configuration exists under name
     */
    Result<NamedKeyConfig> get(const std::string& name);

    Result<std::shared_ptr<KeyRing>> keyRing(const std::string& name);

    /**
     * @brief Force a rotation of the named ring
     */
    Result<NamedKeyConfig> rotate(const std::string& name, const OperationContext& ctx = {});

    /**
     * @brief Rotate every stored ring whose signing key has outlived its period
     * @return Number of rings rotated
     */
    Result<size_t> rotateIfDue(const OperationContext& ctx = {});

    /**
     * @brief Names of all stored configurations, sorted
     */
    Result<std::vector<std::string>> list();

    static bool isValidName(const std::string& name);

private:
    struct Entry {
        NamedKeyRecord header;
        std::shared_ptr<KeyRing> ring;
    };

    Result<std::shared_ptr<Entry>> lookup(const std::string& name);
    Result<std::shared_ptr<Entry>> loadFromStore(const std::string& name);
    Result<std::shared_ptr<KeyRing>> buildRing(const NamedKeyRecord& header);
    static NamedKeyConfig viewOf(const Entry& entry);

    IKeyValueStore* store_;            // non-owning
    PublicKeyPublisher* publisher_;    // non-owning
    IKeyGenerator* generator_;         // non-owning
    KeyRing::Clock clock_;
    size_t minimumCapacity_;
    size_t maximumCapacity_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::set<std::string> pending_;    // names with a create in flight
};

} // namespace Signet
