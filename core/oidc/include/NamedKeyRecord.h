#pragma once

#include "IKeyValueStore.h"
#include "KeyRing.h"
#include "Result.h"
#include "SigningAlgorithm.h"
#include <string>

namespace Signet {

/**
 * @brief Persisted form of a named key configuration and its ring
 *
 * Stored as JSON under oidc-config/namedKey/<name>. Private keys are kept
 * as PEM so the ring can be rebuilt after a restart.
 */
struct NamedKeyRecord {
    std::string name;
    SigningAlgorithm algorithm = SigningAlgorithm::RS256;
    std::string rotationPeriod;
    std::string verificationTtl;
    size_t capacity = 0;
    RingSnapshot ring;

    static std::string storageKey(const std::string& name);

    Result<std::string> encode() const;
    static Result<NamedKeyRecord> decode(const std::string& text);
};

/**
 * @brief Writes a ring's state into its named key record
 *
 * Saving an empty ring deletes the record, which is how a failed initial
 * rotation is rolled back.
 */
class NamedKeyRecordStore : public IRingStore {
public:
    /**
     * @param store Backing store (non-owning)
     * @param header Configuration fields written with every snapshot
     */
    NamedKeyRecordStore(IKeyValueStore* store, NamedKeyRecord header);

    Result<void> save(const RingSnapshot& snapshot) override;

private:
    IKeyValueStore* store_;    // non-owning
    NamedKeyRecord header_;
};

} // namespace Signet
