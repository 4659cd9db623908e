#pragma once

#include "Constants.h"
#include "IdentityClaims.h"
#include "Jose.h"
#include "KeyGenerator.h"
#include "OperationContext.h"
#include "PublicKeyPublisher.h"
#include "Result.h"
#include "SigningAlgorithm.h"
#include "SigningKey.h"
#include "TimeUtils.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Signet {

/**
 * @brief One generated key pair held by a ring
 */
struct KeyEntry {
    std::string keyId;
    TimePoint createdAt;
    std::shared_ptr<const SigningKey> key;
    PublicJwk jwk;
};

/**
 * @brief Sizing and timing of a key ring
 *
 * A key is evicted capacity - 1 rotations after it was retired, so
 * (capacity - 1) * rotationPeriod must cover verificationTtl. Otherwise a
 * full ring would evict keys whose tokens are still verifiable.
 */
struct RingPolicy {
    size_t capacity = defaults::RING_CAPACITY;
    std::chrono::seconds rotationPeriod{0};
    std::chrono::seconds verificationTtl{0};
    SigningAlgorithm algorithm = SigningAlgorithm::RS256;

    /**
     * @brief Smallest capacity >= minimum that satisfies the retention invariant
     */
    static size_t capacityFor(std::chrono::seconds rotationPeriod, std::chrono::seconds verificationTtl,
                              size_t minimum = defaults::RING_CAPACITY);

    Result<void> validate() const;
};

/**
 * @brief Slot array and current index of a ring
 */
struct RingSnapshot {
    std::vector<std::optional<KeyEntry>> slots;
    int current = -1;

    bool empty() const { return current < 0; }

    /// Retained keys from oldest to newest
    std::vector<const KeyEntry*> ordered() const;

    std::vector<std::string> keyIds() const;

    const KeyEntry* currentEntry() const;
};

/**
 * @brief Persistence hook invoked with the next ring state
 *
 * Saving an empty snapshot removes the persisted state.
 */
class IRingStore {
public:
    virtual ~IRingStore() = default;
    virtual Result<void> save(const RingSnapshot& snapshot) = 0;
};

/**
 * @brief Bounded circular set of signing keys for one named configuration
 *
 * Every mutation takes the ring's exclusive lock and is all-or-nothing: the
 * next state is built aside, saved through the attached IRingStore, then the
 * affected public keys are published. If publishing fails the previously
 * saved state is written back. The in-memory state changes only after both
 * steps succeed.
 */
class KeyRing {
public:
    using Clock = std::function<TimePoint()>;

    /**
     * @param generator Key source (non-owning)
     * @param publisher Verification key set (non-owning)
     * @return InvalidInput for a policy that breaks the retention invariant
     */
    static Result<std::shared_ptr<KeyRing>> create(std::string name, RingPolicy policy,
                                                   IKeyGenerator* generator,
                                                   PublicKeyPublisher* publisher,
                                                   Clock clock = SystemClock::now);

private:
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    KeyRing(ConstructionTag, std::string name, RingPolicy policy, IKeyGenerator* generator,
            PublicKeyPublisher* publisher, Clock clock);

    KeyRing(const KeyRing&) = delete;
    KeyRing& operator=(const KeyRing&) = delete;

    /**
     * @brief Generate a key and make it current, evicting the oldest when full
     *
     * The previous current key is republished as expirable at now plus the
     * verification TTL. An evicted key keeps whatever expiry it was given
     * when it was retired.
     *
     * @return The new entry; Cancelled if ctx is cancelled before the state
     *         is saved, GenerationFailed if generation fails or times out
     */
    Result<KeyEntry> rotate(const OperationContext& ctx = {});

    /**
     * @brief Rotate when the current key is older than the rotation period
     * @return true if a rotation happened
     */
    Result<bool> rotateIfDue(const OperationContext& ctx = {});

    /**
     * @brief Public half of the signing key, rotating a stale key first
     * @return EmptyRing if no key was ever generated
     */
    Result<PublicJwk> currentPublicKey(const OperationContext& ctx = {});

    /**
     * @brief Public half of the signing key as it stands, without rotating
     */
    Result<PublicJwk> activePublicKey() const;

    /**
     * @brief Rotate if due, then sign the claims as a compact JWS
     */
    Result<std::string> sign(const IdentityClaims& claims, const OperationContext& ctx = {});

    std::vector<std::string> keyIds() const;
    std::string currentKeyId() const;
    size_t size() const;

    RingSnapshot snapshot() const;

    /**
     * @brief Replace the in-memory state with a persisted one
     *
     * Nothing is saved or published.
     */
    Result<void> restore(RingSnapshot snapshot);

    void attachStore(std::unique_ptr<IRingStore> store);

    const RingPolicy& policy() const { return policy_; }
    const std::string& name() const { return name_; }

private:
    bool isDue(TimePoint now) const;
    Result<KeyEntry> rotateLocked(const OperationContext& ctx);
    Result<void> publishRotation(const KeyEntry& added, const KeyEntry* retired,
                                 const KeyEntry* evicted, TimePoint now);

    const std::string name_;
    const RingPolicy policy_;
    IKeyGenerator* generator_;          // non-owning
    PublicKeyPublisher* publisher_;     // non-owning
    Clock clock_;
    std::unique_ptr<IRingStore> store_;

    RingSnapshot state_;
    mutable std::shared_mutex mutex_;
};

} // namespace Signet
