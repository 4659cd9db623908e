#include "KeyRing.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include <algorithm>
#include <mutex>
#include <set>

namespace Signet {

namespace {

ExpireableKey retiredKey(const KeyEntry& entry, TimePoint expireAt) {
    ExpireableKey key;
    key.key = entry.jwk;
    key.expirable = true;
    key.expireAt = expireAt;
    return key;
}

} // namespace

// =============================================================================
// RingPolicy
// =============================================================================

size_t RingPolicy::capacityFor(std::chrono::seconds rotationPeriod, std::chrono::seconds verificationTtl,
                               size_t minimum) {
    if (rotationPeriod.count() <= 0) {
        return minimum;
    }
    auto periods = (verificationTtl.count() + rotationPeriod.count() - 1) / rotationPeriod.count();
    size_t needed = static_cast<size_t>(periods) + 1;
    return std::max(minimum, needed);
}

Result<void> RingPolicy::validate() const {
    if (capacity == 0) {
        return Error{ErrorCode::InvalidInput, "key ring capacity must be at least 1"};
    }
    if (rotationPeriod.count() <= 0 || rotationPeriod > defaults::MAX_DURATION) {
        return Error{ErrorCode::InvalidDuration, "rotation period must be positive and at most "
                     + std::to_string(defaults::MAX_DURATION.count()) + "s"};
    }
    if (verificationTtl.count() <= 0 || verificationTtl > defaults::MAX_DURATION) {
        return Error{ErrorCode::InvalidDuration, "verification TTL must be positive and at most "
                     + std::to_string(defaults::MAX_DURATION.count()) + "s"};
    }
    // The oldest slot was retired capacity - 1 rotations before it is evicted
    if (static_cast<long double>(capacity - 1) * rotationPeriod.count() < verificationTtl.count()) {
        return Error{ErrorCode::InvalidInput,
                     "key ring of " + std::to_string(capacity) + " keys rotated every "
                     + std::to_string(rotationPeriod.count()) + "s cannot cover a verification TTL of "
                     + std::to_string(verificationTtl.count()) + "s"};
    }
    return Ok();
}

// =============================================================================
// RingSnapshot
// =============================================================================

std::vector<const KeyEntry*> RingSnapshot::ordered() const {
    std::vector<const KeyEntry*> out;
    if (empty() || slots.empty()) {
        return out;
    }
    size_t n = slots.size();
    for (size_t i = 1; i <= n; ++i) {
        const auto& slot = slots[(static_cast<size_t>(current) + i) % n];
        if (slot) {
            out.push_back(&*slot);
        }
    }
    return out;
}

std::vector<std::string> RingSnapshot::keyIds() const {
    std::vector<std::string> ids;
    for (const auto* entry : ordered()) {
        ids.push_back(entry->keyId);
    }
    return ids;
}

const KeyEntry* RingSnapshot::currentEntry() const {
    if (empty() || static_cast<size_t>(current) >= slots.size() || !slots[current]) {
        return nullptr;
    }
    return &*slots[current];
}

// =============================================================================
// KeyRing
// =============================================================================

KeyRing::KeyRing(ConstructionTag, std::string name, RingPolicy policy, IKeyGenerator* generator,
                 PublicKeyPublisher* publisher, Clock clock)
    : name_(std::move(name)),
      policy_(policy),
      generator_(generator),
      publisher_(publisher),
      clock_(std::move(clock)) {
    state_.slots.resize(policy_.capacity);
}

Result<std::shared_ptr<KeyRing>> KeyRing::create(std::string name, RingPolicy policy,
                                                 IKeyGenerator* generator,
                                                 PublicKeyPublisher* publisher,
                                                 Clock clock) {
    if (!generator || !publisher) {
        return Error{ErrorCode::InvalidInput, "key ring needs a generator and a publisher"};
    }
    auto valid = policy.validate();
    if (!valid) {
        return valid.error();
    }
    if (!clock) {
        clock = SystemClock::now;
    }
    return std::make_shared<KeyRing>(ConstructionTag{}, std::move(name), policy, generator, publisher,
                                     std::move(clock));
}

void KeyRing::attachStore(std::unique_ptr<IRingStore> store) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    store_ = std::move(store);
}

bool KeyRing::isDue(TimePoint now) const {
    const KeyEntry* current = state_.currentEntry();
    if (!current) {
        return true;
    }
    return now > current->createdAt + policy_.rotationPeriod;
}

Result<KeyEntry> KeyRing::rotate(const OperationContext& ctx) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return rotateLocked(ctx);
}

Result<bool> KeyRing::rotateIfDue(const OperationContext& ctx) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!isDue(clock_())) {
            return false;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Another caller may have rotated while we waited for the lock
    if (!isDue(clock_())) {
        return false;
    }
    auto rotated = rotateLocked(ctx);
    if (!rotated) {
        return rotated.error();
    }
    return true;
}

// Called with mutex_ held exclusively
Result<KeyEntry> KeyRing::rotateLocked(const OperationContext& ctx) {
    auto& logger = Logger::instance();

    if (ctx.isCancelled()) {
        return Error{ErrorCode::Cancelled, "rotation of key ring \"" + name_ + "\" was cancelled"};
    }

    auto generated = generator_->generate(ctx);
    if (!generated) {
        if (ctx.isCancelled()) {
            return Error{ErrorCode::Cancelled, "rotation of key ring \"" + name_ + "\" was cancelled"};
        }
        logger.log(LogLevel::ERROR, "Key generation for ring " + name_ + " failed: "
                   + generated.error().message, "KeyRing");
        return generated.error();
    }

    auto jwk = PublicJwk::fromSigningKey(*generated->key, generated->keyId, policy_.algorithm);
    if (!jwk) {
        return jwk.error();
    }

    TimePoint now = TimeUtils::floorMillis(clock_());

    KeyEntry added;
    added.keyId = generated->keyId;
    added.createdAt = now;
    added.key = generated->key;
    added.jwk = std::move(*jwk);

    size_t slot = state_.empty() ? 0 : (static_cast<size_t>(state_.current) + 1) % policy_.capacity;

    RingSnapshot next = state_;
    std::optional<KeyEntry> evicted = std::move(next.slots[slot]);
    next.slots[slot] = added;
    next.current = static_cast<int>(slot);

    if (ctx.done()) {
        return Error{ErrorCode::Cancelled,
                     "rotation of key ring \"" + name_ + "\" was cancelled before it was saved"};
    }

    if (store_) {
        auto saved = store_->save(next);
        if (!saved) {
            logger.log(LogLevel::ERROR, "Failed to save key ring " + name_ + ": "
                       + saved.error().message, "KeyRing");
            return saved.error();
        }
    }

    auto published = publishRotation(added, state_.currentEntry(), evicted ? &*evicted : nullptr, now);
    if (!published) {
        if (store_) {
            auto reverted = store_->save(state_);
            if (!reverted) {
                logger.log(LogLevel::CRITICAL, "Key ring " + name_
                           + " could not be reverted after a failed publish: "
                           + reverted.error().message, "KeyRing");
            }
        }
        return published.error();
    }

    state_ = std::move(next);

    logger.log(LogLevel::INFO, "Rotated key ring " + name_ + ", signing key is now " + added.keyId, "KeyRing");
    if (evicted) {
        LOG_INFO_COMP_IF("Evicted key " + evicted->keyId + " from ring " + name_, "KeyRing");
    }
    return added;
}

Result<void> KeyRing::publishRotation(const KeyEntry& added, const KeyEntry* retired,
                                      const KeyEntry* evicted, TimePoint now) {
    TimePoint expireAt = now + policy_.verificationTtl;
    std::vector<ExpireableKey> keys;

    if (retired) {
        keys.push_back(retiredKey(*retired, expireAt));
    }

    // An evicted key normally got its expiry when it was retired
    if (evicted && (!retired || evicted->keyId != retired->keyId)) {
        auto published = publisher_->find(evicted->keyId);
        if (!published || !published->expirable) {
            keys.push_back(retiredKey(*evicted, expireAt));
        }
    }

    ExpireableKey signer;
    signer.key = added.jwk;
    signer.expirable = false;
    keys.push_back(signer);

    return publisher_->publish(keys);
}

Result<PublicJwk> KeyRing::currentPublicKey(const OperationContext& ctx) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (state_.empty()) {
            return Error{ErrorCode::EmptyRing, "key ring \"" + name_ + "\" has no keys"};
        }
    }

    auto due = rotateIfDue(ctx);
    if (!due) {
        return due.error();
    }
    return activePublicKey();
}

Result<PublicJwk> KeyRing::activePublicKey() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const KeyEntry* current = state_.currentEntry();
    if (!current) {
        return Error{ErrorCode::EmptyRing, "key ring \"" + name_ + "\" has no keys"};
    }
    return current->jwk;
}

Result<std::string> KeyRing::sign(const IdentityClaims& claims, const OperationContext& ctx) {
    auto payload = claims.serialize();
    if (!payload) {
        return payload.error();
    }

    auto due = rotateIfDue(ctx);
    if (!due) {
        return due.error();
    }

    KeyEntry signer;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const KeyEntry* current = state_.currentEntry();
        if (!current) {
            return Error{ErrorCode::EmptyRing, "key ring \"" + name_ + "\" has no keys"};
        }
        signer = *current;
    }

    auto token = Jose::signCompact(*payload, *signer.key, signer.keyId, policy_.algorithm);
    if (!token) {
        Logger::instance().log(LogLevel::ERROR, "Signing with key " + signer.keyId + " failed: "
                               + token.error().message, "KeyRing");
        return token.error();
    }
    return token;
}

std::vector<std::string> KeyRing::keyIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_.keyIds();
}

std::string KeyRing::currentKeyId() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const KeyEntry* current = state_.currentEntry();
    return current ? current->keyId : std::string();
}

size_t KeyRing::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_.ordered().size();
}

RingSnapshot KeyRing::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

Result<void> KeyRing::restore(RingSnapshot snapshot) {
    if (snapshot.slots.size() != policy_.capacity) {
        return Error{ErrorCode::InvalidInput, "stored ring has " + std::to_string(snapshot.slots.size())
                     + " slots, expected " + std::to_string(policy_.capacity)};
    }

    if (snapshot.empty()) {
        for (const auto& slot : snapshot.slots) {
            if (slot) {
                return Error{ErrorCode::InvalidInput, "stored ring has keys but no current index"};
            }
        }
    } else {
        if (static_cast<size_t>(snapshot.current) >= snapshot.slots.size() || !snapshot.slots[snapshot.current]) {
            return Error{ErrorCode::InvalidInput, "stored ring current index does not name a key"};
        }

        std::set<std::string> seen;
        const KeyEntry* previous = nullptr;
        for (const auto* entry : snapshot.ordered()) {
            if (!entry->key || entry->keyId.empty() || entry->jwk.kid != entry->keyId) {
                return Error{ErrorCode::InvalidInput, "stored ring has an incomplete key entry"};
            }
            if (!seen.insert(entry->keyId).second) {
                return Error{ErrorCode::InvalidInput, "stored ring repeats key " + entry->keyId};
            }
            if (previous && entry->createdAt < previous->createdAt) {
                return Error{ErrorCode::InvalidInput, "stored ring keys are out of creation order"};
            }
            previous = entry;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_ = std::move(snapshot);
    LOG_DEBUG_COMP_IF("Restored key ring " + name_ + " with " + std::to_string(state_.ordered().size())
                      + " keys", "KeyRing");
    return Ok();
}

} // namespace Signet
