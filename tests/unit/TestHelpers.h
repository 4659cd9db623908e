#pragma once

/**
 * @file TestHelpers.h
 * @brief Shared fakes for the Signet unit tests
 */

#include "IKeyValueStore.h"
#include "KeyGenerator.h"
#include "KeyRing.h"
#include "MemoryKeyValueStore.h"
#include "TimeUtils.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace Signet {
namespace test {

/**
 * @brief Real RSA keys from a small pool generated once per process
 *
 * Every call returns a fresh key ID so rings see distinct keys, while the
 * 2048-bit prime search only runs a handful of times per test binary.
 */
class PooledKeyGenerator : public IKeyGenerator {
public:
    static constexpr size_t POOL_SIZE = 4;

    Result<GeneratedKey> generate(const OperationContext& ctx) override {
        calls_++;
        if (ctx.done()) {
            return Error{ErrorCode::GenerationFailed, "key generation aborted"};
        }
        if (failNext_.exchange(false)) {
            return Error{ErrorCode::GenerationFailed, "injected generation failure"};
        }

        auto keyId = RsaKeyGenerator::generateKeyId();
        if (!keyId) {
            return keyId.error();
        }

        const auto& keys = pool();
        GeneratedKey generated;
        generated.keyId = *keyId;
        generated.key = keys[next_++ % keys.size()];
        return generated;
    }

    void failNext() { failNext_ = true; }
    size_t calls() const { return calls_; }

private:
    static const std::vector<std::shared_ptr<const SigningKey>>& pool() {
        static const std::vector<std::shared_ptr<const SigningKey>> keys = [] {
            std::vector<std::shared_ptr<const SigningKey>> out;
            RsaKeyGenerator generator(2048);
            for (size_t i = 0; i < POOL_SIZE; ++i) {
                auto generated = generator.generate(OperationContext{});
                if (!generated) {
                    throw std::runtime_error("test key pool: " + generated.error().toString());
                }
                out.push_back(generated->key);
            }
            return out;
        }();
        return keys;
    }

    std::atomic<size_t> calls_{0};
    std::atomic<size_t> next_{0};
    std::atomic<bool> failNext_{false};
};

/**
 * @brief Store whose writes under a key prefix can be made to fail
 */
class FailingStore : public IKeyValueStore {
public:
    Result<std::optional<std::string>> get(const std::string& key) override {
        if (failGets_ && matches(key)) {
            return Error{ErrorCode::StorageError, "injected read failure"};
        }
        return inner_.get(key);
    }

    Result<void> put(const std::string& key, const std::string& value) override {
        if (failPuts_ && matches(key)) {
            return Error{ErrorCode::StorageError, "injected write failure"};
        }
        return inner_.put(key, value);
    }

    Result<void> remove(const std::string& key) override {
        return inner_.remove(key);
    }

    Result<std::vector<std::string>> list(const std::string& prefix) override {
        return inner_.list(prefix);
    }

    void failWrites(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        prefix_ = prefix;
        failPuts_ = true;
    }

    void failReads(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        prefix_ = prefix;
        failGets_ = true;
    }

    void heal() {
        failPuts_ = false;
        failGets_ = false;
    }

    MemoryKeyValueStore& inner() { return inner_; }

private:
    bool matches(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return key.compare(0, prefix_.size(), prefix_) == 0;
    }

    MemoryKeyValueStore inner_;
    std::mutex mutex_;
    std::string prefix_;
    std::atomic<bool> failPuts_{false};
    std::atomic<bool> failGets_{false};
};

/**
 * @brief Settable clock shared by copies
 */
class ManualClock {
public:
    ManualClock() : millis_(std::make_shared<std::atomic<int64_t>>(1767225600000LL)) {}   // 2026-01-01T00:00:00Z

    TimePoint now() const { return TimeUtils::fromUnixMillis(millis_->load()); }

    void advance(std::chrono::milliseconds by) { millis_->fetch_add(by.count()); }

    KeyRing::Clock fn() const {
        auto millis = millis_;
        return [millis]() { return TimeUtils::fromUnixMillis(millis->load()); };
    }

private:
    std::shared_ptr<std::atomic<int64_t>> millis_;
};

} // namespace test
} // namespace Signet
