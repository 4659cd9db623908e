#include "NamedKeyRegistry.h"
#include "Constants.h"
#include "Jose.h"
#include "TestHelpers.h"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace Signet;
using namespace std::chrono_literals;

class NamedKeyRegistryTest : public ::testing::Test {
protected:
    NamedKeyRegistryTest()
        : registry_(&store_, &publisher_, &generator_, clock_.fn()) {}

    CreateKeyRequest request(const std::string& name, const std::string& rotation = "1h",
                             const std::string& ttl = "") {
        CreateKeyRequest req;
        req.name = name;
        req.rotationPeriod = rotation;
        req.verificationTtl = ttl;
        return req;
    }

    bool stored(const std::string& name) {
        auto value = store_.inner().get(NamedKeyRecord::storageKey(name));
        return value && value->has_value();
    }

    test::ManualClock clock_;
    test::PooledKeyGenerator generator_;
    test::FailingStore store_;
    PublicKeyPublisher publisher_{&store_};
    NamedKeyRegistry registry_;
};

// =============================================================================
// Create
// =============================================================================

TEST_F(NamedKeyRegistryTest, CreateGeneratesAndPublishesFirstKey) {
    auto created = registry_.create(request("svc", "1h"));
    ASSERT_TRUE(created) << created.error().toString();

    EXPECT_EQ(created->name, "svc");
    EXPECT_EQ(created->algorithm, SigningAlgorithm::RS256);
    EXPECT_EQ(created->rotationPeriod, "1h");
    EXPECT_EQ(created->verificationTtl, "1h");
    ASSERT_EQ(created->keyRing.size(), 1u);
    EXPECT_EQ(created->signingKeyId, created->keyRing.front());

    auto published = publisher_.find(created->signingKeyId);
    ASSERT_TRUE(published.has_value());
    EXPECT_FALSE(published->expirable);
    EXPECT_TRUE(stored("svc"));
}

TEST_F(NamedKeyRegistryTest, GetReturnsCreatedConfiguration) {
    ASSERT_TRUE(registry_.create(request("svc", "1h")));

    auto config = registry_.get("svc");
    ASSERT_TRUE(config) << config.error().toString();
    EXPECT_EQ(config->rotationPeriod, "1h");
    EXPECT_EQ(config->verificationTtl, "1h");
    EXPECT_EQ(config->algorithm, SigningAlgorithm::RS256);

    Json::Value json = config->toJson();
    EXPECT_EQ(json["algorithm"].asString(), "RS256");
    EXPECT_EQ(json["signing_key"].asString(), config->signingKeyId);
    EXPECT_EQ(json["key_ring"].size(), 1u);
    EXPECT_FALSE(json.isMember("private_key_pem"));
}

TEST_F(NamedKeyRegistryTest, DefaultsApplyToOmittedFields) {
    CreateKeyRequest req;
    req.name = "defaults";
    req.rotationPeriod = "";
    req.algorithm = "";

    auto created = registry_.create(req);
    ASSERT_TRUE(created) << created.error().toString();
    EXPECT_EQ(created->rotationPeriod, defaults::ROTATION_PERIOD);
    EXPECT_EQ(created->verificationTtl, defaults::ROTATION_PERIOD);
    EXPECT_EQ(created->algorithm, SigningAlgorithm::RS256);
}

TEST_F(NamedKeyRegistryTest, LongVerificationTtlGrowsRing) {
    auto created = registry_.create(request("long", "1h", "10h"));
    ASSERT_TRUE(created);
    auto ring = registry_.keyRing("long");
    ASSERT_TRUE(ring);
    EXPECT_EQ((*ring)->policy().capacity, 11u);
    EXPECT_EQ((*ring)->policy().verificationTtl, 10h);
}

TEST_F(NamedKeyRegistryTest, RejectsInvalidRequests) {
    auto missing = registry_.create(request(""));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidInput);
    EXPECT_EQ(missing.error().message, "missing name");

    auto badName = registry_.create(request("a/b"));
    ASSERT_FALSE(badName);
    EXPECT_EQ(badName.error().code, ErrorCode::InvalidInput);

    auto badRotation = registry_.create(request("svc", "soon"));
    ASSERT_FALSE(badRotation);
    EXPECT_EQ(badRotation.error().code, ErrorCode::InvalidDuration);
    EXPECT_EQ(badRotation.error().message, "unable to parse provided rotation_period of: soon");

    auto badTtl = registry_.create(request("svc", "1h", "-5m"));
    ASSERT_FALSE(badTtl);
    EXPECT_EQ(badTtl.error().code, ErrorCode::InvalidDuration);

    CreateKeyRequest badAlg = request("svc");
    badAlg.algorithm = "HS256";
    auto unsupported = registry_.create(badAlg);
    ASSERT_FALSE(unsupported);
    EXPECT_EQ(unsupported.error().code, ErrorCode::UnsupportedAlgorithm);

    EXPECT_EQ(generator_.calls(), 0u);
    EXPECT_EQ(publisher_.size(), 0u);
    EXPECT_FALSE(stored("svc"));
}

TEST_F(NamedKeyRegistryTest, OversizedDurationsAreInvalid) {
    auto created = registry_.create(request("svc", "10000000000", "10000000000"));
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::InvalidDuration);
    EXPECT_EQ(created.error().message, "unable to parse provided rotation_period of: 10000000000");

    auto longTtl = registry_.create(request("svc", "1h", "36501d"));
    ASSERT_FALSE(longTtl);
    EXPECT_EQ(longTtl.error().code, ErrorCode::InvalidDuration);

    EXPECT_EQ(generator_.calls(), 0u);
    EXPECT_EQ(publisher_.size(), 0u);
    EXPECT_FALSE(stored("svc"));
    EXPECT_EQ(registry_.get("svc").error().code, ErrorCode::NotFound);
}

TEST_F(NamedKeyRegistryTest, RingLargerThanMaximumIsRefused) {
    // One-second rotation over thirty days needs 2592001 keys
    auto created = registry_.create(request("svc", "1s", "30d"));
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::InvalidInput);
    EXPECT_NE(created.error().message.find("2592001"), std::string::npos);
    EXPECT_NE(created.error().message.find(std::to_string(defaults::RING_MAX_CAPACITY)), std::string::npos);

    EXPECT_EQ(generator_.calls(), 0u);
    EXPECT_EQ(publisher_.size(), 0u);
    EXPECT_FALSE(stored("svc"));

    // The refused name stays free
    EXPECT_TRUE(registry_.create(request("svc", "1h", "30d")));
}

TEST_F(NamedKeyRegistryTest, MaximumCapacityIsConfigurable) {
    NamedKeyRegistry small(&store_, &publisher_, &generator_, clock_.fn(), 4, 10);

    auto fits = small.create(request("fits", "1h", "9h"));
    ASSERT_TRUE(fits) << fits.error().toString();
    auto ring = small.keyRing("fits");
    ASSERT_TRUE(ring);
    EXPECT_EQ((*ring)->policy().capacity, 10u);

    auto tooBig = small.create(request("big", "1h", "10h"));
    ASSERT_FALSE(tooBig);
    EXPECT_EQ(tooBig.error().code, ErrorCode::InvalidInput);
    EXPECT_FALSE(stored("big"));

    // A maximum below the minimum is raised to it
    NamedKeyRegistry clamped(&store_, &publisher_, &generator_, clock_.fn(), 4, 1);
    EXPECT_TRUE(clamped.create(request("clamped", "1h", "3h")));
}

TEST_F(NamedKeyRegistryTest, DuplicateCreateLeavesRingUntouched) {
    auto first = registry_.create(request("svc", "1h"));
    ASSERT_TRUE(first);

    auto second = registry_.create(request("svc", "2h"));
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(second.error().message, "named key \"svc\" already exists");

    auto config = registry_.get("svc");
    ASSERT_TRUE(config);
    EXPECT_EQ(config->keyRing, first->keyRing);
    EXPECT_EQ(config->rotationPeriod, "1h");
    EXPECT_EQ(generator_.calls(), 1u);
}

TEST_F(NamedKeyRegistryTest, DuplicateDetectedAgainstStoreAfterRestart) {
    ASSERT_TRUE(registry_.create(request("svc")));

    NamedKeyRegistry restarted(&store_, &publisher_, &generator_, clock_.fn());
    auto again = restarted.create(request("svc"));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyExists);
}

TEST_F(NamedKeyRegistryTest, StorageFailureLeavesNothingBehind) {
    store_.failWrites(defaults::NAMED_KEY_PREFIX);
    auto created = registry_.create(request("svc"));
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::StorageError);
    EXPECT_EQ(publisher_.size(), 0u);
    EXPECT_FALSE(stored("svc"));
    EXPECT_EQ(registry_.get("svc").error().code, ErrorCode::NotFound);

    // The failed attempt does not hold on to the name
    store_.heal();
    EXPECT_TRUE(registry_.create(request("svc")));
}

TEST_F(NamedKeyRegistryTest, PublishFailureRemovesSavedRecord) {
    store_.failWrites(defaults::PUBLIC_KEYS_PATH);
    auto created = registry_.create(request("svc"));
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::StorageError);
    EXPECT_FALSE(stored("svc"));
    EXPECT_EQ(publisher_.size(), 0u);
}

TEST_F(NamedKeyRegistryTest, GenerationFailureLeavesNothingBehind) {
    generator_.failNext();
    auto created = registry_.create(request("svc"));
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::GenerationFailed);
    EXPECT_FALSE(stored("svc"));
    EXPECT_EQ(publisher_.size(), 0u);
}

TEST_F(NamedKeyRegistryTest, CancelledCreateLeavesNothingBehind) {
    OperationContext ctx;
    ctx.cancel();
    auto created = registry_.create(request("svc"), ctx);
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::Cancelled);
    EXPECT_FALSE(stored("svc"));
    EXPECT_EQ(publisher_.size(), 0u);
    EXPECT_EQ(registry_.get("svc").error().code, ErrorCode::NotFound);
}

TEST_F(NamedKeyRegistryTest, ConcurrentCreateOfSameNameSucceedsOnce) {
    const int threads = 8;
    std::atomic<int> successes{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> others{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&]() {
            auto created = registry_.create(request("svc"));
            if (created) {
                successes++;
            } else if (created.error().code == ErrorCode::AlreadyExists) {
                duplicates++;
            } else {
                others++;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(duplicates.load(), threads - 1);
    EXPECT_EQ(others.load(), 0);
    EXPECT_EQ(generator_.calls(), 1u);
    EXPECT_EQ(publisher_.size(), 1u);
}

TEST_F(NamedKeyRegistryTest, DistinctNamesCreateConcurrently) {
    std::vector<std::thread> workers;
    std::atomic<int> failures{0};
    for (int t = 0; t < 6; ++t) {
        workers.emplace_back([&, t]() {
            if (!registry_.create(request("svc-" + std::to_string(t)))) {
                failures++;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(failures.load(), 0);

    auto names = registry_.list();
    ASSERT_TRUE(names);
    EXPECT_EQ(names->size(), 6u);
}

// =============================================================================
// Lookup and rotation
// =============================================================================

TEST_F(NamedKeyRegistryTest, UnknownNameIsNotFound) {
    auto config = registry_.get("missing");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::NotFound);
    EXPECT_EQ(config.error().message, "no named key was stored at \"missing\"");

    EXPECT_EQ(registry_.keyRing("missing").error().code, ErrorCode::NotFound);
    EXPECT_EQ(registry_.rotate("missing").error().code, ErrorCode::NotFound);
    EXPECT_EQ(registry_.get("").error().code, ErrorCode::InvalidInput);
}

TEST_F(NamedKeyRegistryTest, RotateAdvancesSigningKey) {
    auto created = registry_.create(request("svc"));
    ASSERT_TRUE(created);

    clock_.advance(1s);
    auto rotated = registry_.rotate("svc");
    ASSERT_TRUE(rotated) << rotated.error().toString();
    ASSERT_EQ(rotated->keyRing.size(), 2u);
    EXPECT_EQ(rotated->keyRing.front(), created->signingKeyId);
    EXPECT_NE(rotated->signingKeyId, created->signingKeyId);
    EXPECT_TRUE(publisher_.find(created->signingKeyId)->expirable);
}

TEST_F(NamedKeyRegistryTest, RotateIfDueSweepsStaleRings) {
    auto hourly = registry_.create(request("hourly", "1h"));
    ASSERT_TRUE(hourly);
    auto daily = registry_.create(request("daily", "1d"));
    ASSERT_TRUE(daily);

    auto none = registry_.rotateIfDue();
    ASSERT_TRUE(none);
    EXPECT_EQ(*none, 0u);

    clock_.advance(2h);
    auto swept = registry_.rotateIfDue();
    ASSERT_TRUE(swept) << swept.error().toString();
    EXPECT_EQ(*swept, 1u);

    auto hourlyNow = registry_.get("hourly");
    ASSERT_TRUE(hourlyNow);
    EXPECT_NE(hourlyNow->signingKeyId, hourly->signingKeyId);
    EXPECT_EQ(registry_.get("daily")->signingKeyId, daily->signingKeyId);

    auto set = publisher_.currentSet(clock_.now());
    bool published = false;
    for (const auto& key : set) {
        published = published || key.key.kid == hourlyNow->signingKeyId;
    }
    EXPECT_TRUE(published);
}

TEST_F(NamedKeyRegistryTest, RotateIfDueLoadsStoredRings) {
    ASSERT_TRUE(registry_.create(request("svc", "1h")));
    auto before = registry_.get("svc");
    ASSERT_TRUE(before);

    NamedKeyRegistry restarted(&store_, &publisher_, &generator_, clock_.fn());
    clock_.advance(1h + 1s);
    auto swept = restarted.rotateIfDue();
    ASSERT_TRUE(swept) << swept.error().toString();
    EXPECT_EQ(*swept, 1u);
    EXPECT_NE(restarted.get("svc")->signingKeyId, before->signingKeyId);
}

TEST_F(NamedKeyRegistryTest, RotateIfDueSkipsUnreadableRecords) {
    ASSERT_TRUE(registry_.create(request("svc", "1h")));
    ASSERT_TRUE(store_.inner().put(NamedKeyRecord::storageKey("broken"), "{not json"));

    clock_.advance(2h);
    auto swept = registry_.rotateIfDue();
    ASSERT_TRUE(swept) << swept.error().toString();
    EXPECT_EQ(*swept, 1u);
}

TEST_F(NamedKeyRegistryTest, RotateIfDueReportsFailedRotation) {
    ASSERT_TRUE(registry_.create(request("svc", "1h")));
    auto before = registry_.get("svc");
    ASSERT_TRUE(before);

    clock_.advance(2h);
    generator_.failNext();
    auto swept = registry_.rotateIfDue();
    ASSERT_FALSE(swept);
    EXPECT_EQ(swept.error().code, ErrorCode::GenerationFailed);
    EXPECT_EQ(registry_.get("svc")->signingKeyId, before->signingKeyId);
}

TEST_F(NamedKeyRegistryTest, ListIsSorted) {
    ASSERT_TRUE(registry_.create(request("zeta")));
    ASSERT_TRUE(registry_.create(request("alpha")));
    ASSERT_TRUE(registry_.create(request("mid")));

    auto names = registry_.list();
    ASSERT_TRUE(names);
    EXPECT_EQ(*names, (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST_F(NamedKeyRegistryTest, ValidNames) {
    EXPECT_TRUE(NamedKeyRegistry::isValidName("svc"));
    EXPECT_TRUE(NamedKeyRegistry::isValidName("svc-1.prod_a"));
    EXPECT_FALSE(NamedKeyRegistry::isValidName(""));
    EXPECT_FALSE(NamedKeyRegistry::isValidName("a b"));
    EXPECT_FALSE(NamedKeyRegistry::isValidName("a/b"));
}

// =============================================================================
// Restart
// =============================================================================

TEST_F(NamedKeyRegistryTest, RestartRestoresRingFromStore) {
    ASSERT_TRUE(registry_.create(request("svc")));
    for (int i = 0; i < 5; ++i) {
        clock_.advance(1s);
        ASSERT_TRUE(registry_.rotate("svc"));
    }
    auto before = registry_.get("svc");
    ASSERT_TRUE(before);
    ASSERT_EQ(before->keyRing.size(), 4u);

    PublicKeyPublisher reloaded(&store_);
    ASSERT_TRUE(reloaded.load());
    NamedKeyRegistry restarted(&store_, &reloaded, &generator_, clock_.fn());

    auto after = restarted.get("svc");
    ASSERT_TRUE(after) << after.error().toString();
    EXPECT_EQ(after->keyRing, before->keyRing);
    EXPECT_EQ(after->signingKeyId, before->signingKeyId);
    EXPECT_EQ(after->rotationPeriod, before->rotationPeriod);
    EXPECT_EQ(reloaded.size(), publisher_.size());

    // The restored private key still signs tokens the published key verifies
    auto ring = restarted.keyRing("svc");
    ASSERT_TRUE(ring);
    IdentityClaims claims;
    claims.issuer = "signet";
    claims.subject = "entity-1";
    claims.issuedAt = TimeUtils::floorSeconds(clock_.now());
    claims.expiry = claims.issuedAt + 2min;
    claims.authTime = claims.issuedAt;
    auto token = (*ring)->sign(claims);
    ASSERT_TRUE(token);
    auto published = reloaded.find(before->signingKeyId);
    ASSERT_TRUE(published.has_value());
    EXPECT_TRUE(Jose::verifyCompact(*token, published->key).ok());
}

TEST_F(NamedKeyRegistryTest, CorruptRecordIsReported) {
    ASSERT_TRUE(store_.inner().put(NamedKeyRecord::storageKey("broken"), "{not json"));
    auto config = registry_.get("broken");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::SerializationFailed);
}

TEST_F(NamedKeyRegistryTest, ReadFailureIsStorageError) {
    store_.failReads(defaults::NAMED_KEY_PREFIX);
    EXPECT_EQ(registry_.get("svc").error().code, ErrorCode::StorageError);
    EXPECT_EQ(registry_.create(request("svc")).error().code, ErrorCode::StorageError);
}
