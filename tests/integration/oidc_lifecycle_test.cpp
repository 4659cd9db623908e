/**
 * @file oidc_lifecycle_test.cpp
 * @brief Integration tests for the Signet key lifecycle on SQLite storage
 *
 * Covers the complete flow:
 * - Named key creation and persistence
 * - Token issuance and verification against the published key set
 * - Rotation, eviction and expiry of retired keys
 * - Restart from the same database
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <unistd.h>

#include "Constants.h"
#include "IdentityClaims.h"
#include "Jose.h"
#include "KeyGenerator.h"
#include "NamedKeyRegistry.h"
#include "PublicKeyPublisher.h"
#include "SqliteKeyValueStore.h"
#include "StaticIdentityResolver.h"
#include "TestHelpers.h"
#include "TokenIssuer.h"

using namespace Signet;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// One process lifetime of the service over a database file
struct Service {
    explicit Service(const std::string& path, test::ManualClock& clock, IKeyGenerator* generator) {
        auto opened = SqliteKeyValueStore::open(path);
        if (!opened) {
            throw std::runtime_error(opened.error().toString());
        }
        store = std::move(*opened);
        publisher = std::make_unique<PublicKeyPublisher>(store.get());
        auto loaded = publisher->load();
        if (!loaded) {
            throw std::runtime_error(loaded.error().toString());
        }
        registry = std::make_unique<NamedKeyRegistry>(store.get(), publisher.get(), generator, clock.fn());

        ResolvedIdentity identity;
        identity.entityId = "entity-42";
        identity.displayName = "ci-runner";
        identity.policies = {"default"};
        resolver.add("accessor-42", identity);

        issuer = std::make_unique<TokenIssuer>(registry.get(), publisher.get(), &resolver,
                                               IssuerOptions{}, clock.fn());
    }

    std::unique_ptr<SqliteKeyValueStore> store;
    std::unique_ptr<PublicKeyPublisher> publisher;
    std::unique_ptr<NamedKeyRegistry> registry;
    StaticIdentityResolver resolver;
    std::unique_ptr<TokenIssuer> issuer;
};

bool verifiesWith(const std::string& token, const std::vector<ExpireableKey>& keys) {
    auto parts = Jose::splitCompact(token);
    if (!parts) {
        return false;
    }
    std::string kid = parts->header["kid"].asString();
    for (const auto& key : keys) {
        if (key.key.kid == kid) {
            return Jose::verifyCompact(token, key.key).ok();
        }
    }
    return false;
}

} // namespace

class OidcLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("signet_lifecycle_" + std::to_string(getpid()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        dbPath_ = (dir_ / "signet.db").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    CallerCredential caller() {
        CallerCredential credential;
        credential.accessor = "accessor-42";
        return credential;
    }

    fs::path dir_;
    std::string dbPath_;
    test::ManualClock clock_;
    test::PooledKeyGenerator generator_;
};

TEST_F(OidcLifecycleTest, CreateIssueRotateRestart) {
    std::string firstToken;
    std::string firstKid;
    std::vector<std::string> ringBefore;

    {
        Service service(dbPath_, clock_, &generator_);

        CreateKeyRequest request;
        request.name = "svc";
        request.rotationPeriod = "1h";
        auto created = service.registry->create(request);
        ASSERT_TRUE(created) << created.error().toString();
        firstKid = created->signingKeyId;

        auto issued = service.issuer->issue(caller(), "svc");
        ASSERT_TRUE(issued) << issued.error().toString();
        firstToken = issued->token;
        EXPECT_TRUE(verifiesWith(firstToken, issued->keys));

        auto claims = IdentityClaims::fromToken(firstToken);
        ASSERT_TRUE(claims);
        EXPECT_EQ(claims->subject, "entity-42");
        EXPECT_EQ(claims->expiry - claims->issuedAt, 120s);

        // Stale key triggers a rotation on the next issue
        clock_.advance(1h + 1s);
        auto second = service.issuer->issue(caller(), "svc");
        ASSERT_TRUE(second);
        EXPECT_TRUE(verifiesWith(second->token, second->keys));
        EXPECT_TRUE(verifiesWith(firstToken, second->keys));

        auto config = service.registry->get("svc");
        ASSERT_TRUE(config);
        EXPECT_EQ(config->keyRing.size(), 2u);
        EXPECT_NE(config->signingKeyId, firstKid);
        ringBefore = config->keyRing;
    }

    Service restarted(dbPath_, clock_, &generator_);
    auto config = restarted.registry->get("svc");
    ASSERT_TRUE(config) << config.error().toString();
    EXPECT_EQ(config->keyRing, ringBefore);
    EXPECT_EQ(config->rotationPeriod, "1h");

    // Tokens from before the restart still verify against the reloaded set
    auto keys = restarted.publisher->currentSet(clock_.now());
    EXPECT_TRUE(verifiesWith(firstToken, keys));

    auto issued = restarted.issuer->issue(caller(), "svc");
    ASSERT_TRUE(issued);
    EXPECT_EQ(Jose::splitCompact(issued->token)->header["kid"].asString(), config->signingKeyId);
    EXPECT_TRUE(verifiesWith(issued->token, issued->keys));

    // Once the verification TTL passes the first key is no longer served
    clock_.advance(1h + 1s);
    EXPECT_FALSE(verifiesWith(firstToken, restarted.publisher->currentSet(clock_.now())));

    auto swept = restarted.publisher->sweepExpired(clock_.now());
    ASSERT_TRUE(swept);
    EXPECT_GE(*swept, 1u);
    EXPECT_FALSE(restarted.publisher->find(firstKid).has_value());
}

TEST_F(OidcLifecycleTest, EvictionKeepsRingBounded) {
    Service service(dbPath_, clock_, &generator_);

    CreateKeyRequest request;
    request.name = "bounded";
    request.rotationPeriod = "1h";
    ASSERT_TRUE(service.registry->create(request));

    std::vector<std::string> seen{service.registry->get("bounded")->signingKeyId};
    for (int i = 0; i < 6; ++i) {
        clock_.advance(1s);
        auto rotated = service.registry->rotate("bounded");
        ASSERT_TRUE(rotated) << rotated.error().toString();
        seen.push_back(rotated->signingKeyId);
    }

    auto config = service.registry->get("bounded");
    ASSERT_TRUE(config);
    ASSERT_EQ(config->keyRing.size(), defaults::RING_CAPACITY);
    EXPECT_EQ(config->keyRing, std::vector<std::string>(seen.end() - defaults::RING_CAPACITY, seen.end()));

    for (size_t i = 0; i + defaults::RING_CAPACITY < seen.size(); ++i) {
        auto evicted = service.publisher->find(seen[i]);
        ASSERT_TRUE(evicted.has_value());
        EXPECT_TRUE(evicted->expirable);
    }

    Service restarted(dbPath_, clock_, &generator_);
    auto reloaded = restarted.registry->get("bounded");
    ASSERT_TRUE(reloaded);
    EXPECT_EQ(reloaded->keyRing, config->keyRing);
}

TEST_F(OidcLifecycleTest, RealKeyGeneratorEndToEnd) {
    RsaKeyGenerator generator(defaults::RSA_KEY_BITS);
    Service service(dbPath_, clock_, &generator);

    CreateKeyRequest request;
    request.name = "real";
    auto created = service.registry->create(request);
    ASSERT_TRUE(created) << created.error().toString();

    auto issued = service.issuer->issue(caller(), "real");
    ASSERT_TRUE(issued);
    EXPECT_TRUE(verifiesWith(issued->token, issued->keys));
}
