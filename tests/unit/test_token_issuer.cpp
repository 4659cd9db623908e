#include "TokenIssuer.h"
#include "Config.h"
#include "Jose.h"
#include "StaticIdentityResolver.h"
#include "TestHelpers.h"
#include <gtest/gtest.h>
#include <algorithm>

using namespace Signet;
using namespace std::chrono_literals;

class TokenIssuerTest : public ::testing::Test {
protected:
    TokenIssuerTest()
        : registry_(&store_, &publisher_, &generator_, clock_.fn()),
          issuer_(&registry_, &publisher_, &resolver_, IssuerOptions{}, clock_.fn()) {}

    void SetUp() override {
        ResolvedIdentity identity;
        identity.entityId = "entity-42";
        identity.displayName = "svc-account";
        identity.policies = {"default", "reader"};
        identity.authPath = "auth/token/create";
        identity.namespaceId = "root";
        resolver_.add("accessor-42", identity);

        ResolvedIdentity rootToken;
        resolver_.add("root-accessor", rootToken);

        CreateKeyRequest request;
        request.name = "svc";
        request.rotationPeriod = "1h";
        auto created = registry_.create(request);
        ASSERT_TRUE(created) << created.error().toString();
    }

    CallerCredential caller(const std::string& accessor) {
        CallerCredential credential;
        credential.accessor = accessor;
        return credential;
    }

    static bool containsKid(const std::vector<ExpireableKey>& keys, const std::string& kid) {
        return std::any_of(keys.begin(), keys.end(),
                           [&](const ExpireableKey& key) { return key.key.kid == kid; });
    }

    test::ManualClock clock_;
    test::PooledKeyGenerator generator_;
    test::FailingStore store_;
    PublicKeyPublisher publisher_{&store_};
    StaticIdentityResolver resolver_;
    NamedKeyRegistry registry_;
    TokenIssuer issuer_;
};

TEST_F(TokenIssuerTest, IssuesVerifiableTokenForEntity) {
    auto config = registry_.get("svc");
    ASSERT_TRUE(config);
    EXPECT_EQ(config->rotationPeriod, "1h");
    EXPECT_EQ(config->verificationTtl, "1h");
    EXPECT_EQ(config->algorithm, SigningAlgorithm::RS256);

    auto issued = issuer_.issue(caller("accessor-42"), "svc");
    ASSERT_TRUE(issued) << issued.error().toString();

    auto claims = IdentityClaims::fromToken(issued->token);
    ASSERT_TRUE(claims) << claims.error().toString();
    EXPECT_EQ(claims->subject, "entity-42");
    EXPECT_EQ(claims->issuer, defaults::TOKEN_ISSUER);
    EXPECT_EQ(claims->audience, std::vector<std::string>{defaults::TOKEN_AUDIENCE});
    EXPECT_EQ(claims->expiry - claims->issuedAt, 120s);
    EXPECT_EQ(claims->authTime, claims->issuedAt);
    EXPECT_EQ(claims->claims.displayName, "svc-account");
    EXPECT_EQ(claims->claims.policies, (std::vector<std::string>{"default", "reader"}));
    EXPECT_EQ(claims->claims.authPath, "auth/token/create");
    EXPECT_EQ(claims->claims.namespaceId, "root");

    auto parts = Jose::splitCompact(issued->token);
    ASSERT_TRUE(parts);
    std::string kid = parts->header["kid"].asString();
    EXPECT_EQ(kid, config->signingKeyId);
    ASSERT_TRUE(containsKid(issued->keys, kid));

    auto signer = std::find_if(issued->keys.begin(), issued->keys.end(),
                               [&](const ExpireableKey& key) { return key.key.kid == kid; });
    EXPECT_TRUE(Jose::verifyCompact(issued->token, signer->key).ok());
}

TEST_F(TokenIssuerTest, JwksCarriesPublishedKeys) {
    auto issued = issuer_.issue(caller("accessor-42"), "svc");
    ASSERT_TRUE(issued);
    Json::Value jwks = issued->jwks();
    ASSERT_TRUE(jwks["keys"].isArray());
    EXPECT_EQ(jwks["keys"].size(), issued->keys.size());
    EXPECT_EQ(jwks["keys"][0]["kty"].asString(), "RSA");
}

TEST_F(TokenIssuerTest, TimestampsAreWholeSeconds) {
    clock_.advance(1750ms);
    auto claims = issuer_.buildClaims(ResolvedIdentity{"entity-1", "", {}, "", ""}, clock_.now());
    EXPECT_EQ(TimeUtils::toUnixMillis(claims.issuedAt) % 1000, 0);
    EXPECT_EQ(TimeUtils::toUnixSeconds(claims.issuedAt), 1767225601);
    EXPECT_EQ(claims.expiry - claims.issuedAt, 120s);
}

TEST_F(TokenIssuerTest, StaleKeyIsRotatedBeforeSigning) {
    auto before = registry_.get("svc");
    ASSERT_TRUE(before);

    clock_.advance(1h + 1s);
    auto issued = issuer_.issue(caller("accessor-42"), "svc");
    ASSERT_TRUE(issued);

    auto after = registry_.get("svc");
    ASSERT_TRUE(after);
    EXPECT_NE(after->signingKeyId, before->signingKeyId);
    EXPECT_EQ(Jose::splitCompact(issued->token)->header["kid"].asString(), after->signingKeyId);

    // The retired key is still served until its expiry
    EXPECT_TRUE(containsKid(issued->keys, before->signingKeyId));
}

TEST_F(TokenIssuerTest, ExpiredKeysAreNotReturned) {
    auto before = registry_.get("svc");
    ASSERT_TRUE(before);
    ASSERT_TRUE(registry_.rotate("svc"));

    clock_.advance(1h + 1s);
    auto issued = issuer_.issue(caller("accessor-42"), "svc");
    ASSERT_TRUE(issued);
    EXPECT_FALSE(containsKid(issued->keys, before->signingKeyId));
}

TEST_F(TokenIssuerTest, UnknownCredentialIsUnresolved) {
    auto issued = issuer_.issue(caller("nobody"), "svc");
    ASSERT_FALSE(issued);
    EXPECT_EQ(issued.error().code, ErrorCode::UnresolvedIdentity);
    EXPECT_EQ(issued.error().message, "no entity is associated with the request's token");
}

TEST_F(TokenIssuerTest, CredentialWithoutEntityIsUnresolved) {
    auto issued = issuer_.issue(caller("root-accessor"), "svc");
    ASSERT_FALSE(issued);
    EXPECT_EQ(issued.error().code, ErrorCode::UnresolvedIdentity);
}

TEST_F(TokenIssuerTest, IdentityIsCheckedBeforeKeyLookup) {
    auto issued = issuer_.issue(caller("nobody"), "missing");
    ASSERT_FALSE(issued);
    EXPECT_EQ(issued.error().code, ErrorCode::UnresolvedIdentity);
}

TEST_F(TokenIssuerTest, UnknownKeyIsNotFound) {
    auto issued = issuer_.issue(caller("accessor-42"), "missing");
    ASSERT_FALSE(issued);
    EXPECT_EQ(issued.error().code, ErrorCode::NotFound);
}

TEST_F(TokenIssuerTest, RemovedIdentityStopsResolving) {
    resolver_.remove("accessor-42");
    EXPECT_EQ(issuer_.issue(caller("accessor-42"), "svc").error().code, ErrorCode::UnresolvedIdentity);
}

// =============================================================================
// Options
// =============================================================================

class IssuerOptionsTest : public ::testing::Test {
protected:
    void SetUp() override { Config::instance().clear(); }
    void TearDown() override { Config::instance().clear(); }
};

TEST_F(IssuerOptionsTest, DefaultsWithoutConfig) {
    auto options = IssuerOptions::fromConfig(Config::instance());
    EXPECT_EQ(options.issuer, defaults::TOKEN_ISSUER);
    EXPECT_EQ(options.audience, defaults::TOKEN_AUDIENCE);
    EXPECT_EQ(options.tokenTtl, defaults::TOKEN_TTL);
}

TEST_F(IssuerOptionsTest, ReadsConfiguredValues) {
    auto& config = Config::instance();
    config.set("oidc.issuer", "https://signet.example");
    config.set("oidc.audience", "relying-party");
    config.set("oidc.token_ttl", "5m");

    auto options = IssuerOptions::fromConfig(config);
    EXPECT_EQ(options.issuer, "https://signet.example");
    EXPECT_EQ(options.audience, "relying-party");
    EXPECT_EQ(options.tokenTtl, 300s);
}

TEST_F(IssuerOptionsTest, InvalidTtlKeepsDefault) {
    Config::instance().set("oidc.token_ttl", "forever");
    auto options = IssuerOptions::fromConfig(Config::instance());
    EXPECT_EQ(options.tokenTtl, defaults::TOKEN_TTL);
}
