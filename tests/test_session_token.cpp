#include <gtest/gtest.h>
#include "common/crypto.hpp"
#include "common/jwt.hpp"

using namespace agentrelay;

class SessionTokenTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
    }

    SessionTokenIssuer::TimeSource fake_clock() {
        return [this] { return now_; };
    }

    std::chrono::system_clock::time_point now_{std::chrono::seconds(1'700'000'000)};
};

TEST_F(SessionTokenTest, FreshTokenVerifies) {
    SessionTokenIssuer issuer("test-secret", NoncePolicy::Required);
    auto token = issuer.create_token();

    EXPECT_FALSE(token.empty());
    EXPECT_TRUE(issuer.verify_token(token));
}

TEST_F(SessionTokenTest, TokenCarriesIssuerAndExpiry) {
    SessionTokenIssuer issuer("test-secret", NoncePolicy::Required,
                              std::chrono::seconds(3600), fake_clock());
    auto decoded = jwt::decode<json_traits>(issuer.create_token());

    EXPECT_EQ(decoded.get_issuer(), SessionTokenIssuer::kIssuer);
    EXPECT_EQ(decoded.get_algorithm(), "HS256");
    EXPECT_TRUE(decoded.has_id());
    EXPECT_EQ(decoded.get_expires_at() - decoded.get_issued_at(), std::chrono::seconds(3600));
}

TEST_F(SessionTokenTest, TokensAreDistinct) {
    SessionTokenIssuer issuer("test-secret", NoncePolicy::Required);
    EXPECT_NE(issuer.create_token(), issuer.create_token());
}

TEST_F(SessionTokenTest, ExpiredTokenRejected) {
    SessionTokenIssuer issuer("test-secret", NoncePolicy::Required,
                              std::chrono::seconds(60), fake_clock());
    auto token = issuer.create_token();

    now_ += std::chrono::seconds(59);
    EXPECT_TRUE(issuer.verify_token(token));

    now_ += std::chrono::seconds(2);
    EXPECT_FALSE(issuer.verify_token(token));
}

TEST_F(SessionTokenTest, ForeignSecretRejected) {
    SessionTokenIssuer ours("secret-a", NoncePolicy::Required);
    SessionTokenIssuer theirs("secret-b", NoncePolicy::Required);

    EXPECT_FALSE(ours.verify_token(theirs.create_token()));
}

TEST_F(SessionTokenTest, GarbageRejected) {
    SessionTokenIssuer issuer("test-secret", NoncePolicy::Required);

    EXPECT_FALSE(issuer.verify_token(""));
    EXPECT_FALSE(issuer.verify_token("not-a-token"));
    EXPECT_FALSE(issuer.verify_token("a.b.c"));

    auto token = issuer.create_token();
    token.back() = token.back() == 'A' ? 'B' : 'A';
    EXPECT_FALSE(issuer.verify_token(token));
}

TEST_F(SessionTokenTest, TokenWithoutExpiryRejected) {
    auto token = jwt::create<json_traits>()
        .set_issuer(SessionTokenIssuer::kIssuer)
        .set_issued_at(std::chrono::system_clock::now())
        .sign(jwt::algorithm::hs256{"test-secret"});

    SessionTokenIssuer issuer("test-secret", NoncePolicy::Required);
    EXPECT_FALSE(issuer.verify_token(token));
}

TEST_F(SessionTokenTest, SecretSelectsRequiredPolicy) {
    auto issuer = SessionTokenIssuer::from_config(std::string("configured"));
    EXPECT_EQ(issuer.nonce_policy(), NoncePolicy::Required);
    EXPECT_TRUE(issuer.requires_nonce());

    SessionTokenIssuer same("configured", NoncePolicy::Required);
    EXPECT_TRUE(same.verify_token(issuer.create_token()));
}

TEST_F(SessionTokenTest, MissingSecretSelectsRelaxedPolicy) {
    auto a = SessionTokenIssuer::from_config(std::nullopt);
    auto b = SessionTokenIssuer::from_config(std::nullopt);

    EXPECT_EQ(a.nonce_policy(), NoncePolicy::Relaxed);
    EXPECT_FALSE(a.requires_nonce());
    EXPECT_TRUE(a.verify_token(a.create_token()));

    // Each generated secret is independent
    EXPECT_FALSE(b.verify_token(a.create_token()));
}

TEST_F(SessionTokenTest, FingerprintDoesNotLeakSecret) {
    SessionTokenIssuer issuer("test-secret", NoncePolicy::Required);
    auto fp = issuer.key_fingerprint();

    EXPECT_EQ(fp.size(), 8u);
    EXPECT_EQ(fp.find("test"), std::string::npos);
}
