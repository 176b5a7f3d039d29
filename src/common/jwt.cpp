#include "common/jwt.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"
#include <openssl/sha.h>

namespace agentrelay {

std::string_view nonce_policy_name(NoncePolicy policy) {
    switch (policy) {
        case NoncePolicy::Required: return "required";
        case NoncePolicy::Relaxed: return "relaxed";
        default: return "unknown";
    }
}

SessionTokenIssuer::SessionTokenIssuer(std::string secret,
                                       NoncePolicy policy,
                                       std::chrono::seconds ttl,
                                       TimeSource now)
    : secret_(std::move(secret))
    , policy_(policy)
    , ttl_(ttl)
    , clock_{std::move(now)}
    , verifier_(jwt::verify<IssuerClock, json_traits>(clock_)
        .allow_algorithm(jwt::algorithm::hs256{secret_})
        .with_issuer(kIssuer)) {
}

SessionTokenIssuer SessionTokenIssuer::from_config(const std::optional<std::string>& secret,
                                                   std::chrono::seconds ttl) {
    if (secret && !secret->empty()) {
        return SessionTokenIssuer(*secret, NoncePolicy::Required, ttl);
    }

    auto bytes = crypto::random_bytes(kGeneratedSecretBytes);
    NLOG_INFO(log::AUTH_LOGGER,
              "SessionTokenIssuer: No session secret configured, generated one (nonce policy relaxed)");
    return SessionTokenIssuer(std::string(bytes.begin(), bytes.end()), NoncePolicy::Relaxed, ttl);
}

std::string SessionTokenIssuer::create_token() const {
    auto issued_at = clock_.now();

    return jwt::create<json_traits>()
        .set_issuer(kIssuer)
        .set_type("JWT")
        .set_issued_at(issued_at)
        .set_expires_at(issued_at + ttl_)
        .set_id(crypto::random_hex(16))
        .sign(jwt::algorithm::hs256{secret_});
}

bool SessionTokenIssuer::verify_token(const std::string& token) const {
    if (token.empty()) {
        return false;
    }

    try {
        auto decoded = jwt::decode<json_traits>(token);
        if (!decoded.has_expires_at()) {
            return false;
        }
        verifier_.verify(decoded);
        return true;
    } catch (const std::exception& e) {
        NLOG_DEBUG(log::AUTH_LOGGER, "SessionTokenIssuer: Token rejected: {}", e.what());
        return false;
    }
}

std::string SessionTokenIssuer::key_fingerprint() const {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(secret_.data()), secret_.size(), hash);
    return crypto::to_hex(hash, 4);
}

} // namespace agentrelay
