#pragma once

#include <nlohmann/json.hpp>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace agentrelay {

// JSON traits for jwt-cpp (using nlohmann_json)
using json_traits = jwt::traits::nlohmann_json;

// Whether /api/session demands a nonce from a served bootstrap page before
// issuing a token. Chosen once, at construction.
enum class NoncePolicy {
    Required,  // production: fixed secret supplied by the operator
    Relaxed,   // development: secret generated at startup
};

std::string_view nonce_policy_name(NoncePolicy policy);

// ============================================================================
// Session Token Issuer
// ============================================================================

/**
 * Mints and verifies short-lived HS256 session tokens.
 *
 * Immutable after construction and therefore safe to share between threads.
 * Verification is stateless: a token stays valid until its exp claim passes
 * or the process-wide secret changes (restart without a fixed secret).
 */
class SessionTokenIssuer {
public:
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultTtl{3600};
    static constexpr size_t kGeneratedSecretBytes = 32;
    static constexpr const char* kIssuer = "agent-relay";

    SessionTokenIssuer(std::string secret,
                       NoncePolicy policy,
                       std::chrono::seconds ttl = kDefaultTtl,
                       TimeSource now = {});

    // Supplied secret -> Required policy with that secret.
    // No secret -> Relaxed policy with a freshly generated one.
    static SessionTokenIssuer from_config(const std::optional<std::string>& secret,
                                          std::chrono::seconds ttl = kDefaultTtl);

    std::string create_token() const;

    // Never throws; any malformed, foreign or expired token is simply false
    bool verify_token(const std::string& token) const;

    NoncePolicy nonce_policy() const { return policy_; }
    bool requires_nonce() const { return policy_ == NoncePolicy::Required; }
    std::chrono::seconds ttl() const { return ttl_; }

    // First 8 hex chars of SHA-256(secret), safe to log
    std::string key_fingerprint() const;

private:
    struct IssuerClock {
        TimeSource source;
        jwt::date now() const { return source ? source() : jwt::date::clock::now(); }
    };

    std::string secret_;
    NoncePolicy policy_;
    std::chrono::seconds ttl_;
    IssuerClock clock_;
    jwt::verifier<IssuerClock, json_traits> verifier_;
};

} // namespace agentrelay
