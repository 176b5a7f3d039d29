#pragma once

#include "common/errors.hpp"
#include "common/jwt.hpp"
#include "common/nonce_store.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace agentrelay {

namespace net = boost::asio;

/**
 * SessionBootstrap - page nonce issuance and nonce-for-token exchange.
 *
 * Holds references to the process-wide nonce store and token issuer; both
 * must outlive it.
 */
class SessionBootstrap {
public:
    static constexpr const char* kInvalidNonceMessage =
        "Invalid or expired session nonce. Please refresh the page.";

    SessionBootstrap(NonceStore& nonces, const SessionTokenIssuer& issuer,
                     std::string page_template);

    // Entry document with a freshly issued nonce embedded
    std::string serve_bootstrap_page();

    std::expected<std::string, AuthenticationError> exchange_nonce_for_token(
        std::string_view candidate);

    // Insert <meta name="session-nonce"> right after <head> (or at the
    // top of the document when there is no head element)
    static std::string embed_nonce(std::string_view page, std::string_view nonce);

    // Contents of `path`, or the built-in page when empty or unreadable
    static std::string load_page_template(const std::string& path);

    static const std::string& builtin_page();

private:
    NonceStore& nonces_;
    const SessionTokenIssuer& issuer_;
    std::string page_template_;
};

// Periodically drop expired nonces until the timer is cancelled
net::awaitable<void> run_nonce_sweeper(NonceStore& nonces, net::steady_timer& timer,
                                       std::chrono::seconds interval);

} // namespace agentrelay
