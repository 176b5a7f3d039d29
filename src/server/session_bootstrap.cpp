#include "server/session_bootstrap.hpp"
#include "common/log.hpp"
#include <fstream>
#include <sstream>

namespace agentrelay {

namespace {

// Lowercase copy for a case-insensitive search for the head tag
std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

} // anonymous namespace

SessionBootstrap::SessionBootstrap(NonceStore& nonces, const SessionTokenIssuer& issuer,
                                   std::string page_template)
    : nonces_(nonces)
    , issuer_(issuer)
    , page_template_(std::move(page_template))
{
    if (page_template_.empty()) {
        page_template_ = builtin_page();
    }
}

const std::string& SessionBootstrap::builtin_page() {
    static const std::string page =
        "<!DOCTYPE html>\n"
        "<html lang=\"en\">\n"
        "<head>\n"
        "<meta charset=\"utf-8\">\n"
        "<title>Voice Agent</title>\n"
        "</head>\n"
        "<body>\n"
        "<p>Voice agent relay is running. Fetch <code>/api/session</code> with the "
        "<code>X-Session-Nonce</code> header to obtain a session token.</p>\n"
        "</body>\n"
        "</html>\n";
    return page;
}

std::string SessionBootstrap::load_page_template(const std::string& path) {
    if (path.empty()) {
        return builtin_page();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        NLOG_WARN(log::HTTP_LOGGER, "Index file {} not readable, serving built-in page", path);
        return builtin_page();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string SessionBootstrap::embed_nonce(std::string_view page, std::string_view nonce) {
    std::string meta = "<meta name=\"session-nonce\" content=\"";
    meta += nonce;
    meta += "\">";

    // "<head" followed by '>' or whitespace, so <header> does not match
    auto lower = to_lower(page);
    for (auto pos = lower.find("<head"); pos != std::string::npos; pos = lower.find("<head", pos + 1)) {
        auto next = pos + 5 < lower.size() ? lower[pos + 5] : '\0';
        if (next != '>' && next != ' ' && next != '\t' && next != '\n' && next != '\r') {
            continue;
        }
        auto close = lower.find('>', pos);
        if (close == std::string::npos) {
            break;
        }
        std::string out(page);
        out.insert(close + 1, meta);
        return out;
    }

    return meta + std::string(page);
}

std::string SessionBootstrap::serve_bootstrap_page() {
    auto nonce = nonces_.issue();
    NLOG_DEBUG(log::AUTH_LOGGER, "Issued page nonce ({} outstanding)", nonces_.size());
    return embed_nonce(page_template_, nonce);
}

std::expected<std::string, AuthenticationError> SessionBootstrap::exchange_nonce_for_token(
    std::string_view candidate) {

    if (!issuer_.requires_nonce()) {
        return issuer_.create_token();
    }

    if (candidate.empty() || !nonces_.consume(std::string(candidate))) {
        NLOG_WARN(log::AUTH_LOGGER, "Rejected session request: invalid or expired nonce");
        return std::unexpected(AuthenticationError{AuthErrorCode::INVALID_NONCE,
                                                   kInvalidNonceMessage});
    }

    NLOG_DEBUG(log::AUTH_LOGGER, "Nonce exchanged for session token");
    return issuer_.create_token();
}

net::awaitable<void> run_nonce_sweeper(NonceStore& nonces, net::steady_timer& timer,
                                       std::chrono::seconds interval) {
    for (;;) {
        timer.expires_after(interval);

        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }

        nonces.sweep_expired();
    }
    NLOG_DEBUG(log::AUTH_LOGGER, "Nonce sweeper stopped");
}

} // namespace agentrelay
