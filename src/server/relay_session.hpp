#pragma once

#include "common/jwt.hpp"
#include "common/upstream_client.hpp"
#include "server/http_router.hpp"
#include <boost/asio.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace agentrelay {

/**
 * RelaySession - one authenticated client WebSocket bridged to one upstream leg.
 *
 * Lifecycle:
 *   Pending -> Authenticating -> OutboundConnecting -> Relaying -> Closing -> Closed
 * with early exits Authenticating -> Closed (bad credential, HTTP 401, no
 * upgrade) and OutboundConnecting -> Closed (upstream unreachable).
 *
 * Runs entirely on the io_context that owns the client socket; the upstream
 * leg is connected on the same executor.
 */
class RelaySession {
public:
    enum class State {
        Pending,
        Authenticating,
        OutboundConnecting,
        Relaying,
        Closing,
        Closed,
    };

    struct Stats {
        uint64_t frames_to_upstream = 0;
        uint64_t frames_to_client = 0;
    };

    static constexpr std::string_view kAccessTokenPrefix = "access_token.";
    static constexpr uint16_t kSetupFailedCloseCode = 3000;

    RelaySession(tcp::socket socket,
                 HttpRequest request,
                 const SessionTokenIssuer& issuer,
                 std::shared_ptr<UpstreamConnector> connector);

    // Drives the session to Closed; never throws
    net::awaitable<void> run();

    // Frames forwarded in each direction so far
    Stats stats() const { return stats_; }

    // First "access_token.<token>" entry of a Sec-WebSocket-Protocol value
    // whose token verifies, returned verbatim for echoing
    static std::optional<std::string> select_subprotocol(std::string_view header,
                                                         const SessionTokenIssuer& issuer);

    static const char* state_name(State state);

private:
    void set_state(State new_state);
    std::string remote_address() const;

    net::awaitable<void> reject_unauthorized();
    net::awaitable<void> client_to_upstream();
    net::awaitable<void> upstream_to_client();

    net::awaitable<void> send_error_frame(const UpstreamConnectionError& error);
    net::awaitable<void> close_client(websocket::close_reason reason);

    void log_frame(const char* direction, const RelayFrame& frame, uint64_t count) const;

    websocket::stream<tcp::socket> ws_;
    HttpRequest request_;
    const SessionTokenIssuer& issuer_;
    std::shared_ptr<UpstreamConnector> connector_;
    std::unique_ptr<UpstreamLeg> upstream_;

    uint64_t id_;
    std::string remote_;
    State state_ = State::Pending;
    Stats stats_;

    // Set once either direction starts tearing down; nothing is forwarded after
    bool closing_ = false;
    bool client_closing_ = false;
    bool upstream_failed_ = false;
};

} // namespace agentrelay
