#pragma once

#include "common/config.hpp"
#include "common/io_context_pool.hpp"
#include "common/jwt.hpp"
#include "common/nonce_store.hpp"
#include "common/upstream_client.hpp"
#include "server/http_router.hpp"
#include "server/session_bootstrap.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace agentrelay {

/**
 * RelayServer - HTTP front door and WebSocket relay endpoint.
 *
 * The acceptor and the nonce sweeper live on pool thread 0; every accepted
 * connection is handed to the next io_context round-robin and stays there
 * for its whole life, including any relay session it upgrades into.
 */
class RelayServer {
public:
    static constexpr const char* kRelayPath = "/api/voice-agent";

    struct Stats {
        uint64_t connections_accepted;
        uint64_t sessions_started;
        uint64_t active_sessions;
        uint64_t frames_to_upstream;
        uint64_t frames_to_client;
    };

    RelayServer(IOContextPool& pool,
                const RelayConfig& config,
                NonceStore& nonces,
                const SessionTokenIssuer& issuer,
                std::shared_ptr<UpstreamConnector> connector);

    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    // Bind, listen and start the sweeper. Throws on bind failure.
    void start();

    // Stop accepting and sweeping. Callable from any thread; the acceptor and
    // sweep timer are closed on the control context.
    void stop();

    // Bound port (useful when configured with port 0)
    uint16_t port() const { return bound_port_.load(std::memory_order_acquire); }

    Stats get_stats() const;

private:
    void setup_routes();
    void close_listeners();

    HttpResponse handle_session(const HttpRequest& req);
    HttpResponse handle_metadata(const HttpRequest& req);

    net::awaitable<void> accept_loop();
    net::awaitable<void> handle_connection(tcp::socket socket);
    net::awaitable<void> run_relay(tcp::socket socket, HttpRequest req);

    IOContextPool& pool_;
    RelayConfig config_;
    NonceStore& nonces_;
    const SessionTokenIssuer& issuer_;
    std::shared_ptr<UpstreamConnector> connector_;
    SessionBootstrap bootstrap_;
    HttpRouter router_;

    std::unique_ptr<tcp::acceptor> acceptor_;
    std::unique_ptr<net::steady_timer> sweep_timer_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};

    std::atomic<uint64_t> connections_accepted_{0};
    std::atomic<uint64_t> sessions_started_{0};
    std::atomic<uint64_t> active_sessions_{0};
    std::atomic<uint64_t> frames_to_upstream_{0};
    std::atomic<uint64_t> frames_to_client_{0};
};

} // namespace agentrelay
