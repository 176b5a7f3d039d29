#pragma once

#include "common/errors.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace agentrelay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// One WebSocket message, relayed as-is
struct RelayFrame {
    std::string payload;
    bool text{false};
};

/**
 * UpstreamLeg - the outbound half of a relay session.
 *
 * Bound to the executor it was connected on. Supports one pending read,
 * one pending write and one close at a time, like the underlying stream.
 */
class UpstreamLeg {
public:
    virtual ~UpstreamLeg() = default;

    // Next frame, or std::nullopt once the peer closed the connection
    // cleanly (see peer_close_reason()). Transport failures throw
    // boost::system::system_error.
    virtual net::awaitable<std::optional<RelayFrame>> read() = 0;

    virtual net::awaitable<void> write(const RelayFrame& frame) = 0;

    // Start the close handshake. Idempotent; errors are logged, not thrown.
    virtual net::awaitable<void> close(websocket::close_reason reason) = 0;

    virtual websocket::close_reason peer_close_reason() const = 0;

    virtual bool is_open() const = 0;
};

/**
 * UpstreamConnector - opens outbound legs to the voice-agent service.
 *
 * Shared by all sessions; implementations must be safe to call from any
 * pool thread.
 */
class UpstreamConnector {
public:
    virtual ~UpstreamConnector() = default;

    /**
     * Connect and complete the WebSocket handshake.
     * @param executor Executor of the calling session; the leg stays on it
     * @param query Raw query string of the client's upgrade request (no '?'),
     *              appended to the upstream target unchanged
     */
    virtual net::awaitable<std::expected<std::unique_ptr<UpstreamLeg>, UpstreamConnectionError>>
    connect(net::any_io_executor executor, std::string query) = 0;
};

/**
 * WsUpstreamConnector - Boost.Beast implementation for ws:// and wss:// URLs.
 *
 * The service credential is attached as "Authorization: Token <key>" on the
 * outbound handshake only.
 */
class WsUpstreamConnector : public UpstreamConnector {
public:
    struct Endpoint {
        std::string host;
        std::string port;
        std::string path;   // may carry its own query
        bool use_ssl{false};
    };

    WsUpstreamConnector(const std::string& url, std::string api_key, bool ssl_verify = true);

    net::awaitable<std::expected<std::unique_ptr<UpstreamLeg>, UpstreamConnectionError>>
    connect(net::any_io_executor executor, std::string query) override;

    static std::optional<Endpoint> parse_url(const std::string& url);

    // Upstream request target with the client's query string appended
    static std::string build_target(const std::string& path, const std::string& query);

    const std::string& url() const { return url_; }

private:
    std::string url_;
    std::optional<Endpoint> endpoint_;
    std::string api_key_;
    ssl::context ssl_ctx_{ssl::context::tlsv12_client};
};

} // namespace agentrelay
