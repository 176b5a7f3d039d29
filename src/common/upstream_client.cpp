#include "common/upstream_client.hpp"
#include "common/log.hpp"
#include <boost/beast/http.hpp>
#include <openssl/err.h>
#include <regex>

namespace agentrelay {

namespace http = beast::http;

namespace {

using WsStream = websocket::stream<tcp::socket>;
using WssStream = websocket::stream<ssl::stream<tcp::socket>>;

constexpr const char* kUserAgent = "agent-relay/1.0";

// One upstream connection over a plain or TLS WebSocket stream
template <typename Stream>
class BasicUpstreamLeg : public UpstreamLeg {
public:
    BasicUpstreamLeg(std::unique_ptr<Stream> ws, std::string url)
        : ws_(std::move(ws))
        , url_(std::move(url)) {}

    net::awaitable<std::optional<RelayFrame>> read() override {
        beast::flat_buffer buffer;
        boost::system::error_code ec;
        co_await ws_->async_read(buffer, net::redirect_error(net::use_awaitable, ec));

        if (ec == websocket::error::closed) {
            NLOG_DEBUG(log::UPSTREAM_LOGGER, "Upstream {} closed: code={} reason='{}'",
                       url_, static_cast<int>(ws_->reason().code),
                       std::string(ws_->reason().reason.c_str()));
            co_return std::nullopt;
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }

        RelayFrame frame;
        frame.text = ws_->got_text();
        frame.payload = beast::buffers_to_string(buffer.data());
        co_return frame;
    }

    net::awaitable<void> write(const RelayFrame& frame) override {
        ws_->text(frame.text);
        co_await ws_->async_write(net::buffer(frame.payload), net::use_awaitable);
    }

    net::awaitable<void> close(websocket::close_reason reason) override {
        if (closing_ || !ws_->is_open()) {
            co_return;
        }
        closing_ = true;

        boost::system::error_code ec;
        co_await ws_->async_close(reason, net::redirect_error(net::use_awaitable, ec));
        if (ec && ec != websocket::error::closed && ec != net::error::operation_aborted) {
            NLOG_DEBUG(log::UPSTREAM_LOGGER, "Upstream {} close: {}", url_, ec.message());
        }
    }

    websocket::close_reason peer_close_reason() const override { return ws_->reason(); }

    bool is_open() const override { return ws_->is_open(); }

private:
    std::unique_ptr<Stream> ws_;
    std::string url_;
    bool closing_ = false;
};

// Common handshake for both stream flavours; fills `res` even when the
// peer declines the upgrade
template <typename Stream>
net::awaitable<void> handshake(Stream& ws, const std::string& host_header,
                               const std::string& target, const std::string& api_key,
                               websocket::response_type& res) {
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator([api_key](websocket::request_type& req) {
        req.set(http::field::user_agent, kUserAgent);
        req.set(http::field::authorization, "Token " + api_key);
    }));

    co_await ws.async_handshake(res, host_header, target, net::use_awaitable);
}

} // anonymous namespace

WsUpstreamConnector::WsUpstreamConnector(const std::string& url, std::string api_key,
                                         bool ssl_verify)
    : url_(url)
    , endpoint_(parse_url(url))
    , api_key_(std::move(api_key))
{
    if (!endpoint_) {
        NLOG_ERROR(log::UPSTREAM_LOGGER, "Invalid upstream URL: {}", url);
    }

    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl_verify ? ssl::verify_peer : ssl::verify_none);
}

std::optional<WsUpstreamConnector::Endpoint> WsUpstreamConnector::parse_url(const std::string& url) {
    // Pattern: wss?://host[:port][/path[?query]]
    static const std::regex url_regex(R"(^(wss?)://([^:/?]+)(?::(\d+))?(/[^#]*)?$)");
    std::smatch match;

    if (!std::regex_match(url, match, url_regex)) {
        return std::nullopt;
    }

    Endpoint parts;
    parts.use_ssl = (match[1].str() == "wss");
    parts.host = match[2].str();
    parts.port = match[3].matched ? match[3].str() : (parts.use_ssl ? "443" : "80");
    parts.path = match[4].matched ? match[4].str() : "/";

    return parts;
}

std::string WsUpstreamConnector::build_target(const std::string& path, const std::string& query) {
    if (query.empty()) {
        return path;
    }
    char sep = path.find('?') == std::string::npos ? '?' : '&';
    return path + sep + query;
}

net::awaitable<std::expected<std::unique_ptr<UpstreamLeg>, UpstreamConnectionError>>
WsUpstreamConnector::connect(net::any_io_executor executor, std::string query) {
    if (!endpoint_) {
        co_return std::unexpected(UpstreamConnectionError{
            UpstreamErrorCode::CONNECTION_FAILED, "Invalid upstream URL"});
    }

    const auto& ep = *endpoint_;
    auto target = build_target(ep.path, query);
    bool default_port = (ep.use_ssl && ep.port == "443") || (!ep.use_ssl && ep.port == "80");
    auto host_header = default_port ? ep.host : ep.host + ":" + ep.port;

    websocket::response_type res;

    try {
        tcp::resolver resolver(executor);
        auto endpoints = co_await resolver.async_resolve(ep.host, ep.port, net::use_awaitable);

        if (ep.use_ssl) {
            auto wss = std::make_unique<WssStream>(executor, ssl_ctx_);

            // Set SNI hostname
            if (!SSL_set_tlsext_host_name(wss->next_layer().native_handle(), ep.host.c_str())) {
                throw boost::system::system_error(
                    boost::system::error_code(
                        static_cast<int>(::ERR_get_error()),
                        net::error::get_ssl_category()));
            }

            co_await net::async_connect(beast::get_lowest_layer(*wss), endpoints, net::use_awaitable);
            co_await wss->next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_await handshake(*wss, host_header, target, api_key_, res);

            NLOG_INFO(log::UPSTREAM_LOGGER, "Connected to {}{}", url_, query.empty() ? "" : " (with query)");
            co_return std::make_unique<BasicUpstreamLeg<WssStream>>(std::move(wss), url_);
        }

        auto ws = std::make_unique<WsStream>(executor);
        co_await net::async_connect(beast::get_lowest_layer(*ws), endpoints, net::use_awaitable);
        co_await handshake(*ws, host_header, target, api_key_, res);

        NLOG_INFO(log::UPSTREAM_LOGGER, "Connected to {}{}", url_, query.empty() ? "" : " (with query)");
        co_return std::make_unique<BasicUpstreamLeg<WsStream>>(std::move(ws), url_);

    } catch (const boost::system::system_error& e) {
        std::string description = e.code().message();
        if (e.code() == websocket::error::upgrade_declined) {
            description = "Upstream rejected handshake (HTTP " +
                          std::to_string(res.result_int()) + ")";
        }
        NLOG_WARN(log::UPSTREAM_LOGGER, "Failed to connect to {}: {}", url_, description);
        co_return std::unexpected(UpstreamConnectionError{
            UpstreamErrorCode::CONNECTION_FAILED, std::move(description)});
    }
}

} // namespace agentrelay
