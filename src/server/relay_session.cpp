#include "server/relay_session.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <atomic>

namespace agentrelay {

using namespace boost::asio::experimental::awaitable_operators;

namespace {

std::atomic<uint64_t> next_session_id{1};

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

// Reserved codes cannot be sent in a close frame
websocket::close_reason forwardable(websocket::close_reason reason) {
    auto code = static_cast<uint16_t>(reason.code);
    if (code == 0 || code == websocket::close_code::no_status ||
        code == websocket::close_code::abnormal || code == 1015) {
        return websocket::close_reason(websocket::close_code::normal);
    }
    return reason;
}

} // anonymous namespace

RelaySession::RelaySession(tcp::socket socket,
                           HttpRequest request,
                           const SessionTokenIssuer& issuer,
                           std::shared_ptr<UpstreamConnector> connector)
    : ws_(std::move(socket))
    , request_(std::move(request))
    , issuer_(issuer)
    , connector_(std::move(connector))
    , id_(next_session_id.fetch_add(1, std::memory_order_relaxed))
{
    remote_ = remote_address();
}

const char* RelaySession::state_name(State state) {
    switch (state) {
        case State::Pending: return "Pending";
        case State::Authenticating: return "Authenticating";
        case State::OutboundConnecting: return "OutboundConnecting";
        case State::Relaying: return "Relaying";
        case State::Closing: return "Closing";
        case State::Closed: return "Closed";
        default: return "Unknown";
    }
}

void RelaySession::set_state(State new_state) {
    if (state_ != new_state) {
        NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: State {} -> {}", id_,
                   state_name(state_), state_name(new_state));
        state_ = new_state;
    }
}

std::string RelaySession::remote_address() const {
    boost::system::error_code ec;
    auto ep = ws_.next_layer().remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

std::optional<std::string> RelaySession::select_subprotocol(std::string_view header,
                                                            const SessionTokenIssuer& issuer) {
    while (!header.empty()) {
        auto comma = header.find(',');
        auto entry = trim(header.substr(0, comma));
        header = comma == std::string_view::npos ? std::string_view{} : header.substr(comma + 1);

        if (!entry.starts_with(kAccessTokenPrefix)) {
            continue;
        }
        auto token = entry.substr(kAccessTokenPrefix.size());
        if (!token.empty() && issuer.verify_token(std::string(token))) {
            return std::string(entry);
        }
    }
    return std::nullopt;
}

net::awaitable<void> RelaySession::run() {
    set_state(State::Authenticating);

    // A header may be repeated; treat all occurrences as one list
    std::string offered;
    for (auto range = request_.equal_range(http::field::sec_websocket_protocol);
         range.first != range.second; ++range.first) {
        if (!offered.empty()) offered += ",";
        offered += to_string_view(range.first->value());
    }

    auto subprotocol = select_subprotocol(offered, issuer_);
    if (!subprotocol) {
        co_await reject_unauthorized();
        set_state(State::Closed);
        co_return;
    }

    try {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [protocol = *subprotocol](websocket::response_type& res) {
                res.set(http::field::server, "agent-relay/1.0");
                res.set(http::field::sec_websocket_protocol, protocol);
            }));

        co_await ws_.async_accept(request_, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        NLOG_WARN(log::RELAY_LOGGER, "Session {}: Upgrade from {} failed: {}", id_, remote_, e.what());
        set_state(State::Closed);
        co_return;
    }

    NLOG_INFO(log::RELAY_LOGGER, "Session {}: Client {} connected", id_, remote_);

    set_state(State::OutboundConnecting);
    auto executor = co_await net::this_coro::executor;
    auto leg = co_await connector_->connect(executor, std::string(target_query(to_string_view(request_.target()))));
    if (!leg) {
        NLOG_WARN(log::RELAY_LOGGER, "Session {}: Upstream setup failed: {}", id_, leg.error().description);
        co_await send_error_frame(leg.error());
        co_await close_client(websocket::close_reason(kSetupFailedCloseCode, "Setup failed"));
        set_state(State::Closed);
        co_return;
    }
    upstream_ = std::move(*leg);

    set_state(State::Relaying);

    // Either direction finishing cancels the other
    co_await (client_to_upstream() || upstream_to_client());

    set_state(State::Closing);
    closing_ = true;

    if (ws_.is_open() && !client_closing_) {
        if (upstream_failed_) {
            co_await send_error_frame(UpstreamConnectionError{
                UpstreamErrorCode::DEEPGRAM_ERROR, "Upstream connection lost"});
            co_await close_client(websocket::close_reason(websocket::close_code::internal_error));
        } else {
            co_await close_client(websocket::close_reason(websocket::close_code::normal));
        }
    }
    co_await upstream_->close(websocket::close_reason(websocket::close_code::normal));

    set_state(State::Closed);
    NLOG_INFO(log::RELAY_LOGGER, "Session {}: Closed ({} frames up, {} frames down)",
              id_, stats_.frames_to_upstream, stats_.frames_to_client);
}

net::awaitable<void> RelaySession::reject_unauthorized() {
    NLOG_WARN(log::AUTH_LOGGER, "Session {}: Rejected upgrade from {}: missing or invalid token",
              id_, remote_);

    AuthenticationError error{AuthErrorCode::INVALID_TOKEN, "Invalid or missing session token"};
    auto res = make_json_response(http::status::unauthorized, to_json(error));
    res.version(request_.version());
    res.keep_alive(false);
    res.prepare_payload();

    boost::system::error_code ec;
    co_await http::async_write(ws_.next_layer(), res, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Failed to send 401: {}", id_, ec.message());
    }

    ws_.next_layer().shutdown(tcp::socket::shutdown_send, ec);
    ws_.next_layer().close(ec);
}

net::awaitable<void> RelaySession::client_to_upstream() {
    co_await net::this_coro::throw_if_cancelled(false);

    beast::flat_buffer buffer;

    try {
        for (;;) {
            boost::system::error_code ec;
            co_await ws_.async_read(buffer, net::redirect_error(net::use_awaitable, ec));

            if (ec == websocket::error::closed) {
                NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Client closed: code={}", id_,
                           static_cast<int>(ws_.reason().code));
                client_closing_ = true;
                break;
            }
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Client read error: {}", id_, ec.message());
                }
                break;
            }
            if (closing_) {
                break;
            }

            RelayFrame frame;
            frame.text = ws_.got_text();
            frame.payload = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());

            log_frame("client->upstream", frame, ++stats_.frames_to_upstream);
            co_await upstream_->write(frame);
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != net::error::operation_aborted) {
            NLOG_WARN(log::RELAY_LOGGER, "Session {}: Upstream write failed: {}", id_, e.what());
            upstream_failed_ = true;
        }
    }

    closing_ = true;
    co_await upstream_->close(websocket::close_reason(websocket::close_code::normal));
}

net::awaitable<void> RelaySession::upstream_to_client() {
    co_await net::this_coro::throw_if_cancelled(false);

    try {
        for (;;) {
            auto frame = co_await upstream_->read();
            if (!frame) {
                closing_ = true;
                auto reason = forwardable(upstream_->peer_close_reason());
                NLOG_INFO(log::RELAY_LOGGER, "Session {}: Upstream closed with code {}", id_,
                          static_cast<int>(reason.code));
                co_await close_client(reason);
                co_return;
            }
            if (closing_) {
                co_return;
            }

            log_frame("upstream->client", *frame, ++stats_.frames_to_client);

            boost::system::error_code ec;
            ws_.text(frame->text);
            co_await ws_.async_write(net::buffer(frame->payload),
                                     net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Client write error: {}", id_, ec.message());
                closing_ = true;
                co_await upstream_->close(websocket::close_reason(websocket::close_code::normal));
                co_return;
            }
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() == net::error::operation_aborted) {
            co_return;
        }
        NLOG_WARN(log::RELAY_LOGGER, "Session {}: Upstream error: {}", id_, e.what());
        upstream_failed_ = true;
    }

    closing_ = true;
    co_await send_error_frame(UpstreamConnectionError{
        UpstreamErrorCode::DEEPGRAM_ERROR, "Upstream connection lost"});
    co_await close_client(websocket::close_reason(websocket::close_code::internal_error));
}

net::awaitable<void> RelaySession::send_error_frame(const UpstreamConnectionError& error) {
    if (client_closing_ || !ws_.is_open()) {
        co_return;
    }

    auto payload = to_error_frame(error);
    boost::system::error_code ec;
    ws_.text(true);
    co_await ws_.async_write(net::buffer(payload), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Failed to send error frame: {}", id_, ec.message());
    }
}

net::awaitable<void> RelaySession::close_client(websocket::close_reason reason) {
    if (client_closing_ || !ws_.is_open()) {
        co_return;
    }
    client_closing_ = true;

    boost::system::error_code ec;
    co_await ws_.async_close(reason, net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != websocket::error::closed && ec != net::error::operation_aborted) {
        NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: Client close: {}", id_, ec.message());
    }
}

void RelaySession::log_frame(const char* direction, const RelayFrame& frame, uint64_t count) const {
    if (frame.text) {
        NLOG_DEBUG(log::RELAY_LOGGER, "Session {}: {} text: {}", id_, direction, frame.payload);
    } else if (count % 10 == 0) {
        NLOG_TRACE(log::RELAY_LOGGER, "Session {}: {} binary frame #{} ({} bytes)",
                   id_, direction, count, frame.payload.size());
    }
}

} // namespace agentrelay
