#include "server/relay_server.hpp"
#include "server/metadata.hpp"
#include "server/relay_session.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

namespace agentrelay {

using json = nlohmann::json;

namespace {

constexpr const char* kNonceHeader = "X-Session-Nonce";

bool is_http_parse_error(const boost::system::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_method).category() &&
           ec != http::error::end_of_stream && ec != http::error::partial_message;
}

} // anonymous namespace

RelayServer::RelayServer(IOContextPool& pool,
                         const RelayConfig& config,
                         NonceStore& nonces,
                         const SessionTokenIssuer& issuer,
                         std::shared_ptr<UpstreamConnector> connector)
    : pool_(pool)
    , config_(config)
    , nonces_(nonces)
    , issuer_(issuer)
    , connector_(std::move(connector))
    , bootstrap_(nonces, issuer, SessionBootstrap::load_page_template(config.index_file))
{
    setup_routes();
}

RelayServer::~RelayServer() {
    // The pool has stopped running by now, so nothing else touches the acceptor
    running_.store(false, std::memory_order_release);
    close_listeners();
}

void RelayServer::setup_routes() {
    auto serve_page = [this](const HttpRequest&) {
        return make_html_response(bootstrap_.serve_bootstrap_page());
    };
    router_.add_route("GET", "/", serve_page);
    router_.add_route("GET", "/index.html", serve_page);

    router_.add_route("GET", "/api/session", [this](const HttpRequest& req) {
        return handle_session(req);
    });

    router_.add_route("GET", "/api/metadata", [this](const HttpRequest& req) {
        return handle_metadata(req);
    });

    router_.add_route("GET", "/health", [](const HttpRequest&) {
        return make_json_response(http::status::ok, R"({"status":"ok"})");
    });

    // Upgrades never reach the router; a plain GET here is a protocol error
    router_.add_route("*", kRelayPath, [](const HttpRequest&) {
        ProtocolError error{ProtocolErrorCode::NOT_WEBSOCKET_UPGRADE, "Expected WebSocket"};
        NLOG_DEBUG(log::HTTP_LOGGER, "{} on {}", protocol_error_code_name(error.code), kRelayPath);
        return make_text_response(http::status::upgrade_required, error.message);
    });
}

HttpResponse RelayServer::handle_session(const HttpRequest& req) {
    auto candidate = to_string_view(req[kNonceHeader]);

    auto token = bootstrap_.exchange_nonce_for_token(candidate);
    if (!token) {
        return make_json_response(http::status::forbidden, to_json(token.error()));
    }

    json body;
    body["token"] = *token;
    return make_json_response(http::status::ok, body.dump());
}

HttpResponse RelayServer::handle_metadata(const HttpRequest&) {
    auto meta = load_metadata(config_.metadata_file);
    if (!meta) {
        return make_error_response(http::status::internal_server_error,
                                   "INTERNAL_SERVER_ERROR", meta.error());
    }
    return make_json_response(http::status::ok, meta->dump());
}

void RelayServer::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already running
    }

    try {
        // Acceptor and sweeper live on thread 0's io_context
        auto& ioc = pool_.control_context();
        auto address = net::ip::make_address(config_.bind_address);
        auto endpoint = tcp::endpoint{address, config_.port};

        acceptor_ = std::make_unique<tcp::acceptor>(ioc);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);
        bound_port_.store(acceptor_->local_endpoint().port(), std::memory_order_release);

        net::co_spawn(
            ioc,
            [this]() -> net::awaitable<void> {
                co_await accept_loop();
            },
            [](std::exception_ptr ep) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        NLOG_ERROR(log::HTTP_LOGGER, "Accept loop exception: {}", e.what());
                    }
                }
            });

        sweep_timer_ = std::make_unique<net::steady_timer>(ioc);
        net::co_spawn(ioc, run_nonce_sweeper(nonces_, *sweep_timer_, config_.nonce_sweep_interval),
                      net::detached);

        NLOG_INFO(log::HTTP_LOGGER, "Listening on {}:{}", config_.bind_address, port());

    } catch (const std::exception& e) {
        running_.store(false, std::memory_order_release);
        NLOG_ERROR(log::HTTP_LOGGER, "Failed to start: {}", e.what());
        throw;
    }
}

void RelayServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;  // Not running
    }

    // Runs inline when already on the control context
    net::dispatch(pool_.control_context(), [this] {
        close_listeners();
        NLOG_INFO(log::HTTP_LOGGER, "Stopped");
    });
}

void RelayServer::close_listeners() {
    if (acceptor_ && acceptor_->is_open()) {
        beast::error_code ec;
        acceptor_->close(ec);
    }
    if (sweep_timer_) {
        sweep_timer_->cancel();
    }
}

RelayServer::Stats RelayServer::get_stats() const {
    return {
        connections_accepted_.load(std::memory_order_relaxed),
        sessions_started_.load(std::memory_order_relaxed),
        active_sessions_.load(std::memory_order_relaxed),
        frames_to_upstream_.load(std::memory_order_relaxed),
        frames_to_client_.load(std::memory_order_relaxed)
    };
}

net::awaitable<void> RelayServer::accept_loop() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            // Round-robin target thread
            auto& target_ioc = pool_.next_context();

            tcp::socket socket(target_ioc);
            co_await acceptor_->async_accept(socket, net::use_awaitable);

            connections_accepted_.fetch_add(1, std::memory_order_relaxed);

            net::co_spawn(
                socket.get_executor(),
                [this, socket = std::move(socket)]() mutable -> net::awaitable<void> {
                    co_await handle_connection(std::move(socket));
                },
                [](std::exception_ptr ep) {
                    if (ep) {
                        try {
                            std::rethrow_exception(ep);
                        } catch (const std::exception& e) {
                            NLOG_ERROR(log::HTTP_LOGGER, "Connection handler exception: {}", e.what());
                        }
                    }
                });

        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted) {
                break;  // Server stopping
            }
            NLOG_WARN(log::HTTP_LOGGER, "Accept error: {}", e.what());
        }
    }
}

net::awaitable<void> RelayServer::handle_connection(tcp::socket socket) {
    beast::flat_buffer buffer;

    for (;;) {
        HttpRequest req;
        boost::system::error_code ec;
        co_await http::async_read(socket, buffer, req, net::redirect_error(net::use_awaitable, ec));

        if (ec) {
            if (is_http_parse_error(ec)) {
                ProtocolError error{ProtocolErrorCode::BAD_REQUEST, ec.message()};
                auto res = make_error_response(http::status::bad_request,
                                               std::string(protocol_error_code_name(error.code)),
                                               error.message);
                res.keep_alive(false);
                co_await http::async_write(socket, res, net::redirect_error(net::use_awaitable, ec));
            }
            break;
        }

        auto path = target_path(to_string_view(req.target()));
        if (beast::websocket::is_upgrade(req) && path == kRelayPath) {
            co_await run_relay(std::move(socket), std::move(req));
            co_return;
        }

        auto res = router_.dispatch(req);
        NLOG_DEBUG(log::HTTP_LOGGER, "{} {} -> {}", to_string_view(req.method_string()),
                   path, res.result_int());

        co_await http::async_write(socket, res, net::redirect_error(net::use_awaitable, ec));
        if (ec || !res.keep_alive()) {
            break;
        }
    }

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

net::awaitable<void> RelayServer::run_relay(tcp::socket socket, HttpRequest req) {
    sessions_started_.fetch_add(1, std::memory_order_relaxed);
    active_sessions_.fetch_add(1, std::memory_order_relaxed);

    RelaySession session(std::move(socket), std::move(req), issuer_, connector_);
    co_await session.run();

    auto stats = session.stats();
    frames_to_upstream_.fetch_add(stats.frames_to_upstream, std::memory_order_relaxed);
    frames_to_client_.fetch_add(stats.frames_to_client, std::memory_order_relaxed);
    active_sessions_.fetch_sub(1, std::memory_order_relaxed);
}

} // namespace agentrelay
