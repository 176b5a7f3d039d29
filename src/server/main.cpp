#include "server/relay_server.hpp"
#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/io_context_pool.hpp"
#include "common/jwt.hpp"
#include "common/log.hpp"
#include "common/nonce_store.hpp"
#include "common/upstream_client.hpp"

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

using namespace agentrelay;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>   Configuration file path (optional)\n"
              << "  -h, --help            Show this help message\n"
              << "\n"
              << "Environment:\n"
              << "  DEEPGRAM_API_KEY      Voice-agent service key (required)\n"
              << "  SESSION_SECRET        Token signing secret; enables nonce enforcement\n"
              << "  PORT, HOST            Listen address (default 0.0.0.0:8081)\n"
              << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) &&
                   i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    log::init_from_env();

    RelayConfig config;
    if (!config_path.empty()) {
        auto loaded = RelayConfig::load(config_path);
        if (!loaded) {
            LOG_ERROR("{}: {}", config_error_message(loaded.error()), config_path);
            return 1;
        }
        config = std::move(*loaded);
    }

    RelayConfig::load_dotenv();
    if (auto env = config.apply_env(); !env) {
        LOG_ERROR("{}", config_error_message(env.error()));
        return 1;
    }
    if (auto valid = config.validate(); !valid) {
        LOG_ERROR("{}", config_error_message(valid.error()));
        return 1;
    }

    log::LogConfig log_config;
    log_config.level = log::parse_level(config.log_level);
    log_config.file_path = config.log_file;
    if (const char* file = std::getenv("AGENT_RELAY_LOG_FILE")) {
        log_config.file_path = file;
    }
    log::init(log_config);

    if (!crypto::init()) {
        LOG_ERROR("Failed to initialize libsodium");
        return 1;
    }

    LOG_INFO("agent-relay starting...");
    if (!config_path.empty()) {
        LOG_INFO("Configuration loaded from: {}", config_path);
    }

    try {
        NonceStore nonces(config.nonce_ttl);
        auto issuer = SessionTokenIssuer::from_config(config.session_secret, config.token_ttl);
        if (issuer.requires_nonce()) {
            LOG_INFO("Session nonce enforcement: required (key {})", issuer.key_fingerprint());
        } else {
            LOG_WARN("SESSION_SECRET not set: nonce enforcement relaxed, tokens signed with a "
                     "generated key and invalidated on restart");
        }

        auto connector = std::make_shared<WsUpstreamConnector>(
            config.upstream_url, config.upstream_api_key, config.upstream_ssl_verify);

        IOContextPool pool(config.num_threads);
        RelayServer server(pool, config, nonces, issuer, connector);

        boost::asio::signal_set signals(pool.control_context(), SIGINT, SIGTERM);
        signals.async_wait([&](boost::system::error_code ec, int signal_number) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down...", signal_number);
                server.stop();
                pool.stop();
            }
        });

        server.start();

        LOG_INFO("Upstream: {}", config.upstream_url);
        LOG_INFO("Voice agent endpoint: ws://{}:{}{}", config.bind_address, server.port(),
                 RelayServer::kRelayPath);
        LOG_INFO("Server running with {} IO threads", pool.size());
        pool.run();

        LOG_INFO("Server stopped");
        log::shutdown();
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
