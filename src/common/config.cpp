#include "common/config.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

int64_t jint(const json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // anonymous namespace

namespace agentrelay {

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

std::expected<RelayConfig, ConfigError> RelayConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<RelayConfig, ConfigError> RelayConfig::parse(const std::string& json_content) {
    RelayConfig config;

    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        // server section
        if (auto* server = jsection(root, "server")) {
            config.bind_address = jstr(*server, "bind", config.bind_address);
            auto port = jint(*server, "port", config.port);
            if (port <= 0 || port > 65535) {
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.port = static_cast<uint16_t>(port);
            auto threads = jint(*server, "threads", 0);
            if (threads < 0) {
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.num_threads = static_cast<size_t>(threads);
        }

        // upstream section
        if (auto* upstream = jsection(root, "upstream")) {
            config.upstream_url = jstr(*upstream, "url", config.upstream_url);
            config.upstream_api_key = jstr(*upstream, "api_key");
            config.upstream_ssl_verify = jbool(*upstream, "ssl_verify", config.upstream_ssl_verify);
        }

        // session section
        if (auto* session = jsection(root, "session")) {
            if (auto secret = jstr(*session, "secret"); !secret.empty()) {
                config.session_secret = secret;
            }
            if (auto secs = jint(*session, "token_ttl_seconds"))
                config.token_ttl = std::chrono::seconds(secs);
            if (auto secs = jint(*session, "nonce_ttl_seconds"))
                config.nonce_ttl = std::chrono::seconds(secs);
            if (auto secs = jint(*session, "nonce_sweep_seconds"))
                config.nonce_sweep_interval = std::chrono::seconds(secs);
        }

        // frontend section
        if (auto* frontend = jsection(root, "frontend")) {
            config.index_file = jstr(*frontend, "index_file");
            config.metadata_file = jstr(*frontend, "metadata_file", config.metadata_file);
        }

        // log section
        if (auto* log_cfg = jsection(root, "log")) {
            config.log_level = jstr(*log_cfg, "level", config.log_level);
            config.log_file = jstr(*log_cfg, "file");
        }

    } catch (const std::exception& e) {
        NLOG_ERROR(log::CONFIG_LOGGER, "Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    return config;
}

void RelayConfig::load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
            val = val.substr(1, val.size() - 2);
        }
        ::setenv(key.c_str(), val.c_str(), 0);
    }
}

std::expected<void, ConfigError> RelayConfig::apply_env() {
    if (auto key = env("DEEPGRAM_API_KEY")) {
        upstream_api_key = *key;
    }
    if (auto secret = env("SESSION_SECRET")) {
        session_secret = *secret;
    }
    if (auto host = env("HOST")) {
        bind_address = *host;
    }
    if (auto port = env("PORT")) {
        try {
            auto value = std::stoi(*port);
            if (value <= 0 || value > 65535) {
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            this->port = static_cast<uint16_t>(value);
        } catch (const std::exception&) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
    }
    if (auto level = env("AGENT_RELAY_LOG_LEVEL")) {
        log_level = *level;
    }
    return {};
}

std::expected<void, ConfigError> RelayConfig::validate() const {
    if (upstream_api_key.empty()) {
        NLOG_ERROR(log::CONFIG_LOGGER,
                   "DEEPGRAM_API_KEY is required (set it in the environment or in .env)");
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    if (upstream_url.rfind("ws://", 0) != 0 && upstream_url.rfind("wss://", 0) != 0) {
        NLOG_ERROR(log::CONFIG_LOGGER, "Upstream URL must be ws:// or wss://: {}", upstream_url);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (token_ttl.count() <= 0 || nonce_ttl.count() <= 0 || nonce_sweep_interval.count() <= 0) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    return {};
}

} // namespace agentrelay
