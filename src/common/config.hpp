#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace agentrelay {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Relay Configuration
// ============================================================================

struct RelayConfig {
    // Server settings
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8081;
    size_t num_threads = 0;  // 0 = auto (hardware_concurrency)

    // Upstream voice-agent endpoint
    std::string upstream_url = "wss://agent.deepgram.com/v1/agent/converse";
    std::string upstream_api_key;   // server-held, never sent to the browser
    bool upstream_ssl_verify = true;

    // Session credentials. No secret = relaxed nonce policy (development).
    std::optional<std::string> session_secret;
    std::chrono::seconds token_ttl{3600};
    std::chrono::seconds nonce_ttl{300};
    std::chrono::seconds nonce_sweep_interval{60};

    // Bootstrap page template and metadata source
    std::string index_file;          // empty = built-in page
    std::string metadata_file = "deepgram.toml";

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Load from JSON file
    static std::expected<RelayConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<RelayConfig, ConfigError> parse(const std::string& json_content);

    // Read KEY=VALUE lines into the environment without overwriting
    // variables that are already set. A missing file is not an error.
    static void load_dotenv(const std::string& path = ".env");

    // DEEPGRAM_API_KEY, SESSION_SECRET, PORT, HOST, AGENT_RELAY_LOG_LEVEL
    std::expected<void, ConfigError> apply_env();

    std::expected<void, ConfigError> validate() const;
};

} // namespace agentrelay
