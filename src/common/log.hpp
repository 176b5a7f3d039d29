#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace agentrelay {
namespace log {

// ============================================================================
// Channels
// ============================================================================

// One spdlog logger per channel. The set is fixed; every logger shares the
// same sinks so a log file sees all channels interleaved in order.
enum class Channel : size_t {
    Main,
    Http,
    Auth,
    Relay,
    Upstream,
    Config,
};

inline constexpr size_t kChannelCount = 6;

constexpr Channel MAIN_LOGGER = Channel::Main;
constexpr Channel HTTP_LOGGER = Channel::Http;
constexpr Channel AUTH_LOGGER = Channel::Auth;
constexpr Channel RELAY_LOGGER = Channel::Relay;
constexpr Channel UPSTREAM_LOGGER = Channel::Upstream;
constexpr Channel CONFIG_LOGGER = Channel::Config;

// Logger name as it appears in the [%n] field
std::string_view channel_name(Channel channel);

// ============================================================================
// Configuration
// ============================================================================
struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    bool console{true};
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{3};
};

// (Re)build every channel with the given sinks and level
void init(const LogConfig& config = LogConfig{});

// AGENT_RELAY_LOG_LEVEL and AGENT_RELAY_LOG_FILE, used before the config
// file has been read
void init_from_env();

// trace, debug, info, warn/warning, error/err, critical/crit, off.
// Anything else is info.
spdlog::level::level_enum parse_level(std::string_view name);

// Logger for a channel; builds the default configuration on first use
std::shared_ptr<spdlog::logger> channel(Channel channel);

// Flush and drop every channel
void shutdown();

template<typename... Args>
inline void log_to(Channel ch, spdlog::level::level_enum level,
                   fmt::format_string<Args...> fmt, Args&&... args) {
    auto logger = channel(ch);
    if (logger->should_log(level)) {
        logger->log(level, fmt, std::forward<Args>(args)...);
    }
}

#define LOG_TRACE(...) ::agentrelay::log::log_to(::agentrelay::log::MAIN_LOGGER, ::spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::agentrelay::log::log_to(::agentrelay::log::MAIN_LOGGER, ::spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) ::agentrelay::log::log_to(::agentrelay::log::MAIN_LOGGER, ::spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) ::agentrelay::log::log_to(::agentrelay::log::MAIN_LOGGER, ::spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) ::agentrelay::log::log_to(::agentrelay::log::MAIN_LOGGER, ::spdlog::level::err, __VA_ARGS__)

#define NLOG_TRACE(ch, ...) ::agentrelay::log::log_to(ch, ::spdlog::level::trace, __VA_ARGS__)
#define NLOG_DEBUG(ch, ...) ::agentrelay::log::log_to(ch, ::spdlog::level::debug, __VA_ARGS__)
#define NLOG_INFO(ch, ...) ::agentrelay::log::log_to(ch, ::spdlog::level::info, __VA_ARGS__)
#define NLOG_WARN(ch, ...) ::agentrelay::log::log_to(ch, ::spdlog::level::warn, __VA_ARGS__)
#define NLOG_ERROR(ch, ...) ::agentrelay::log::log_to(ch, ::spdlog::level::err, __VA_ARGS__)

} // namespace log
} // namespace agentrelay
