#include "common/log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <cstdlib>
#include <mutex>
#include <vector>

namespace agentrelay::log {

namespace {

constexpr std::array<std::string_view, kChannelCount> kChannelNames = {
    "agent-relay", "http", "auth", "relay", "upstream", "config",
};

std::mutex g_mutex;
std::array<std::shared_ptr<spdlog::logger>, kChannelCount> g_channels;
bool g_built = false;

// Caller holds g_mutex
void build_channels(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files));
    }

    for (size_t i = 0; i < kChannelCount; ++i) {
        auto logger = std::make_shared<spdlog::logger>(std::string(kChannelNames[i]),
                                                       sinks.begin(), sinks.end());
        logger->set_level(config.level);
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);
        g_channels[i] = std::move(logger);
    }
    g_built = true;
}

} // anonymous namespace

std::string_view channel_name(Channel channel) {
    return kChannelNames[static_cast<size_t>(channel)];
}

spdlog::level::level_enum parse_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical" || name == "crit") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);
    build_channels(config);
}

void init_from_env() {
    LogConfig config;
    if (const char* level = std::getenv("AGENT_RELAY_LOG_LEVEL")) {
        config.level = parse_level(level);
    }
    if (const char* file = std::getenv("AGENT_RELAY_LOG_FILE")) {
        config.file_path = file;
    }
    init(config);
}

std::shared_ptr<spdlog::logger> channel(Channel channel) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_built) {
        build_channels(LogConfig{});
    }
    return g_channels[static_cast<size_t>(channel)];
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& logger : g_channels) {
        if (logger) {
            logger->flush();
            logger.reset();
        }
    }
    g_built = false;
}

} // namespace agentrelay::log
