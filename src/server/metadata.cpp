#include "server/metadata.hpp"
#include "common/log.hpp"
#include <toml++/toml.hpp>
#include <sstream>

namespace agentrelay {

using json = nlohmann::json;

namespace {

json scalar_to_json(const toml::node& node) {
    if (node.is_string()) return std::string(node.as_string()->get());
    if (node.is_integer()) return node.as_integer()->get();
    if (node.is_floating_point()) return node.as_floating_point()->get();
    if (node.is_boolean()) return node.as_boolean()->get();
    if (auto* arr = node.as_array()) {
        json out = json::array();
        for (auto&& elem : *arr) {
            out.push_back(scalar_to_json(elem));
        }
        return out;
    }
    if (auto* tbl = node.as_table()) {
        json out = json::object();
        for (auto&& [key, val] : *tbl) {
            out[std::string(key.str())] = scalar_to_json(val);
        }
        return out;
    }
    // dates and times
    std::ostringstream ss;
    node.visit([&ss](auto&& v) { ss << v; });
    return ss.str();
}

} // anonymous namespace

std::expected<json, std::string> load_metadata(const std::string& path) {
    try {
        auto tbl = toml::parse_file(path);
        auto* meta = tbl["meta"].as_table();
        if (meta == nullptr) {
            return std::unexpected("Missing [meta] section in " + path);
        }
        return scalar_to_json(*meta);
    } catch (const toml::parse_error& e) {
        NLOG_WARN(log::HTTP_LOGGER, "Failed to read metadata from {}: {}", path,
                  std::string(e.description()));
        return std::unexpected("Failed to read metadata from " + path + ": " +
                               std::string(e.description()));
    }
}

} // namespace agentrelay
