#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <string>

namespace agentrelay {

// The [meta] table of a project TOML file as a JSON object. Missing file,
// parse failure or a missing [meta] table yield an error description.
std::expected<nlohmann::json, std::string> load_metadata(const std::string& path);

} // namespace agentrelay
