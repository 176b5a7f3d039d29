#include "common/errors.hpp"
#include <nlohmann/json.hpp>

namespace agentrelay {

using json = nlohmann::json;

std::string_view auth_error_code_name(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::INVALID_NONCE: return "INVALID_NONCE";
        case AuthErrorCode::INVALID_TOKEN: return "INVALID_TOKEN";
        default: return "UNKNOWN_ERROR";
    }
}

std::string_view upstream_error_code_name(UpstreamErrorCode code) {
    switch (code) {
        case UpstreamErrorCode::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case UpstreamErrorCode::DEEPGRAM_ERROR: return "DEEPGRAM_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

std::string_view protocol_error_code_name(ProtocolErrorCode code) {
    switch (code) {
        case ProtocolErrorCode::NOT_WEBSOCKET_UPGRADE: return "NOT_WEBSOCKET_UPGRADE";
        case ProtocolErrorCode::BAD_REQUEST: return "BAD_REQUEST";
        default: return "UNKNOWN_ERROR";
    }
}

std::string to_json(const AuthenticationError& error) {
    json j;
    j["error"]["type"] = "AuthenticationError";
    j["error"]["code"] = std::string(auth_error_code_name(error.code));
    j["error"]["message"] = error.message;
    return j.dump();
}

std::string to_error_frame(const UpstreamConnectionError& error) {
    json j;
    j["type"] = "Error";
    j["description"] = error.description;
    j["code"] = std::string(upstream_error_code_name(error.code));
    return j.dump();
}

} // namespace agentrelay
