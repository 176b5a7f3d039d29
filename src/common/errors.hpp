#pragma once

#include <string>
#include <string_view>

namespace agentrelay {

// ============================================================================
// Authentication errors
// The client must restart the bootstrap flow; never retried by the server.
// ============================================================================

enum class AuthErrorCode {
    INVALID_NONCE,
    INVALID_TOKEN,
};

struct AuthenticationError {
    AuthErrorCode code{AuthErrorCode::INVALID_TOKEN};
    std::string message;
};

// ============================================================================
// Upstream errors
// Reported to the connected client as an error frame before teardown.
// ============================================================================

enum class UpstreamErrorCode {
    CONNECTION_FAILED,  // outbound connect or handshake failed
    DEEPGRAM_ERROR,     // outbound leg failed after it was open
};

struct UpstreamConnectionError {
    UpstreamErrorCode code{UpstreamErrorCode::CONNECTION_FAILED};
    std::string description;
};

// ============================================================================
// Protocol errors
// Rejected with a client error status before any session exists.
// ============================================================================

enum class ProtocolErrorCode {
    NOT_WEBSOCKET_UPGRADE,
    BAD_REQUEST,
};

struct ProtocolError {
    ProtocolErrorCode code{ProtocolErrorCode::BAD_REQUEST};
    std::string message;
};

// Machine-readable code strings as they appear on the wire
std::string_view auth_error_code_name(AuthErrorCode code);
std::string_view upstream_error_code_name(UpstreamErrorCode code);
std::string_view protocol_error_code_name(ProtocolErrorCode code);

// {"error":{"type":"AuthenticationError","code":"...","message":"..."}}
std::string to_json(const AuthenticationError& error);

// {"type":"Error","description":"...","code":"..."}
std::string to_error_frame(const UpstreamConnectionError& error);

} // namespace agentrelay
