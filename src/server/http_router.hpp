#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace agentrelay {

namespace beast = boost::beast;
namespace http = beast::http;

// ============================================================================
// HTTP Request Handler Types
// ============================================================================

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;
using RouteHandler = std::function<HttpResponse(const HttpRequest&)>;

// ============================================================================
// HTTP Router
// ============================================================================

class HttpRouter {
public:
    // method "*" matches any method
    void add_route(const std::string& method, const std::string& path, RouteHandler handler);

    // nullptr when nothing matches
    RouteHandler find_route(std::string_view method, std::string_view path) const;

    // Route the request; answers OPTIONS preflights and unknown paths itself
    HttpResponse dispatch(const HttpRequest& req) const;

private:
    struct Route {
        std::string method;
        std::string path;
        RouteHandler handler;
    };

    std::vector<Route> routes_;
};

inline std::string_view to_string_view(beast::string_view sv) {
    return {sv.data(), sv.size()};
}

// Path part of a request target
std::string_view target_path(std::string_view target);

// Query part of a request target without the '?', empty if none
std::string_view target_query(std::string_view target);

// ============================================================================
// Response Helpers
// ============================================================================

HttpResponse make_json_response(http::status status, const std::string& body);

// {"error":"<error>","message":"<message>"}
HttpResponse make_error_response(http::status status, const std::string& error,
                                 const std::string& message);

HttpResponse make_html_response(const std::string& body);

// Plain-text body with the CORS origin header
HttpResponse make_text_response(http::status status, const std::string& body);

// Preflight answer with the allowed methods and headers
HttpResponse make_cors_preflight_response();

} // namespace agentrelay
