#include "server/http_router.hpp"
#include <nlohmann/json.hpp>

namespace agentrelay {

using json = nlohmann::json;

// ============================================================================
// Response Helpers
// ============================================================================

HttpResponse make_json_response(http::status status, const std::string& body) {
    HttpResponse res{status, 11};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse make_error_response(http::status status, const std::string& error,
                                 const std::string& message) {
    json j;
    j["error"] = error;
    j["message"] = message;
    return make_json_response(status, j.dump());
}

HttpResponse make_html_response(const std::string& body) {
    HttpResponse res{http::status::ok, 11};
    res.set(http::field::content_type, "text/html; charset=utf-8");
    res.set(http::field::cache_control, "no-store");
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse make_text_response(http::status status, const std::string& body) {
    HttpResponse res{status, 11};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set(http::field::access_control_allow_origin, "*");
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse make_cors_preflight_response() {
    HttpResponse res{http::status::no_content, 11};
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers,
            "Content-Type, Authorization, X-Session-Nonce");
    res.set(http::field::access_control_max_age, "86400");
    res.prepare_payload();
    return res;
}

std::string_view target_path(std::string_view target) {
    auto pos = target.find('?');
    return pos == std::string_view::npos ? target : target.substr(0, pos);
}

std::string_view target_query(std::string_view target) {
    auto pos = target.find('?');
    return pos == std::string_view::npos ? std::string_view{} : target.substr(pos + 1);
}

// ============================================================================
// HttpRouter Implementation
// ============================================================================

void HttpRouter::add_route(const std::string& method, const std::string& path, RouteHandler handler) {
    Route route;
    route.method = method;
    route.path = path;
    route.handler = std::move(handler);
    routes_.push_back(std::move(route));
}

RouteHandler HttpRouter::find_route(std::string_view method, std::string_view path) const {
    for (const auto& route : routes_) {
        if (route.method != method && route.method != "*") continue;
        if (route.path == path) {
            return route.handler;
        }
    }
    return nullptr;
}

HttpResponse HttpRouter::dispatch(const HttpRequest& req) const {
    HttpResponse res;
    if (req.method() == http::verb::options) {
        res = make_cors_preflight_response();
    } else if (auto handler = find_route(to_string_view(req.method_string()),
                                         target_path(to_string_view(req.target())))) {
        res = handler(req);
    } else {
        res = make_error_response(http::status::not_found, "Not Found", "Endpoint not found");
    }

    res.version(req.version());
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

} // namespace agentrelay
