#include <gtest/gtest.h>
#include "relay_test_support.hpp"
#include "server/http_router.hpp"
#include "server/metadata.hpp"
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <regex>

using namespace agentrelay;
using namespace agentrelay::test;
using json = nlohmann::json;

namespace {

constexpr const char* kUnusedUpstream = "ws://127.0.0.1:9/v1/agent/converse";

std::string nonce_from_page(const std::string& page) {
    static const std::regex meta(R"re(name="session-nonce" content="([0-9a-f]+)")re");
    std::smatch match;
    return std::regex_search(page, match, meta) ? match[1].str() : std::string{};
}

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << content;
    return path;
}

} // anonymous namespace

// ============================================================================
// Router
// ============================================================================

TEST(HttpRouterTest, TargetSplitting) {
    EXPECT_EQ(target_path("/api/voice-agent?model=x&y=1"), "/api/voice-agent");
    EXPECT_EQ(target_query("/api/voice-agent?model=x&y=1"), "model=x&y=1");
    EXPECT_EQ(target_path("/health"), "/health");
    EXPECT_EQ(target_query("/health"), "");
}

TEST(HttpRouterTest, MethodAndPathMatching) {
    HttpRouter router;
    router.add_route("GET", "/a", [](const HttpRequest&) {
        return make_json_response(http::status::ok, "{}");
    });
    router.add_route("*", "/b", [](const HttpRequest&) {
        return make_json_response(http::status::ok, "{}");
    });

    EXPECT_TRUE(router.find_route("GET", "/a"));
    EXPECT_FALSE(router.find_route("POST", "/a"));
    EXPECT_TRUE(router.find_route("DELETE", "/b"));
    EXPECT_FALSE(router.find_route("GET", "/c"));
}

TEST(HttpRouterTest, DispatchUnknownIs404) {
    HttpRouter router;
    HttpRequest req{http::verb::get, "/nope", 11};

    auto res = router.dispatch(req);
    EXPECT_EQ(res.result(), http::status::not_found);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["error"], "Not Found");
    EXPECT_EQ(body["message"], "Endpoint not found");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

// ============================================================================
// Metadata
// ============================================================================

TEST(MetadataTest, MetaTableAsJson) {
    auto path = write_temp("agent-relay-meta.toml",
                           "[meta]\ntitle = \"Voice Agent\"\ntags = [\"voice\", \"agent\"]\n"
                           "version = 2\n\n[other]\nignored = true\n");

    auto meta = load_metadata(path.string());
    ASSERT_TRUE(meta.has_value()) << meta.error();
    EXPECT_EQ((*meta)["title"], "Voice Agent");
    EXPECT_EQ((*meta)["tags"], json::array({"voice", "agent"}));
    EXPECT_EQ((*meta)["version"], 2);
    EXPECT_FALSE(meta->contains("ignored"));

    std::filesystem::remove(path);
}

TEST(MetadataTest, MissingFileIsError) {
    auto meta = load_metadata("/nonexistent/deepgram.toml");
    EXPECT_FALSE(meta.has_value());
}

TEST(MetadataTest, MissingMetaSectionIsError) {
    auto path = write_temp("agent-relay-nometa.toml", "[app]\nname = \"x\"\n");

    auto meta = load_metadata(path.string());
    ASSERT_FALSE(meta.has_value());
    EXPECT_NE(meta.error().find("[meta]"), std::string::npos);

    std::filesystem::remove(path);
}

// ============================================================================
// Server routes
// ============================================================================

class HttpRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
    }
};

TEST_F(HttpRoutesTest, HealthCheck) {
    RelayHarness harness(kUnusedUpstream);

    auto res = harness.request(http::verb::get, "/health");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["status"], "ok");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

TEST_F(HttpRoutesTest, UnknownRouteIs404) {
    RelayHarness harness(kUnusedUpstream);

    auto res = harness.request(http::verb::get, "/api/unknown");
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(HttpRoutesTest, PreflightAllowsNonceHeader) {
    RelayHarness harness(kUnusedUpstream);

    auto res = harness.request(http::verb::options, "/api/session");
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
    EXPECT_NE(std::string(res[http::field::access_control_allow_headers]).find("X-Session-Nonce"),
              std::string::npos);
}

TEST_F(HttpRoutesTest, IndexServesNoncePage) {
    RelayHarness harness(kUnusedUpstream);

    auto res = harness.request(http::verb::get, "/");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(std::string(res[http::field::cache_control]), "no-store");
    EXPECT_NE(std::string(res[http::field::content_type]).find("text/html"), std::string::npos);
    EXPECT_FALSE(nonce_from_page(res.body()).empty());

    auto again = harness.request(http::verb::get, "/index.html");
    EXPECT_NE(nonce_from_page(again.body()), nonce_from_page(res.body()));
}

TEST_F(HttpRoutesTest, SessionExchangeRequiredMode) {
    RelayHarness harness(kUnusedUpstream, NoncePolicy::Required);

    auto missing = harness.request(http::verb::get, "/api/session");
    EXPECT_EQ(missing.result(), http::status::forbidden);
    auto error = json::parse(missing.body());
    EXPECT_EQ(error["error"]["type"], "AuthenticationError");
    EXPECT_EQ(error["error"]["code"], "INVALID_NONCE");
    EXPECT_EQ(error["error"]["message"], "Invalid or expired session nonce. Please refresh the page.");

    auto nonce = nonce_from_page(harness.request(http::verb::get, "/").body());
    ASSERT_FALSE(nonce.empty());

    auto first = harness.request(http::verb::get, "/api/session", {{"X-Session-Nonce", nonce}});
    ASSERT_EQ(first.result(), http::status::ok);
    auto token = json::parse(first.body())["token"].get<std::string>();
    EXPECT_TRUE(harness.issuer().verify_token(token));

    auto reused = harness.request(http::verb::get, "/api/session", {{"X-Session-Nonce", nonce}});
    EXPECT_EQ(reused.result(), http::status::forbidden);
}

TEST_F(HttpRoutesTest, SessionExchangeRelaxedMode) {
    RelayHarness harness(kUnusedUpstream, NoncePolicy::Relaxed);

    auto res = harness.request(http::verb::get, "/api/session");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(harness.issuer().verify_token(json::parse(res.body())["token"].get<std::string>()));
}

TEST_F(HttpRoutesTest, MetadataFailureIsServerError) {
    RelayHarness harness(kUnusedUpstream, NoncePolicy::Required, "/nonexistent/deepgram.toml");

    auto res = harness.request(http::verb::get, "/api/metadata");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(json::parse(res.body())["error"], "INTERNAL_SERVER_ERROR");
}

TEST_F(HttpRoutesTest, MetadataServed) {
    auto path = write_temp("agent-relay-served.toml", "[meta]\ntitle = \"Relay\"\n");
    RelayHarness harness(kUnusedUpstream, NoncePolicy::Required, path.string());

    auto res = harness.request(http::verb::get, "/api/metadata");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["title"], "Relay");

    std::filesystem::remove(path);
}

TEST_F(HttpRoutesTest, KeepAliveServesSeveralRequests) {
    RelayHarness harness(kUnusedUpstream);

    net::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), harness.port()));
    beast::flat_buffer buffer;

    for (int i = 0; i < 3; ++i) {
        http::request<http::string_body> req{http::verb::get, "/health", 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(true);
        http::write(socket, req);

        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        EXPECT_EQ(res.result(), http::status::ok);
        EXPECT_TRUE(res.keep_alive());
    }
}
