#include <catch2/catch_test_macros.hpp>

#include <cowgnition/mcp/lifecycle.hpp>
#include <cowgnition/transport/http_transport.hpp>

#include "../../test/mocks/capture_sink.hpp"
#include "../../test/mocks/mock_schema_fetcher.hpp"

#include <httplib.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace cowgnition;
using namespace std::chrono_literals;
using cowgnition::testing::CaptureSink;
using cowgnition::testing::MakeCaptureLogger;
using cowgnition::testing::MockSchemaFetcher;

namespace {

constexpr const char* kInitialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05",)"
    R"("capabilities":{},"clientInfo":{"name":"http-client","version":"0.1"}}})";
constexpr const char* kInitialized =
    R"({"jsonrpc":"2.0","method":"notifications/initialized"})";
constexpr const char* kPing = R"({"jsonrpc":"2.0","id":2,"method":"ping"})";

ConnectionFactory MakeFactory(std::shared_ptr<Logger> logger) {
    auto validator = std::make_shared<SchemaValidator>(
        SchemaSourceOptions{}, std::make_shared<MockSchemaFetcher>(), logger);
    REQUIRE(validator->Initialize(CancellationToken{}).IsOk());
    auto router = BuildRouter(ServerInfo{"Http Test", "0.0.1", ""}, {}, logger);
    REQUIRE(router.IsOk());
    std::shared_ptr<const Router> shared = router.Value();

    return [shared, validator, logger]() {
        ConnectionServerOptions options;
        options.request_timeout = 1000ms;
        options.shutdown_timeout = 1000ms;
        return std::make_unique<ConnectionServer>(shared, validator, options, logger);
    };
}

struct Fixture {
    std::shared_ptr<CaptureSink::Store> logs = std::make_shared<CaptureSink::Store>();
    std::shared_ptr<Logger> logger = MakeCaptureLogger(logs);
    HttpTransport transport;

    explicit Fixture(HttpTransportOptions options = {})
        : transport(std::move(options), MakeFactory(logger), logger) {}

    std::string OpenSession() {
        auto opened = transport.HandlePost("", kInitialize);
        REQUIRE(opened.status == 200);
        REQUIRE_FALSE(opened.session_id.empty());
        return opened.session_id;
    }
};

} // anonymous namespace

// ===========================================================================
// Session lifecycle
// ===========================================================================

TEST_CASE("HttpTransport: initialize without a session opens one", "[transport][http]") {
    Fixture f;
    auto exchange = f.transport.HandlePost("", kInitialize);

    CHECK(exchange.status == 200);
    CHECK(exchange.content_type == "application/json");
    CHECK(exchange.session_id.size() == 32);
    auto body = nlohmann::json::parse(exchange.body);
    CHECK(body["id"] == 1);
    CHECK(body["result"]["serverInfo"]["name"] == "Http Test");
    CHECK(f.transport.SessionCount() == 1);
    CHECK(f.logs->Contains("Session " + exchange.session_id + " opened"));
}

TEST_CASE("HttpTransport: each initialize gets its own session", "[transport][http]") {
    Fixture f;
    auto a = f.OpenSession();
    auto b = f.OpenSession();
    CHECK(a != b);
    CHECK(f.transport.SessionCount() == 2);
}

TEST_CASE("HttpTransport: notification answers 202 with an empty body", "[transport][http]") {
    Fixture f;
    auto id = f.OpenSession();
    auto exchange = f.transport.HandlePost(id, kInitialized);
    CHECK(exchange.status == 202);
    CHECK(exchange.body.empty());
    CHECK(exchange.session_id == id);
}

TEST_CASE("HttpTransport: requests within a session answer 200", "[transport][http]") {
    Fixture f;
    auto id = f.OpenSession();
    REQUIRE(f.transport.HandlePost(id, kInitialized).status == 202);

    auto exchange = f.transport.HandlePost(id, kPing);
    CHECK(exchange.status == 200);
    CHECK(nlohmann::json::parse(exchange.body)["result"] == nlohmann::json::object());
}

TEST_CASE("HttpTransport: missing session header is 400", "[transport][http]") {
    Fixture f;
    auto exchange = f.transport.HandlePost("", kPing);
    CHECK(exchange.status == 400);
    CHECK(nlohmann::json::parse(exchange.body)["error"] == "Mcp-Session-Id header required");
    CHECK(f.transport.SessionCount() == 0);
}

TEST_CASE("HttpTransport: unknown session is 404", "[transport][http]") {
    Fixture f;
    auto exchange = f.transport.HandlePost("deadbeef", kPing);
    CHECK(exchange.status == 404);
}

TEST_CASE("HttpTransport: rejected initialize keeps no session", "[transport][http]") {
    Fixture f;
    auto exchange = f.transport.HandlePost(
        "", R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    CHECK(exchange.status == 200);
    CHECK(exchange.session_id.empty());
    CHECK(nlohmann::json::parse(exchange.body)["error"]["code"] == -32602);
    CHECK(f.transport.SessionCount() == 0);
}

TEST_CASE("HttpTransport: session limit is 503", "[transport][http]") {
    HttpTransportOptions options;
    options.max_sessions = 1;
    Fixture f(options);
    f.OpenSession();
    auto exchange = f.transport.HandlePost("", kInitialize);
    CHECK(exchange.status == 503);
    CHECK(f.transport.SessionCount() == 1);
}

TEST_CASE("HttpTransport: concurrent initializes respect the session limit",
          "[transport][http]") {
    HttpTransportOptions options;
    options.max_sessions = 3;
    Fixture f(options);

    std::vector<std::future<HttpExchange>> opened;
    for (int i = 0; i < 8; ++i) {
        opened.push_back(std::async(std::launch::async,
                                    [&f] { return f.transport.HandlePost("", kInitialize); }));
    }
    int accepted = 0;
    int refused = 0;
    for (auto& exchange : opened) {
        auto result = exchange.get();
        if (result.status == 200) ++accepted;
        if (result.status == 503) ++refused;
    }
    CHECK(accepted == 3);
    CHECK(refused == 5);
    CHECK(f.transport.SessionCount() == 3);
}

// ===========================================================================
// Idle expiry
// ===========================================================================

TEST_CASE("HttpTransport: idle session expires", "[transport][http][idle]") {
    HttpTransportOptions options;
    options.session_idle_timeout = 50ms;
    Fixture f(options);
    auto id = f.OpenSession();
    REQUIRE(f.transport.HandlePost(id, kInitialized).status == 202);

    std::this_thread::sleep_for(150ms);
    CHECK(f.transport.HandlePost(id, kPing).status == 404);
    CHECK(f.transport.SessionCount() == 0);
    CHECK(f.logs->Contains("Session " + id + " expired"));
}

TEST_CASE("HttpTransport: traffic keeps a session alive", "[transport][http][idle]") {
    HttpTransportOptions options;
    options.session_idle_timeout = 300ms;
    Fixture f(options);
    auto id = f.OpenSession();
    REQUIRE(f.transport.HandlePost(id, kInitialized).status == 202);

    for (int i = 0; i < 4; ++i) {
        std::this_thread::sleep_for(100ms);
        REQUIRE(f.transport.HandlePost(id, kPing).status == 200);
    }
    CHECK(f.transport.EvictIdle() == 0);
    CHECK(f.transport.SessionCount() == 1);
}

TEST_CASE("HttpTransport: expiry frees a slot at the session limit", "[transport][http][idle]") {
    HttpTransportOptions options;
    options.max_sessions = 1;
    options.session_idle_timeout = 50ms;
    Fixture f(options);
    auto abandoned = f.OpenSession();

    std::this_thread::sleep_for(150ms);
    auto fresh = f.transport.HandlePost("", kInitialize);
    CHECK(fresh.status == 200);
    CHECK(fresh.session_id != abandoned);
    CHECK(f.transport.SessionCount() == 1);
}

TEST_CASE("HttpTransport: zero idle timeout keeps sessions", "[transport][http][idle]") {
    HttpTransportOptions options;
    options.session_idle_timeout = 0ms;
    Fixture f(options);
    f.OpenSession();

    std::this_thread::sleep_for(20ms);
    CHECK(f.transport.EvictIdle() == 0);
    CHECK(f.transport.SessionCount() == 1);
}

// ===========================================================================
// Ending sessions
// ===========================================================================

TEST_CASE("HttpTransport: shutdown and exit end the session", "[transport][http]") {
    Fixture f;
    auto id = f.OpenSession();
    REQUIRE(f.transport.HandlePost(id, kInitialized).status == 202);
    REQUIRE(f.transport.HandlePost(id, R"({"jsonrpc":"2.0","id":3,"method":"shutdown"})")
                .status == 200);
    CHECK(f.transport.SessionCount() == 1);

    CHECK(f.transport.HandlePost(id, R"({"jsonrpc":"2.0","method":"exit"})").status == 202);
    CHECK(f.transport.SessionCount() == 0);
    CHECK(f.transport.HandlePost(id, kPing).status == 404);
}

TEST_CASE("HttpTransport: DELETE closes a session", "[transport][http]") {
    Fixture f;
    auto id = f.OpenSession();

    auto deleted = f.transport.HandleDelete(id);
    CHECK(deleted.status == 204);
    CHECK(deleted.body.empty());
    CHECK(f.transport.SessionCount() == 0);

    CHECK(f.transport.HandleDelete(id).status == 404);
    CHECK(f.transport.HandleDelete("").status == 400);
}

// ===========================================================================
// Live server
// ===========================================================================

TEST_CASE("HttpTransport: serves over a real socket", "[transport][http][live]") {
    HttpTransportOptions options;
    options.port = 0;
    Fixture f(options);

    CancellationSource stop;
    auto served = std::async(std::launch::async,
                             [&f, &stop] { return f.transport.Serve(stop.Token()); });

    auto until = std::chrono::steady_clock::now() + 5s;
    while (!f.transport.IsListening() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(f.transport.IsListening());
    REQUIRE(f.transport.BoundPort() > 0);

    httplib::Client client("127.0.0.1", f.transport.BoundPort());
    auto health = client.Get("/healthz");
    REQUIRE(health);
    CHECK(health->status == 200);

    auto init = client.Post("/mcp", kInitialize, "application/json");
    REQUIRE(init);
    CHECK(init->status == 200);
    auto session = init->get_header_value("Mcp-Session-Id");
    REQUIRE_FALSE(session.empty());

    httplib::Headers headers{{"Mcp-Session-Id", session}};
    auto notified = client.Post("/mcp", headers, kInitialized, "application/json");
    REQUIRE(notified);
    CHECK(notified->status == 202);

    auto ping = client.Post("/mcp", headers, kPing, "application/json");
    REQUIRE(ping);
    CHECK(ping->status == 200);
    CHECK(nlohmann::json::parse(ping->body)["id"] == 2);

    auto orphan = client.Post("/mcp", kPing, "application/json");
    REQUIRE(orphan);
    CHECK(orphan->status == 400);

    stop.Cancel();
    REQUIRE(served.wait_for(5s) == std::future_status::ready);
    CHECK(served.get().IsOk());
    CHECK(f.transport.SessionCount() == 0);

    auto late = f.transport.HandlePost("", kInitialize);
    CHECK(late.status == 503);
    CHECK(nlohmann::json::parse(late.body)["error"] == "Server is shutting down");
}
