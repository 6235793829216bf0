#include <catch2/catch_test_macros.hpp>

#include <cowgnition/schema/schema_validator.hpp>

#include "../../test/mocks/mock_schema_fetcher.hpp"

#include <memory>
#include <string>
#include <atomic>
#include <thread>
#include <vector>

using namespace cowgnition;
using cowgnition::testing::MockSchemaFetcher;

namespace {

std::shared_ptr<SchemaValidator> MakeEmbeddedValidator() {
    auto validator = std::make_shared<SchemaValidator>(
        SchemaSourceOptions{}, std::make_shared<MockSchemaFetcher>(), nullptr);
    auto init = validator->Initialize(CancellationToken{});
    REQUIRE(init.IsOk());
    return validator;
}

nlohmann::json InitializeRequest() {
    return {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "initialize"},
        {"params", {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}},
        }},
    };
}

} // anonymous namespace

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("SchemaValidator: uninitialized validator rejects everything", "[schema][validator]") {
    SchemaValidator validator(SchemaSourceOptions{}, nullptr, nullptr);
    CHECK_FALSE(validator.IsInitialized());
    CHECK(validator.GetSchemaVersion() == "[unknown]");
    CHECK(validator.SchemaOrigin().empty());

    auto outcome = validator.Validate(InitializeRequest(), MessageDirection::Incoming);
    CHECK_FALSE(outcome.Passed());
}

TEST_CASE("SchemaValidator: Initialize is idempotent", "[schema][validator]") {
    auto fetcher = std::make_shared<MockSchemaFetcher>();
    fetcher->EnqueueFetch(Result<std::string, Error>::Ok(R"({"version":"x-1"})"));
    SchemaSourceOptions options;
    options.override_uri = "http://schemas.local/mcp.json";
    SchemaValidator validator(options, fetcher, nullptr);

    REQUIRE(validator.Initialize(CancellationToken{}).IsOk());
    REQUIRE(validator.Initialize(CancellationToken{}).IsOk());
    CHECK(fetcher->FetchCallCount() == 1);
    CHECK(validator.GetSchemaVersion() == "x-1");
    CHECK(validator.SchemaOrigin() == "http://schemas.local/mcp.json");
}

TEST_CASE("SchemaValidator: failed override leaves it uninitialized", "[schema][validator]") {
    auto fetcher = std::make_shared<MockSchemaFetcher>();
    SchemaSourceOptions options;
    options.override_uri = "http://schemas.local/missing.json";
    SchemaValidator validator(options, fetcher, nullptr);

    auto r = validator.Initialize(CancellationToken{});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::SchemaLoad);
    CHECK_FALSE(validator.IsInitialized());
}

TEST_CASE("SchemaValidator: Shutdown is repeatable", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    CHECK(validator->IsInitialized());
    CHECK(validator->Shutdown().IsOk());
    CHECK_FALSE(validator->IsInitialized());
    CHECK(validator->Shutdown().IsOk());
}

TEST_CASE("SchemaValidator: unknown version string", "[schema][validator]") {
    auto fetcher = std::make_shared<MockSchemaFetcher>();
    fetcher->EnqueueFetch(Result<std::string, Error>::Ok(R"({"definitions":{}})"));
    SchemaSourceOptions options;
    options.override_uri = "https://x/schema.json";
    SchemaValidator validator(options, fetcher, nullptr);
    REQUIRE(validator.Initialize(CancellationToken{}).IsOk());
    CHECK(validator.GetSchemaVersion() == "[unknown]");
}

// ===========================================================================
// Incoming messages
// ===========================================================================

TEST_CASE("SchemaValidator: valid initialize request passes", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    auto outcome = validator->Validate(InitializeRequest(), MessageDirection::Incoming);
    CHECK(outcome.Passed());
    CHECK(outcome.schema_keys.size() == 2);
    CHECK(validator->DefinitionForMethod("initialize") == "#/definitions/InitializeRequest");
}

TEST_CASE("SchemaValidator: missing params field is Invalid params", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    auto message = InitializeRequest();
    message["params"].erase("clientInfo");

    auto outcome = validator->Validate(message, MessageDirection::Incoming);
    REQUIRE_FALSE(outcome.Passed());
    CHECK(outcome.TouchesParams());

    auto error = outcome.ToError();
    CHECK(error.RpcCode() == -32602);
    CHECK(error.message == "Invalid params");
    CHECK(error.data["validationPath"] == "/params");
    CHECK(error.data["suggestion"].get<std::string>().find("clientInfo") != std::string::npos);
    CHECK(error.data["violations"].is_array());
}

TEST_CASE("SchemaValidator: bad envelope is Invalid Request", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    nlohmann::json message = {{"jsonrpc", "2.0"}, {"id", true}, {"method", "ping"}};

    auto outcome = validator->Validate(message, MessageDirection::Incoming);
    REQUIRE_FALSE(outcome.Passed());
    CHECK_FALSE(outcome.TouchesParams());
    CHECK(outcome.ToError().RpcCode() == -32600);
}

TEST_CASE("SchemaValidator: notification must not carry an id", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    nlohmann::json ok = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    CHECK(validator->Validate(ok, MessageDirection::Incoming).Passed());
}

TEST_CASE("SchemaValidator: methods without a definition check the envelope only",
          "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    nlohmann::json message = {{"jsonrpc", "2.0"}, {"id", "a"}, {"method", "custom/thing"},
                              {"params", {{"anything", 1}}}};
    auto outcome = validator->Validate(message, MessageDirection::Incoming);
    CHECK(outcome.Passed());
    CHECK(outcome.schema_keys.size() == 1);
}

TEST_CASE("SchemaValidator: non-object payload", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    auto outcome = validator->Validate(nlohmann::json::array(), MessageDirection::Incoming);
    CHECK_FALSE(outcome.Passed());
}

// ===========================================================================
// Outgoing messages
// ===========================================================================

TEST_CASE("SchemaValidator: outgoing result checked against the method's result",
          "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    nlohmann::json good = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", nlohmann::json::object()},
            {"serverInfo", {{"name", "s"}, {"version", "1"}}},
        }},
    };
    CHECK(validator->Validate(good, MessageDirection::Outgoing, "initialize").Passed());

    auto bad = good;
    bad["result"].erase("serverInfo");
    auto outcome = validator->Validate(bad, MessageDirection::Outgoing, "initialize");
    REQUIRE_FALSE(outcome.Passed());
    CHECK(outcome.violations[0].path == "/result");
}

TEST_CASE("SchemaValidator: outgoing error responses", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    nlohmann::json error = {
        {"jsonrpc", "2.0"},
        {"id", nullptr},
        {"error", {{"code", -32700}, {"message", "Parse error"}}},
    };
    CHECK(validator->Validate(error, MessageDirection::Outgoing).Passed());
}

TEST_CASE("SchemaValidator: null result for shutdown passes", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", 2}, {"result", nullptr}};
    CHECK(validator->Validate(response, MessageDirection::Outgoing, "shutdown").Passed());
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_CASE("SchemaValidator: concurrent Validate calls", "[schema][validator]") {
    auto validator = MakeEmbeddedValidator();
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (!validator->Validate(InitializeRequest(),
                                         MessageDirection::Incoming).Passed()) {
                    ++failures;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(failures.load() == 0);
}

TEST_CASE("ResultDefinitionFor: known and unknown methods", "[schema][validator]") {
    CHECK(ResultDefinitionFor("tools/call") == "CallToolResult");
    CHECK(ResultDefinitionFor("ping").empty());
}
