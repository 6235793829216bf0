#include <catch2/catch_test_macros.hpp>

#include <cowgnition/core/result.hpp>
#include <cowgnition/jsonrpc/error_codes.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace cowgnition;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok and Err are distinguishable", "[result]") {
    auto ok = Result<int, std::string>::Ok(7);
    auto err = Result<int, std::string>::Err("boom");

    REQUIRE(ok.IsOk());
    CHECK(static_cast<bool>(ok));
    CHECK(ok.Value() == 7);

    REQUIRE(err.IsErr());
    CHECK_FALSE(static_cast<bool>(err));
    CHECK(err.Error() == "boom");
}

TEST_CASE("Result: ValueOr falls back only on Err", "[result]") {
    CHECK(Result<int, std::string>::Ok(1).ValueOr(5) == 1);
    CHECK(Result<int, std::string>::Err("x").ValueOr(5) == 5);
}

TEST_CASE("Result: AndThen stops at the first Err", "[result]") {
    int calls = 0;
    auto r = Result<int, std::string>::Ok(2)
        .AndThen([&calls](int v) {
            ++calls;
            return Result<int, std::string>::Err("stop at " + std::to_string(v));
        })
        .AndThen([&calls](int v) {
            ++calls;
            return Result<int, std::string>::Ok(v * 100);
        });
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "stop at 2");
    CHECK(calls == 1);
}

TEST_CASE("Result: Map changes the value type", "[result]") {
    auto r = Result<int, std::string>::Ok(42).Map([](int v) { return std::to_string(v); });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "42");

    auto e = Result<int, std::string>::Err("nope").Map([](int v) { return v + 1; });
    REQUIRE(e.IsErr());
    CHECK(e.Error() == "nope");
}

TEST_CASE("Result: move-only values can be moved out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(9));
    auto p = std::move(r).Value();
    REQUIRE(p != nullptr);
    CHECK(*p == 9);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(Error{"op", "failed"});
    REQUIRE(err.IsErr());
    CHECK(err.Error().message == "failed");
    CHECK(std::move(err).Error().operation == "op");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e{"op", "msg"};
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.RpcCode() == jsonrpc::kInternalError);
    CHECK(e.ExitCode() == 1);
}

TEST_CASE("Error: RpcCode follows the category", "[error]") {
    CHECK(Error{"", "", ErrorCategory::Decode}.RpcCode() == -32700);
    CHECK(Error{"", "", ErrorCategory::InvalidRequest}.RpcCode() == -32600);
    CHECK(Error{"", "", ErrorCategory::StateViolation}.RpcCode() == -32600);
    CHECK(Error{"", "", ErrorCategory::SchemaValidation}.RpcCode() == -32600);
    CHECK(Error{"", "", ErrorCategory::MethodNotFound}.RpcCode() == -32601);
    CHECK(Error{"", "", ErrorCategory::InvalidParams}.RpcCode() == -32602);
    CHECK(Error{"", "", ErrorCategory::Handler}.RpcCode() == -32603);
    CHECK(Error{"", "", ErrorCategory::Timeout}.RpcCode() == -32005);
    CHECK(Error{"", "", ErrorCategory::Cancelled}.RpcCode() == -32800);
}

TEST_CASE("Error: explicit rpc_code wins over the category", "[error]") {
    Error e{"tools/call", "Unknown tool", ErrorCategory::Handler, jsonrpc::kToolNotFound};
    CHECK(e.RpcCode() == -32001);
}

TEST_CASE("Error: WithRpcCode picks a matching category", "[error]") {
    auto params = Error::WithRpcCode("op", jsonrpc::kInvalidParams, "bad");
    CHECK(params.category == ErrorCategory::InvalidParams);
    CHECK(params.RpcCode() == -32602);

    auto custom = Error::WithRpcCode("op", jsonrpc::kResourceNotFound, "gone",
                                     {{"uri", "x://y"}});
    CHECK(custom.category == ErrorCategory::Handler);
    CHECK(custom.RpcCode() == -32000);
    CHECK(custom.data["uri"] == "x://y");
}

TEST_CASE("Error: ExitCode for boot failures", "[error]") {
    CHECK(Error{"", "", ErrorCategory::Config}.ExitCode() == 2);
    CHECK(Error{"", "", ErrorCategory::SchemaLoad}.ExitCode() == 3);
    CHECK(Error{"", "", ErrorCategory::Transport}.ExitCode() == 4);
    CHECK(Error{"", "", ErrorCategory::Timeout}.ExitCode() == 1);
}

TEST_CASE("Error: ToString includes operation, code and message", "[error]") {
    Error plain{"LoadSchema", "file missing", ErrorCategory::SchemaLoad};
    CHECK(plain.ToString() == "LoadSchema: file missing");

    auto coded = Error::WithRpcCode("tools/call", -32001, "Unknown tool: x");
    CHECK(coded.ToString() == "tools/call (code -32001): Unknown tool: x");
}

TEST_CASE("Error: ToJson is parseable and carries data", "[error]") {
    Error e{"Dispatch", "quote \" and\nnewline", ErrorCategory::Timeout, std::nullopt,
            nlohmann::json{{"timeoutMs", 50}}};
    auto j = nlohmann::json::parse(e.ToJson());
    CHECK(j["error"]["category"] == "timeout");
    CHECK(j["error"]["message"] == "quote \" and\nnewline");
    CHECK(j["error"]["code"] == -32005);
    CHECK(j["error"]["exit_code"] == 1);
    CHECK(j["error"]["data"]["timeoutMs"] == 50);
}

TEST_CASE("Error: equality compares every field", "[error]") {
    Error a{"op", "msg", ErrorCategory::Config};
    Error b{"op", "msg", ErrorCategory::Config};
    CHECK(a == b);

    b.category = ErrorCategory::Transport;
    CHECK(a != b);

    Error c{"op", "msg", ErrorCategory::Config, std::nullopt, nlohmann::json{{"k", 1}}};
    CHECK(a != c);
}
