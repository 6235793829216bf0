#include <catch2/catch_test_macros.hpp>

#include <cowgnition/mcp/tool_registry.hpp>

#include <stdexcept>
#include <string>

using namespace cowgnition;

namespace {

nlohmann::json QuerySchema() {
    return {
        {"type", "object"},
        {"properties", {
            {"query", {{"type", "string"}}},
            {"limit", {{"type", "integer"}, {"minimum", 1}}},
        }},
        {"required", nlohmann::json::array({"query"})},
    };
}

RequestContext MakeContext(const std::string& method = "tools/call") {
    RequestContext ctx;
    ctx.id = 1;
    ctx.method = method;
    ctx.logger = MakeNullLogger();
    return ctx;
}

ToolHandler SearchTasks() {
    return [](RequestContext&, const nlohmann::json& args) {
        return ToolResult::Text("found: " + args["query"].get<std::string>());
    };
}

} // anonymous namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("ToolRegistry: register and list tools", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register("searchTasks", "Search tasks by text", QuerySchema(),
                              SearchTasks()).IsOk());

    REQUIRE(registry.Tools().size() == 1);
    CHECK(registry.Tools()[0].name == "searchTasks");
    CHECK(registry.Tools()[0].description == "Search tasks by text");
    CHECK(registry.HasTool("searchTasks"));
    CHECK_FALSE(registry.HasTool("deleteTask"));
}

TEST_CASE("ToolRegistry: registration errors", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register("a", "", nlohmann::json::object(), SearchTasks()).IsOk());

    auto duplicate = registry.Register("a", "", nlohmann::json::object(), SearchTasks());
    REQUIRE(duplicate.IsErr());
    CHECK(duplicate.Error().category == ErrorCategory::Config);

    CHECK(registry.Register("", "", nlohmann::json::object(), SearchTasks()).IsErr());
    CHECK(registry.Register("b", "", nlohmann::json::array(), SearchTasks()).IsErr());
    CHECK(registry.Register("c", "", nlohmann::json::object(), ToolHandler{}).IsErr());
    CHECK(registry.Tools().size() == 1);
}

TEST_CASE("ToolSchema: ToJson uses inputSchema", "[mcp][registry]") {
    ToolSchema schema{"t", "desc", QuerySchema()};
    auto j = schema.ToJson();
    CHECK(j["name"] == "t");
    CHECK(j["description"] == "desc");
    CHECK(j["inputSchema"]["type"] == "object");
}

TEST_CASE("ToolResult: isError only when set", "[mcp][registry]") {
    auto ok = ToolResult::Text("fine").ToJson();
    CHECK(ok["content"][0]["type"] == "text");
    CHECK(ok["content"][0]["text"] == "fine");
    CHECK_FALSE(ok.contains("isError"));

    auto failed = ToolResult::Text("bad", true).ToJson();
    CHECK(failed["isError"] == true);
}

// ===========================================================================
// Execute
// ===========================================================================

TEST_CASE("ToolRegistry: execute registered tool", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register("searchTasks", "", QuerySchema(), SearchTasks()).IsOk());

    auto ctx = MakeContext();
    auto r = registry.Execute(ctx, "searchTasks", {{"query", "milk"}});
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().is_error);
    CHECK(r.Value().content[0]["text"] == "found: milk");
}

TEST_CASE("ToolRegistry: unknown tool is -32001", "[mcp][registry]") {
    ToolRegistry registry;
    auto ctx = MakeContext();
    auto r = registry.Execute(ctx, "nonexistent", nlohmann::json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().RpcCode() == -32001);
    CHECK(r.Error().message.find("Unknown tool") != std::string::npos);
    CHECK(r.Error().data["tool"] == "nonexistent");
}

TEST_CASE("ToolRegistry: arguments checked against the input schema", "[mcp][registry]") {
    ToolRegistry registry;
    bool called = false;
    REQUIRE(registry.Register("searchTasks", "", QuerySchema(),
        [&called](RequestContext&, const nlohmann::json&) {
            called = true;
            return ToolResult::Text("x");
        }).IsOk());

    auto ctx = MakeContext();
    auto missing = registry.Execute(ctx, "searchTasks", nlohmann::json::object());
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().RpcCode() == -32602);
    CHECK(missing.Error().data["violations"].size() == 1);

    auto out_of_range = registry.Execute(ctx, "searchTasks", {{"query", "q"}, {"limit", 0}});
    REQUIRE(out_of_range.IsErr());
    CHECK(out_of_range.Error().data["violations"][0]["path"] == "/limit");

    CHECK_FALSE(called);
}

TEST_CASE("ToolRegistry: handler exception becomes an error result", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register("throw", "Throws", nlohmann::json::object(),
        [](RequestContext&, const nlohmann::json&) -> ToolResult {
            throw std::runtime_error("boom");
        }).IsOk());

    auto ctx = MakeContext();
    auto r = registry.Execute(ctx, "throw", nlohmann::json::object());
    REQUIRE(r.IsOk());
    CHECK(r.Value().is_error);
    CHECK(r.Value().content[0]["text"].get<std::string>().find("boom") != std::string::npos);
}

// ===========================================================================
// Provider contract
// ===========================================================================

TEST_CASE("ToolRegistry: capabilities fragment", "[mcp][registry]") {
    ToolRegistry registry;
    CHECK(registry.Name() == "tools");
    CHECK(registry.ContributeCapabilities()["tools"]["listChanged"] == false);
}

TEST_CASE("ToolRegistry: tools/list and tools/call routes", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register("searchTasks", "Search", QuerySchema(), SearchTasks()).IsOk());

    Router router;
    REQUIRE(registry.RegisterRoutes(router).IsOk());

    auto list_ctx = MakeContext("tools/list");
    auto listed = router.Dispatch(list_ctx, nullptr, MessageKind::Request);
    REQUIRE(listed.IsOk());
    REQUIRE(listed.Value()["tools"].size() == 1);
    CHECK(listed.Value()["tools"][0]["inputSchema"]["required"][0] == "query");

    auto call_ctx = MakeContext("tools/call");
    auto called = router.Dispatch(
        call_ctx, {{"name", "searchTasks"}, {"arguments", {{"query", "bread"}}}},
        MessageKind::Request);
    REQUIRE(called.IsOk());
    CHECK(called.Value()["content"][0]["text"] == "found: bread");

    auto no_name = router.Dispatch(call_ctx, {{"arguments", nlohmann::json::object()}},
                                   MessageKind::Request);
    REQUIRE(no_name.IsErr());
    CHECK(no_name.Error().RpcCode() == -32602);

    auto unknown = router.Dispatch(call_ctx, {{"name", "nope"}}, MessageKind::Request);
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().RpcCode() == -32001);
}

TEST_CASE("ToolRegistry: registering routes twice conflicts", "[mcp][registry]") {
    ToolRegistry registry;
    Router router;
    REQUIRE(registry.RegisterRoutes(router).IsOk());
    CHECK(registry.RegisterRoutes(router).IsErr());
}
