#pragma once

#include <cowgnition/core/result.hpp>
#include <cowgnition/mcp/capability_provider.hpp>
#include <cowgnition/mcp/router.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cowgnition {

// ---------------------------------------------------------------------------
// ToolSchema — what tools/list reports for one tool.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolResult — result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks

    static ToolResult Text(const std::string& text, bool is_error = false);

    [[nodiscard]] nlohmann::json ToJson() const;
};

using ToolHandler =
    std::function<ToolResult(RequestContext& ctx, const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — registry of MCP tools, served as tools/list and tools/call.
//
// Tools are registered before the router is built. Arguments are checked
// against the tool's input schema before the handler runs.
// ---------------------------------------------------------------------------
class ToolRegistry : public ICapabilityProvider {
public:
    ToolRegistry() = default;

    /// Fails when the name is empty, already taken, or the schema is not
    /// an object.
    [[nodiscard]] Result<void, Error> Register(const std::string& name,
                                               const std::string& description,
                                               const nlohmann::json& input_schema,
                                               ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Unknown tool: -32001. Schema violation: -32602. A throwing handler
    /// becomes an isError tool result.
    [[nodiscard]] Result<ToolResult, Error> Execute(RequestContext& ctx,
                                                    const std::string& name,
                                                    const nlohmann::json& arguments) const;

    [[nodiscard]] std::string Name() const override { return "tools"; }
    [[nodiscard]] nlohmann::json ContributeCapabilities() const override;
    [[nodiscard]] Result<void, Error> RegisterRoutes(Router& router) override;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace cowgnition
