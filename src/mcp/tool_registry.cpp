#include <cowgnition/mcp/tool_registry.hpp>

#include <cowgnition/jsonrpc/error_codes.hpp>
#include <cowgnition/schema/json_schema.hpp>

#include <exception>

namespace cowgnition {

namespace {

Error MakeToolError(int code, const std::string& message,
                    nlohmann::json data = nullptr) {
    return Error::WithRpcCode("tools/call", code, message, std::move(data));
}

} // anonymous namespace

nlohmann::json ToolSchema::ToJson() const {
    return {{"name", name}, {"description", description}, {"inputSchema", input_schema}};
}

ToolResult ToolResult::Text(const std::string& text, bool is_error) {
    return ToolResult{is_error,
                      nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

nlohmann::json ToolResult::ToJson() const {
    nlohmann::json j = {{"content", content.is_array() ? content : nlohmann::json::array()}};
    if (is_error) {
        j["isError"] = true;
    }
    return j;
}

Result<void, Error> ToolRegistry::Register(const std::string& name,
                                           const std::string& description,
                                           const nlohmann::json& input_schema,
                                           ToolHandler handler) {
    if (name.empty()) {
        return Result<void, Error>::Err(
            Error{"RegisterTool", "Tool name must not be empty", ErrorCategory::Config});
    }
    if (handlers_.count(name) > 0) {
        return Result<void, Error>::Err(
            Error{"RegisterTool", "Tool already registered: " + name, ErrorCategory::Config});
    }
    if (!input_schema.is_object()) {
        return Result<void, Error>::Err(Error{
            "RegisterTool", "Input schema for " + name + " must be an object",
            ErrorCategory::Config});
    }
    if (!handler) {
        return Result<void, Error>::Err(
            Error{"RegisterTool", "Tool " + name + " has no handler", ErrorCategory::Config});
    }
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
    return Result<void, Error>::Ok();
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<ToolResult, Error> ToolRegistry::Execute(RequestContext& ctx,
                                                const std::string& name,
                                                const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return Result<ToolResult, Error>::Err(MakeToolError(
            jsonrpc::kToolNotFound, "Unknown tool: " + name, {{"tool", name}}));
    }

    for (const auto& schema : schemas_) {
        if (schema.name != name) continue;
        auto violations = ValidateJson(schema.input_schema, arguments);
        if (!violations.empty()) {
            auto list = nlohmann::json::array();
            for (const auto& v : violations) list.push_back(v.ToJson());
            return Result<ToolResult, Error>::Err(MakeToolError(
                jsonrpc::kInvalidParams,
                "Invalid arguments for tool " + name + ": " + violations.front().message,
                {{"tool", name}, {"violations", std::move(list)}}));
        }
        break;
    }

    try {
        return Result<ToolResult, Error>::Ok(it->second(ctx, arguments));
    } catch (const std::exception& e) {
        if (ctx.logger) {
            ctx.logger->Warn("tools", "Tool " + name + " threw: " + e.what());
        }
        return Result<ToolResult, Error>::Ok(
            ToolResult::Text(std::string("Tool error: ") + e.what(), true));
    }
}

nlohmann::json ToolRegistry::ContributeCapabilities() const {
    return {{"tools", {{"listChanged", false}}}};
}

Result<void, Error> ToolRegistry::RegisterRoutes(Router& router) {
    auto listed = router.AddRequestRoute(
        "tools/list", [this](RequestContext&, const nlohmann::json&) {
            auto tools = nlohmann::json::array();
            for (const auto& schema : schemas_) {
                tools.push_back(schema.ToJson());
            }
            return Result<nlohmann::json, Error>::Ok(
                nlohmann::json{{"tools", std::move(tools)}});
        });
    if (listed.IsErr()) {
        return listed;
    }

    return router.AddRequestRoute(
        "tools/call", [this](RequestContext& ctx, const nlohmann::json& params) {
            using R = Result<nlohmann::json, Error>;
            if (!params.is_object() || !params.contains("name") ||
                !params["name"].is_string()) {
                return R::Err(MakeToolError(jsonrpc::kInvalidParams,
                                            "tools/call requires a string 'name'"));
            }
            auto arguments = params.value("arguments", nlohmann::json::object());
            auto result = Execute(ctx, params["name"].get<std::string>(), arguments);
            if (result.IsErr()) {
                return R::Err(std::move(result).Error());
            }
            return R::Ok(result.Value().ToJson());
        });
}

} // namespace cowgnition
