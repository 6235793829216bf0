#include <cowgnition/mcp/lifecycle.hpp>

#include <cowgnition/core/version.hpp>
#include <cowgnition/jsonrpc/error_codes.hpp>

#include <algorithm>
#include <map>

namespace cowgnition {

namespace {

constexpr const char* kComponent = "lifecycle";

Result<void, Error> CancelFromParams(RequestContext& ctx, const nlohmann::json& params,
                                     const char* id_field) {
    if (!params.is_object() || !params.contains(id_field) ||
        !IsValidRequestId(params[id_field])) {
        return Result<void, Error>::Err(Error::WithRpcCode(
            ctx.method, jsonrpc::kInvalidParams,
            std::string("Missing or invalid '") + id_field + "'"));
    }
    const auto& id = params[id_field];
    const bool cancelled = ctx.session && ctx.session->CancelRequest(id);
    if (ctx.logger) {
        ctx.logger->Info(kComponent, "Cancellation requested for id " + id.dump() +
                                         (cancelled ? "" : " (not in flight)"));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> kVersions = {"2024-11-05", "2025-03-26"};
    return kVersions;
}

std::string NegotiateProtocolVersion(const nlohmann::json& requested) {
    if (requested.is_string()) {
        const auto& versions = SupportedProtocolVersions();
        const auto& wanted = requested.get_ref<const std::string&>();
        if (std::find(versions.begin(), versions.end(), wanted) != versions.end()) {
            return wanted;
        }
    }
    return kDefaultProtocolVersion;
}

Result<nlohmann::json, Error> AggregateCapabilities(
    const std::vector<std::shared_ptr<ICapabilityProvider>>& providers) {
    nlohmann::json merged = nlohmann::json::object();
    std::map<std::string, std::string> owners;
    for (const auto& provider : providers) {
        auto fragment = provider->ContributeCapabilities();
        if (fragment.is_null()) continue;
        if (!fragment.is_object()) {
            return Result<nlohmann::json, Error>::Err(Error{
                "AggregateCapabilities",
                "Provider '" + provider->Name() + "' contributed a non-object fragment",
                ErrorCategory::Config});
        }
        for (const auto& [key, value] : fragment.items()) {
            auto owner = owners.find(key);
            if (owner != owners.end()) {
                return Result<nlohmann::json, Error>::Err(Error{
                    "AggregateCapabilities",
                    "Capability '" + key + "' contributed by both '" + owner->second +
                        "' and '" + provider->Name() + "'",
                    ErrorCategory::Config});
            }
            owners.emplace(key, provider->Name());
            merged[key] = value;
        }
    }
    return Result<nlohmann::json, Error>::Ok(std::move(merged));
}

Result<void, Error> RegisterLifecycleRoutes(Router& router, const ServerInfo& info,
                                            const nlohmann::json& capabilities) {
    std::vector<std::pair<std::string, RouteHandler>> routes;

    routes.emplace_back("ping", RequestHandler(
        [](RequestContext&, const nlohmann::json&) {
            return Result<nlohmann::json, Error>::Ok(nlohmann::json::object());
        }));

    routes.emplace_back("initialize", RequestHandler(
        [info, capabilities](RequestContext& ctx, const nlohmann::json& params) {
            const auto empty = nlohmann::json::object();
            const auto& p = params.is_object() ? params : empty;
            auto version = NegotiateProtocolVersion(p.value("protocolVersion", nlohmann::json()));

            if (ctx.session) {
                ctx.session->SetClientInfo(p.value("clientInfo", nlohmann::json::object()),
                                           p.value("capabilities", nlohmann::json::object()),
                                           version);
            }
            if (ctx.logger) {
                auto client = p.value("clientInfo", nlohmann::json::object());
                ctx.logger->Info(kComponent,
                                 "initialize from " + client.value("name", std::string("unknown client")) +
                                     " " + client.value("version", std::string("")) +
                                     ", protocol " + version);
            }

            nlohmann::json result = {
                {"protocolVersion", version},
                {"capabilities", capabilities},
                {"serverInfo", {{"name", info.name}, {"version", info.version}}},
            };
            if (!info.instructions.empty()) {
                result["instructions"] = info.instructions;
            }
            return Result<nlohmann::json, Error>::Ok(std::move(result));
        }));

    routes.emplace_back("notifications/initialized", NotificationHandler(
        [](RequestContext& ctx, const nlohmann::json&) {
            if (ctx.logger) ctx.logger->Info(kComponent, "Client finished initialization");
            return Result<void, Error>::Ok();
        }));

    routes.emplace_back("shutdown", RequestHandler(
        [](RequestContext& ctx, const nlohmann::json&) {
            if (ctx.logger) ctx.logger->Info(kComponent, "Shutdown requested by client");
            return Result<nlohmann::json, Error>::Ok(nlohmann::json(nullptr));
        }));

    routes.emplace_back("exit", NotificationHandler(
        [](RequestContext& ctx, const nlohmann::json&) {
            if (ctx.logger) ctx.logger->Info(kComponent, "Exit received");
            return Result<void, Error>::Ok();
        }));

    routes.emplace_back("$/cancelRequest", NotificationHandler(
        [](RequestContext& ctx, const nlohmann::json& params) {
            return CancelFromParams(ctx, params, "id");
        }));

    routes.emplace_back("notifications/cancelled", NotificationHandler(
        [](RequestContext& ctx, const nlohmann::json& params) {
            return CancelFromParams(ctx, params, "requestId");
        }));

    for (auto& [method, handler] : routes) {
        auto added = router.AddRoute(method, std::move(handler));
        if (added.IsErr()) {
            return added;
        }
    }
    return Result<void, Error>::Ok();
}

Result<std::shared_ptr<const Router>, Error> BuildRouter(
    const ServerInfo& info,
    const std::vector<std::shared_ptr<ICapabilityProvider>>& providers,
    std::shared_ptr<Logger> logger) {
    using R = Result<std::shared_ptr<const Router>, Error>;

    auto capabilities = AggregateCapabilities(providers);
    if (capabilities.IsErr()) {
        return R::Err(std::move(capabilities).Error());
    }

    auto router = std::make_shared<Router>(logger);
    auto lifecycle = RegisterLifecycleRoutes(*router, info, capabilities.Value());
    if (lifecycle.IsErr()) {
        return R::Err(lifecycle.Error());
    }
    for (const auto& provider : providers) {
        auto registered = provider->RegisterRoutes(*router);
        if (registered.IsErr()) {
            auto error = registered.Error();
            error.message = "Provider '" + provider->Name() + "': " + error.message;
            return R::Err(std::move(error));
        }
    }
    if (logger) {
        logger->Info(kComponent, "Router built with " +
                                     std::to_string(router->Methods().size()) + " methods");
    }
    return R::Ok(std::shared_ptr<const Router>(std::move(router)));
}

} // namespace cowgnition
