#pragma once

#include <cowgnition/core/log.hpp>
#include <cowgnition/core/result.hpp>
#include <cowgnition/mcp/capability_provider.hpp>
#include <cowgnition/mcp/router.hpp>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cowgnition {

constexpr const char* kDefaultProtocolVersion = "2024-11-05";

// Identity reported in the initialize result.
struct ServerInfo {
    std::string name = "CowGnition MCP Server";
    std::string version;
    std::string instructions;  // omitted from the result when empty
};

/// Protocol versions this server speaks, newest last.
[[nodiscard]] const std::vector<std::string>& SupportedProtocolVersions();

/// Echo the client's version when supported, otherwise the default.
[[nodiscard]] std::string NegotiateProtocolVersion(const nlohmann::json& requested);

/// Union of provider fragments. Two providers claiming the same top-level
/// capability is a Config error.
[[nodiscard]] Result<nlohmann::json, Error> AggregateCapabilities(
    const std::vector<std::shared_ptr<ICapabilityProvider>>& providers);

/// Register ping, initialize, notifications/initialized, shutdown, exit,
/// $/cancelRequest and notifications/cancelled.
[[nodiscard]] Result<void, Error> RegisterLifecycleRoutes(
    Router& router, const ServerInfo& info, const nlohmann::json& capabilities);

/// Lifecycle routes plus every provider's routes, frozen for serving.
/// Any registration conflict aborts with a Config error.
[[nodiscard]] Result<std::shared_ptr<const Router>, Error> BuildRouter(
    const ServerInfo& info,
    const std::vector<std::shared_ptr<ICapabilityProvider>>& providers,
    std::shared_ptr<Logger> logger);

} // namespace cowgnition
