#pragma once

#include <cowgnition/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace cowgnition {

class Router;

// ---------------------------------------------------------------------------
// ICapabilityProvider — an integration that adds methods to the server.
//
// Providers are composed before serving starts. Each contributes a
// fragment of the capabilities object returned by initialize and registers
// its routes on the shared Router.
// ---------------------------------------------------------------------------
class ICapabilityProvider {
public:
    virtual ~ICapabilityProvider() = default;

    ICapabilityProvider(const ICapabilityProvider&) = delete;
    ICapabilityProvider& operator=(const ICapabilityProvider&) = delete;
    ICapabilityProvider(ICapabilityProvider&&) = delete;
    ICapabilityProvider& operator=(ICapabilityProvider&&) = delete;

    [[nodiscard]] virtual std::string Name() const = 0;

    /// Capabilities fragment, e.g. {"tools": {"listChanged": false}}.
    [[nodiscard]] virtual nlohmann::json ContributeCapabilities() const = 0;

    [[nodiscard]] virtual Result<void, Error> RegisterRoutes(Router& router) = 0;

protected:
    ICapabilityProvider() = default;
};

} // namespace cowgnition
