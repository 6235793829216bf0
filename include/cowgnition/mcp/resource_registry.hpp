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

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type = "text/plain";

    [[nodiscard]] nlohmann::json ToJson() const;
};

// Returns the resource text. Exceptions become internal errors.
using ResourceReader = std::function<Result<std::string, Error>(RequestContext& ctx)>;

// ---------------------------------------------------------------------------
// ResourceRegistry — static resources, served as resources/list and
// resources/read.
// ---------------------------------------------------------------------------
class ResourceRegistry : public ICapabilityProvider {
public:
    ResourceRegistry() = default;

    [[nodiscard]] Result<void, Error> Register(ResourceDescriptor descriptor,
                                               ResourceReader reader);

    [[nodiscard]] const std::vector<ResourceDescriptor>& Resources() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasResource(const std::string& uri) const;

    /// ReadResourceResult for `uri`; an unknown uri is -32000.
    [[nodiscard]] Result<nlohmann::json, Error> Read(RequestContext& ctx,
                                                     const std::string& uri) const;

    [[nodiscard]] std::string Name() const override { return "resources"; }
    [[nodiscard]] nlohmann::json ContributeCapabilities() const override;
    [[nodiscard]] Result<void, Error> RegisterRoutes(Router& router) override;

private:
    std::vector<ResourceDescriptor> descriptors_;
    std::map<std::string, ResourceReader> readers_;
};

} // namespace cowgnition
