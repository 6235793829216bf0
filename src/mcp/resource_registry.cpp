#include <cowgnition/mcp/resource_registry.hpp>

#include <cowgnition/jsonrpc/error_codes.hpp>

#include <algorithm>

namespace cowgnition {

namespace {

Error MakeRegistryError(const std::string& message) {
    return Error{"RegisterResource", message, ErrorCategory::Config};
}

} // anonymous namespace

nlohmann::json ResourceDescriptor::ToJson() const {
    nlohmann::json j = {{"uri", uri}, {"name", name}};
    if (!description.empty()) j["description"] = description;
    if (!mime_type.empty()) j["mimeType"] = mime_type;
    return j;
}

Result<void, Error> ResourceRegistry::Register(ResourceDescriptor descriptor,
                                               ResourceReader reader) {
    if (descriptor.uri.empty()) {
        return Result<void, Error>::Err(MakeRegistryError("Resource uri must not be empty"));
    }
    if (descriptor.name.empty()) {
        return Result<void, Error>::Err(
            MakeRegistryError("Resource " + descriptor.uri + " needs a name"));
    }
    if (!reader) {
        return Result<void, Error>::Err(
            MakeRegistryError("Resource " + descriptor.uri + " has no reader"));
    }
    if (readers_.count(descriptor.uri) > 0) {
        return Result<void, Error>::Err(
            MakeRegistryError("Resource already registered: " + descriptor.uri));
    }
    readers_[descriptor.uri] = std::move(reader);
    descriptors_.push_back(std::move(descriptor));
    return Result<void, Error>::Ok();
}

bool ResourceRegistry::HasResource(const std::string& uri) const {
    return readers_.count(uri) > 0;
}

Result<nlohmann::json, Error> ResourceRegistry::Read(RequestContext& ctx,
                                                     const std::string& uri) const {
    using R = Result<nlohmann::json, Error>;
    auto it = readers_.find(uri);
    if (it == readers_.end()) {
        return R::Err(Error::WithRpcCode("resources/read", jsonrpc::kResourceNotFound,
                                         "Resource not found: " + uri, {{"uri", uri}}));
    }
    auto descriptor = std::find_if(descriptors_.begin(), descriptors_.end(),
                                   [&](const ResourceDescriptor& d) { return d.uri == uri; });

    auto text = it->second(ctx);
    if (text.IsErr()) {
        return R::Err(std::move(text).Error());
    }

    nlohmann::json contents = {{"uri", uri}, {"text", text.Value()}};
    if (descriptor != descriptors_.end() && !descriptor->mime_type.empty()) {
        contents["mimeType"] = descriptor->mime_type;
    }
    return R::Ok(nlohmann::json{{"contents", nlohmann::json::array({std::move(contents)})}});
}

nlohmann::json ResourceRegistry::ContributeCapabilities() const {
    return {{"resources", {{"listChanged", false}, {"subscribe", false}}}};
}

Result<void, Error> ResourceRegistry::RegisterRoutes(Router& router) {
    auto listed = router.AddRequestRoute(
        "resources/list", [this](RequestContext&, const nlohmann::json&) {
            auto resources = nlohmann::json::array();
            for (const auto& descriptor : descriptors_) {
                resources.push_back(descriptor.ToJson());
            }
            return Result<nlohmann::json, Error>::Ok(
                nlohmann::json{{"resources", std::move(resources)}});
        });
    if (listed.IsErr()) {
        return listed;
    }

    return router.AddRequestRoute(
        "resources/read", [this](RequestContext& ctx, const nlohmann::json& params) {
            if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
                return Result<nlohmann::json, Error>::Err(Error::WithRpcCode(
                    "resources/read", jsonrpc::kInvalidParams,
                    "resources/read requires a string 'uri'"));
            }
            return Read(ctx, params["uri"].get<std::string>());
        });
}

} // namespace cowgnition
