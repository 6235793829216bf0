#include <cowgnition/schema/schema_validator.hpp>

#include <cowgnition/jsonrpc/error_codes.hpp>

#include <atomic>

namespace cowgnition {

namespace {

constexpr const char* kComponent = "schema";
constexpr const char* kUnknownVersion = "[unknown]";

// Outgoing result definitions, keyed by the request method answered.
const std::map<std::string, std::string, std::less<>>& ResultDefinitions() {
    static const std::map<std::string, std::string, std::less<>> kTable = {
        {"initialize", "InitializeResult"},
        {"tools/list", "ListToolsResult"},
        {"tools/call", "CallToolResult"},
        {"resources/list", "ListResourcesResult"},
        {"resources/read", "ReadResourceResult"},
        {"prompts/list", "ListPromptsResult"},
        {"prompts/get", "GetPromptResult"},
    };
    return kTable;
}

bool EndsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

std::string Suggestion(const SchemaViolation& v) {
    if (EndsWith(v.schema_path, "/required")) {
        return "Add the missing required property '" + v.expected + "'.";
    }
    if (EndsWith(v.schema_path, "/type")) {
        return "Change the value at " + (v.path.empty() ? std::string("(root)") : v.path) +
               " to type " + v.expected + ".";
    }
    if (EndsWith(v.schema_path, "/const") || EndsWith(v.schema_path, "/enum")) {
        return "Use an allowed value: " + v.expected + ".";
    }
    if (EndsWith(v.schema_path, "/additionalProperties")) {
        return "Remove the unexpected property '" + v.actual + "'.";
    }
    return "Check the message against the MCP schema for this method.";
}

// "#/definitions/<name>" or "#/$defs/<name>", whichever exists.
std::string DefinitionRef(const JsonSchema& schema, const std::string& name) {
    auto ref = "#/definitions/" + EscapePointerToken(name);
    if (schema.Resolve(ref) != nullptr) return ref;
    ref = "#/$defs/" + EscapePointerToken(name);
    if (schema.Resolve(ref) != nullptr) return ref;
    return "";
}

void IndexMethods(const nlohmann::json& definitions, const std::string& prefix,
                  std::map<std::string, std::string, std::less<>>& out) {
    if (!definitions.is_object()) return;
    for (const auto& [name, def] : definitions.items()) {
        if (!def.is_object()) continue;
        auto props = def.find("properties");
        if (props == def.end() || !props->is_object()) continue;
        auto method = props->find("method");
        if (method == props->end() || !method->is_object()) continue;
        auto constant = method->find("const");
        if (constant == method->end() || !constant->is_string()) continue;
        out.emplace(constant->get<std::string>(), prefix + EscapePointerToken(name));
    }
}

} // anonymous namespace

std::string ResultDefinitionFor(std::string_view method) {
    const auto& table = ResultDefinitions();
    auto it = table.find(method);
    return it == table.end() ? std::string() : it->second;
}

// ---------------------------------------------------------------------------
// ValidationOutcome
// ---------------------------------------------------------------------------
bool ValidationOutcome::TouchesParams() const {
    for (const auto& v : violations) {
        if (v.path == "/params" || v.path.rfind("/params/", 0) == 0) {
            return true;
        }
        if (v.schema_path.find("/properties/params") != std::string::npos) {
            return true;
        }
        // params itself missing.
        if (v.path.empty() && v.expected == "params" &&
            EndsWith(v.schema_path, "/required")) {
            return true;
        }
    }
    return false;
}

Error ValidationOutcome::ToError() const {
    const bool params = TouchesParams();
    const int code = params ? jsonrpc::kInvalidParams : jsonrpc::kInvalidRequest;
    const std::string message = params ? "Invalid params" : "Invalid Request";

    nlohmann::json data = nlohmann::json::object();
    if (!violations.empty()) {
        const auto& first = violations.front();
        data["validationPath"] = first.path;
        data["schemaPath"] = first.schema_path;
        data["validationError"] = first.message;
        data["suggestion"] = Suggestion(first);
    }
    auto list = nlohmann::json::array();
    for (const auto& v : violations) {
        list.push_back(v.ToJson());
    }
    data["violations"] = std::move(list);

    return Error{"SchemaValidation", message, ErrorCategory::SchemaValidation,
                 code, std::move(data)};
}

// ---------------------------------------------------------------------------
// SchemaValidator
// ---------------------------------------------------------------------------
SchemaValidator::SchemaValidator(SchemaSourceOptions options,
                                 std::shared_ptr<ISchemaFetcher> fetcher,
                                 std::shared_ptr<Logger> logger)
    : options_(std::move(options)),
      fetcher_(std::move(fetcher)),
      logger_(logger ? std::move(logger) : MakeNullLogger()) {}

std::shared_ptr<const SchemaValidator::Compiled> SchemaValidator::Snapshot() const {
    return std::atomic_load(&compiled_);
}

Result<void, Error> SchemaValidator::Initialize(const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (Snapshot()) {
        logger_->Debug(kComponent, "Schema validator already initialized");
        return Result<void, Error>::Ok();
    }

    SchemaLoader loader(fetcher_, logger_);
    auto loaded = loader.Load(options_, token);
    if (loaded.IsErr()) {
        logger_->Error(kComponent, "Schema initialization failed: " +
                                       loaded.Error().ToString());
        return Result<void, Error>::Err(std::move(loaded).Error());
    }
    auto schema = std::move(loaded).Value();

    auto version = DetectSchemaVersion(schema.document);
    if (version.empty()) {
        version = kUnknownVersion;
    }

    std::map<std::string, std::string, std::less<>> method_refs;
    if (auto defs = schema.document.find("definitions"); defs != schema.document.end()) {
        IndexMethods(*defs, "#/definitions/", method_refs);
    }
    if (auto defs = schema.document.find("$defs"); defs != schema.document.end()) {
        IndexMethods(*defs, "#/$defs/", method_refs);
    }

    auto compiled = std::make_shared<const Compiled>(Compiled{
        JsonSchema(std::move(schema.document)), version, schema.origin,
        std::move(method_refs)});

    logger_->Info(kComponent, "Schema loaded from " + compiled->origin +
                                  " (" + ToString(schema.kind) + "), version " +
                                  compiled->version + ", " +
                                  std::to_string(compiled->method_refs.size()) +
                                  " method definitions");
    std::atomic_store(&compiled_, std::move(compiled));
    return Result<void, Error>::Ok();
}

ValidationOutcome SchemaValidator::Validate(const nlohmann::json& payload,
                                            MessageDirection direction,
                                            std::string_view method) const {
    ValidationOutcome outcome;
    auto compiled = Snapshot();
    if (!compiled) {
        outcome.violations.push_back(SchemaViolation{
            "", "", "initialized validator", "uninitialized",
            "Schema validator is not initialized"});
        return outcome;
    }
    if (!payload.is_object()) {
        outcome.violations.push_back(SchemaViolation{
            "", "", "object", JsonTypeName(payload),
            "A JSON-RPC message must be an object"});
        return outcome;
    }

    auto check = [&](const std::string& ref, const std::string& key,
                     const nlohmann::json& instance, const std::string& base) {
        outcome.schema_keys.push_back(key);
        auto found = compiled->schema.ValidateRef(ref, instance, base);
        outcome.violations.insert(outcome.violations.end(),
                                  std::make_move_iterator(found.begin()),
                                  std::make_move_iterator(found.end()));
    };

    const bool has_method = payload.contains("method");
    std::string envelope;
    if (has_method) {
        envelope = payload.contains("id") ? "JSONRPCRequest" : "JSONRPCNotification";
    } else if (payload.contains("error")) {
        envelope = "JSONRPCError";
    } else {
        envelope = "JSONRPCResponse";
    }

    auto envelope_ref = DefinitionRef(compiled->schema, envelope);
    if (envelope_ref.empty()) {
        logger_->Debug(kComponent, "Schema has no " + envelope + " definition");
    } else {
        check(envelope_ref, envelope, payload, "");
    }

    if (has_method) {
        const auto& m = payload["method"];
        if (m.is_string()) {
            auto it = compiled->method_refs.find(m.get<std::string>());
            if (it != compiled->method_refs.end()) {
                check(it->second, it->second.substr(it->second.rfind('/') + 1),
                      payload, "");
            }
        }
    } else if (direction == MessageDirection::Outgoing &&
               envelope == "JSONRPCResponse" && !method.empty()) {
        auto name = ResultDefinitionFor(method);
        if (!name.empty()) {
            auto ref = DefinitionRef(compiled->schema, name);
            auto result = payload.find("result");
            if (!ref.empty() && result != payload.end()) {
                check(ref, name, *result, "/result");
            }
        }
    }

    return outcome;
}

std::string SchemaValidator::GetSchemaVersion() const {
    auto compiled = Snapshot();
    return compiled ? compiled->version : std::string(kUnknownVersion);
}

std::string SchemaValidator::SchemaOrigin() const {
    auto compiled = Snapshot();
    return compiled ? compiled->origin : std::string();
}

std::string SchemaValidator::DefinitionForMethod(std::string_view method) const {
    auto compiled = Snapshot();
    if (!compiled) return "";
    auto it = compiled->method_refs.find(method);
    return it == compiled->method_refs.end() ? std::string() : it->second;
}

bool SchemaValidator::IsInitialized() const {
    return Snapshot() != nullptr;
}

Result<void, Error> SchemaValidator::Shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!Snapshot()) {
        return Result<void, Error>::Ok();
    }
    std::atomic_store(&compiled_, std::shared_ptr<const Compiled>());
    fetcher_.reset();
    logger_->Info(kComponent, "Schema validator shut down");
    return Result<void, Error>::Ok();
}

} // namespace cowgnition
