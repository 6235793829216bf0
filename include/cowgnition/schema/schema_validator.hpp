#pragma once

#include <cowgnition/core/cancellation.hpp>
#include <cowgnition/core/log.hpp>
#include <cowgnition/core/result.hpp>
#include <cowgnition/schema/json_schema.hpp>
#include <cowgnition/schema/schema_loader.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cowgnition {

enum class MessageDirection {
    Incoming,  // client -> server
    Outgoing,  // server -> client
};

// ---------------------------------------------------------------------------
// ValidationOutcome — pass, or the violations of every schema checked.
// ---------------------------------------------------------------------------
struct ValidationOutcome {
    std::vector<SchemaViolation> violations;
    std::vector<std::string> schema_keys;

    [[nodiscard]] bool Passed() const { return violations.empty(); }

    /// True when a violation lies under /params, which makes the failure
    /// "Invalid params" rather than "Invalid Request".
    [[nodiscard]] bool TouchesParams() const;

    /// JSON-RPC error for a failed outcome: -32602 for params violations,
    /// -32600 otherwise, with the violations attached as data.
    [[nodiscard]] Error ToError() const;
};

// ---------------------------------------------------------------------------
// ISchemaValidator — validates JSON-RPC payloads against the MCP schema.
//
// Validate must be safe to call concurrently once Initialize succeeded.
// ---------------------------------------------------------------------------
class ISchemaValidator {
public:
    virtual ~ISchemaValidator() = default;

    ISchemaValidator(const ISchemaValidator&) = delete;
    ISchemaValidator& operator=(const ISchemaValidator&) = delete;
    ISchemaValidator(ISchemaValidator&&) = delete;
    ISchemaValidator& operator=(ISchemaValidator&&) = delete;

    [[nodiscard]] virtual Result<void, Error> Initialize(
        const CancellationToken& token) = 0;

    /// method is the request method an outgoing response answers; it
    /// selects the result schema. Ignored for incoming messages.
    [[nodiscard]] virtual ValidationOutcome Validate(
        const nlohmann::json& payload,
        MessageDirection direction,
        std::string_view method = {}) const = 0;

    [[nodiscard]] virtual std::string GetSchemaVersion() const = 0;

    [[nodiscard]] virtual bool IsInitialized() const = 0;

    [[nodiscard]] virtual Result<void, Error> Shutdown() = 0;

protected:
    ISchemaValidator() = default;
};

// ---------------------------------------------------------------------------
// SchemaValidator — ISchemaValidator over a SchemaLoader and JsonSchema.
//
// Initialize resolves the source once; a second call is a no-op. The
// compiled schema is published as an immutable snapshot so Validate takes
// no lock. Shutdown drops the snapshot and may be called repeatedly.
// ---------------------------------------------------------------------------
class SchemaValidator : public ISchemaValidator {
public:
    SchemaValidator(SchemaSourceOptions options,
                    std::shared_ptr<ISchemaFetcher> fetcher,
                    std::shared_ptr<Logger> logger);

    [[nodiscard]] Result<void, Error> Initialize(
        const CancellationToken& token) override;

    [[nodiscard]] ValidationOutcome Validate(
        const nlohmann::json& payload,
        MessageDirection direction,
        std::string_view method = {}) const override;

    /// Detected version, or "[unknown]".
    [[nodiscard]] std::string GetSchemaVersion() const override;

    [[nodiscard]] bool IsInitialized() const override;

    [[nodiscard]] Result<void, Error> Shutdown() override;

    /// Where the active schema came from ("" before Initialize).
    [[nodiscard]] std::string SchemaOrigin() const;

    /// Definition checked for a method's params, if the schema has one.
    [[nodiscard]] std::string DefinitionForMethod(std::string_view method) const;

private:
    struct Compiled {
        JsonSchema schema;
        std::string version;
        std::string origin;
        std::map<std::string, std::string, std::less<>> method_refs;
    };

    std::shared_ptr<const Compiled> Snapshot() const;

    SchemaSourceOptions options_;
    std::shared_ptr<ISchemaFetcher> fetcher_;
    std::shared_ptr<Logger> logger_;

    std::mutex lifecycle_mutex_;
    std::shared_ptr<const Compiled> compiled_;
};

/// Result definition for an outgoing response to `method`, "" when none.
[[nodiscard]] std::string ResultDefinitionFor(std::string_view method);

} // namespace cowgnition
