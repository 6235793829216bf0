#pragma once

#include <cowgnition/core/cancellation.hpp>
#include <cowgnition/core/log.hpp>
#include <cowgnition/core/result.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cowgnition {

// ---------------------------------------------------------------------------
// ISchemaFetcher — retrieves a schema document from a remote URL.
//
// Abstract so the validator can be tested without a network; the
// production implementation is HttpSchemaFetcher.
// ---------------------------------------------------------------------------
class ISchemaFetcher {
public:
    virtual ~ISchemaFetcher() = default;

    ISchemaFetcher(const ISchemaFetcher&) = delete;
    ISchemaFetcher& operator=(const ISchemaFetcher&) = delete;
    ISchemaFetcher(ISchemaFetcher&&) = delete;
    ISchemaFetcher& operator=(ISchemaFetcher&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Fetch(
        const std::string& url, std::chrono::seconds timeout) = 0;

protected:
    ISchemaFetcher() = default;
};

// ---------------------------------------------------------------------------
// HttpSchemaFetcher — cpp-httplib GET; anything but HTTP 200 is an error.
// https:// URLs need a build with OpenSSL.
// ---------------------------------------------------------------------------
class HttpSchemaFetcher : public ISchemaFetcher {
public:
    HttpSchemaFetcher() = default;

    [[nodiscard]] Result<std::string, Error> Fetch(
        const std::string& url, std::chrono::seconds timeout) override;
};

enum class SchemaSourceKind {
    Embedded,
    File,
    Url,
};

[[nodiscard]] const char* ToString(SchemaSourceKind kind);

// A parsed schema document and where it came from.
struct LoadedSchema {
    nlohmann::json document;
    std::string origin;
    SchemaSourceKind kind = SchemaSourceKind::Embedded;
};

struct SchemaSourceOptions {
    // Local path, file:// URI, or http(s):// URL. Empty selects the
    // embedded schema.
    std::string override_uri;
    std::chrono::seconds fetch_timeout{30};
};

// ---------------------------------------------------------------------------
// SchemaLoader — resolves the configured source into a parsed document.
//
// An explicitly configured override that cannot be read or parsed is an
// error; the embedded schema is used only when no override is set.
// ---------------------------------------------------------------------------
class SchemaLoader {
public:
    SchemaLoader(std::shared_ptr<ISchemaFetcher> fetcher,
                 std::shared_ptr<Logger> logger);

    [[nodiscard]] Result<LoadedSchema, Error> Load(
        const SchemaSourceOptions& options,
        const CancellationToken& token) const;

private:
    Result<LoadedSchema, Error> LoadEmbedded() const;
    Result<LoadedSchema, Error> LoadFile(const std::string& path) const;
    Result<LoadedSchema, Error> LoadUrl(const std::string& url,
                                        std::chrono::seconds timeout) const;

    std::shared_ptr<ISchemaFetcher> fetcher_;
    std::shared_ptr<Logger> logger_;
};

/// Parse schema bytes; the document must be a JSON object.
[[nodiscard]] Result<nlohmann::json, Error> ParseSchemaDocument(
    std::string_view bytes, const std::string& origin);

/// Best-effort version string for a schema document, empty when nothing
/// identifies it. Checked in order: a "$schema" draft, a top-level
/// "version", "info.version", then a YYYY-MM-DD date in an MCP "$id" or
/// "title".
[[nodiscard]] std::string DetectSchemaVersion(const nlohmann::json& document);

} // namespace cowgnition
