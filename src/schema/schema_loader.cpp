#include <cowgnition/schema/schema_loader.hpp>

#include <cowgnition/schema/embedded_schema.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>

namespace cowgnition {

namespace {

constexpr const char* kComponent = "schema";

Error MakeSchemaError(const std::string& operation, const std::string& message) {
    return Error{operation, message, ErrorCategory::SchemaLoad};
}

bool StartsWith(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string FindDate(const std::string& text) {
    static const std::regex kDate(R"((\d{4}-\d{2}-\d{2}))");
    std::smatch match;
    if (std::regex_search(text, match, kDate)) {
        return match[1].str();
    }
    return "";
}

} // anonymous namespace

const char* ToString(SchemaSourceKind kind) {
    switch (kind) {
        case SchemaSourceKind::Embedded: return "embedded";
        case SchemaSourceKind::File:     return "file";
        case SchemaSourceKind::Url:      return "url";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// HttpSchemaFetcher
// ---------------------------------------------------------------------------
Result<std::string, Error> HttpSchemaFetcher::Fetch(const std::string& url,
                                                    std::chrono::seconds timeout) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return Result<std::string, Error>::Err(
            MakeSchemaError("FetchSchema", "Not an absolute URL: " + url));
    }
    auto path_start = url.find('/', scheme_end + 3);
    auto base = url.substr(0, path_start);
    auto path = path_start == std::string::npos ? std::string("/")
                                                : url.substr(path_start);

    httplib::Client client(base);
    if (!client.is_valid()) {
        return Result<std::string, Error>::Err(MakeSchemaError(
            "FetchSchema", "Cannot create HTTP client for " + base +
                               " (https requires OpenSSL support)"));
    }
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_follow_location(true);

    auto res = client.Get(path);
    if (!res) {
        return Result<std::string, Error>::Err(MakeSchemaError(
            "FetchSchema",
            "HTTP request to " + url + " failed: " + httplib::to_string(res.error())));
    }
    if (res->status != 200) {
        return Result<std::string, Error>::Err(MakeSchemaError(
            "FetchSchema",
            "HTTP " + std::to_string(res->status) + " fetching schema from " + url));
    }
    return Result<std::string, Error>::Ok(res->body);
}

// ---------------------------------------------------------------------------
// Parsing and version detection
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> ParseSchemaDocument(std::string_view bytes,
                                                  const std::string& origin) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(MakeSchemaError(
            "ParseSchema", "Schema from " + origin + " is not valid JSON: " + e.what()));
    }
    if (!doc.is_object()) {
        return Result<nlohmann::json, Error>::Err(MakeSchemaError(
            "ParseSchema", "Schema from " + origin + " must be a JSON object"));
    }
    return Result<nlohmann::json, Error>::Ok(std::move(doc));
}

std::string DetectSchemaVersion(const nlohmann::json& document) {
    if (!document.is_object()) return "";

    if (auto s = document.find("$schema"); s != document.end() && s->is_string()) {
        const auto& value = s->get_ref<const std::string&>();
        if (value.find("draft-2020-12") != std::string::npos ||
            value.find("draft/2020-12") != std::string::npos) {
            return "draft-2020-12";
        }
        if (value.find("draft-07") != std::string::npos) {
            return "draft-07";
        }
    }

    if (auto v = document.find("version");
        v != document.end() && v->is_string() && !v->get<std::string>().empty()) {
        return v->get<std::string>();
    }

    if (auto info = document.find("info"); info != document.end() && info->is_object()) {
        if (auto v = info->find("version");
            v != info->end() && v->is_string() && !v->get<std::string>().empty()) {
            return v->get<std::string>();
        }
    }

    if (auto id = document.find("$id"); id != document.end() && id->is_string()) {
        const auto& value = id->get_ref<const std::string&>();
        if (value.find("modelcontextprotocol") != std::string::npos) {
            auto date = FindDate(value);
            if (!date.empty()) return date;
        }
    }

    if (auto title = document.find("title"); title != document.end() && title->is_string()) {
        const auto& value = title->get_ref<const std::string&>();
        if (ToLower(value).find("mcp") != std::string::npos) {
            auto date = FindDate(value);
            if (!date.empty()) return date;
        }
    }

    return "";
}

// ---------------------------------------------------------------------------
// SchemaLoader
// ---------------------------------------------------------------------------
SchemaLoader::SchemaLoader(std::shared_ptr<ISchemaFetcher> fetcher,
                           std::shared_ptr<Logger> logger)
    : fetcher_(std::move(fetcher)),
      logger_(logger ? std::move(logger) : MakeNullLogger()) {}

Result<LoadedSchema, Error> SchemaLoader::Load(const SchemaSourceOptions& options,
                                               const CancellationToken& token) const {
    if (token.IsCancelled()) {
        return Result<LoadedSchema, Error>::Err(
            Error{"LoadSchema", "Schema loading cancelled", ErrorCategory::Cancelled});
    }

    const auto& uri = options.override_uri;
    if (uri.empty()) {
        logger_->Debug(kComponent, "No schema override configured, using embedded schema");
        return LoadEmbedded();
    }

    const auto lower = ToLower(uri);
    if (StartsWith(lower, "http://") || StartsWith(lower, "https://")) {
        return LoadUrl(uri, options.fetch_timeout);
    }
    if (StartsWith(lower, "file://")) {
        return LoadFile(uri.substr(7));
    }
    return LoadFile(uri);
}

Result<LoadedSchema, Error> SchemaLoader::LoadEmbedded() const {
    auto parsed = ParseSchemaDocument(kEmbeddedSchema, kEmbeddedSchemaOrigin);
    if (parsed.IsErr()) {
        return Result<LoadedSchema, Error>::Err(std::move(parsed).Error());
    }
    return Result<LoadedSchema, Error>::Ok(LoadedSchema{
        std::move(parsed).Value(), kEmbeddedSchemaOrigin, SchemaSourceKind::Embedded});
}

Result<LoadedSchema, Error> SchemaLoader::LoadFile(const std::string& path) const {
    logger_->Info(kComponent, "Loading schema from file " + path);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<LoadedSchema, Error>::Err(
            MakeSchemaError("ReadSchemaFile", "Cannot open schema file: " + path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Result<LoadedSchema, Error>::Err(
            MakeSchemaError("ReadSchemaFile", "Failed reading schema file: " + path));
    }

    auto parsed = ParseSchemaDocument(buffer.str(), path);
    if (parsed.IsErr()) {
        return Result<LoadedSchema, Error>::Err(std::move(parsed).Error());
    }
    return Result<LoadedSchema, Error>::Ok(
        LoadedSchema{std::move(parsed).Value(), path, SchemaSourceKind::File});
}

Result<LoadedSchema, Error> SchemaLoader::LoadUrl(const std::string& url,
                                                  std::chrono::seconds timeout) const {
    if (!fetcher_) {
        return Result<LoadedSchema, Error>::Err(
            MakeSchemaError("FetchSchema", "No fetcher available for " + url));
    }
    logger_->Info(kComponent, "Fetching schema from " + url);
    auto body = fetcher_->Fetch(url, timeout);
    if (body.IsErr()) {
        return Result<LoadedSchema, Error>::Err(std::move(body).Error());
    }
    auto parsed = ParseSchemaDocument(body.Value(), url);
    if (parsed.IsErr()) {
        return Result<LoadedSchema, Error>::Err(std::move(parsed).Error());
    }
    return Result<LoadedSchema, Error>::Ok(
        LoadedSchema{std::move(parsed).Value(), url, SchemaSourceKind::Url});
}

} // namespace cowgnition
