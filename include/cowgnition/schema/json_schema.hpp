#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cowgnition {

// ---------------------------------------------------------------------------
// SchemaViolation — one failed JSON Schema keyword.
//
// path is a JSON pointer into the validated instance ("" is the root),
// schema_path a JSON pointer into the schema document.
// ---------------------------------------------------------------------------
struct SchemaViolation {
    std::string path;
    std::string schema_path;
    std::string expected;
    std::string actual;
    std::string message;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// JsonSchema — evaluator for the JSON Schema subset used by MCP schemas.
//
// Supported keywords: $ref (local "#/..." pointers), type, enum, const,
// properties, required, additionalProperties, items, minItems, maxItems,
// minLength, maxLength, pattern, minimum, maximum, exclusiveMinimum,
// exclusiveMaximum, allOf, anyOf, oneOf, not. Unknown keywords are ignored.
//
// The document is immutable after construction; Validate is const and
// safe to call from many threads. Each pattern is compiled once and
// reused; strings longer than kMaxPatternSubject are not matched against
// a pattern and fail it instead.
//
// Count bounds (minItems, maxItems, minLength, maxLength) must be
// non-negative integers; any other value is reported as a violation.
// ---------------------------------------------------------------------------
class JsonSchema {
public:
    static constexpr std::size_t kMaxPatternSubject = 64 * 1024;

    explicit JsonSchema(nlohmann::json document);

    [[nodiscard]] const nlohmann::json& Document() const noexcept {
        return document_;
    }

    /// Validate against the document root.
    [[nodiscard]] std::vector<SchemaViolation> Validate(
        const nlohmann::json& instance) const;

    /// Validate against the subschema a local ref points at, e.g.
    /// "#/definitions/InitializeRequest". instance_path prefixes reported
    /// paths when the instance is a fragment of a larger message.
    [[nodiscard]] std::vector<SchemaViolation> ValidateRef(
        std::string_view ref,
        const nlohmann::json& instance,
        const std::string& instance_path = "") const;

    /// Subschema for a local ref, or nullptr when it does not resolve.
    [[nodiscard]] const nlohmann::json* Resolve(std::string_view ref) const;

private:
    void Evaluate(const nlohmann::json& schema,
                  const nlohmann::json& instance,
                  const std::string& path,
                  const std::string& schema_path,
                  std::vector<SchemaViolation>& out,
                  int depth) const;

    bool Matches(const nlohmann::json& schema,
                 const nlohmann::json& instance,
                 const std::string& path,
                 const std::string& schema_path,
                 int depth) const;

    // Compiled form of a pattern, nullptr when it does not compile.
    std::shared_ptr<const std::regex> CompiledPattern(const std::string& pattern) const;

    struct PatternCache {
        std::mutex mutex;
        std::map<std::string, std::shared_ptr<const std::regex>> patterns;
    };

    nlohmann::json document_;
    std::shared_ptr<PatternCache> patterns_;
};

/// Validate an instance against a standalone schema document.
[[nodiscard]] std::vector<SchemaViolation> ValidateJson(
    const nlohmann::json& schema, const nlohmann::json& instance);

/// Escape one reference token for use in a JSON pointer.
[[nodiscard]] std::string EscapePointerToken(std::string_view token);

/// JSON type name of a value as JSON Schema spells it.
[[nodiscard]] std::string JsonTypeName(const nlohmann::json& value);

} // namespace cowgnition
