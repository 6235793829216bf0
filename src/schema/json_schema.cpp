#include <cowgnition/schema/json_schema.hpp>

#include <cmath>
#include <cstdint>
#include <optional>

namespace cowgnition {

namespace {

// Deep $ref chains beyond this are treated as cycles.
constexpr int kMaxDepth = 64;

std::string Describe(const nlohmann::json& value) {
    auto text = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() > 80) {
        text = text.substr(0, 77) + "...";
    }
    return text;
}

bool IsType(const nlohmann::json& instance, const std::string& type) {
    if (type == "object") return instance.is_object();
    if (type == "array") return instance.is_array();
    if (type == "string") return instance.is_string();
    if (type == "number") return instance.is_number();
    if (type == "integer") {
        if (instance.is_number_integer()) return true;
        if (instance.is_number_float()) {
            auto v = instance.get<double>();
            return std::isfinite(v) && std::floor(v) == v;
        }
        return false;
    }
    if (type == "boolean") return instance.is_boolean();
    if (type == "null") return instance.is_null();
    return true;
}

std::size_t Utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

void Add(std::vector<SchemaViolation>& out, const std::string& path,
         const std::string& schema_path, std::string expected,
         std::string actual, std::string message) {
    out.push_back(SchemaViolation{path, schema_path, std::move(expected),
                                  std::move(actual), std::move(message)});
}

std::string Where(const std::string& path) {
    return path.empty() ? "(root)" : path;
}

// Reads a count keyword such as minItems. Absent gives nullopt; a value
// that is not a non-negative integer is reported and also gives nullopt.
std::optional<std::size_t> CountBound(const nlohmann::json& schema, const char* keyword,
                                      const std::string& path,
                                      const std::string& schema_path,
                                      std::vector<SchemaViolation>& out) {
    auto bound = schema.find(keyword);
    if (bound == schema.end()) {
        return std::nullopt;
    }
    if (bound->is_number_unsigned()) {
        return bound->get<std::size_t>();
    }
    if (bound->is_number_integer() && bound->get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(bound->get<std::int64_t>());
    }
    Add(out, path, schema_path + "/" + keyword, "non-negative integer", Describe(*bound),
        std::string("Schema keyword ") + keyword + " must be a non-negative integer, got " +
            Describe(*bound));
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Free helpers
// ---------------------------------------------------------------------------
std::string EscapePointerToken(std::string_view token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string JsonTypeName(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::object:          return "object";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float:    return "number";
        case nlohmann::json::value_t::null:            return "null";
        default:                                       return "unknown";
    }
}

nlohmann::json SchemaViolation::ToJson() const {
    return {
        {"path", path},
        {"schemaPath", schema_path},
        {"expected", expected},
        {"actual", actual},
        {"message", message},
    };
}

std::vector<SchemaViolation> ValidateJson(const nlohmann::json& schema,
                                          const nlohmann::json& instance) {
    return JsonSchema(schema).Validate(instance);
}

// ---------------------------------------------------------------------------
// JsonSchema
// ---------------------------------------------------------------------------
JsonSchema::JsonSchema(nlohmann::json document)
    : document_(std::move(document)), patterns_(std::make_shared<PatternCache>()) {}

std::shared_ptr<const std::regex> JsonSchema::CompiledPattern(const std::string& pattern) const {
    std::lock_guard<std::mutex> lock(patterns_->mutex);
    auto it = patterns_->patterns.find(pattern);
    if (it != patterns_->patterns.end()) {
        return it->second;
    }
    std::shared_ptr<const std::regex> compiled;
    try {
        compiled = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error&) {
        compiled = nullptr;
    }
    patterns_->patterns.emplace(pattern, compiled);
    return compiled;
}

std::vector<SchemaViolation> JsonSchema::Validate(
    const nlohmann::json& instance) const {
    std::vector<SchemaViolation> out;
    Evaluate(document_, instance, "", "#", out, 0);
    return out;
}

std::vector<SchemaViolation> JsonSchema::ValidateRef(
    std::string_view ref, const nlohmann::json& instance,
    const std::string& instance_path) const {
    std::vector<SchemaViolation> out;
    const auto* schema = Resolve(ref);
    if (schema == nullptr) {
        Add(out, instance_path, std::string(ref), "resolvable $ref",
            std::string(ref), "Schema reference does not resolve");
        return out;
    }
    Evaluate(*schema, instance, instance_path, std::string(ref), out, 0);
    return out;
}

const nlohmann::json* JsonSchema::Resolve(std::string_view ref) const {
    if (ref.empty() || ref[0] != '#') {
        return nullptr;
    }
    auto pointer_text = std::string(ref.substr(1));
    if (pointer_text.empty()) {
        return &document_;
    }
    try {
        nlohmann::json::json_pointer pointer(pointer_text);
        if (!document_.contains(pointer)) {
            return nullptr;
        }
        return &document_.at(pointer);
    } catch (const nlohmann::json::exception&) {
        return nullptr;
    }
}

bool JsonSchema::Matches(const nlohmann::json& schema,
                         const nlohmann::json& instance,
                         const std::string& path,
                         const std::string& schema_path,
                         int depth) const {
    std::vector<SchemaViolation> scratch;
    Evaluate(schema, instance, path, schema_path, scratch, depth);
    return scratch.empty();
}

void JsonSchema::Evaluate(const nlohmann::json& schema,
                          const nlohmann::json& instance,
                          const std::string& path,
                          const std::string& schema_path,
                          std::vector<SchemaViolation>& out,
                          int depth) const {
    if (schema.is_boolean()) {
        if (!schema.get<bool>()) {
            Add(out, path, schema_path, "nothing", JsonTypeName(instance),
                Where(path) + ": no value is allowed here");
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (depth > kMaxDepth) {
        Add(out, path, schema_path, "finite schema", "recursive $ref",
            Where(path) + ": schema nesting too deep");
        return;
    }

    // -- $ref --------------------------------------------------------------
    if (auto ref = schema.find("$ref"); ref != schema.end() && ref->is_string()) {
        const auto ref_text = ref->get<std::string>();
        const auto* target = Resolve(ref_text);
        if (target == nullptr) {
            Add(out, path, schema_path + "/$ref", "resolvable $ref", ref_text,
                "Schema reference does not resolve: " + ref_text);
        } else {
            Evaluate(*target, instance, path, ref_text, out, depth + 1);
        }
    }

    // -- type --------------------------------------------------------------
    if (auto type = schema.find("type"); type != schema.end()) {
        bool ok = false;
        std::string expected;
        if (type->is_string()) {
            expected = type->get<std::string>();
            ok = IsType(instance, expected);
        } else if (type->is_array()) {
            for (const auto& t : *type) {
                if (!t.is_string()) continue;
                if (!expected.empty()) expected += "|";
                expected += t.get<std::string>();
                ok = ok || IsType(instance, t.get<std::string>());
            }
        } else {
            ok = true;
        }
        if (!ok) {
            Add(out, path, schema_path + "/type", expected, JsonTypeName(instance),
                Where(path) + ": expected " + expected + ", got " +
                    JsonTypeName(instance));
            // Structural keywords below would only repeat the mismatch.
            return;
        }
    }

    // -- enum / const ------------------------------------------------------
    if (auto e = schema.find("enum"); e != schema.end() && e->is_array()) {
        bool found = false;
        for (const auto& candidate : *e) {
            if (candidate == instance) {
                found = true;
                break;
            }
        }
        if (!found) {
            Add(out, path, schema_path + "/enum", "one of " + Describe(*e),
                Describe(instance),
                Where(path) + ": value is not one of " + Describe(*e));
        }
    }
    if (auto c = schema.find("const"); c != schema.end()) {
        if (*c != instance) {
            Add(out, path, schema_path + "/const", Describe(*c), Describe(instance),
                Where(path) + ": expected " + Describe(*c));
        }
    }

    // -- object ------------------------------------------------------------
    if (instance.is_object()) {
        if (auto req = schema.find("required"); req != schema.end() && req->is_array()) {
            for (const auto& name : *req) {
                if (!name.is_string()) continue;
                const auto key = name.get<std::string>();
                if (!instance.contains(key)) {
                    Add(out, path, schema_path + "/required", key, "missing",
                        Where(path) + ": missing required property '" + key + "'");
                }
            }
        }

        const auto props = schema.find("properties");
        const bool has_props = props != schema.end() && props->is_object();
        if (has_props) {
            for (const auto& [name, subschema] : props->items()) {
                auto member = instance.find(name);
                if (member == instance.end()) continue;
                Evaluate(subschema, *member, path + "/" + EscapePointerToken(name),
                         schema_path + "/properties/" + EscapePointerToken(name),
                         out, depth + 1);
            }
        }

        if (auto extra = schema.find("additionalProperties"); extra != schema.end()) {
            for (const auto& [name, value] : instance.items()) {
                if (has_props && props->contains(name)) continue;
                const auto member_path = path + "/" + EscapePointerToken(name);
                if (extra->is_boolean() && !extra->get<bool>()) {
                    Add(out, member_path, schema_path + "/additionalProperties",
                        "no additional properties", name,
                        Where(path) + ": unexpected property '" + name + "'");
                } else if (extra->is_object()) {
                    Evaluate(*extra, value, member_path,
                             schema_path + "/additionalProperties", out, depth + 1);
                }
            }
        }
    }

    // -- array -------------------------------------------------------------
    if (instance.is_array()) {
        if (auto items = schema.find("items"); items != schema.end()) {
            if (items->is_array()) {
                for (std::size_t i = 0; i < items->size() && i < instance.size(); ++i) {
                    Evaluate((*items)[i], instance[i], path + "/" + std::to_string(i),
                             schema_path + "/items/" + std::to_string(i), out, depth + 1);
                }
            } else {
                for (std::size_t i = 0; i < instance.size(); ++i) {
                    Evaluate(*items, instance[i], path + "/" + std::to_string(i),
                             schema_path + "/items", out, depth + 1);
                }
            }
        }
        if (auto min = CountBound(schema, "minItems", path, schema_path, out)) {
            if (instance.size() < *min) {
                Add(out, path, schema_path + "/minItems",
                    "at least " + std::to_string(*min) + " items",
                    std::to_string(instance.size()) + " items",
                    Where(path) + ": too few items");
            }
        }
        if (auto max = CountBound(schema, "maxItems", path, schema_path, out)) {
            if (instance.size() > *max) {
                Add(out, path, schema_path + "/maxItems",
                    "at most " + std::to_string(*max) + " items",
                    std::to_string(instance.size()) + " items",
                    Where(path) + ": too many items");
            }
        }
    }

    // -- string ------------------------------------------------------------
    if (instance.is_string()) {
        const auto& text = instance.get_ref<const std::string&>();
        const auto length = Utf8Length(text);
        if (auto min = CountBound(schema, "minLength", path, schema_path, out)) {
            if (length < *min) {
                Add(out, path, schema_path + "/minLength",
                    "length >= " + std::to_string(*min), "length " + std::to_string(length),
                    Where(path) + ": string is too short");
            }
        }
        if (auto max = CountBound(schema, "maxLength", path, schema_path, out)) {
            if (length > *max) {
                Add(out, path, schema_path + "/maxLength",
                    "length <= " + std::to_string(*max), "length " + std::to_string(length),
                    Where(path) + ": string is too long");
            }
        }
        if (auto pattern = schema.find("pattern");
            pattern != schema.end() && pattern->is_string()) {
            const auto& pattern_text = pattern->get_ref<const std::string&>();
            auto re = CompiledPattern(pattern_text);
            if (!re) {
                Add(out, path, schema_path + "/pattern", "valid pattern",
                    pattern_text, "Schema pattern cannot be compiled: " + pattern_text);
            } else if (text.size() > kMaxPatternSubject) {
                Add(out, path, schema_path + "/pattern",
                    "at most " + std::to_string(kMaxPatternSubject) + " bytes",
                    std::to_string(text.size()) + " bytes",
                    Where(path) + ": string is too long to match pattern " + pattern_text);
            } else if (!std::regex_search(text, *re)) {
                Add(out, path, schema_path + "/pattern", pattern_text,
                    Describe(instance),
                    Where(path) + ": does not match pattern " + pattern_text);
            }
        }
    }

    // -- number ------------------------------------------------------------
    if (instance.is_number()) {
        const auto value = instance.get<double>();
        auto check = [&](const char* keyword, auto violates, const char* relation) {
            auto bound = schema.find(keyword);
            if (bound == schema.end() || !bound->is_number()) return;
            if (violates(value, bound->get<double>())) {
                Add(out, path, schema_path + "/" + keyword,
                    std::string(relation) + " " + bound->dump(), instance.dump(),
                    Where(path) + ": value out of range (" + relation + " " +
                        bound->dump() + ")");
            }
        };
        check("minimum", [](double v, double b) { return v < b; }, ">=");
        check("maximum", [](double v, double b) { return v > b; }, "<=");
        check("exclusiveMinimum", [](double v, double b) { return v <= b; }, ">");
        check("exclusiveMaximum", [](double v, double b) { return v >= b; }, "<");
    }

    // -- combinators -------------------------------------------------------
    if (auto all = schema.find("allOf"); all != schema.end() && all->is_array()) {
        for (std::size_t i = 0; i < all->size(); ++i) {
            Evaluate((*all)[i], instance, path,
                     schema_path + "/allOf/" + std::to_string(i), out, depth + 1);
        }
    }
    if (auto any = schema.find("anyOf"); any != schema.end() && any->is_array()) {
        bool matched = false;
        for (std::size_t i = 0; i < any->size() && !matched; ++i) {
            matched = Matches((*any)[i], instance, path,
                              schema_path + "/anyOf/" + std::to_string(i), depth + 1);
        }
        if (!matched) {
            Add(out, path, schema_path + "/anyOf", "match any subschema",
                JsonTypeName(instance),
                Where(path) + ": does not match any allowed schema");
        }
    }
    if (auto one = schema.find("oneOf"); one != schema.end() && one->is_array()) {
        std::size_t matches = 0;
        for (std::size_t i = 0; i < one->size(); ++i) {
            if (Matches((*one)[i], instance, path,
                        schema_path + "/oneOf/" + std::to_string(i), depth + 1)) {
                ++matches;
            }
        }
        if (matches != 1) {
            Add(out, path, schema_path + "/oneOf", "exactly one match",
                std::to_string(matches) + " matches",
                Where(path) + ": must match exactly one schema, matched " +
                    std::to_string(matches));
        }
    }
    if (auto neg = schema.find("not"); neg != schema.end()) {
        if (Matches(*neg, instance, path, schema_path + "/not", depth + 1)) {
            Add(out, path, schema_path + "/not", "no match", Describe(instance),
                Where(path) + ": matches a schema it must not match");
        }
    }
}

} // namespace cowgnition
