#include <cowgnition/jsonrpc/message.hpp>

#include <cctype>

namespace cowgnition {

namespace {

constexpr const char* kOperation = "Decode";

Result<DecodedMessage, DecodeFailure> Fail(ErrorCategory category,
                                           const std::string& message,
                                           nlohmann::json id = nullptr,
                                           bool id_recovered = false) {
    return Result<DecodedMessage, DecodeFailure>::Err(DecodeFailure{
        Error{kOperation, message, category}, std::move(id), id_recovered});
}

Result<DecodedMessage, DecodeFailure> FailInvalid(const nlohmann::json& doc,
                                                  const std::string& message) {
    // An invalid envelope is answered when it carries a usable id.
    if (doc.is_object()) {
        auto it = doc.find("id");
        if (it != doc.end() && IsValidRequestId(*it)) {
            return Fail(ErrorCategory::InvalidRequest, message, *it, true);
        }
    }
    return Fail(ErrorCategory::InvalidRequest, message);
}

Result<RpcError, std::string> DecodeErrorObject(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Result<RpcError, std::string>::Err("'error' must be an object");
    }
    auto code = value.find("code");
    if (code == value.end() || !code->is_number_integer()) {
        return Result<RpcError, std::string>::Err("'error.code' must be an integer");
    }
    auto message = value.find("message");
    if (message == value.end() || !message->is_string()) {
        return Result<RpcError, std::string>::Err("'error.message' must be a string");
    }
    RpcError error;
    error.code = code->get<int>();
    error.message = message->get<std::string>();
    if (auto data = value.find("data"); data != value.end()) {
        error.data = *data;
    }
    return Result<RpcError, std::string>::Ok(std::move(error));
}

std::size_t SkipSpace(std::string_view s, std::size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return pos;
}

} // anonymous namespace

MessageKind KindOf(const Message& message) {
    switch (message.index()) {
        case 0: return MessageKind::Request;
        case 1: return MessageKind::Notification;
        default: return MessageKind::Response;
    }
}

const char* ToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::Request:      return "request";
        case MessageKind::Notification: return "notification";
        case MessageKind::Response:     return "response";
    }
    return "unknown";
}

bool IsValidRequestId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer();
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------
Result<DecodedMessage, DecodeFailure> Decode(std::string_view bytes) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::parse_error& e) {
        auto id = SalvageId(bytes);
        return Fail(ErrorCategory::Decode,
                    std::string("Parse error: ") + e.what(),
                    id.value_or(nullptr), id.has_value());
    }

    if (doc.is_array()) {
        return Fail(ErrorCategory::InvalidRequest,
                    "Batch requests are not supported");
    }
    if (!doc.is_object()) {
        return Fail(ErrorCategory::InvalidRequest,
                    "Message must be a JSON object");
    }

    auto version = doc.find("jsonrpc");
    if (version == doc.end() || !version->is_string() || *version != "2.0") {
        return FailInvalid(doc, "Invalid JSON-RPC version, expected \"2.0\"");
    }

    auto method = doc.find("method");
    auto id = doc.find("id");

    if (method != doc.end()) {
        if (!method->is_string()) {
            return FailInvalid(doc, "'method' must be a string");
        }
        if (doc.contains("result") || doc.contains("error")) {
            return FailInvalid(doc, "A request must not carry 'result' or 'error'");
        }
        nlohmann::json params = nullptr;
        if (auto p = doc.find("params"); p != doc.end()) {
            if (!p->is_object() && !p->is_array()) {
                return FailInvalid(doc, "'params' must be an object or array");
            }
            params = *p;
        }

        if (id == doc.end()) {
            return Result<DecodedMessage, DecodeFailure>::Ok(DecodedMessage{
                Notification{method->get<std::string>(), std::move(params)},
                std::move(doc)});
        }
        if (!IsValidRequestId(*id)) {
            // Answer with a null id; the one sent is unusable.
            return Fail(ErrorCategory::InvalidRequest,
                        "Request id must be a string or integer", nullptr, true);
        }
        Request request{*id, method->get<std::string>(), std::move(params)};
        return Result<DecodedMessage, DecodeFailure>::Ok(
            DecodedMessage{std::move(request), std::move(doc)});
    }

    // No method: a response.
    if (id == doc.end()) {
        return Fail(ErrorCategory::InvalidRequest,
                    "Message has neither 'method' nor 'id'");
    }
    if (!id->is_null() && !IsValidRequestId(*id)) {
        return Fail(ErrorCategory::InvalidRequest,
                    "Response id must be a string, integer, or null");
    }

    auto result = doc.find("result");
    auto error = doc.find("error");
    if ((result == doc.end()) == (error == doc.end())) {
        return Fail(ErrorCategory::InvalidRequest,
                    "A response must carry exactly one of 'result' or 'error'");
    }

    Response response;
    response.id = *id;
    if (result != doc.end()) {
        response.result = *result;
    } else {
        auto decoded = DecodeErrorObject(*error);
        if (decoded.IsErr()) {
            return Fail(ErrorCategory::InvalidRequest, decoded.Error());
        }
        response.error = std::move(decoded).Value();
    }
    return Result<DecodedMessage, DecodeFailure>::Ok(
        DecodedMessage{std::move(response), std::move(doc)});
}

// ---------------------------------------------------------------------------
// SalvageId — find the top-level "id": <string|integer> in unparseable
// bytes. Keys nested inside params or other members are skipped.
// ---------------------------------------------------------------------------
namespace {

// Index of the quote closing the string that opens at `pos`, or npos.
std::size_t StringEnd(std::string_view bytes, std::size_t pos) {
    for (auto i = pos + 1; i < bytes.size(); ++i) {
        if (bytes[i] == '\\') {
            ++i;
        } else if (bytes[i] == '"') {
            return i;
        }
    }
    return std::string_view::npos;
}

std::optional<nlohmann::json> ReadIdValue(std::string_view bytes, std::size_t pos) {
    if (pos >= bytes.size()) return std::nullopt;

    if (bytes[pos] == '"') {
        std::string value;
        for (auto i = pos + 1; i < bytes.size(); ++i) {
            char c = bytes[i];
            if (c == '\\') {
                if (i + 1 >= bytes.size()) return std::nullopt;
                value.push_back(bytes[++i]);
                continue;
            }
            if (c == '"') return nlohmann::json(value);
            value.push_back(c);
        }
        return std::nullopt;
    }

    auto end = pos;
    if (end < bytes.size() && bytes[end] == '-') ++end;
    auto digits_begin = end;
    while (end < bytes.size() &&
           std::isdigit(static_cast<unsigned char>(bytes[end]))) {
        ++end;
    }
    if (end == digits_begin) return std::nullopt;
    // A fraction or exponent makes it a non-integer id.
    if (end < bytes.size() &&
        (bytes[end] == '.' || bytes[end] == 'e' || bytes[end] == 'E')) {
        return std::nullopt;
    }
    try {
        return nlohmann::json(std::stoll(std::string(bytes.substr(pos, end - pos))));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // anonymous namespace

std::optional<nlohmann::json> SalvageId(std::string_view bytes) {
    constexpr std::string_view kKey = "\"id\"";
    int depth = 0;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        const char c = bytes[i];
        if (c == '{' || c == '[') {
            ++depth;
            continue;
        }
        if (c == '}' || c == ']') {
            --depth;
            continue;
        }
        if (c != '"') continue;

        auto end = StringEnd(bytes, i);
        if (end == std::string_view::npos) return std::nullopt;
        if (depth == 1 && bytes.substr(i, end - i + 1) == kKey) {
            auto colon = SkipSpace(bytes, end + 1);
            if (colon < bytes.size() && bytes[colon] == ':') {
                return ReadIdValue(bytes, SkipSpace(bytes, colon + 1));
            }
        }
        i = end;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const Response& response) {
    nlohmann::json out = {
        {"jsonrpc", "2.0"},
        {"id", response.id},
    };
    if (response.error.has_value()) {
        nlohmann::json error = {
            {"code", response.error->code},
            {"message", response.error->message},
        };
        if (!response.error->data.is_null()) {
            error["data"] = response.error->data;
        }
        out["error"] = std::move(error);
    } else {
        out["result"] = response.result.value_or(nullptr);
    }
    return out;
}

std::string Encode(const Response& response) {
    // Error messages may quote raw client bytes; never fail on bad UTF-8.
    return ToJson(response).dump(-1, ' ', false,
                                 nlohmann::json::error_handler_t::replace);
}

Response MakeResultResponse(const nlohmann::json& id, nlohmann::json result) {
    return Response{id, std::move(result), std::nullopt};
}

Response MakeErrorResponse(const nlohmann::json& id, const Error& error) {
    return Response{id, std::nullopt,
                    RpcError{error.RpcCode(), error.message, error.data}};
}

Response MakeErrorResponse(const nlohmann::json& id, int code,
                           const std::string& message, nlohmann::json data) {
    return Response{id, std::nullopt, RpcError{code, message, std::move(data)}};
}

} // namespace cowgnition
