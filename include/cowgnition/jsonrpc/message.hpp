#pragma once

#include <cowgnition/core/result.hpp>
#include <cowgnition/jsonrpc/error_codes.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace cowgnition {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 envelope types.
//
// Ids are kept as JSON values (string or integer) so they echo back exactly
// as the client sent them.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = jsonrpc::kInternalError;
    std::string message;
    nlohmann::json data;  // null when absent

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message &&
               data == other.data;
    }
    bool operator!=(const RpcError& other) const { return !(*this == other); }
};

struct Request {
    nlohmann::json id;
    std::string method;
    nlohmann::json params;  // null when absent
};

struct Notification {
    std::string method;
    nlohmann::json params;  // null when absent
};

// Exactly one of result / error is set.
struct Response {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    [[nodiscard]] bool IsError() const { return error.has_value(); }

    bool operator==(const Response& other) const {
        return id == other.id && result == other.result &&
               error == other.error;
    }
    bool operator!=(const Response& other) const { return !(*this == other); }
};

using Message = std::variant<Request, Notification, Response>;

enum class MessageKind {
    Request,
    Notification,
    Response,
};

[[nodiscard]] MessageKind KindOf(const Message& message);
[[nodiscard]] const char* ToString(MessageKind kind);

// A decoded message together with the parsed document it came from, which
// is what the schema validator checks.
struct DecodedMessage {
    Message message;
    nlohmann::json document;
};

// Why a message could not be decoded. error.category is Decode for bytes
// that are not JSON and InvalidRequest for JSON that is not a valid
// envelope. When id_recovered is false no response can be addressed and
// the message is dropped.
struct DecodeFailure {
    Error error;
    nlohmann::json id;
    bool id_recovered = false;
};

// ---------------------------------------------------------------------------
// Codec
// ---------------------------------------------------------------------------

/// Decode one JSON-RPC message. Batch arrays are rejected.
[[nodiscard]] Result<DecodedMessage, DecodeFailure> Decode(std::string_view bytes);

/// Best-effort scan for the top-level "id" member in bytes that failed to
/// parse. An "id" nested in params or any other member is never returned.
[[nodiscard]] std::optional<nlohmann::json> SalvageId(std::string_view bytes);

[[nodiscard]] nlohmann::json ToJson(const Response& response);
[[nodiscard]] std::string Encode(const Response& response);

[[nodiscard]] Response MakeResultResponse(const nlohmann::json& id,
                                          nlohmann::json result);
[[nodiscard]] Response MakeErrorResponse(const nlohmann::json& id,
                                         const Error& error);
[[nodiscard]] Response MakeErrorResponse(const nlohmann::json& id, int code,
                                         const std::string& message,
                                         nlohmann::json data = nullptr);

/// True for ids a request may carry: strings and integers.
[[nodiscard]] bool IsValidRequestId(const nlohmann::json& id);

} // namespace cowgnition
