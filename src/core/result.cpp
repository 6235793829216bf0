#include <cowgnition/core/result.hpp>

#include <cowgnition/jsonrpc/error_codes.hpp>

#include <sstream>

namespace cowgnition {

Error Error::WithRpcCode(const std::string& operation, int code,
                         const std::string& message, nlohmann::json data) {
    ErrorCategory category = ErrorCategory::Handler;
    switch (code) {
        case jsonrpc::kInvalidParams:  category = ErrorCategory::InvalidParams; break;
        case jsonrpc::kMethodNotFound: category = ErrorCategory::MethodNotFound; break;
        case jsonrpc::kInvalidRequest: category = ErrorCategory::InvalidRequest; break;
        case jsonrpc::kRequestTimeout: category = ErrorCategory::Timeout; break;
        default: break;
    }
    return Error{operation, message, category, code, std::move(data)};
}

int Error::RpcCode() const {
    if (rpc_code.has_value()) {
        return *rpc_code;
    }
    switch (category) {
        case ErrorCategory::Decode:           return jsonrpc::kParseError;
        case ErrorCategory::InvalidRequest:   return jsonrpc::kInvalidRequest;
        case ErrorCategory::StateViolation:   return jsonrpc::kInvalidRequest;
        case ErrorCategory::SchemaValidation: return jsonrpc::kInvalidRequest;
        case ErrorCategory::MethodNotFound:   return jsonrpc::kMethodNotFound;
        case ErrorCategory::InvalidParams:    return jsonrpc::kInvalidParams;
        case ErrorCategory::Timeout:          return jsonrpc::kRequestTimeout;
        case ErrorCategory::Cancelled:        return jsonrpc::kRequestCancelled;
        default:                              return jsonrpc::kInternalError;
    }
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:     return 2;
        case ErrorCategory::SchemaLoad: return 3;
        case ErrorCategory::Transport:  return 4;
        default:                        return 1;
    }
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Transport:        return "transport";
        case ErrorCategory::EndOfStream:      return "end_of_stream";
        case ErrorCategory::Cancelled:        return "cancelled";
        case ErrorCategory::Decode:           return "decode";
        case ErrorCategory::InvalidRequest:   return "invalid_request";
        case ErrorCategory::SchemaValidation: return "schema_validation";
        case ErrorCategory::StateViolation:   return "state_violation";
        case ErrorCategory::MethodNotFound:   return "method_not_found";
        case ErrorCategory::InvalidParams:    return "invalid_params";
        case ErrorCategory::Handler:          return "handler";
        case ErrorCategory::Timeout:          return "timeout";
        case ErrorCategory::Config:           return "config";
        case ErrorCategory::SchemaLoad:       return "schema_load";
        case ErrorCategory::Internal:         return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (rpc_code.has_value()) {
        oss << " (code " << *rpc_code << ")";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"code", RpcCode()},
        {"exit_code", ExitCode()},
    };
    if (!data.is_null()) {
        body["data"] = data;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace cowgnition
