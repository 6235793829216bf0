#pragma once

namespace cowgnition {
namespace jsonrpc {

// Standard JSON-RPC 2.0 codes.
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;

// Server-defined codes (-32000 to -32099).
constexpr int kResourceNotFound = -32000;
constexpr int kToolNotFound     = -32001;
constexpr int kInvalidArguments = -32002;
constexpr int kRequestTimeout   = -32005;

// Request cancelled by the client.
constexpr int kRequestCancelled = -32800;

} // namespace jsonrpc
} // namespace cowgnition
