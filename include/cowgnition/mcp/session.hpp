#pragma once

#include <cowgnition/mcp/state_machine.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace cowgnition {

// ---------------------------------------------------------------------------
// ISession — the view of one connection that handlers may use.
// ---------------------------------------------------------------------------
class ISession {
public:
    virtual ~ISession() = default;

    ISession(const ISession&) = delete;
    ISession& operator=(const ISession&) = delete;
    ISession(ISession&&) = delete;
    ISession& operator=(ISession&&) = delete;

    [[nodiscard]] virtual ProtocolState CurrentState() const = 0;

    /// Cancel the in-flight request with this id. Returns false when no
    /// such request is running.
    virtual bool CancelRequest(const nlohmann::json& id) = 0;

    /// Record what the client announced in initialize.
    virtual void SetClientInfo(const nlohmann::json& client_info,
                               const nlohmann::json& capabilities,
                               const std::string& protocol_version) = 0;

    [[nodiscard]] virtual nlohmann::json ClientInfo() const = 0;

    [[nodiscard]] virtual std::string ProtocolVersion() const = 0;

protected:
    ISession() = default;
};

} // namespace cowgnition
