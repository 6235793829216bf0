#pragma once

#include <cowgnition/mcp/session.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cowgnition {
namespace testing {

// ---------------------------------------------------------------------------
// MockSession — hand-written ISession that records what handlers do.
// ---------------------------------------------------------------------------
class MockSession : public ISession {
public:
    MockSession() = default;

    void SetState(ProtocolState state) { state_ = state; }
    void SetInFlight(std::vector<nlohmann::json> ids) { in_flight_ = std::move(ids); }

    [[nodiscard]] const std::vector<nlohmann::json>& CancelCalls() const noexcept {
        return cancel_calls_;
    }
    [[nodiscard]] const nlohmann::json& Capabilities() const noexcept {
        return capabilities_;
    }

    ProtocolState CurrentState() const override { return state_; }

    bool CancelRequest(const nlohmann::json& id) override {
        cancel_calls_.push_back(id);
        for (const auto& candidate : in_flight_) {
            if (candidate == id) return true;
        }
        return false;
    }

    void SetClientInfo(const nlohmann::json& client_info,
                       const nlohmann::json& capabilities,
                       const std::string& protocol_version) override {
        client_info_ = client_info;
        capabilities_ = capabilities;
        protocol_version_ = protocol_version;
    }

    nlohmann::json ClientInfo() const override { return client_info_; }
    std::string ProtocolVersion() const override { return protocol_version_; }

private:
    ProtocolState state_ = ProtocolState::Uninitialized;
    std::vector<nlohmann::json> in_flight_;
    std::vector<nlohmann::json> cancel_calls_;
    nlohmann::json client_info_;
    nlohmann::json capabilities_;
    std::string protocol_version_;
};

} // namespace testing
} // namespace cowgnition
