#pragma once

#include <cowgnition/core/cancellation.hpp>
#include <cowgnition/core/result.hpp>

#include <string>
#include <string_view>

namespace cowgnition {

// ---------------------------------------------------------------------------
// ITransport — a duplex stream of framed JSON-RPC messages.
//
// Read blocks until one message arrives. It fails with EndOfStream when the
// peer closed cleanly, Cancelled when `token` fires, and Transport on an
// I/O failure. Decode errors in a frame are left to the caller.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Read(
        const CancellationToken& token) = 0;

    [[nodiscard]] virtual Result<void, Error> Write(std::string_view message) = 0;

    virtual void Close() = 0;

protected:
    ITransport() = default;
};

} // namespace cowgnition
