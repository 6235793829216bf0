#pragma once

#include <cowgnition/core/log.hpp>
#include <cowgnition/transport/transport.hpp>

#include <cstddef>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace cowgnition {

constexpr std::size_t kDefaultMaxMessageBytes = 1024 * 1024;

// ---------------------------------------------------------------------------
// StdioTransport — newline-delimited JSON over a pair of streams.
//
// A reader thread pulls lines from `in` into a queue so Read can return
// when its token is cancelled even though getline cannot be interrupted.
// Blank lines are skipped. A line over max_message_bytes is reported as a
// Decode error and reading continues with the next line.
// ---------------------------------------------------------------------------
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(std::istream& in = std::cin,
                            std::ostream& out = std::cout,
                            std::size_t max_message_bytes = kDefaultMaxMessageBytes,
                            std::shared_ptr<Logger> logger = nullptr);
    ~StdioTransport() override;

    [[nodiscard]] Result<std::string, Error> Read(const CancellationToken& token) override;
    [[nodiscard]] Result<void, Error> Write(std::string_view message) override;
    void Close() override;

private:
    struct SharedState;

    void StartReader();

    std::istream& in_;
    std::ostream& out_;
    std::size_t max_message_bytes_;
    std::shared_ptr<Logger> logger_;

    std::shared_ptr<SharedState> state_;
    std::once_flag reader_started_;
    std::thread reader_;
    std::mutex write_mutex_;
};

} // namespace cowgnition
