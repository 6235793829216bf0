#include <catch2/catch_test_macros.hpp>

#include <cowgnition/transport/stdio_transport.hpp>

#include "../../test/mocks/capture_sink.hpp"

#include <condition_variable>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <string>

using namespace cowgnition;
using cowgnition::testing::CaptureSink;
using cowgnition::testing::MakeCaptureLogger;

namespace {

// A stream buffer that blocks reads until released, then reports EOF.
class BlockingBuf : public std::streambuf {
public:
    void Release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

protected:
    int_type underflow() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return released_; });
        return traits_type::eof();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
};

std::string ReadOk(StdioTransport& transport) {
    auto r = transport.Read(CancellationToken{});
    REQUIRE(r.IsOk());
    return r.Value();
}

} // anonymous namespace

// ===========================================================================
// Reading
// ===========================================================================

TEST_CASE("StdioTransport: reads one message per line", "[transport][stdio]") {
    std::istringstream in("{\"a\":1}\n{\"b\":2}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    CHECK(ReadOk(transport) == "{\"a\":1}");
    CHECK(ReadOk(transport) == "{\"b\":2}");

    auto end = transport.Read(CancellationToken{});
    REQUIRE(end.IsErr());
    CHECK(end.Error().category == ErrorCategory::EndOfStream);
}

TEST_CASE("StdioTransport: strips carriage returns and skips blank lines", "[transport][stdio]") {
    std::istringstream in("\r\n   \n{\"x\":true}\r\n\n\t\n{\"y\":false}");
    std::ostringstream out;
    StdioTransport transport(in, out);

    CHECK(ReadOk(transport) == "{\"x\":true}");
    CHECK(ReadOk(transport) == "{\"y\":false}");
    CHECK(transport.Read(CancellationToken{}).Error().category == ErrorCategory::EndOfStream);
}

TEST_CASE("StdioTransport: oversized line is a Decode error and reading continues",
          "[transport][stdio]") {
    auto store = std::make_shared<CaptureSink::Store>();
    std::istringstream in(std::string(64, 'x') + "\n{\"ok\":1}\n");
    std::ostringstream out;
    StdioTransport transport(in, out, 16, MakeCaptureLogger(store));

    auto big = transport.Read(CancellationToken{});
    REQUIRE(big.IsErr());
    CHECK(big.Error().category == ErrorCategory::Decode);
    CHECK(big.Error().message == "Message of 64 bytes exceeds the 16 byte limit");
    CHECK(store->Contains("Discarding message of 64 bytes"));

    CHECK(ReadOk(transport) == "{\"ok\":1}");
}

TEST_CASE("StdioTransport: line exactly at the limit is accepted", "[transport][stdio]") {
    std::istringstream in(std::string(16, 'y') + "\n");
    std::ostringstream out;
    StdioTransport transport(in, out, 16);
    CHECK(ReadOk(transport) == std::string(16, 'y'));
}

TEST_CASE("StdioTransport: empty input is end of stream", "[transport][stdio]") {
    std::istringstream in("");
    std::ostringstream out;
    StdioTransport transport(in, out);
    CHECK(transport.Read(CancellationToken{}).Error().category == ErrorCategory::EndOfStream);
}

TEST_CASE("StdioTransport: cancelled token unblocks a pending read", "[transport][stdio]") {
    BlockingBuf buf;
    std::istream in(&buf);
    std::ostringstream out;
    {
        StdioTransport transport(in, out);
        CancellationSource source;
        source.Cancel();

        auto r = transport.Read(source.Token());
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Cancelled);
        buf.Release();
    }
}

TEST_CASE("StdioTransport: Close ends reading", "[transport][stdio]") {
    BlockingBuf buf;
    std::istream in(&buf);
    std::ostringstream out;
    {
        StdioTransport transport(in, out);
        transport.Close();
        CHECK(transport.Read(CancellationToken{}).Error().category ==
              ErrorCategory::EndOfStream);
        buf.Release();
    }
}

// ===========================================================================
// Writing
// ===========================================================================

TEST_CASE("StdioTransport: Write appends a newline", "[transport][stdio]") {
    std::istringstream in("");
    std::ostringstream out;
    StdioTransport transport(in, out);

    REQUIRE(transport.Write(R"({"jsonrpc":"2.0","id":1,"result":{}})").IsOk());
    REQUIRE(transport.Write(R"({"jsonrpc":"2.0","id":2,"result":{}})").IsOk());
    CHECK(out.str() ==
          "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n"
          "{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{}}\n");
}

TEST_CASE("StdioTransport: failed output stream is a Transport error", "[transport][stdio]") {
    std::istringstream in("");
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StdioTransport transport(in, out);

    auto r = transport.Write("{}");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Transport);
    CHECK(r.Error().ExitCode() == 4);
}
