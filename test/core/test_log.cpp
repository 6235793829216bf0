#include <catch2/catch_test_macros.hpp>

#include <cowgnition/core/log.hpp>

#include "../../test/mocks/capture_sink.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cowgnition;
using cowgnition::testing::CaptureSink;
using cowgnition::testing::MakeCaptureLogger;

namespace {

std::string TempLogPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

std::string ReadAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // anonymous namespace

// ===========================================================================
// Level names
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts names case-insensitively", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("Warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
    CHECK_FALSE(ParseLogLevel("").has_value());
}

TEST_CASE("LogLevelName: upper-case names", "[log]") {
    CHECK(std::string(LogLevelName(LogLevel::Debug)) == "DEBUG");
    CHECK(std::string(LogLevelName(LogLevel::Error)) == "ERROR");
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one parseable object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "router", "dispatching tools/call");
    sink.Write(LogLevel::Warn, "schema", "override unreachable");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);

    std::istringstream lines(output);
    std::string line;
    std::getline(lines, line);
    auto first = nlohmann::json::parse(line);
    CHECK(first["level"] == "INFO");
    CHECK(first["component"] == "router");
    CHECK(first["message"] == "dispatching tools/call");
    CHECK(first.contains("ts"));

    std::getline(lines, line);
    CHECK(nlohmann::json::parse(line)["level"] == "WARN");
}

TEST_CASE("JsonSink: escapes quotes and control characters", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "decode", "bad \"frame\"\n\ttab");

    auto j = nlohmann::json::parse(oss.str());
    CHECK(j["message"] == "bad \"frame\"\n\ttab");
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "session", "state Initializing -> Ready");

    auto out = oss.str();
    CHECK(out.find('\033') == std::string::npos);
    CHECK(out.find("[INFO] [session] state Initializing -> Ready") != std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode emits ANSI sequences", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "transport", "write failed");

    auto out = oss.str();
    CHECK(out.find("\033[") != std::string::npos);
    CHECK(out.find("write failed") != std::string::npos);
    CHECK(out.back() == '\n');
}

// ===========================================================================
// FileSink
// ===========================================================================

TEST_CASE("FileSink: appends plain lines", "[log]") {
    auto path = TempLogPath("cowgnition_test_plain.log");
    std::remove(path.c_str());
    {
        FileSink sink(path, false);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "main", "first");
        sink.Write(LogLevel::Info, "main", "second");
    }
    auto text = ReadAll(path);
    CHECK(text.find("[main] first") != std::string::npos);
    CHECK(text.find("[main] second") != std::string::npos);
    std::remove(path.c_str());
}

TEST_CASE("FileSink: JSON format", "[log]") {
    auto path = TempLogPath("cowgnition_test_json.log");
    std::remove(path.c_str());
    {
        FileSink sink(path, true);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Debug, "main", "hello");
    }
    auto j = nlohmann::json::parse(ReadAll(path));
    CHECK(j["message"] == "hello");
    std::remove(path.c_str());
}

TEST_CASE("FileSink: unopenable path reports not open", "[log]") {
    FileSink sink("/nonexistent-dir/cowgnition/x.log", false);
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Error, "main", "dropped");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below the minimum level", "[log]") {
    auto store = std::make_shared<CaptureSink::Store>();
    Logger logger(std::make_unique<CaptureSink>(store), LogLevel::Warn);

    logger.Debug("c", "debug");
    logger.Info("c", "info");
    logger.Warn("c", "warn");
    logger.Error("c", "error");

    auto messages = store->Snapshot();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].level == LogLevel::Warn);
    CHECK(messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel takes effect immediately", "[log]") {
    auto store = std::make_shared<CaptureSink::Store>();
    Logger logger(std::make_unique<CaptureSink>(store), LogLevel::Error);

    logger.Info("c", "hidden");
    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Level() == LogLevel::Debug);
    logger.Debug("c", "visible");

    auto messages = store->Snapshot();
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].message == "visible");
}

TEST_CASE("Logger: concurrent writers do not lose messages", "[log]") {
    auto store = std::make_shared<CaptureSink::Store>();
    auto logger = MakeCaptureLogger(store);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([logger, t] {
            for (int i = 0; i < 50; ++i) {
                logger->Info("worker", "thread " + std::to_string(t));
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(store->Snapshot().size() == 200);
}

TEST_CASE("MakeNullLogger: accepts every level", "[log]") {
    auto logger = MakeNullLogger();
    REQUIRE(logger != nullptr);
    logger->Debug("c", "x");
    logger->Error("c", "y");
}

TEST_CASE("JsonSink: invalid UTF-8 in a message is replaced, not thrown", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Warn, "connection", std::string("raw \xff\xfe bytes"));

    auto j = nlohmann::json::parse(oss.str());
    CHECK(j["component"] == "connection");
    CHECK(j["message"].get<std::string>().find("raw ") == 0);
}
