/**
 * @file test_logger.cpp
 * @brief Unit tests for level/tag filtering and the file sink.
 */

#include <catch2/catch_test_macros.hpp>

#include <playscript/core/logger.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace playscript::core;

namespace {

struct LoggerReset {
    ~LoggerReset() {
        LoggingConfig off;
        off.enabled = false;
        Logger::instance().init(off);
    }
};

} // namespace

TEST_CASE("Logger filters by level", "[core][logger]") {
    LoggerReset reset;

    LoggingConfig cfg;
    cfg.level = LogLevel::Warning;
    Logger::instance().init(cfg);

    auto& log = Logger::instance();
    REQUIRE_FALSE(log.enabled(LogLevel::Debug, "runner"));
    REQUIRE_FALSE(log.enabled(LogLevel::Info, "runner"));
    REQUIRE(log.enabled(LogLevel::Warning, "runner"));
    REQUIRE(log.enabled(LogLevel::Error, "runner"));
    REQUIRE_FALSE(log.enabled(LogLevel::None, "runner"));
}

TEST_CASE("Logger filters by tag", "[core][logger]") {
    LoggerReset reset;

    LoggingConfig cfg;
    cfg.level = LogLevel::Trace;
    cfg.tags.script = false;
    Logger::instance().init(cfg);

    auto& log = Logger::instance();
    REQUIRE_FALSE(log.enabled(LogLevel::Error, "script"));
    REQUIRE(log.enabled(LogLevel::Error, "runner"));
    REQUIRE(log.enabled(LogLevel::Trace, "loop"));

    SECTION("unknown tags pass") {
        REQUIRE(log.enabled(LogLevel::Info, "cli"));
        REQUIRE(log.enabled(LogLevel::Info, nullptr));
    }
}

TEST_CASE("Disabled logger drops everything", "[core][logger]") {
    LoggerReset reset;

    LoggingConfig cfg;
    cfg.enabled = false;
    Logger::instance().init(cfg);

    REQUIRE_FALSE(Logger::instance().enabled(LogLevel::Error, "loop"));
    playscript::core::logf(LogLevel::Error, "loop", "not printed %d", 1);
}

TEST_CASE("Logger appends to the configured file", "[core][logger]") {
    LoggerReset reset;

    const auto path = std::filesystem::temp_directory_path() / "playscript_logger_test.log";
    std::filesystem::remove(path);

    LoggingConfig cfg;
    cfg.level = LogLevel::Debug;
    cfg.file = path.string();
    Logger::instance().init(cfg);

    playscript::core::logf(LogLevel::Info, "runner", "loaded %s in %d ms", "logic.lua", 12);
    playscript::core::logf(LogLevel::Trace, "runner", "filtered out");
    Logger::instance().shutdown();

    std::ifstream in(path);
    REQUIRE(in.is_open());
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    REQUIRE(text.find("[INFO][runner] loaded logic.lua in 12 ms") != std::string::npos);
    REQUIRE(text.find("filtered out") == std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("log_level_name covers every level", "[core][logger]") {
    REQUIRE(std::string(log_level_name(LogLevel::Trace)) == "TRACE");
    REQUIRE(std::string(log_level_name(LogLevel::Warning)) == "WARN");
    REQUIRE(std::string(log_level_name(LogLevel::Error)) == "ERROR");
}
