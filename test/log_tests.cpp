#include <catch2/catch_all.hpp>

#include "jsonstream/log.hpp"

#include <sstream>

using JsonStream::Logger;
using JsonStream::LogLevel;

TEST_CASE("Logger Writes key=value Lines") {
    std::ostringstream out;
    Logger logger{ LogLevel::info, out };

    logger.info("jsonstream.test", "hello \"world\"", { { "path", "$.a[0]" }, { "n", "3" } });

    const std::string line = out.str();
    REQUIRE(line.rfind("ts_utc=", 0) == 0);
    REQUIRE(line.find(" level=INFO logger=\"jsonstream.test\" msg=\"hello \\\"world\\\"\" path=\"$.a[0]\" n=\"3\"\n") != std::string::npos);
    REQUIRE(line.find('Z') != std::string::npos);
}

TEST_CASE("Logger Filters by Level") {
    std::ostringstream out;
    Logger logger{ LogLevel::warn, out };

    logger.debug("t", "dropped");
    logger.info("t", "dropped");
    REQUIRE(out.str().empty());

    logger.warn("t", "kept");
    logger.error("t", "kept too");
    REQUIRE(out.str().find("level=WARN") != std::string::npos);
    REQUIRE(out.str().find("level=ERROR") != std::string::npos);

    REQUIRE(logger.should_log(LogLevel::error));
    REQUIRE_FALSE(logger.should_log(LogLevel::info));
}

TEST_CASE("Log Levels Parse Case-Insensitively") {
    REQUIRE(JsonStream::parse_log_level("DEBUG") == LogLevel::debug);
    REQUIRE(JsonStream::parse_log_level("Info") == LogLevel::info);
    REQUIRE(JsonStream::parse_log_level("warning") == LogLevel::warn);
    REQUIRE(JsonStream::parse_log_level("error") == LogLevel::error);
    REQUIRE_FALSE(JsonStream::parse_log_level("loud"));
}

TEST_CASE("Logger Escapes Newlines in Values") {
    std::ostringstream out;
    Logger logger{ LogLevel::debug, out };
    logger.debug("t", "a\nb");

    const std::string line = out.str();
    REQUIRE(line.find("msg=\"a\\nb\"") != std::string::npos);
    REQUIRE(line.find('\n') == line.size() - 1);
}
