#include <catch2/catch.hpp>

#include "Logger.hpp"

#include <sstream>

using namespace typo;

namespace {

// Restores global logging state after each test
struct LoggerFixture {
    std::ostringstream console;

    LoggerFixture() {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
        Logger::setConsoleStream(console);
    }

    ~LoggerFixture() {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
        Logger::setConsoleStream(std::clog);
    }
};

} // namespace

TEST_CASE_METHOD(LoggerFixture, "Messages are filtered by the default level", "[Logger]") {
    Logger logger("Widget");

    logger.info("shown");
    logger.debug("hidden");
    logger.flush();

    REQUIRE(console.str().find("INFO  Widget: shown") != std::string::npos);
    REQUIRE(console.str().find("hidden") == std::string::npos);
}

TEST_CASE_METHOD(LoggerFixture, "Facility levels override the default", "[Logger]") {
    Logger::parseLogConfig("2,Widget=6");

    REQUIRE(Logger::getFacilityLevel("Widget") == LogLevel::TRACE);
    REQUIRE(Logger::getFacilityLevel("Other") == LogLevel::WARNING);

    Logger widget("Widget");
    Logger other("Other");
    REQUIRE(widget.shouldOutput(LogLevel::TRACE));
    REQUIRE_FALSE(other.shouldOutput(LogLevel::INFO));
    REQUIRE(other.shouldOutput(LogLevel::WARNING));
}

TEST_CASE_METHOD(LoggerFixture, "Log configuration parsing", "[Logger]") {
    Logger::parseLogConfig("default=5, Gadget = 1");
    REQUIRE(Logger::getFacilityLevel("anything") == LogLevel::DEBUG);
    REQUIRE(Logger::getFacilityLevel("Gadget") == LogLevel::ERROR);

    // Out of range levels are clamped
    Logger::parseLogConfig("Gadget=42");
    REQUIRE(Logger::getFacilityLevel("Gadget") == LogLevel::TRACE);

    // Malformed entries are skipped
    Logger::parseLogConfig("Gadget=loud,3");
    REQUIRE(Logger::getFacilityLevel("Gadget") == LogLevel::TRACE);
    REQUIRE(Logger::getFacilityLevel("anything") == LogLevel::INFO);
}

TEST_CASE_METHOD(LoggerFixture, "Repeated messages are collapsed", "[Logger]") {
    Logger logger("Repeater");

    logger.warning("same");
    logger.warning("same");
    logger.warning("same");
    logger.warning("different");
    logger.flush();

    std::string out = console.str();
    REQUIRE(out.find("occurred 3 times") != std::string::npos);
    REQUIRE(out.find("different") != std::string::npos);
}

TEST_CASE_METHOD(LoggerFixture, "Instance level applies when no facility level is set", "[Logger]") {
    Logger logger(LogLevel::ERROR);
    REQUIRE(logger.getLogLevel() == LogLevel::ERROR);
    REQUIRE_FALSE(logger.shouldOutput(LogLevel::WARNING));

    logger.setLogLevel(LogLevel::DEBUG);
    REQUIRE(logger.shouldOutput(LogLevel::DEBUG));
}
