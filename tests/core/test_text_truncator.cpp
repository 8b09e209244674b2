#include <catch2/catch.hpp>

#include "TextTruncator.hpp"
#include "TextWidthEstimator.hpp"
#include "Logger.hpp"

#include <iostream>
#include <limits>
#include <sstream>

using namespace typo;

static double one_per_char(const std::string& s) { return static_cast<double>(s.length()); }

TEST_CASE("Text that fits is returned unchanged", "[TextTruncator]") {
    TruncationResult result = truncate(one_per_char, "hi", 10.0);
    REQUIRE(result.text == "hi");
    REQUIRE(result.kept_chars == 2);
    REQUIRE_FALSE(result.was_truncated);

    // Exact fit
    result = truncate(one_per_char, "hello", 5.0, "...");
    REQUIRE(result.text == "hello");
    REQUIRE(result.kept_chars == 5);
    REQUIRE_FALSE(result.was_truncated);
}

TEST_CASE("Text wider than the target is cut", "[TextTruncator]") {
    TruncationResult result = truncate(one_per_char, "hello world", 5.0);
    REQUIRE(result.text == "hello");
    REQUIRE(result.kept_chars == 5);
    REQUIRE(result.was_truncated);
}

TEST_CASE("Tail reserves room from the kept characters", "[TextTruncator]") {
    TruncationResult result = truncate(one_per_char, "hello world", 5.0, "...");
    REQUIRE(result.text == "he...");
    REQUIRE(result.kept_chars == 2);

    auto [text, count] = truncate_pair(one_per_char, "hello world", 5.0, "...");
    REQUIRE(text == "he...");
    REQUIRE(count == 2);
}

TEST_CASE("Tail longer than the room left clamps at zero", "[TextTruncator]") {
    TruncationResult result = truncate(one_per_char, "hello world", 2.0, "...");
    REQUIRE(result.text == "...");
    REQUIRE(result.kept_chars == 0);
    REQUIRE(result.was_truncated);
}

TEST_CASE("Truncated output is shorter than the input", "[TextTruncator]") {
    std::string text = "The quick brown fox jumps over the lazy dog";
    for (double width : {0.0, 1.0, 7.5, 20.0, 42.0}) {
        TruncationResult result = truncate(one_per_char, text, width);
        REQUIRE(result.was_truncated);
        REQUIRE(result.kept_chars < text.length());
        REQUIRE(result.text.length() == result.kept_chars);
    }
}

TEST_CASE("Full text is measured once", "[TextTruncator]") {
    int calls = 0;
    auto counting = [&calls](const std::string& s) {
        ++calls;
        return static_cast<double>(s.length()) * 3.0;
    };

    truncate(counting, "truncate me please", 12.0, "..");
    REQUIRE(calls == 1);
}

TEST_CASE("Degenerate measurements leave text untruncated", "[TextTruncator]") {
    auto zero = [](const std::string&) { return 0.0; };
    auto nan = [](const std::string&) { return std::numeric_limits<double>::quiet_NaN(); };

    REQUIRE(truncate(zero, "anything", 1.0).text == "anything");
    REQUIRE(truncate(nan, "anything", 1.0).text == "anything");

    TruncationResult empty = truncate(one_per_char, "", 1.0, "...");
    REQUIRE(empty.text.empty());
    REQUIRE(empty.kept_chars == 0);
    REQUIRE_FALSE(empty.was_truncated);
}

TEST_CASE("Truncation with an estimator as measure", "[TextTruncator]") {
    TextWidthEstimator estimator(8.0);

    // 10 chars * 8 = 80 wide, 40 fits half
    TruncationResult result = truncate(estimator.as_measure(), "abcdefghij", 40.0, "~");
    REQUIRE(result.text == "abcd~");
    REQUIRE(result.kept_chars == 4);
}

TEST_CASE("NaN width and zero measurement keep the text", "[TextTruncator]") {
    int calls = 0;
    auto counting = [&calls](const std::string& s) {
        ++calls;
        return static_cast<double>(s.length());
    };

    TruncationResult nan_width = truncate(counting, "abc", std::numeric_limits<double>::quiet_NaN(), "..");
    REQUIRE(nan_width.text == "abc");
    REQUIRE_FALSE(nan_width.was_truncated);
    REQUIRE(calls == 0);

    // Zero width text stays as is even against a negative target
    auto zero = [](const std::string&) { return 0.0; };
    TruncationResult negative = truncate(zero, "abc", -1.0, "..");
    REQUIRE(negative.text == "abc");
    REQUIRE(negative.kept_chars == 3);
    REQUIRE_FALSE(negative.was_truncated);
}

TEST_CASE("Truncation logs only at trace level", "[TextTruncator]") {
    std::ostringstream console;
    Logger::clearFacilityLevels();
    Logger::setDefaultLevel(LogLevel::INFO);
    Logger::setConsoleStream(console);

    truncate(one_per_char, "hello world", 5.0, "...");
    REQUIRE(console.str().empty());

    Logger::setFacilityLevel("TextTruncator", LogLevel::TRACE);
    truncate(one_per_char, "hello world", 5.0, "...");
    REQUIRE(console.str().find("TextTruncator: Truncated 'hello world' from 11 to 2 characters") != std::string::npos);

    Logger::clearFacilityLevels();
    Logger::setConsoleStream(std::clog);
}
