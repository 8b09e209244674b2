#include <catch2/catch.hpp>

#include "TextWidthEstimator.hpp"

#include <cmath>
#include <limits>

using namespace typo;

static double two_per_char(const std::string& s) { return static_cast<double>(s.length()) * 2.0; }

TEST_CASE("Estimate uses the weighted average of sample widths", "[TextWidthEstimator]") {
    TextWidthEstimator estimator = TextWidthEstimator::build(two_per_char, {"a", "bb"}, {0.5, 0.5});

    // measured = [2, 4], avg = 0.5*2 + 0.5*4
    REQUIRE(estimator.average_width() == Approx(3.0));
    REQUIRE(estimator.estimate("xyz") == Approx(9.0));
    REQUIRE(estimator("xyz") == Approx(9.0));
    REQUIRE(estimator.estimate("") == 0.0);
}

TEST_CASE("Estimate is linear in string length", "[TextWidthEstimator]") {
    TextWidthEstimator estimator = TextWidthEstimator::build(two_per_char);

    std::string s = "label";
    REQUIRE(estimator.estimate(s + s) == Approx(2.0 * estimator.estimate(s)));
}

TEST_CASE("Default calibration samples and weights", "[TextWidthEstimator]") {
    REQUIRE(TextWidthEstimator::default_samples() == std::vector<std::string>{"M", "n", "."});
    REQUIRE(TextWidthEstimator::default_distribution() == std::vector<double>{0.06, 0.8, 0.14});

    // Every default sample is one character, weights sum to 1
    TextWidthEstimator estimator = TextWidthEstimator::build(two_per_char);
    REQUIRE(estimator.average_width() == Approx(2.0));
}

TEST_CASE("Measure is called once per sample during calibration only", "[TextWidthEstimator]") {
    int calls = 0;
    auto counting = [&calls](const std::string& s) {
        ++calls;
        return static_cast<double>(s.length());
    };

    TextWidthEstimator estimator = TextWidthEstimator::build(counting);
    REQUIRE(calls == 3);

    estimator.estimate("hello");
    estimator.estimate("world");
    REQUIRE(calls == 3);
}

TEST_CASE("Weights are not normalized", "[TextWidthEstimator]") {
    TextWidthEstimator estimator = TextWidthEstimator::build(two_per_char, {"a", "b"}, {1.0, 1.0});
    REQUIRE(estimator.average_width() == Approx(4.0));
}

TEST_CASE("Invalid calibration input throws", "[TextWidthEstimator]") {
    SECTION("length mismatch") {
        try {
            TextWidthEstimator::build(two_per_char, {"a", "b", "c"}, {0.5, 0.5});
            FAIL("expected TypographyError");
        } catch (const TypographyError& e) {
            REQUIRE(e.kind() == SizingFailure::LENGTH_MISMATCH);
        }
    }

    SECTION("empty samples") {
        try {
            TextWidthEstimator::build(two_per_char, {}, {});
            FAIL("expected TypographyError");
        } catch (const TypographyError& e) {
            REQUIRE(e.kind() == SizingFailure::EMPTY_SAMPLES);
        }
    }

    SECTION("non-finite weight") {
        try {
            TextWidthEstimator::build(two_per_char, {"a"}, {std::numeric_limits<double>::quiet_NaN()});
            FAIL("expected TypographyError");
        } catch (const TypographyError& e) {
            REQUIRE(e.kind() == SizingFailure::NON_FINITE);
        }
    }

    SECTION("non-finite measurement") {
        auto broken = [](const std::string&) { return std::numeric_limits<double>::infinity(); };
        REQUIRE_THROWS_AS(TextWidthEstimator::build(broken), TypographyError);
    }
}

TEST_CASE("Estimator adapts to a measure function", "[TextWidthEstimator]") {
    TextWidthEstimator estimator(1.5);
    MeasureFunction measure = estimator.as_measure();

    REQUIRE(measure("abcd") == Approx(6.0));

    // Calibrating against an estimator reproduces its average width
    TextWidthEstimator again = TextWidthEstimator::build(measure);
    REQUIRE(again.average_width() == Approx(1.5));
}
