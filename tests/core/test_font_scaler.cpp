#include <catch2/catch.hpp>

#include "FontScaler.hpp"

#include <cmath>
#include <limits>

using namespace typo;

TEST_CASE("Box scaler follows the reference height", "[FontScaler]") {
    BoxFontScaler scaler = FontScaler::to_box(BoundingBox(0, 0, 100, 20));

    REQUIRE(scaler.reference_dimension() == Approx(20.0));
    REQUIRE(scaler.base_size() == Approx(20.0));
    REQUIRE(scaler.by_height());

    SizingResult same = scaler.apply(BoundingBox(0, 0, 300, 20));
    REQUIRE(same.ok());
    REQUIRE(same.value == Approx(20.0));

    SizingResult doubled = scaler.apply(BoundingBox(10, 10, 110, 50));
    REQUIRE(doubled.ok());
    REQUIRE(doubled.value == Approx(40.0));
}

TEST_CASE("Doubling the box doubles the font size", "[FontScaler]") {
    BoxFontScaler scaler = FontScaler::to_box(BoundingBox(0, 0, 37, 13), 1.0);

    for (double h : {1.0, 6.5, 13.0, 100.0}) {
        SizingResult single = scaler(BoundingBox(0, 0, 1, h));
        SizingResult twice = scaler(BoundingBox(0, 0, 1, 2 * h));
        REQUIRE(single.ok());
        REQUIRE(twice.ok());
        REQUIRE(twice.value == Approx(2.0 * single.value));
    }
}

TEST_CASE("Box scaler ratio and width tracking", "[FontScaler]") {
    BoxFontScaler by_width = FontScaler::to_box(BoundingBox(0, 0, 200, 40), 0.5, false);
    REQUIRE_FALSE(by_width.by_height());
    REQUIRE(by_width.base_size() == Approx(100.0));

    SizingResult result = by_width.apply(BoundingBox(0, 0, 300, 10));
    REQUIRE(result.ok());
    REQUIRE(result.value == Approx(150.0));
}

TEST_CASE("Box scaler built from points", "[FontScaler]") {
    std::vector<Point2D> reference = {{0, 0}, {50, 10}, {20, 30}};
    BoxFontScaler scaler = FontScaler::to_box(reference);
    REQUIRE(scaler.reference_dimension() == Approx(30.0));

    std::vector<Point2D> bigger = {{5, -15}, {5, 45}};
    SizingResult result = scaler.apply(bigger);
    REQUIRE(result.ok());
    REQUIRE(result.value == Approx(60.0));
}

TEST_CASE("Zero-extent reference box fails instead of dividing by zero", "[FontScaler]") {
    // All points on one horizontal line
    std::vector<Point2D> flat = {{0, 5}, {10, 5}, {20, 5}};
    BoxFontScaler scaler = FontScaler::to_box(flat);
    REQUIRE_FALSE(scaler.is_valid());

    SizingResult result = scaler.apply(BoundingBox(0, 0, 10, 10));
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.failure == SizingFailure::ZERO_EXTENT);
    REQUIRE(std::isnan(result.value));
    REQUIRE_FALSE(result.explanation.empty());

    // Still usable by width
    BoxFontScaler by_width = FontScaler::to_box(flat, 1.0, false);
    REQUIRE(by_width.is_valid());
    REQUIRE(by_width.apply(BoundingBox(0, 0, 40, 0)).value == Approx(40.0));
}

TEST_CASE("Threshold scaler without direction scales freely", "[FontScaler]") {
    ThresholdFontScaler scaler = FontScaler::to_threshold(100.0);
    REQUIRE(scaler.direction() == 0);

    REQUIRE(scaler.apply(12.0, 50.0).value == Approx(6.0));
    REQUIRE(scaler.apply(12.0, 200.0).value == Approx(24.0));
    REQUIRE(scaler.apply(12.0, -50.0).value == Approx(-6.0));
    REQUIRE(scaler.apply(12.0, 100.0).value == Approx(12.0));
}

TEST_CASE("Negative direction only shrinks", "[FontScaler]") {
    ThresholdFontScaler scaler = FontScaler::to_threshold(100.0, -1);

    for (double value : {-300.0, -1.0, 0.0, 25.0, 99.0, 100.0, 101.0, 1000.0}) {
        SizingResult result = scaler(16.0, value);
        REQUIRE(result.ok());
        REQUIRE(result.value <= 16.0);
    }
    REQUIRE(scaler.apply(16.0, 50.0).value == Approx(8.0));
    REQUIRE(scaler.apply(16.0, 500.0).value == Approx(16.0));
}

TEST_CASE("Positive direction only grows", "[FontScaler]") {
    ThresholdFontScaler scaler = FontScaler::to_threshold(100.0, 3);

    for (double value : {-300.0, -1.0, 0.0, 25.0, 99.0, 100.0, 101.0, 1000.0}) {
        SizingResult result = scaler(16.0, value);
        REQUIRE(result.ok());
        REQUIRE(result.value >= 16.0);
    }
    REQUIRE(scaler.apply(16.0, 50.0).value == Approx(16.0));
    REQUIRE(scaler.apply(16.0, 150.0).value == Approx(24.0));
}

TEST_CASE("Zero threshold fails instead of dividing by zero", "[FontScaler]") {
    ThresholdFontScaler scaler = FontScaler::to_threshold(0.0);

    SizingResult result = scaler.apply(16.0, 10.0);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.failure == SizingFailure::ZERO_THRESHOLD);

    ThresholdFontScaler nan_scaler = FontScaler::to_threshold(std::numeric_limits<double>::quiet_NaN());
    REQUIRE(nan_scaler.apply(16.0, 10.0).failure == SizingFailure::ZERO_THRESHOLD);
}

TEST_CASE("Non-finite threshold input is reported", "[FontScaler]") {
    ThresholdFontScaler scaler = FontScaler::to_threshold(10.0, 1);
    SizingResult result = scaler.apply(16.0, std::numeric_limits<double>::infinity());
    REQUIRE(result.failure == SizingFailure::NON_FINITE);
}

TEST_CASE("Fractional directions clamp by sign", "[FontScaler]") {
    ThresholdFontScaler shrink = FontScaler::to_threshold(100.0, -0.5);
    REQUIRE(shrink.direction() == -0.5);
    REQUIRE(shrink.apply(16.0, 200.0).value == Approx(16.0));
    REQUIRE(shrink.apply(16.0, 50.0).value == Approx(8.0));

    ThresholdFontScaler grow = FontScaler::to_threshold(100.0, 0.25);
    REQUIRE(grow.direction() == 0.25);
    REQUIRE(grow.apply(16.0, 50.0).value == Approx(16.0));
    REQUIRE(grow.apply(16.0, 200.0).value == Approx(32.0));
}

TEST_CASE("Infinite reference box or ratio is reported as non-finite", "[FontScaler]") {
    const double inf = std::numeric_limits<double>::infinity();

    BoxFontScaler tall = FontScaler::to_box(BoundingBox(0, 0, 10, inf));
    REQUIRE_FALSE(tall.is_valid());
    REQUIRE(tall.apply(BoundingBox(0, 0, 10, 10)).failure == SizingFailure::NON_FINITE);

    BoxFontScaler huge_ratio = FontScaler::to_box(BoundingBox(0, 0, 10, 10), inf);
    REQUIRE(huge_ratio.apply(BoundingBox(0, 0, 10, 20)).failure == SizingFailure::NON_FINITE);

    BoxFontScaler flat = FontScaler::to_box(BoundingBox(0, 0, 10, 0));
    REQUIRE(flat.apply(BoundingBox(0, 0, 10, 20)).failure == SizingFailure::ZERO_EXTENT);
}
