#include <catch2/catch.hpp>

#include "typography.hpp"

using namespace typo;

TEST_CASE("Bounding box of points", "[Geometry]") {
    std::vector<Point2D> points = {{3, -1}, {-2, 4}, {0, 0}};
    BoundingBox box = BoundingBox::from_points(points);

    REQUIRE(box.min_x == -2.0);
    REQUIRE(box.min_y == -1.0);
    REQUIRE(box.max_x == 3.0);
    REQUIRE(box.max_y == 4.0);
    REQUIRE(box.width() == 5.0);
    REQUIRE(box.height() == 5.0);
}

TEST_CASE("Degenerate point sets", "[Geometry]") {
    BoundingBox empty = BoundingBox::from_points({});
    REQUIRE(empty.width() == 0.0);
    REQUIRE(empty.height() == 0.0);

    BoundingBox single = BoundingBox::from_points({Point2D(7, 8)});
    REQUIRE(single.min_x == 7.0);
    REQUIRE(single.max_y == 8.0);
    REQUIRE(single.width() == 0.0);

    BoundingBox vertical = BoundingBox::from_points({{1, 0}, {1, 9}});
    REQUIRE(vertical.width() == 0.0);
    REQUIRE(vertical.height() == 9.0);
}

TEST_CASE("Sizing results", "[Geometry]") {
    SizingResult good = SizingResult::success(12.5);
    REQUIRE(good.ok());
    REQUIRE(good.value == 12.5);

    SizingResult bad = SizingResult::fail(SizingFailure::ZERO_EXTENT, "flat");
    REQUIRE_FALSE(bad.ok());
    REQUIRE(bad.explanation == "flat");

    REQUIRE(to_string(SizingFailure::NONE) == "none");
    REQUIRE(to_string(SizingFailure::ZERO_THRESHOLD) == "zero threshold");
    REQUIRE(to_string(SizingFailure::NON_FINITE) == "non-finite value");
}
