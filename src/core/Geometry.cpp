/**
 * @file Geometry.cpp
 * @brief Bounding box construction and failure names
 */

#include "typography.hpp"
#include <algorithm>

namespace typo {

BoundingBox BoundingBox::from_points(const std::vector<Point2D>& points) {
    if (points.empty()) {
        return BoundingBox();
    }

    BoundingBox bbox(points.front().x(), points.front().y(),
                     points.front().x(), points.front().y());

    for (const auto& point : points) {
        bbox.min_x = std::min(bbox.min_x, point.x());
        bbox.min_y = std::min(bbox.min_y, point.y());
        bbox.max_x = std::max(bbox.max_x, point.x());
        bbox.max_y = std::max(bbox.max_y, point.y());
    }

    return bbox;
}

std::string to_string(SizingFailure failure) {
    switch (failure) {
        case SizingFailure::NONE:            return "none";
        case SizingFailure::ZERO_EXTENT:     return "zero extent";
        case SizingFailure::ZERO_THRESHOLD:  return "zero threshold";
        case SizingFailure::LENGTH_MISMATCH: return "length mismatch";
        case SizingFailure::EMPTY_SAMPLES:   return "empty samples";
        case SizingFailure::NON_FINITE:      return "non-finite value";
    }
    return "unknown";
}

} // namespace typo
