/**
 * @file FontScaler.cpp
 * @brief Implementation of box-relative and threshold font scaling
 */

#include "FontScaler.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace typo {

namespace {

Logger& scaler_logger() {
    static Logger logger("FontScaler");
    return logger;
}

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(6) << value;
    return oss.str();
}

} // namespace

// ============================================================================
// BoxFontScaler
// ============================================================================

BoxFontScaler::BoxFontScaler(const BoundingBox& reference, double ratio, bool by_height)
    : reference_(by_height ? reference.height() : reference.width()),
      base_(ratio * reference_),
      by_height_(by_height) {
    if (!is_valid()) {
        scaler_logger().warning("Reference box " + std::string(by_height_ ? "height" : "width") +
                                " is " + format_number(reference_) + ", box scaling will fail");
    }
}

bool BoxFontScaler::is_valid() const {
    return reference_ != 0.0 && std::isfinite(reference_) && std::isfinite(base_);
}

SizingResult BoxFontScaler::apply(const BoundingBox& box) const {
    if (!std::isfinite(reference_) || !std::isfinite(base_)) {
        return SizingResult::fail(SizingFailure::NON_FINITE,
                                  "reference " + std::string(by_height_ ? "height" : "width") +
                                  " is " + format_number(reference_) + " with base size " +
                                  format_number(base_));
    }
    if (reference_ == 0.0) {
        return SizingResult::fail(SizingFailure::ZERO_EXTENT,
                                  "reference " + std::string(by_height_ ? "height" : "width") +
                                  " is " + format_number(reference_));
    }

    double dimension = dimension_of(box);
    if (!std::isfinite(dimension)) {
        return SizingResult::fail(SizingFailure::NON_FINITE, "box dimension is not finite");
    }

    double size = base_ * (dimension / reference_);
    auto& logger = scaler_logger();
    if (logger.shouldOutput(LogLevel::TRACE)) {
        logger.trace("Box scale: " + format_number(dimension) + "/" +
                     format_number(reference_) + " -> " + format_number(size));
    }
    return SizingResult::success(size);
}

SizingResult BoxFontScaler::apply(const std::vector<Point2D>& points) const {
    return apply(BoundingBox::from_points(points));
}

// ============================================================================
// ThresholdFontScaler
// ============================================================================

ThresholdFontScaler::ThresholdFontScaler(double threshold, double direction)
    : threshold_(threshold), direction_(direction) {
}

SizingResult ThresholdFontScaler::apply(double default_size, double value) const {
    if (threshold_ == 0.0 || !std::isfinite(threshold_)) {
        return SizingResult::fail(SizingFailure::ZERO_THRESHOLD,
                                  "threshold is " + format_number(threshold_));
    }

    double d = default_size * value / threshold_;
    if (!std::isfinite(d)) {
        return SizingResult::fail(SizingFailure::NON_FINITE,
                                  "scaled size of " + format_number(default_size) + " by " +
                                  format_number(value) + " is not finite");
    }

    if (direction_ < 0.0) return SizingResult::success(std::min(d, default_size));
    if (direction_ > 0.0) return SizingResult::success(std::max(d, default_size));
    return SizingResult::success(d);
}

// ============================================================================
// Factories
// ============================================================================

BoxFontScaler FontScaler::to_box(const BoundingBox& box, double ratio, bool by_height) {
    return BoxFontScaler(box, ratio, by_height);
}

BoxFontScaler FontScaler::to_box(const std::vector<Point2D>& points, double ratio, bool by_height) {
    return BoxFontScaler(BoundingBox::from_points(points), ratio, by_height);
}

ThresholdFontScaler FontScaler::to_threshold(double threshold, double direction) {
    if (threshold == 0.0) {
        scaler_logger().warning("Threshold scaler built with a zero threshold");
    }
    return ThresholdFontScaler(threshold, direction);
}

} // namespace typo
