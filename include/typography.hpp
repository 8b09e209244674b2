#pragma once

/**
 * @file typography.hpp
 * @brief Main header for the TypoFit typography heuristics library
 *
 * Fast, approximate text sizing for 2D layout: width estimation,
 * single-pass truncation and font-size scaling against boxes or thresholds.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace typo {

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 2D point with x, y coordinates
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }
};

/**
 * @brief Axis-aligned bounding box
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }

    /**
     * @brief Axis-aligned extent of a group of points
     *
     * Empty input yields a zero box at the origin. A single point or a
     * collinear run yields zero extent in the flat dimension.
     */
    static BoundingBox from_points(const std::vector<Point2D>& points);
};

// ============================================================================
// Failure Reporting
// ============================================================================

/**
 * @brief Numeric degeneracies that make a sizing result unusable
 */
enum class SizingFailure {
    NONE,             ///< Value is valid
    ZERO_EXTENT,      ///< Reference box has no extent in the scaled dimension
    ZERO_THRESHOLD,   ///< Threshold scaler built with a zero threshold
    LENGTH_MISMATCH,  ///< Samples and distribution differ in length
    EMPTY_SAMPLES,    ///< No calibration samples supplied
    NON_FINITE        ///< A measurement or input was NaN or infinite
};

/**
 * @brief Human readable name for a failure kind
 */
std::string to_string(SizingFailure failure);

/**
 * @brief Result of a font-size computation
 *
 * Replaces silent NaN/Infinity propagation with an observable failure.
 */
struct SizingResult {
    double value = std::numeric_limits<double>::quiet_NaN();
    SizingFailure failure = SizingFailure::NONE;
    std::string explanation;

    bool ok() const { return failure == SizingFailure::NONE; }

    static SizingResult success(double v) {
        SizingResult result;
        result.value = v;
        return result;
    }

    static SizingResult fail(SizingFailure kind, const std::string& why) {
        SizingResult result;
        result.failure = kind;
        result.explanation = why;
        return result;
    }
};

/**
 * @brief Exception thrown when a builder is given unusable calibration input
 */
class TypographyError : public std::runtime_error {
public:
    TypographyError(SizingFailure kind, const std::string& message)
        : std::runtime_error("Typography error: " + message), kind_(kind) {}

    SizingFailure kind() const { return kind_; }

private:
    SizingFailure kind_;
};

/**
 * @brief Caller-supplied text measuring function (width in caller units)
 */
using MeasureFunction = std::function<double(const std::string&)>;

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Per-glyph advance table in em units
 */
struct GlyphMetrics {
    double default_advance = 0.55;                ///< Advance for characters not in the table
    std::map<char, double> advances;              ///< Per-character overrides
};

/**
 * @brief Configuration for the typo-fit tool
 */
struct TypographyConfig {
    // Estimator calibration
    std::vector<std::string> samples = {"M", "n", "."};
    std::vector<double> distribution = {0.06, 0.8, 0.14};

    // Truncation
    std::string tail = "";
    std::optional<double> target_width_px;

    // Measurement
    double font_size_px = 16.0;
    double dpi = 96.0;
    std::optional<GlyphMetrics> glyph_metrics;   ///< Empty = built-in table

    // Box scaling
    double box_ratio = 1.0;
    bool by_height = true;

    // Threshold scaling
    double threshold = 1.0;
    int direction = 0;

    // Logging options
    int log_level = 3;  // 1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE
    std::optional<std::string> log_file;
};

} // namespace typo
