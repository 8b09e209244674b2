/**
 * @file FontScaler.hpp
 * @brief Font-size scaling relative to a reference box or a threshold value
 *
 * Both scalers are immutable values built once by a factory and applied any
 * number of times. Degenerate references are reported through SizingResult
 * instead of producing NaN or Infinity.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "typography.hpp"
#include <vector>

namespace typo {

/**
 * @brief Scales a font size with the height (or width) of a box
 *
 * The result is ratio * reference_dimension * (new_dimension / reference_dimension).
 */
class BoxFontScaler {
public:
    BoxFontScaler(const BoundingBox& reference, double ratio, bool by_height);

    /**
     * @brief Font size for a new box
     * @return ZERO_EXTENT failure when the reference box is flat in the scaled dimension,
     *         NON_FINITE when the reference, ratio or new box is not finite
     */
    SizingResult apply(const BoundingBox& box) const;
    SizingResult apply(const std::vector<Point2D>& points) const;

    SizingResult operator()(const BoundingBox& box) const { return apply(box); }

    double reference_dimension() const { return reference_; }
    double base_size() const { return base_; }
    bool by_height() const { return by_height_; }

    /**
     * @brief False if every apply() call would fail
     */
    bool is_valid() const;

private:
    double reference_;  // h
    double base_;       // ratio * h
    bool by_height_;

    double dimension_of(const BoundingBox& box) const {
        return by_height_ ? box.height() : box.width();
    }
};

/**
 * @brief Scales a font size by how a value compares with a threshold
 *
 * direction < 0 only ever shrinks, direction > 0 only ever grows,
 * direction == 0 scales freely.
 */
class ThresholdFontScaler {
public:
    ThresholdFontScaler(double threshold, double direction);

    /**
     * @brief Font size for a value
     * @param default_size Font size to base on
     * @param value Value to compare with the threshold
     * @return ZERO_THRESHOLD failure when the threshold is zero or not finite
     */
    SizingResult apply(double default_size, double value) const;

    SizingResult operator()(double default_size, double value) const {
        return apply(default_size, value);
    }

    double threshold() const { return threshold_; }
    double direction() const { return direction_; }

private:
    double threshold_;
    double direction_;
};

/**
 * @brief Factories for the font-size scalers
 */
class FontScaler {
public:
    /**
     * @brief Scale font size proportionally to text box size changes
     * @param box Initial box
     * @param ratio Font-size change ratio, default 1
     * @param by_height Track height (true) or width (false)
     */
    static BoxFontScaler to_box(const BoundingBox& box, double ratio = 1.0, bool by_height = true);

    /**
     * @brief Same as above, with the box taken from a group of points
     */
    static BoxFontScaler to_box(const std::vector<Point2D>& points, double ratio = 1.0,
                                bool by_height = true);

    /**
     * @brief Scale font size based on a threshold value
     * @param threshold Threshold value
     * @param direction Negative keeps results <= default size, positive keeps
     *        them >= default size, 0 (default) leaves them unclamped
     */
    static ThresholdFontScaler to_threshold(double threshold, double direction = 0.0);
};

} // namespace typo
