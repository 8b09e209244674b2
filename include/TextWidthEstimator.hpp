/**
 * @file TextWidthEstimator.hpp
 * @brief Heuristic text width estimation from a calibrated average glyph width
 *
 * Measures a handful of sample strings once with an accurate (and usually
 * expensive) measuring function, combines them with a probability
 * distribution and then estimates any string as length * average width.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "typography.hpp"
#include <string>
#include <vector>

namespace typo {

/**
 * @brief Calibrated, immutable text width estimator
 *
 * Less accurate than the reference measure, but O(1) per call after
 * calibration. Assumes uniform glyph width, so proportional fonts and mixed
 * scripts are approximated.
 */
class TextWidthEstimator {
public:
    /**
     * @brief Calibrate an estimator
     *
     * Calls @p measure exactly once per sample. The average glyph width is the
     * dot product of @p distribution and the measured widths; weights are not
     * normalized.
     *
     * @param measure Reference function that can measure text width accurately
     * @param samples Sample strings, default {"M", "n", "."}
     * @param distribution Probability of each sample, default {0.06, 0.8, 0.14}
     * @return Estimator capturing the average width
     * @throws TypographyError on empty samples, length mismatch, or a non-finite
     *         measurement or weight
     */
    static TextWidthEstimator build(const MeasureFunction& measure,
                                    const std::vector<std::string>& samples = default_samples(),
                                    const std::vector<double>& distribution = default_distribution());

    /**
     * @brief Build directly from a known average glyph width
     */
    explicit TextWidthEstimator(double average_width);

    /**
     * @brief Estimate the width of a string
     */
    double estimate(const std::string& text) const {
        return static_cast<double>(text.length()) * average_width_;
    }

    double operator()(const std::string& text) const { return estimate(text); }

    double average_width() const { return average_width_; }

    /**
     * @brief Adapt this estimator to the MeasureFunction signature
     */
    MeasureFunction as_measure() const;

    static const std::vector<std::string>& default_samples();
    static const std::vector<double>& default_distribution();

private:
    double average_width_;
};

} // namespace typo
