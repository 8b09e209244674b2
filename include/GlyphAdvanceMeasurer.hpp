/**
 * @file GlyphAdvanceMeasurer.hpp
 * @brief Deterministic text measurement from a per-glyph advance table
 *
 * Stands in for a real font-metrics API: sums per-character advances (in em)
 * and scales by the font size. Used as the reference measure when calibrating
 * estimators from the command line.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "typography.hpp"
#include <string>

namespace typo {

class GlyphAdvanceMeasurer {
public:
    /**
     * @brief Measurer using the built-in proportional sans-serif table
     */
    explicit GlyphAdvanceMeasurer(double font_size_px);

    GlyphAdvanceMeasurer(const GlyphMetrics& metrics, double font_size_px);

    /**
     * @brief Width of @p text in pixels
     */
    double measure(const std::string& text) const;

    double operator()(const std::string& text) const { return measure(text); }

    /**
     * @brief Advance of a single character in em
     */
    double advance(char c) const;

    double font_size() const { return font_size_px_; }
    const GlyphMetrics& metrics() const { return metrics_; }

    MeasureFunction as_measure() const;

    /**
     * @brief Approximate advances of a proportional sans-serif face
     */
    static GlyphMetrics builtin_metrics();

private:
    GlyphMetrics metrics_;
    double font_size_px_;
};

} // namespace typo
