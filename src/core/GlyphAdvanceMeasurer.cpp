/**
 * @file GlyphAdvanceMeasurer.cpp
 * @brief Implementation of table-driven text measurement
 */

#include "GlyphAdvanceMeasurer.hpp"

namespace typo {

GlyphAdvanceMeasurer::GlyphAdvanceMeasurer(double font_size_px)
    : metrics_(builtin_metrics()), font_size_px_(font_size_px) {
}

GlyphAdvanceMeasurer::GlyphAdvanceMeasurer(const GlyphMetrics& metrics, double font_size_px)
    : metrics_(metrics), font_size_px_(font_size_px) {
}

GlyphMetrics GlyphAdvanceMeasurer::builtin_metrics() {
    GlyphMetrics metrics;
    metrics.default_advance = 0.556;

    // Uppercase is wider than lowercase on average
    for (char c = 'A'; c <= 'Z'; ++c) {
        metrics.advances[c] = 0.667;
    }
    for (char c : std::string("IJ")) metrics.advances[c] = 0.278;
    for (char c : std::string("MW")) metrics.advances[c] = 0.833;
    for (char c : std::string("ilj")) metrics.advances[c] = 0.222;
    for (char c : std::string("ftr")) metrics.advances[c] = 0.333;
    for (char c : std::string("mw")) metrics.advances[c] = 0.833;
    for (char c : std::string(" .,:;'!|")) metrics.advances[c] = 0.278;
    for (char c : std::string("-()[]")) metrics.advances[c] = 0.333;

    return metrics;
}

double GlyphAdvanceMeasurer::advance(char c) const {
    auto it = metrics_.advances.find(c);
    if (it != metrics_.advances.end()) {
        return it->second;
    }
    return metrics_.default_advance;
}

double GlyphAdvanceMeasurer::measure(const std::string& text) const {
    double em = 0.0;
    for (char c : text) {
        em += advance(c);
    }
    return em * font_size_px_;
}

MeasureFunction GlyphAdvanceMeasurer::as_measure() const {
    GlyphAdvanceMeasurer copy = *this;
    return [copy](const std::string& text) { return copy.measure(text); };
}

} // namespace typo
