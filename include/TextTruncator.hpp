/**
 * @file TextTruncator.hpp
 * @brief Single-pass truncation of text to a target width
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "typography.hpp"
#include <cstddef>
#include <string>
#include <utility>

namespace typo {

/**
 * @brief Text truncation result
 */
struct TruncationResult {
    std::string text;            ///< Final text, tail included when truncated
    std::size_t kept_chars = 0;  ///< Characters kept from the original text (tail excluded)
    bool was_truncated = false;
};

/**
 * @brief Truncate text to fit a width
 *
 * Measures the full text once and extrapolates linearly: the number of
 * characters that fit is floor(length * min(1, width / measured)). When that
 * is short of the full length, tail.length() characters are given up for the
 * overflow marker (never below zero). The result is not re-measured.
 *
 * A non-positive or non-finite full-text measurement, or a NaN width, is
 * treated as fitting and the text is returned unchanged. This holds for any
 * width, so measuring zero against a negative width keeps the text rather
 * than reducing it to the tail.
 *
 * @param measure Function that can measure text width
 * @param text Text to truncate
 * @param width Width to fit
 * @param tail Overflow indicator such as "...", default empty
 */
TruncationResult truncate(const MeasureFunction& measure,
                          const std::string& text,
                          double width,
                          const std::string& tail = "");

/**
 * @brief Pair form of truncate(): (text, kept character count)
 */
inline std::pair<std::string, std::size_t> truncate_pair(const MeasureFunction& measure,
                                                         const std::string& text,
                                                         double width,
                                                         const std::string& tail = "") {
    TruncationResult result = truncate(measure, text, width, tail);
    return {std::move(result.text), result.kept_chars};
}

} // namespace typo
