/**
 * @file TextTruncator.cpp
 * @brief Implementation of linear-extrapolation truncation
 */

#include "TextTruncator.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace typo {

namespace {

Logger& truncator_logger() {
    static Logger logger("TextTruncator");
    return logger;
}

} // namespace

TruncationResult truncate(const MeasureFunction& measure,
                          const std::string& text,
                          double width,
                          const std::string& tail) {
    auto& logger = truncator_logger();

    TruncationResult result;
    result.text = text;
    result.kept_chars = text.length();

    if (std::isnan(width)) {
        if (logger.shouldOutput(LogLevel::DEBUG)) {
            logger.debug("Target width is NaN, leaving '" + text + "' untruncated");
        }
        return result;
    }

    double measured = measure(text);
    if (!std::isfinite(measured) || measured <= 0.0) {
        // Nothing to extrapolate from
        if (logger.shouldOutput(LogLevel::DEBUG)) {
            std::ostringstream oss;
            oss << "Measured width of '" << text << "' is " << measured
                << ", leaving it untruncated";
            logger.debug(oss.str());
        }
        return result;
    }

    double fraction = std::min(1.0, width / measured);
    double length = static_cast<double>(text.length());
    double trim = std::floor(length * fraction);

    if (trim >= length) {
        if (logger.shouldOutput(LogLevel::TRACE)) {
            logger.trace("'" + text + "' fits in " + std::to_string(width));
        }
        return result;
    }

    trim = std::max(0.0, trim - static_cast<double>(tail.length()));
    auto keep = static_cast<std::size_t>(trim);

    result.text = text.substr(0, keep) + tail;
    result.kept_chars = keep;
    result.was_truncated = true;

    if (logger.shouldOutput(LogLevel::TRACE)) {
        logger.trace("Truncated '" + text + "' from " + std::to_string(text.length()) +
                     " to " + std::to_string(keep) + " characters");
    }
    return result;
}

} // namespace typo
