/**
 * @file TextWidthEstimator.cpp
 * @brief Implementation of the calibrated width estimator
 */

#include "TextWidthEstimator.hpp"
#include "Logger.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <sstream>

namespace typo {

namespace {

Logger& estimator_logger() {
    static Logger logger("TextWidthEstimator");
    return logger;
}

} // namespace

TextWidthEstimator::TextWidthEstimator(double average_width)
    : average_width_(average_width) {
}

const std::vector<std::string>& TextWidthEstimator::default_samples() {
    static const std::vector<std::string> samples = {"M", "n", "."};
    return samples;
}

const std::vector<double>& TextWidthEstimator::default_distribution() {
    static const std::vector<double> distribution = {0.06, 0.8, 0.14};
    return distribution;
}

TextWidthEstimator TextWidthEstimator::build(const MeasureFunction& measure,
                                             const std::vector<std::string>& samples,
                                             const std::vector<double>& distribution) {
    if (samples.empty()) {
        throw TypographyError(SizingFailure::EMPTY_SAMPLES,
                              "estimator calibration needs at least one sample");
    }
    if (samples.size() != distribution.size()) {
        throw TypographyError(SizingFailure::LENGTH_MISMATCH,
                              "got " + std::to_string(samples.size()) + " samples but " +
                              std::to_string(distribution.size()) + " distribution weights");
    }

    const auto n = static_cast<Eigen::Index>(samples.size());
    Eigen::VectorXd measured(n);
    Eigen::VectorXd weights(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        const std::string& sample = samples[static_cast<size_t>(i)];
        double width = measure(sample);
        if (!std::isfinite(width)) {
            throw TypographyError(SizingFailure::NON_FINITE,
                                  "measurement of sample '" + sample + "' is not finite");
        }
        double weight = distribution[static_cast<size_t>(i)];
        if (!std::isfinite(weight)) {
            throw TypographyError(SizingFailure::NON_FINITE,
                                  "distribution weight for sample '" + sample + "' is not finite");
        }
        measured(i) = width;
        weights(i) = weight;
    }

    double average = weights.dot(measured);

    auto& logger = estimator_logger();
    if (logger.shouldOutput(LogLevel::DEBUG)) {
        std::ostringstream oss;
        oss << "Calibrated estimator from " << n << " samples: average glyph width = " << average;
        logger.debug(oss.str());
    }

    return TextWidthEstimator(average);
}

MeasureFunction TextWidthEstimator::as_measure() const {
    double average = average_width_;
    return [average](const std::string& text) {
        return static_cast<double>(text.length()) * average;
    };
}

} // namespace typo
