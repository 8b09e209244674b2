/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace typo {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid typography parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const TypographyConfig& config) const {
    ValidationResult result;
    result.is_valid = true;

    for (const auto& conflict : {check_calibration(config),
                                 check_threshold(config),
                                 check_measurement(config)}) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    if (auto warning = check_distribution_sum(config)) {
        result.warnings.push_back(*warning);
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_calibration(
    const TypographyConfig& config) const {

    if (config.samples.empty()) {
        ParameterConflict conflict;
        conflict.description = "No calibration samples given";
        conflict.involved_params = {"samples"};
        conflict.suggestions = {
            "Remove 'samples' to use the defaults [\"M\", \"n\", \".\"]",
            "List at least one sample string"
        };
        return conflict;
    }

    if (config.samples.size() != config.distribution.size()) {
        ParameterConflict conflict;
        conflict.description = "Every calibration sample needs exactly one distribution weight";
        conflict.involved_params = {
            "samples (" + std::to_string(config.samples.size()) + " entries)",
            "distribution (" + std::to_string(config.distribution.size()) + " entries)"
        };
        conflict.suggestions = {
            "Add or remove weights so both lists have the same length",
            "Remove both keys to use the default calibration"
        };
        return conflict;
    }

    for (double weight : config.distribution) {
        if (!std::isfinite(weight)) {
            ParameterConflict conflict;
            conflict.description = "Distribution contains a non-finite weight";
            conflict.involved_params = {"distribution"};
            conflict.suggestions = {"Use finite numbers for every weight"};
            return conflict;
        }
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_threshold(
    const TypographyConfig& config) const {

    if (config.threshold == 0.0 || !std::isfinite(config.threshold)) {
        ParameterConflict conflict;
        conflict.description = "Threshold scaling requires a non-zero, finite threshold";
        conflict.involved_params = {"threshold = " + std::to_string(config.threshold)};
        conflict.suggestions = {"Set 'threshold' to the value at which the default size applies"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_measurement(
    const TypographyConfig& config) const {

    std::vector<std::string> involved;

    if (!(config.font_size_px > 0.0) || !std::isfinite(config.font_size_px)) {
        involved.push_back("font_size = " + std::to_string(config.font_size_px));
    }
    if (!(config.dpi > 0.0) || !std::isfinite(config.dpi)) {
        involved.push_back("dpi = " + std::to_string(config.dpi));
    }
    if (!std::isfinite(config.box_ratio)) {
        involved.push_back("box_ratio");
    }
    if (config.glyph_metrics && !(config.glyph_metrics->default_advance >= 0.0)) {
        involved.push_back("glyph_metrics.default_advance");
    }

    if (involved.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Measurement parameters must be positive, finite numbers";
    conflict.involved_params = involved;
    conflict.suggestions = {
        "Use a positive font size such as 16 or 12pt",
        "Use a positive DPI such as 96"
    };
    return conflict;
}

std::optional<std::string> InputValidator::check_distribution_sum(
    const TypographyConfig& config) const {

    double sum = std::accumulate(config.distribution.begin(), config.distribution.end(), 0.0);
    if (std::isfinite(sum) && std::abs(sum - 1.0) > 1e-6) {
        std::ostringstream oss;
        oss << std::setprecision(4)
            << "Distribution weights sum to " << sum
            << ", estimates will be scaled by the same factor";
        return oss.str();
    }

    return std::nullopt;
}

} // namespace typo
