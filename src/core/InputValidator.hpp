/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory or degenerate parameters
 *
 * Checks a TypographyConfig before any builder runs and reports each problem
 * with the parameters involved and suggested fixes.
 */

#pragma once

#include "typography.hpp"
#include <optional>
#include <string>
#include <vector>

namespace typo {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;                   // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 *
 * Conflicts make the configuration unusable; warnings are reported but do
 * not fail validation.
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;
    std::vector<std::string> warnings;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const TypographyConfig& config) const;

private:
    /**
     * @brief Samples and distribution must pair up one to one
     */
    std::optional<ParameterConflict> check_calibration(const TypographyConfig& config) const;

    /**
     * @brief Threshold scaling divides by the threshold
     */
    std::optional<ParameterConflict> check_threshold(const TypographyConfig& config) const;

    /**
     * @brief Font size, DPI and box ratio must be usable numbers
     */
    std::optional<ParameterConflict> check_measurement(const TypographyConfig& config) const;

    /**
     * @brief Distribution weights are expected, not required, to sum to 1
     */
    std::optional<std::string> check_distribution_sum(const TypographyConfig& config) const;
};

} // namespace typo
