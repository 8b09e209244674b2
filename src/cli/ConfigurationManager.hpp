/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file management for typo-fit
 */

#pragma once

#include "typography.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace typo {

/**
 * @brief Loads and saves TypographyConfig as JSON
 *
 * Missing keys keep their defaults. Keys with the wrong type are recorded as
 * problems and also keep their defaults.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;
    explicit ConfigurationManager(const TypographyConfig& config) : config_(config) {}

    /**
     * @brief Load configuration from file
     * @param filename Path to JSON configuration file
     * @return true if the file was read and parsed, false otherwise
     *
     * Problems are logged here, callers only check the return value.
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Load configuration from a JSON document
     * @return true if the text parsed as a JSON object
     */
    bool load_from_string(const std::string& text);

    /**
     * @brief Save configuration to file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    nlohmann::json to_json() const;

    const TypographyConfig& get_config() const { return config_; }
    TypographyConfig& get_config() { return config_; }

    /**
     * @brief Problems found by the last load
     */
    const std::vector<std::string>& get_problems() const { return problems_; }

private:
    TypographyConfig config_;
    std::vector<std::string> problems_;

    void apply_json(const nlohmann::json& j);
};

} // namespace typo
