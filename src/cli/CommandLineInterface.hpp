/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for typo-fit
 */

#pragma once

#include "typography.hpp"
#include "SimpleCommandLineParser.hpp"
#include "UnitParser.hpp"
#include "../core/Logger.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace typo {

/**
 * @brief Parses arguments into a TypographyConfig and runs one command
 *
 * Results are written to the output stream, diagnostics go through the
 * logger.
 */
class CommandLineInterface {
public:
    explicit CommandLineInterface(std::ostream& out = std::cout);

    /**
     * @brief Parse command line arguments
     * @return true if a command is ready to run; false after help, version,
     *         create-config or an error (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);
    bool parse_arguments(const std::vector<std::string>& args);

    /**
     * @brief Run the parsed command
     * @return Process exit status
     */
    int run();

    const TypographyConfig& get_config() const { return config_; }
    const std::string& get_command() const { return command_; }

    /**
     * @brief Exit status to use when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

private:
    std::ostream& out_;
    Logger logger_;
    TypographyConfig config_;
    std::string command_;
    int exit_code_ = 0;

    // Command inputs that have no place in the configuration file
    std::string text_;
    std::optional<std::pair<double, double>> from_box_;
    std::optional<std::pair<double, double>> to_box_;
    std::optional<double> value_;

    bool apply_options(const SimpleCommandLineParser& parser);
    void apply_logging(const SimpleCommandLineParser& parser);
    bool create_default_config_file(const std::string& filename);
    std::vector<std::string> parse_list(const std::string& list_str) const;

    MeasureFunction make_measure() const;

    int run_estimate();
    int run_truncate();
    int run_scale_box();
    int run_scale_threshold();

    int report_failure(const SizingResult& result);
};

} // namespace typo
