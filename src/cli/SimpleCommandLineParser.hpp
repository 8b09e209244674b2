/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for typo-fit
 */

#pragma once

#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace typo {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long, --long=value, -s short options, boolean flags and
 * positional arguments (the first positional is the subcommand).
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    /**
     * @brief Parse command line arguments
     * @return false if help was requested or an argument was invalid
     */
    bool parse(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        return parse(args);
    }

    bool parse(const std::vector<std::string>& args) {
        args_ = args;
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool has_inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    has_inline_value = true;
                }

                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!has_inline_value) {
                        if (i + 1 >= args_.size() || is_option(args_[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (is_option(arg)) {
                std::string short_name = arg.substr(1);

                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || is_option(args_[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " COMMAND [OPTIONS]\n\n";

        std::cout << "COMMANDS:\n";
        std::cout << "    estimate          Estimate the width of --text from a calibrated average glyph width\n";
        std::cout << "    truncate          Cut --text to fit --width, appending --tail\n";
        std::cout << "    scale-box         Scale --font-size from box --from to box --to\n";
        std::cout << "    scale-threshold   Scale --font-size by --value relative to --threshold\n\n";

        std::cout << "OPTIONS:\n";
        for (const auto& name : order_) {
            print_help_section(name);
        }
        std::cout << "\n";

        std::cout << "LENGTHS:\n";
        std::cout << "    Widths and font sizes accept px (default), pt, mm and in, e.g. 12pt or 40mm.\n";
        std::cout << "    Box sizes are WIDTHxHEIGHT, e.g. 200x40 or 3inx1in.\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " estimate --text \"Hello world\" --font-size 12pt\n";
        std::cout << "    " << program_name_ << " truncate --text \"A long caption\" --width 60 --tail ...\n";
        std::cout << "    " << program_name_ << " scale-box --from 200x40 --to 300x80\n";
        std::cout << "    " << program_name_ << " scale-threshold --threshold 800 --value 400 --direction -1\n";
    }

private:
    // "-3" and "-0.5" are values, not options
    static bool is_option(const std::string& arg) {
        if (arg.size() < 2 || arg[0] != '-') return false;
        unsigned char next = static_cast<unsigned char>(arg[1]);
        return !(std::isdigit(next) || next == '.');
    }

    void print_help_section(const std::string& option_name) const {
        auto it = options_.find(option_name);
        if (it == options_.end()) return;

        const auto& option = it->second;
        std::string usage = "--" + option.long_name;
        if (!option.short_name.empty()) {
            usage = "-" + option.short_name + ", " + usage;
        }
        if (option.has_value) {
            usage += " VALUE";
        }
        std::cout << "    " << usage;
        if (usage.size() < 28) {
            std::cout << std::string(28 - usage.size(), ' ');
        } else {
            std::cout << "\n    " << std::string(28, ' ');
        }
        std::cout << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace typo
