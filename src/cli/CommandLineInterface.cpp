/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "FontScaler.hpp"
#include "GlyphAdvanceMeasurer.hpp"
#include "TextTruncator.hpp"
#include "TextWidthEstimator.hpp"
#include "../core/InputValidator.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

#ifndef TYPOFIT_VERSION_STRING
#define TYPOFIT_VERSION_STRING "0.0.0"
#endif

namespace typo {

namespace {

std::string format_px(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << "px";
    return oss.str();
}

} // namespace

CommandLineInterface::CommandLineInterface(std::ostream& out)
    : out_(out), logger_("CLI") {
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return parse_arguments(args);
}

bool CommandLineInterface::parse_arguments(const std::vector<std::string>& args) {
    SimpleCommandLineParser parser("typo-fit",
        "TYPO-FIT - Fast typography heuristics for 2D layout\n"
        "\n"
        "Estimates text width from a calibrated average glyph width, truncates text\n"
        "to a width and scales font sizes against boxes or threshold values.");

    // Configuration file options
    parser.add_option("config", "c", "Load configuration from JSON file");
    parser.add_option("create-config", "", "Create a default configuration file at the specified path");

    // Command inputs
    parser.add_option("text", "t", "Text to estimate or truncate");
    parser.add_option("width", "w", "Target width for truncate (length)");
    parser.add_option("tail", "", "Overflow marker appended when truncating");
    parser.add_option("from", "", "Reference box for scale-box (WIDTHxHEIGHT)");
    parser.add_option("to", "", "New box for scale-box (WIDTHxHEIGHT)");
    parser.add_option("value", "", "Value compared with --threshold");

    // Calibration and measurement
    parser.add_option("samples", "", "Comma-separated calibration samples (default: M,n,.)");
    parser.add_option("distribution", "", "Comma-separated sample weights (default: 0.06,0.8,0.14)");
    parser.add_option("font-size", "f", "Font size (length, default: 16px)");
    parser.add_option("dpi", "", "Resolution for pt, mm and in conversions (default: 96)");

    // Scaling
    parser.add_option("ratio", "r", "Font size to box dimension ratio (default: 1)");
    parser.add_flag("by-width", "", "Scale boxes by width instead of height");
    parser.add_flag("by-height", "", "Scale boxes by height (default)");
    parser.add_option("threshold", "", "Threshold at which the font size is unchanged");
    parser.add_option("direction", "d", "Negative: only shrink, positive: only grow, 0: free (default)");

    // Logging and utility options
    parser.add_option("log-level", "", "Verbosity 1=ERROR .. 6=TRACE, or per facility: \"3,TextTruncator=6\"");
    parser.add_option("log-file", "", "Log to specified file (append if exists)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_flag("silent", "s", "Only report errors (same as --log-level 1)");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(args)) {
        exit_code_ = parser.help_requested() ? 0 : 1;
        return false;
    }

    if (parser.get_flag("version")) {
        out_ << "typo-fit v" << TYPOFIT_VERSION_STRING << std::endl;
        out_ << "Built with Eigen and nlohmann::json" << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            logger_.error("Could not write configuration file: " + config_path.value());
            exit_code_ = 1;
            return false;
        }
        out_ << "Created default configuration file: " << config_path.value() << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        ConfigurationManager manager;
        if (!manager.load_from_file(config_file.value())) {
            exit_code_ = 1;
            return false;
        }
        config_ = manager.get_config();
    }

    apply_logging(parser);

    const auto& positional = parser.get_positional();
    if (positional.empty()) {
        logger_.error("No command given. Use one of: estimate, truncate, scale-box, scale-threshold");
        exit_code_ = 1;
        return false;
    }
    if (positional.size() > 1) {
        logger_.warning("Ignoring extra arguments after '" + positional[0] + "'");
    }
    command_ = positional[0];

    if (command_ != "estimate" && command_ != "truncate" &&
        command_ != "scale-box" && command_ != "scale-threshold") {
        logger_.error("Unknown command: " + command_);
        exit_code_ = 1;
        return false;
    }

    try {
        if (!apply_options(parser)) {
            exit_code_ = 1;
            return false;
        }
    } catch (const UnitParseError& e) {
        logger_.error(e.what());
        exit_code_ = 1;
        return false;
    }

    InputValidator validator;
    ValidationResult validation = validator.validate(config_);
    for (const auto& warning : validation.warnings) {
        logger_.warning(warning);
    }
    if (validation.has_errors()) {
        logger_.error(validation.format_error_message());
        exit_code_ = 1;
        return false;
    }

    exit_code_ = 0;
    return true;
}

void CommandLineInterface::apply_logging(const SimpleCommandLineParser& parser) {
    Logger::setDefaultLevel(static_cast<LogLevel>(std::clamp(config_.log_level, 1, 6)));

    if (auto log_level = parser.get("log-level")) {
        Logger::parseLogConfig(log_level.value());
    }
    if (parser.get_flag("verbose")) {
        Logger::setDefaultLevel(LogLevel::TRACE);
    }
    if (parser.get_flag("silent")) {
        Logger::setDefaultLevel(LogLevel::ERROR);
    }

    if (auto log_file = parser.get("log-file")) {
        config_.log_file = log_file.value();
    }
    if (config_.log_file.has_value() && !Logger::setSharedLogFile(config_.log_file)) {
        logger_.warning("Logging to console only");
    }
}

bool CommandLineInterface::apply_options(const SimpleCommandLineParser& parser) {
    // DPI first, every other length depends on it
    if (auto dpi = parser.get("dpi")) {
        auto parsed = parser.get_as<double>("dpi");
        if (!parsed) {
            logger_.error("Invalid --dpi value: " + dpi.value());
            return false;
        }
        config_.dpi = parsed.value();
    }
    UnitParser units(config_.dpi);

    if (auto font_size = parser.get("font-size")) {
        config_.font_size_px = units.parse_length(font_size.value()).pixels;
    }
    if (auto width = parser.get("width")) {
        config_.target_width_px = units.parse_length(width.value()).pixels;
    }
    if (auto tail = parser.get("tail")) {
        config_.tail = tail.value();
    }
    if (auto samples = parser.get("samples")) {
        config_.samples = parse_list(samples.value());
    }
    if (auto distribution = parser.get("distribution")) {
        config_.distribution.clear();
        for (const auto& weight : parse_list(distribution.value())) {
            try {
                config_.distribution.push_back(std::stod(weight));
            } catch (const std::exception&) {
                logger_.error("Invalid distribution weight: '" + weight + "'");
                return false;
            }
        }
    }

    if (auto ratio = parser.get("ratio")) {
        auto parsed = parser.get_as<double>("ratio");
        if (!parsed) {
            logger_.error("Invalid --ratio value: " + ratio.value());
            return false;
        }
        config_.box_ratio = parsed.value();
    }
    if (parser.get_flag("by-width")) config_.by_height = false;
    if (parser.get_flag("by-height")) config_.by_height = true;

    if (auto threshold = parser.get("threshold")) {
        auto parsed = parser.get_as<double>("threshold");
        if (!parsed) {
            logger_.error("Invalid --threshold value: " + threshold.value());
            return false;
        }
        config_.threshold = parsed.value();
    }
    if (auto direction = parser.get("direction")) {
        auto parsed = parser.get_as<double>("direction");
        if (!parsed) {
            logger_.error("Invalid --direction value: " + direction.value());
            return false;
        }
        config_.direction = parsed.value() < 0 ? -1 : (parsed.value() > 0 ? 1 : 0);
    }

    if (auto text = parser.get("text")) text_ = text.value();
    if (auto from = parser.get("from")) from_box_ = units.parse_size(from.value());
    if (auto to = parser.get("to")) to_box_ = units.parse_size(to.value());
    if (auto value = parser.get("value")) {
        value_ = parser.get_as<double>("value");
        if (!value_) {
            logger_.error("Invalid --value: " + value.value());
            return false;
        }
    }

    // Per-command required inputs
    if ((command_ == "estimate" || command_ == "truncate") && !parser.get("text")) {
        logger_.error(command_ + " requires --text");
        return false;
    }
    if (command_ == "truncate" && !config_.target_width_px) {
        logger_.error("truncate requires --width (or 'target_width' in the configuration file)");
        return false;
    }
    if (command_ == "scale-box" && (!from_box_ || !to_box_)) {
        logger_.error("scale-box requires --from and --to");
        return false;
    }
    if (command_ == "scale-threshold" && !value_) {
        logger_.error("scale-threshold requires --value");
        return false;
    }

    return true;
}

std::vector<std::string> CommandLineInterface::parse_list(const std::string& list_str) const {
    std::vector<std::string> items;
    std::istringstream iss(list_str);
    std::string item;

    while (std::getline(iss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        if (!item.empty()) {
            items.push_back(item);
        }
    }

    return items;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    ConfigurationManager manager{TypographyConfig()};
    manager.get_config().glyph_metrics = GlyphAdvanceMeasurer::builtin_metrics();
    return manager.save_to_file(filename);
}

MeasureFunction CommandLineInterface::make_measure() const {
    if (config_.glyph_metrics) {
        return GlyphAdvanceMeasurer(*config_.glyph_metrics, config_.font_size_px).as_measure();
    }
    return GlyphAdvanceMeasurer(config_.font_size_px).as_measure();
}

// ============================================================================
// Commands
// ============================================================================

int CommandLineInterface::run() {
    try {
        if (command_ == "estimate") return run_estimate();
        if (command_ == "truncate") return run_truncate();
        if (command_ == "scale-box") return run_scale_box();
        if (command_ == "scale-threshold") return run_scale_threshold();
    } catch (const TypographyError& e) {
        logger_.error(std::string(e.what()) + " (" + to_string(e.kind()) + ")");
        return 1;
    }

    logger_.error("Nothing to run");
    return 1;
}

int CommandLineInterface::run_estimate() {
    MeasureFunction measure = make_measure();
    TextWidthEstimator estimator = TextWidthEstimator::build(measure, config_.samples, config_.distribution);

    double estimated = estimator.estimate(text_);
    double measured = measure(text_);

    logger_.detailed("Estimated '" + text_ + "' at " + format_px(config_.font_size_px));

    out_ << "Estimated width:     " << format_px(estimated) << "\n";
    out_ << "Measured width:      " << format_px(measured) << "\n";
    out_ << "Average glyph width: " << format_px(estimator.average_width()) << std::endl;
    return 0;
}

int CommandLineInterface::run_truncate() {
    TruncationResult result = truncate(make_measure(), text_, *config_.target_width_px, config_.tail);

    out_ << result.text << "\n";
    out_ << "Kept " << result.kept_chars << " of " << text_.length() << " characters"
         << (result.was_truncated ? "" : " (fits)") << std::endl;
    return 0;
}

int CommandLineInterface::run_scale_box() {
    BoundingBox reference(0.0, 0.0, from_box_->first, from_box_->second);
    BoundingBox target(0.0, 0.0, to_box_->first, to_box_->second);

    BoxFontScaler scaler = FontScaler::to_box(reference, config_.box_ratio, config_.by_height);
    SizingResult result = scaler.apply(target);
    if (!result.ok()) {
        return report_failure(result);
    }

    out_ << "Font size: " << format_px(result.value) << std::endl;
    return 0;
}

int CommandLineInterface::run_scale_threshold() {
    ThresholdFontScaler scaler = FontScaler::to_threshold(config_.threshold, config_.direction);
    SizingResult result = scaler.apply(config_.font_size_px, *value_);
    if (!result.ok()) {
        return report_failure(result);
    }

    out_ << "Font size: " << format_px(result.value) << std::endl;
    return 0;
}

int CommandLineInterface::report_failure(const SizingResult& result) {
    logger_.error("Cannot compute font size (" + to_string(result.failure) + "): " + result.explanation);
    return 1;
}

} // namespace typo
