/**
 * @file Logger.hpp
 * @brief Centralized logging system with per-facility verbosity control
 *
 * Every component logs through a Logger named after it. Output goes through
 * a single verbosity check in outputMessage() and a single write in
 * doOutput(), to the console and optionally to an append-mode log file.
 */

#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace typo {

/**
 * @brief Log levels
 *
 * Level 1: Errors (disrupts execution)
 * Level 2: Warnings (result will be unusable or degraded)
 * Level 3: Information (high-level)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (calibration values, builder state)
 * Level 6: Detailed debugging (per-call values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Leveled logger with a single point of output control
 */
class Logger {
public:
    /**
     * @brief Default constructor with WARNING level
     */
    Logger();

    /**
     * @brief Constructor with facility name (uses default WARNING level)
     * @param component_name Facility used for per-component level lookup
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with specified log level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    /**
     * @brief Destructor - reports pending repeats and flushes
     */
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Consecutive identical messages are collapsed into a single
     * "occurred N times" line.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Check if a message level would be output
     */
    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();  // Flush after highest debug level messages
    }

    /**
     * @brief Flush console and file output
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a specific facility
     *
     * @example
     * Logger::setFacilityLevel("TextTruncator", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Set default log level for all facilities
     */
    static void setDefaultLevel(LogLevel level);

    /**
     * @brief Get log level for a facility, falling back to the default level
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "TextTruncator=6,FontScaler=3"
     * - Mixed: "4,TextWidthEstimator=6"
     * - "default=N" is the same as a bare "N"
     *
     * Levels outside 1..6 are clamped. Malformed entries are reported on
     * stderr and skipped.
     */
    static void parseLogConfig(const std::string& config);

    /**
     * @brief Clear all facility-specific log levels
     */
    static void clearFacilityLevels();

    /**
     * @brief Redirect console output (std::clog by default)
     */
    static void setConsoleStream(std::ostream& stream);

    /**
     * @brief Log file shared by every logger without a file of its own
     * @param log_file Path to log file (appends if exists), or nullopt to disable
     * @return false if the file could not be opened
     */
    static bool setSharedLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Facility level, then instance level, then global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Static facility-based logging registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::ostream* console_stream_;
    static std::shared_ptr<std::ofstream> shared_file_stream_;
    static std::mutex registry_mutex_;

    void initializeFileStream();
    static std::shared_ptr<std::ofstream> openLogFile(const std::string& path);
    void doOutput(LogLevel level, const std::string& message) const;
    void reportRepeats() const;
};

} // namespace typo
