#pragma once

#include <string>
#include <stdexcept>
#include <utility>

namespace typo {

/**
 * @brief Exception thrown when unit parsing fails
 */
class UnitParseError : public std::runtime_error {
public:
    explicit UnitParseError(const std::string& message)
        : std::runtime_error("Unit parsing error: " + message) {}
};

/**
 * @brief Unit types for typographic lengths
 */
enum class LengthUnit {
    PIXELS,      // px
    POINTS,      // pt (1/72 in)
    MILLIMETERS, // mm
    INCHES       // in
};

/**
 * @brief Result of parsing a value with units
 */
struct ParsedLength {
    double pixels;              // Value converted to pixels at the parser DPI
    LengthUnit original_unit;   // Unit that was parsed
    bool had_explicit_unit;     // Whether unit was explicitly specified

    ParsedLength(double px, LengthUnit u, bool explicit_unit = false)
        : pixels(px), original_unit(u), had_explicit_unit(explicit_unit) {}
};

/**
 * @brief Parses lengths and font sizes with optional unit suffixes
 *
 * Everything is converted to pixels, using the DPI for physical units:
 *   "16"     -> 16 px
 *   "12pt"   -> 16 px at 96 DPI
 *   "25.4mm" -> 96 px at 96 DPI
 *   "0.5in"  -> 48 px at 96 DPI
 */
class UnitParser {
public:
    UnitParser() = default;

    /**
     * @brief Construct parser for a specific output resolution
     * @throws UnitParseError if dpi is not positive
     */
    explicit UnitParser(double dpi);

    double dpi() const { return dpi_; }

    /**
     * @brief Parse a length with optional unit suffix
     *
     * @param input String to parse (e.g., "200", "12pt", "4mm")
     * @param default_unit Unit to use if no suffix is provided
     * @return Parsed value in pixels
     */
    ParsedLength parse_length(const std::string& input,
                              LengthUnit default_unit = LengthUnit::PIXELS) const;

    /**
     * @brief Parse a "WIDTHxHEIGHT" pair such as "200x40" or "3inx1in"
     * @return Pair of (width, height) in pixels
     */
    std::pair<double, double> parse_size(const std::string& input) const;

    /**
     * @brief Convert between units at a DPI
     */
    static double convert_length(double value, LengthUnit from_unit, LengthUnit to_unit, double dpi);

    /**
     * @brief Number of pixels in one unit at a DPI
     */
    static double to_pixels_factor(LengthUnit unit, double dpi);

    /**
     * @brief Parse unit string to LengthUnit enum
     * @throws UnitParseError if unit string is not recognized
     */
    static LengthUnit parse_unit_string(const std::string& unit_str);

private:
    double dpi_ = 96.0;

    /**
     * @brief Split numeric value and unit suffix
     *
     * Examples:
     *   "200" -> ("200", "")
     *   "12pt" -> ("12", "pt")
     *   "10.5 mm" -> ("10.5", "mm")
     */
    std::pair<std::string, std::string> split_value_and_unit(const std::string& input) const;
};

} // namespace typo
