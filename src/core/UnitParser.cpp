#include "UnitParser.hpp"
#include <algorithm>
#include <cctype>

namespace typo {

UnitParser::UnitParser(double dpi) : dpi_(dpi) {
    if (dpi <= 0) {
        throw UnitParseError("DPI must be positive, got: " + std::to_string(dpi));
    }
}

// ============================================================================
// UNIT CONVERSION
// ============================================================================

double UnitParser::to_pixels_factor(LengthUnit unit, double dpi) {
    if (dpi <= 0) {
        throw UnitParseError("DPI must be positive, got: " + std::to_string(dpi));
    }
    switch (unit) {
        case LengthUnit::PIXELS:      return 1.0;
        case LengthUnit::POINTS:      return dpi / 72.0;
        case LengthUnit::MILLIMETERS: return dpi / 25.4;
        case LengthUnit::INCHES:      return dpi;
    }
    throw UnitParseError("Unknown length unit in to_pixels_factor");
}

double UnitParser::convert_length(double value, LengthUnit from_unit, LengthUnit to_unit, double dpi) {
    if (from_unit == to_unit) {
        return value;
    }

    // Convert to pixels first, then to target unit
    double in_pixels = value * to_pixels_factor(from_unit, dpi);
    return in_pixels / to_pixels_factor(to_unit, dpi);
}

LengthUnit UnitParser::parse_unit_string(const std::string& unit_str) {
    std::string lower_unit = unit_str;
    std::transform(lower_unit.begin(), lower_unit.end(), lower_unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower_unit == "px" || lower_unit == "pixels") {
        return LengthUnit::PIXELS;
    } else if (lower_unit == "pt" || lower_unit == "points") {
        return LengthUnit::POINTS;
    } else if (lower_unit == "mm" || lower_unit == "millimeters") {
        return LengthUnit::MILLIMETERS;
    } else if (lower_unit == "in" || lower_unit == "inches" || lower_unit == "\"") {
        return LengthUnit::INCHES;
    }

    throw UnitParseError("Unrecognized unit: '" + unit_str + "'. " +
                       "Supported units: px, pt, mm, in");
}

// ============================================================================
// VALUE AND UNIT SPLITTING
// ============================================================================

std::pair<std::string, std::string> UnitParser::split_value_and_unit(const std::string& input) const {
    // Trim whitespace
    std::string trimmed = input;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\n\r"));
    trimmed.erase(trimmed.find_last_not_of(" \t\n\r") + 1);

    if (trimmed.empty()) {
        throw UnitParseError("Empty input string");
    }

    // Find where numeric part ends
    size_t num_end = 0;
    bool found_decimal = false;
    bool found_digit = false;

    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];

        if (std::isdigit(static_cast<unsigned char>(c))) {
            found_digit = true;
            num_end = i + 1;
        } else if (c == '.' && !found_decimal) {
            found_decimal = true;
            num_end = i + 1;
        } else if ((c == '-' || c == '+') && i == 0) {
            num_end = i + 1;
        } else {
            // Start of unit suffix
            break;
        }
    }

    if (!found_digit) {
        throw UnitParseError("No numeric value found in: '" + input + "'");
    }

    std::string value_str = trimmed.substr(0, num_end);
    std::string unit_str = trimmed.substr(num_end);

    unit_str.erase(0, unit_str.find_first_not_of(" \t"));
    unit_str.erase(unit_str.find_last_not_of(" \t") + 1);

    return {value_str, unit_str};
}

// ============================================================================
// LENGTH PARSING
// ============================================================================

ParsedLength UnitParser::parse_length(const std::string& input, LengthUnit default_unit) const {
    auto [value_str, unit_str] = split_value_and_unit(input);

    double value;
    try {
        value = std::stod(value_str);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid numeric value: '" + value_str + "'");
    }

    LengthUnit source_unit = default_unit;
    bool had_explicit_unit = !unit_str.empty();

    if (had_explicit_unit) {
        source_unit = parse_unit_string(unit_str);
    }

    double pixels = convert_length(value, source_unit, LengthUnit::PIXELS, dpi_);
    return ParsedLength(pixels, source_unit, had_explicit_unit);
}

std::pair<double, double> UnitParser::parse_size(const std::string& input) const {
    // Separator is the first 'x' that is not part of a "px" suffix
    size_t sep = std::string::npos;
    for (size_t i = 1; i < input.size(); ++i) {
        if ((input[i] == 'x' || input[i] == 'X') && input[i - 1] != 'p' && input[i - 1] != 'P') {
            sep = i;
            break;
        }
    }
    if (sep == std::string::npos) {
        throw UnitParseError("Size must be given as WIDTHxHEIGHT: '" + input + "'");
    }

    double width = parse_length(input.substr(0, sep)).pixels;
    double height = parse_length(input.substr(sep + 1)).pixels;
    return {width, height};
}

} // namespace typo
