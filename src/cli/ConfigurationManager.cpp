/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for typo-fit
 */

#include "ConfigurationManager.hpp"
#include "UnitParser.hpp"
#include "../core/Logger.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace typo {

bool ConfigurationManager::load_from_file(const std::string& filename) {
    Logger logger("ConfigurationManager");

    std::ifstream file(filename);
    if (!file.is_open()) {
        logger.error("Could not open config file: " + filename);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_string(buffer.str())) {
        for (const auto& problem : problems_) {
            logger.error(filename + ": " + problem);
        }
        return false;
    }

    for (const auto& problem : problems_) {
        logger.warning(filename + ": " + problem);
    }
    logger.detailed("Loaded configuration from " + filename);
    return true;
}

bool ConfigurationManager::load_from_string(const std::string& text) {
    problems_.clear();

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            problems_.push_back("configuration must be a JSON object");
            return false;
        }
        apply_json(j);
        return true;
    } catch (const json::exception& e) {
        problems_.push_back(std::string("JSON error: ") + e.what());
        return false;
    }
}

void ConfigurationManager::apply_json(const json& j) {
    auto report = [this](const std::string& key, const std::string& expected) {
        problems_.push_back("'" + key + "' should be " + expected + ", using default");
    };

    auto read_number = [&](const std::string& key, double& target) {
        if (!j.contains(key) || j[key].is_null()) return;
        if (j[key].is_number()) {
            target = j[key].get<double>();
        } else {
            report(key, "a number");
        }
    };

    auto read_bool = [&](const std::string& key, bool& target) {
        if (!j.contains(key) || j[key].is_null()) return;
        if (j[key].is_boolean()) {
            target = j[key].get<bool>();
        } else {
            report(key, "true or false");
        }
    };

    auto read_string = [&](const std::string& key, std::string& target) {
        if (!j.contains(key) || j[key].is_null()) return;
        if (j[key].is_string()) {
            target = j[key].get<std::string>();
        } else {
            report(key, "a string");
        }
    };

    // Calibration lists are replaced as a whole
    if (j.contains("samples") && !j["samples"].is_null()) {
        try {
            config_.samples = j["samples"].get<std::vector<std::string>>();
        } catch (const json::exception&) {
            report("samples", "an array of strings");
        }
    }
    if (j.contains("distribution") && !j["distribution"].is_null()) {
        try {
            config_.distribution = j["distribution"].get<std::vector<double>>();
        } catch (const json::exception&) {
            report("distribution", "an array of numbers");
        }
    }

    read_string("tail", config_.tail);
    read_number("dpi", config_.dpi);

    // Lengths take numbers (pixels) or strings with a unit suffix
    auto read_length = [&](const std::string& key, auto& target) {
        if (!j.contains(key) || j[key].is_null()) return;
        if (j[key].is_number()) {
            target = j[key].get<double>();
        } else if (j[key].is_string()) {
            try {
                UnitParser parser(config_.dpi);
                target = parser.parse_length(j[key].get<std::string>()).pixels;
            } catch (const UnitParseError& e) {
                problems_.push_back(std::string(e.what()) + " for key '" + key + "', using default");
            }
        } else {
            report(key, "a number or a length such as \"12pt\"");
        }
    };

    read_length("font_size", config_.font_size_px);
    read_length("target_width", config_.target_width_px);

    read_number("box_ratio", config_.box_ratio);
    read_bool("by_height", config_.by_height);
    read_number("threshold", config_.threshold);

    if (j.contains("direction") && !j["direction"].is_null()) {
        if (j["direction"].is_number()) {
            double direction = j["direction"].get<double>();
            config_.direction = direction < 0 ? -1 : (direction > 0 ? 1 : 0);
        } else {
            report("direction", "a number");
        }
    }

    if (j.contains("glyph_metrics") && !j["glyph_metrics"].is_null()) {
        const auto& gm = j["glyph_metrics"];
        if (!gm.is_object()) {
            report("glyph_metrics", "an object");
        } else {
            GlyphMetrics metrics;
            if (gm.contains("default_advance") && gm["default_advance"].is_number()) {
                metrics.default_advance = gm["default_advance"].get<double>();
            }
            if (gm.contains("advances") && gm["advances"].is_object()) {
                for (const auto& [glyph, advance] : gm["advances"].items()) {
                    if (glyph.size() != 1 || !advance.is_number()) {
                        problems_.push_back("glyph_metrics.advances entry '" + glyph +
                                            "' ignored, expected a single character and a number");
                        continue;
                    }
                    metrics.advances[glyph[0]] = advance.get<double>();
                }
            }
            config_.glyph_metrics = metrics;
        }
    }

    if (j.contains("log_level") && !j["log_level"].is_null()) {
        if (j["log_level"].is_number_integer()) {
            config_.log_level = j["log_level"].get<int>();
        } else {
            report("log_level", "an integer from 1 to 6");
        }
    }
    if (j.contains("log_file") && j["log_file"].is_string()) {
        config_.log_file = j["log_file"].get<std::string>();
    }
}

json ConfigurationManager::to_json() const {
    json j;
    j["samples"] = config_.samples;
    j["distribution"] = config_.distribution;
    j["tail"] = config_.tail;
    j["target_width"] = config_.target_width_px ? json(*config_.target_width_px) : json(nullptr);
    j["font_size"] = config_.font_size_px;
    j["dpi"] = config_.dpi;
    j["box_ratio"] = config_.box_ratio;
    j["by_height"] = config_.by_height;
    j["threshold"] = config_.threshold;
    j["direction"] = config_.direction;
    j["log_level"] = config_.log_level;
    j["log_file"] = config_.log_file ? json(*config_.log_file) : json(nullptr);

    if (config_.glyph_metrics) {
        json advances = json::object();
        for (const auto& [glyph, advance] : config_.glyph_metrics->advances) {
            advances[std::string(1, glyph)] = advance;
        }
        j["glyph_metrics"] = {
            {"default_advance", config_.glyph_metrics->default_advance},
            {"advances", advances}
        };
    } else {
        j["glyph_metrics"] = nullptr;
    }

    return j;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << to_json().dump(2) << std::endl;
    return static_cast<bool>(file);
}

} // namespace typo
