#include "tpd/analysis_options.hpp"
#include "tpd/errors.hpp"
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace tpd {

void
ParserOptions::validate() const {
    if (columns_per_channel < 3) {
        throw ConfigError("columns_per_channel must be at least 3 (index, time, value), got " +
                          std::to_string(columns_per_channel) + ".");
    }
    if (require_temperature_marker && temperature_markers.empty()) {
        throw ConfigError("require_temperature_marker is set but no temperature markers are configured.");
    }
    for (const auto &marker : temperature_markers) {
        if (marker.empty()) { throw ConfigError("Temperature markers cannot be empty strings."); }
    }
}

void
TrimOptions::validate() const {
    if (!std::isfinite(target_slope)) { throw ConfigError("Target slope must be a finite number."); }
    if (!std::isfinite(tolerance) || tolerance < 0.0) {
        throw ConfigError("Slope tolerance must be a non-negative finite number, got " + std::to_string(tolerance) +
                          ".");
    }
    if (smoothing_window < 1) {
        throw ConfigError("Smoothing window must be at least 1, got " + std::to_string(smoothing_window) + ".");
    }
    if (!std::isfinite(min_duration) || min_duration < 0.0) {
        throw ConfigError("Minimum duration must be a non-negative finite number.");
    }
}

void
IntegrationOptions::validate() const {
    if (temperature_smoothing_window < 1) {
        throw ConfigError("Temperature smoothing window must be at least 1, got " +
                          std::to_string(temperature_smoothing_window) + ".");
    }
}

void
CalibrationOptions::validate() const {
    if (max_num_iterations < 1) { throw ConfigError("max_num_iterations must be positive."); }
    if (!(function_tolerance > 0.0) || !(gradient_tolerance > 0.0) || !(parameter_tolerance > 0.0)) {
        throw ConfigError("Calibration solver tolerances must be positive.");
    }
}

void
AnalysisOptions::validate() const {
    parser.validate();
    trim.validate();
    integration.validate();
    calibration.validate();
}

namespace {

template<typename T>
void
read_if_present(const nlohmann::json &section, const char *key, T &target) {
    auto it = section.find(key);
    if (it != section.end()) { target = it->template get<T>(); }
}

const nlohmann::json *
find_section(const nlohmann::json &root, const char *key) {
    auto it = root.find(key);
    if (it == root.end()) { return nullptr; }
    if (!it->is_object()) { throw ConfigError(std::string("Config section '") + key + "' must be a JSON object."); }
    return &(*it);
}

} // namespace

AnalysisOptions
parse_analysis_options(const std::string &json_text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error &e) {
        throw ConfigError(std::string("Invalid JSON in analysis options: ") + e.what());
    }
    if (!root.is_object()) { throw ConfigError("Analysis options must be a JSON object."); }

    AnalysisOptions options;
    try {
        if (const auto *parser = find_section(root, "parser")) {
            read_if_present(*parser, "header_line_index", options.parser.header_line_index);
            read_if_present(*parser, "columns_per_channel", options.parser.columns_per_channel);
            read_if_present(*parser, "require_temperature_marker", options.parser.require_temperature_marker);
            read_if_present(*parser, "temperature_markers", options.parser.temperature_markers);
        }
        if (const auto *trim = find_section(root, "trim")) {
            read_if_present(*trim, "target_slope", options.trim.target_slope);
            read_if_present(*trim, "tolerance", options.trim.tolerance);
            read_if_present(*trim, "smoothing_enabled", options.trim.smoothing_enabled);
            read_if_present(*trim, "smoothing_window", options.trim.smoothing_window);
            read_if_present(*trim, "min_duration", options.trim.min_duration);
        }
        if (const auto *integration = find_section(root, "integration")) {
            read_if_present(*integration,
                            "temperature_smoothing_window",
                            options.integration.temperature_smoothing_window);
        }
        if (const auto *calibration = find_section(root, "calibration")) {
            read_if_present(*calibration, "max_num_iterations", options.calibration.max_num_iterations);
            read_if_present(*calibration, "function_tolerance", options.calibration.function_tolerance);
            read_if_present(*calibration, "gradient_tolerance", options.calibration.gradient_tolerance);
            read_if_present(*calibration, "parameter_tolerance", options.calibration.parameter_tolerance);
            read_if_present(*calibration, "verbose", options.calibration.verbose);
        }
    } catch (const nlohmann::json::exception &e) {
        throw ConfigError(std::string("Invalid value in analysis options: ") + e.what());
    }

    options.validate();
    return options;
}

AnalysisOptions
load_analysis_options(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) { throw ConfigError("Could not open analysis options file '" + path + "'."); }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_analysis_options(buffer.str());
}

} // namespace tpd
