#ifndef TPD_ANALYSIS_OPTIONS_HPP
#define TPD_ANALYSIS_OPTIONS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace tpd {

/**
 * @brief Layout of the instrument's tab-separated export.
 */
struct ParserOptions {
    std::size_t header_line_index = 6;   ///< 0-based line holding the channel names.
    std::size_t columns_per_channel = 3; ///< (sample index, time, value) per channel.

    /// When true, a file without a channel matching temperature_markers is a ParseError
    /// instead of falling back to the last channel.
    bool require_temperature_marker = false;

    /// Case-insensitive substrings identifying the temperature channel's header token.
    std::vector<std::string> temperature_markers = { "temp" };

    /// @throws ConfigError if the layout is unusable.
    void validate() const;
};

/**
 * @brief Parameters of the linear heating-ramp search.
 */
struct TrimOptions {
    double target_slope = 1.0; ///< K/s
    double tolerance = 0.3;    ///< Allowed |slope - target_slope|.
    bool smoothing_enabled = false;
    int smoothing_window = 10;
    double min_duration = 20.0; ///< Seconds a run must span to qualify.

    /// @throws ConfigError on a window < 1, a negative tolerance or non-finite values.
    void validate() const;
};

/**
 * @brief Parameters shared by full and ratio integration.
 */
struct IntegrationOptions {
    /// Box window applied to the temperature axis before integrating (1 disables smoothing).
    int temperature_smoothing_window = 10;

    void validate() const;
};

/**
 * @brief Ceres settings for the piecewise calibration fit.
 */
struct CalibrationOptions {
    int max_num_iterations = 200;
    double function_tolerance = 1e-10;
    double gradient_tolerance = 1e-14;
    double parameter_tolerance = 1e-10;
    bool verbose = false; ///< Print Ceres progress to stdout.

    void validate() const;
};

/**
 * @brief Every tunable of the analysis pipeline.
 */
struct AnalysisOptions {
    ParserOptions parser;
    TrimOptions trim;
    IntegrationOptions integration;
    CalibrationOptions calibration;

    void validate() const;
};

/**
 * @brief Builds options from a JSON document, starting from the defaults.
 *
 * Recognised top-level objects are "parser", "trim", "integration" and "calibration";
 * their members use the field names of the structs above. Unknown keys are ignored.
 *
 * @throws ConfigError if the text is not valid JSON, a value has the wrong type, or the
 *         resulting options fail validation.
 */
AnalysisOptions
parse_analysis_options(const std::string &json_text);

/**
 * @brief Reads and parses a JSON options file.
 * @throws ConfigError if the file cannot be opened or its content is invalid.
 */
AnalysisOptions
load_analysis_options(const std::string &path);

} // namespace tpd

#endif // TPD_ANALYSIS_OPTIONS_HPP
