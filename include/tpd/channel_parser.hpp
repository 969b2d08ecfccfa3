#ifndef TPD_CHANNEL_PARSER_HPP
#define TPD_CHANNEL_PARSER_HPP

#include "tpd/analysis_options.hpp"
#include "tpd/experiment.hpp"
#include <optional>
#include <string>

namespace tpd {

/**
 * @brief Converts a numeric token that may use ',' or '.' as decimal separator.
 *
 * Surrounding whitespace is ignored; the rest of the token must convert completely.
 *
 * @return The value, or std::nullopt if the token is not a number.
 */
std::optional<double>
parse_decimal(const std::string &token);

/**
 * @brief Parses the text of one instrument export into an Experiment.
 *
 * Layout: metadata lines, then the tab-separated channel-name header on line
 * options.header_line_index, then data rows holding options.columns_per_channel columns
 * (sample index, time, value) per header entry in header order. A column-label row
 * directly after the header and a terminator as the last line are dropped when they hold
 * no numeric cell; a data row with a single bad cell is a ParseError.
 *
 * Channels are named "{experiment_name}_{header token}". The temperature channel is the
 * first one whose header token contains a temperature marker; without a match the last
 * channel is used (or a ParseError raised if options.require_temperature_marker is set).
 *
 * @param experiment_name Name of the experiment, normally the file name without extension.
 * @param content Whole file content.
 * @param options Layout options.
 * @return The parsed experiment; all channels have the same row count.
 * @throws ParseError on a missing header, inconsistent column counts or unparsable numbers.
 * @throws ConfigError if options are invalid.
 */
Experiment
parse_experiment(const std::string &experiment_name, const std::string &content, const ParserOptions &options = {});

/**
 * @brief File name without directory and extension ("data/Xe_5K_1.txt" -> "Xe_5K_1").
 */
std::string
experiment_name_from_path(const std::string &path);

/**
 * @brief Reads a file from disk and parses it with parse_experiment().
 * @throws std::runtime_error if the file cannot be read.
 * @throws ParseError if its content is malformed.
 */
Experiment
load_experiment_file(const std::string &path, const ParserOptions &options = {});

} // namespace tpd

#endif // TPD_CHANNEL_PARSER_HPP
