#include "tpd/channel_parser.hpp"
#include "tpd/errors.hpp"
#include <boost/algorithm/string.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tpd {

namespace {

std::vector<std::string>
split_lines(const std::string &content) {
    std::vector<std::string> lines;
    boost::split(lines, content, boost::is_any_of("\n"));
    for (auto &line : lines) {
        if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    }
    return lines;
}

bool
is_blank(const std::string &line) {
    return boost::trim_copy(line).empty();
}

std::vector<std::string>
split_cells(const std::string &line) {
    std::vector<std::string> cells;
    boost::split(cells, line, boost::is_any_of("\t"));
    for (auto &cell : cells) { boost::trim(cell); }
    // Exports pad rows with trailing tabs.
    while (!cells.empty() && cells.back().empty()) { cells.pop_back(); }
    return cells;
}

// Column-label rows and end-of-data markers hold no number at all.
bool
has_no_numeric_cell(const std::vector<std::string> &cells) {
    for (const auto &cell : cells) {
        if (parse_decimal(cell).has_value()) { return false; }
    }
    return true;
}

bool
matches_temperature_marker(const std::string &token, const std::vector<std::string> &markers) {
    for (const auto &marker : markers) {
        if (boost::algorithm::icontains(token, marker)) { return true; }
    }
    return false;
}

} // namespace

std::optional<double>
parse_decimal(const std::string &token) {
    std::string normalized = boost::trim_copy(token);
    if (normalized.empty()) { return std::nullopt; }
    boost::replace_all(normalized, ",", ".");

    std::istringstream stream(normalized);
    stream.imbue(std::locale::classic());
    double value = 0.0;
    stream >> value;
    if (stream.fail()) { return std::nullopt; }
    if (stream.peek() != std::char_traits<char>::eof()) { return std::nullopt; }
    return value;
}

Experiment
parse_experiment(const std::string &experiment_name, const std::string &content, const ParserOptions &options) {
    options.validate();

    const std::vector<std::string> lines = split_lines(content);
    const std::size_t header_index = options.header_line_index;
    if (lines.size() <= header_index || is_blank(lines[header_index])) {
        throw ParseError(experiment_name,
                         0,
                         "missing channel header (expected on line " + std::to_string(header_index + 1) + ").");
    }

    // --- Channel header ---
    std::vector<std::string> headers;
    for (const auto &token : split_cells(lines[header_index])) {
        if (!token.empty()) { headers.push_back(token); }
    }
    if (headers.empty()) {
        throw ParseError(experiment_name, header_index + 1, "channel header contains no channel names.");
    }

    // --- Locate data rows: [first, last) in line indices ---
    std::size_t first = header_index + 1;
    std::size_t last = lines.size();
    while (last > first && is_blank(lines[last - 1])) { --last; }

    if (first < last && has_no_numeric_cell(split_cells(lines[first]))) {
        ++first; // Column-label row repeated for every channel block.
    }
    if (first < last && has_no_numeric_cell(split_cells(lines[last - 1]))) {
        --last; // Instrument end-of-data marker.
    }

    // --- Channels ---
    Experiment experiment;
    experiment.name = experiment_name;
    experiment.channels.resize(headers.size());
    for (std::size_t c = 0; c < headers.size(); ++c) {
        experiment.channels[c].name = experiment_name + "_" + headers[c];
        experiment.channels[c].time.reserve(last - first);
        experiment.channels[c].value.reserve(last - first);
    }

    const std::size_t width = options.columns_per_channel;
    const std::size_t expected_cells = width * headers.size();
    for (std::size_t line_index = first; line_index < last; ++line_index) {
        const std::size_t line_number = line_index + 1;
        if (is_blank(lines[line_index])) {
            throw ParseError(experiment_name, line_number, "blank line inside the data block.");
        }
        const auto cells = split_cells(lines[line_index]);
        if (cells.size() != expected_cells) {
            throw ParseError(experiment_name,
                             line_number,
                             "expected " + std::to_string(expected_cells) + " columns for " +
                               std::to_string(headers.size()) + " channels, found " + std::to_string(cells.size()) +
                               ".");
        }

        std::vector<double> row(cells.size());
        for (std::size_t i = 0; i < cells.size(); ++i) {
            auto number = parse_decimal(cells[i]);
            if (!number.has_value()) {
                throw ParseError(experiment_name,
                                 line_number,
                                 "column " + std::to_string(i + 1) + ": cannot convert '" + cells[i] +
                                   "' to a number.");
            }
            row[i] = *number;
        }
        for (std::size_t c = 0; c < headers.size(); ++c) {
            experiment.channels[c].time.push_back(row[c * width + 1]);
            experiment.channels[c].value.push_back(row[c * width + 2]);
        }
    }

    // --- Temperature role ---
    for (std::size_t c = 0; c < headers.size(); ++c) {
        if (matches_temperature_marker(headers[c], options.temperature_markers)) {
            experiment.temperature_index = c;
            break;
        }
    }
    if (!experiment.temperature_index.has_value()) {
        if (options.require_temperature_marker) {
            throw ParseError(experiment_name, header_index + 1, "no channel header names a temperature channel.");
        }
        std::cerr << "[ChannelParser] Warning: no temperature marker in the header of '" << experiment_name
                  << "'; using last channel '" << headers.back() << "' as temperature." << std::endl;
        experiment.temperature_index = headers.size() - 1;
    }
    experiment.channels[*experiment.temperature_index].role = ChannelRole::Temperature;

    return experiment;
}

std::string
experiment_name_from_path(const std::string &path) {
    return std::filesystem::path(path).stem().string();
}

Experiment
load_experiment_file(const std::string &path, const ParserOptions &options) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) { throw std::runtime_error("Could not open experiment file '" + path + "'."); }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) { throw std::runtime_error("Error while reading experiment file '" + path + "'."); }
    return parse_experiment(experiment_name_from_path(path), buffer.str(), options);
}

} // namespace tpd
