#include "tpd/integration_engine.hpp"
#include "tpd/dosage_extractor.hpp"
#include "tpd/errors.hpp"
#include "tpd/simpson.hpp"
#include "tpd/smoother.hpp"
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tpd {

namespace {

void
warn(std::vector<std::string> &warnings, const std::string &message) {
    std::cerr << "[IntegrationEngine] Warning: " << message << std::endl;
    warnings.push_back(message);
}

std::string
format_dosage(double dosage) {
    std::ostringstream out;
    out << dosage;
    return out.str();
}

std::vector<double>
smoothed_temperature(const TrimmedExperiment &trimmed, int window) {
    const Channel *temperature = trimmed.temperature_channel();
    if (temperature == nullptr) {
        throw std::invalid_argument("Experiment '" + trimmed.name + "' has no temperature channel.");
    }
    return smooth(temperature->value, window);
}

void
check_row_alignment(const TrimmedExperiment &trimmed, const Channel &channel, std::size_t rows) {
    if (channel.size() != rows) {
        throw std::invalid_argument("Channel '" + channel.name + "' of '" + trimmed.name +
                                    "' is not aligned with the temperature channel.");
    }
}

// Keeps the samples whose temperature lies in [lo, hi], in sample order, and integrates them.
double
integrate_window(const std::vector<double> &temperature, const std::vector<double> &current, double lo, double hi) {
    std::vector<double> x;
    std::vector<double> y;
    for (std::size_t i = 0; i < temperature.size(); ++i) {
        if (temperature[i] >= lo && temperature[i] <= hi) {
            x.push_back(temperature[i]);
            y.push_back(current[i]);
        }
    }
    return simpson(x, y);
}

} // namespace

void
RatioWindows::validate() const {
    for (double bound : { left_start, left_end, right_start, right_end }) {
        if (!std::isfinite(bound)) { throw ConfigError("Integration window boundaries must be finite numbers."); }
    }
    if (left_end < left_start) { throw ConfigError("Left integration window ends before it starts."); }
    if (right_end < right_start) { throw ConfigError("Right integration window ends before it starts."); }
    // Windows may touch but not overlap.
    if (left_start < right_end && right_start < left_end) {
        throw ConfigError("Left and right integration windows overlap.");
    }
}

RatioValue
WindowIntegrals::ratio() const {
    if (right == 0.0) { return std::nullopt; }
    return left / right;
}

double
integrate_channels(const TrimmedExperiment &trimmed,
                   const std::vector<const Channel *> &ion_channels,
                   int temperature_smoothing_window) {
    const std::vector<double> temperature = smoothed_temperature(trimmed, temperature_smoothing_window);
    double total = 0.0;
    for (const Channel *channel : ion_channels) {
        check_row_alignment(trimmed, *channel, temperature.size());
        total += simpson(temperature, channel->value);
    }
    return total;
}

WindowIntegrals
integrate_windows(const TrimmedExperiment &trimmed,
                  const std::vector<const Channel *> &ion_channels,
                  const RatioWindows &windows,
                  int temperature_smoothing_window) {
    windows.validate();
    const std::vector<double> temperature = smoothed_temperature(trimmed, temperature_smoothing_window);
    WindowIntegrals integrals;
    for (const Channel *channel : ion_channels) {
        check_row_alignment(trimmed, *channel, temperature.size());
        integrals.left += integrate_window(temperature, channel->value, windows.left_start, windows.left_end);
        integrals.right += integrate_window(temperature, channel->value, windows.right_start, windows.right_end);
    }
    return integrals;
}

// --- IntegrationEngine ---

IntegrationEngine::IntegrationEngine(const ExperimentStore &store, IntegrationOptions options)
  : store_(store)
  , options_(std::move(options)) {
    options_.validate();
}

std::vector<ChannelSelection>
IntegrationEngine::select_all() const {
    std::vector<ChannelSelection> selections;
    for (const auto &name : store_.names()) { selections.push_back(ChannelSelection{ name, {} }); }
    return selections;
}

std::optional<IntegrationEngine::PreparedExperiment>
IntegrationEngine::prepare(const ChannelSelection &selection, std::vector<std::string> &warnings) const {
    const std::string &name = selection.experiment;
    if (!store_.contains(name)) {
        warn(warnings, "skipping unknown experiment '" + name + "'.");
        return std::nullopt;
    }

    auto trimmed = store_.trimmed(name);
    if (!trimmed) {
        warn(warnings, "skipping '" + name + "': no linear region / trim window.");
        return std::nullopt;
    }
    if (trimmed->empty()) {
        warn(warnings, "skipping '" + name + "': trimmed data is empty.");
        return std::nullopt;
    }
    const Channel *temperature = trimmed->temperature_channel();
    if (temperature == nullptr) {
        warn(warnings, "skipping '" + name + "': no temperature reference channel.");
        return std::nullopt;
    }

    const auto dosage = extract_dosage(name);
    if (!dosage.has_value()) {
        warn(warnings, "skipping '" + name + "': could not extract a dosage from its name.");
        return std::nullopt;
    }

    PreparedExperiment prepared;
    prepared.dosage = *dosage;
    if (selection.channels.empty()) {
        prepared.channels = trimmed->ion_channels();
    } else {
        for (const auto &channel_name : selection.channels) {
            const Channel *channel = trimmed->find_channel(channel_name);
            if (channel == nullptr) { channel = trimmed->find_channel(name + "_" + channel_name); }
            if (channel == nullptr) {
                warn(warnings, "skipping '" + name + "': unknown channel '" + channel_name + "'.");
                return std::nullopt;
            }
            if (channel == temperature) {
                warn(warnings, "'" + name + "': temperature channel excluded from integration.");
                continue;
            }
            prepared.channels.push_back(channel);
        }
    }
    if (prepared.channels.empty()) {
        warn(warnings, "skipping '" + name + "': no ion-current channel selected.");
        return std::nullopt;
    }
    prepared.trimmed = std::move(trimmed);
    return prepared;
}

FullIntegrationResult
IntegrationEngine::integrate_full(const std::vector<ChannelSelection> &selections) const {
    FullIntegrationResult result;
    std::map<double, std::string> written_by;

    for (const auto &selection : selections) {
        auto prepared = prepare(selection, result.warnings);
        if (!prepared.has_value()) { continue; }

        const double integral =
          integrate_channels(*prepared->trimmed, prepared->channels, options_.temperature_smoothing_window);

        auto previous = written_by.find(prepared->dosage);
        if (previous != written_by.end()) {
            warn(result.warnings,
                 "dosage " + format_dosage(prepared->dosage) + " of '" + selection.experiment +
                   "' overwrites the result of '" + previous->second + "'.");
        }
        written_by[prepared->dosage] = selection.experiment;
        result.integrals[prepared->dosage] = integral;
        result.experiments.push_back(
          ExperimentIntegral{ selection.experiment, prepared->dosage, integral, prepared->channels.size() });

        std::cout << "[IntegrationEngine] " << selection.experiment << " (dosage " << prepared->dosage
                  << "): integral " << integral << " over " << prepared->channels.size() << " channel(s)"
                  << std::endl;
    }
    return result;
}

RatioIntegrationResult
IntegrationEngine::integrate_ratio(const std::vector<ChannelSelection> &selections,
                                   const RatioWindows &windows) const {
    windows.validate();

    RatioIntegrationResult result;
    std::map<double, std::string> written_by;

    for (const auto &selection : selections) {
        auto prepared = prepare(selection, result.warnings);
        if (!prepared.has_value()) { continue; }

        const WindowIntegrals integrals =
          integrate_windows(*prepared->trimmed, prepared->channels, windows, options_.temperature_smoothing_window);
        const RatioValue ratio = integrals.ratio();
        if (!ratio.has_value()) {
            warn(result.warnings, "'" + selection.experiment + "': right window integral is zero; ratio undefined.");
        }

        auto previous = written_by.find(prepared->dosage);
        if (previous != written_by.end()) {
            warn(result.warnings,
                 "dosage " + format_dosage(prepared->dosage) + " of '" + selection.experiment +
                   "' overwrites the result of '" + previous->second + "'.");
        }
        written_by[prepared->dosage] = selection.experiment;
        result.ratios[prepared->dosage] = ratio;
        result.experiments.push_back(
          ExperimentRatio{ selection.experiment, prepared->dosage, integrals.left, integrals.right, ratio });
    }
    return result;
}

} // namespace tpd
