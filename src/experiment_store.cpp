#include "tpd/experiment_store.hpp"
#include "tpd/channel_parser.hpp"
#include "tpd/errors.hpp"
#include "tpd/linear_region_detector.hpp"
#include "tpd/trim_applier.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tpd {

namespace {

TrimState
make_trim_state(const Experiment &experiment, const std::optional<TrimRegion> &region) {
    TrimState state;
    if (!region.has_value()) { return state; }
    state.region = region;
    state.trimmed = std::make_shared<const TrimmedExperiment>(apply_trim(experiment, *region));
    if (state.trimmed->empty()) {
        std::cerr << "[ExperimentStore] Warning: trim region of '" << experiment.name
                  << "' contains no samples; trimmed data is empty." << std::endl;
    }
    return state;
}

ExperimentStore::ChannelTable
to_table(const std::vector<Channel> &channels) {
    ExperimentStore::ChannelTable table;
    for (const auto &channel : channels) { table.emplace(channel.name, channel); }
    return table;
}

} // namespace

const ExperimentStore::Record &
ExperimentStore::record(const std::string &name) const {
    auto it = records_.find(name);
    if (it == records_.end()) { throw std::out_of_range("Unknown experiment '" + name + "'."); }
    return it->second;
}

ExperimentStore::Record &
ExperimentStore::record(const std::string &name) {
    auto it = records_.find(name);
    if (it == records_.end()) { throw std::out_of_range("Unknown experiment '" + name + "'."); }
    return it->second;
}

void
ExperimentStore::add(Experiment experiment) {
    experiment.validate_alignment();
    const std::string name = experiment.name;
    auto it = records_.find(name);
    if (it != records_.end()) {
        std::cerr << "[ExperimentStore] Warning: replacing existing experiment '" << name << "'." << std::endl;
        it->second = Record{ std::move(experiment), TrimState{} };
        return;
    }
    records_.emplace(name, Record{ std::move(experiment), TrimState{} });
    order_.push_back(name);
}

LoadReport
ExperimentStore::load_files(const std::vector<std::string> &paths, const ParserOptions &options) {
    options.validate();

    LoadReport report;
    for (const auto &path : paths) {
        try {
            Experiment experiment = load_experiment_file(path, options);
            std::cout << "[ExperimentStore] Loaded " << experiment.name << " (" << experiment.channels.size()
                      << " channels, " << experiment.row_count() << " rows)" << std::endl;
            report.loaded.push_back(experiment.name);
            add(std::move(experiment));
        } catch (const ParseError &e) {
            std::cerr << "[ExperimentStore] Error: could not parse '" << path << "': " << e.what() << std::endl;
            report.failures[path] = e.what();
        } catch (const std::runtime_error &e) {
            std::cerr << "[ExperimentStore] Error: could not read '" << path << "': " << e.what() << std::endl;
            report.failures[path] = e.what();
        }
    }
    return report;
}

bool
ExperimentStore::contains(const std::string &name) const {
    return records_.count(name) > 0;
}

const Experiment &
ExperimentStore::experiment(const std::string &name) const {
    return record(name).experiment;
}

std::optional<TrimRegion>
ExperimentStore::trim_region(const std::string &name) const {
    return record(name).trim.region;
}

std::shared_ptr<const TrimmedExperiment>
ExperimentStore::trimmed(const std::string &name) const {
    return record(name).trim.trimmed;
}

std::optional<TrimRegion>
ExperimentStore::detect_and_trim(const std::string &name, const TrimOptions &options) {
    options.validate();
    Record &target = record(name);
    const auto region = detect_linear_region(target.experiment, options);
    TrimState next = make_trim_state(target.experiment, region);
    target.trim = std::move(next);
    return region;
}

std::map<std::string, std::optional<TrimRegion>>
ExperimentStore::detect_and_trim_all(const TrimOptions &options) {
    options.validate();
    std::map<std::string, std::optional<TrimRegion>> regions;
    for (const auto &name : order_) { regions[name] = detect_and_trim(name, options); }
    return regions;
}

std::shared_ptr<const TrimmedExperiment>
ExperimentStore::set_trim_region(const std::string &name, double start_time, double end_time) {
    if (!std::isfinite(start_time) || !std::isfinite(end_time)) {
        throw std::invalid_argument("Trim boundaries must be finite numbers.");
    }
    if (end_time < start_time) {
        throw std::invalid_argument("Trim end (" + std::to_string(end_time) + ") is before trim start (" +
                                    std::to_string(start_time) + ").");
    }
    Record &target = record(name);
    TrimState next = make_trim_state(target.experiment, TrimRegion{ start_time, end_time });
    target.trim = std::move(next);
    return target.trim.trimmed;
}

void
ExperimentStore::clear_trim_region(const std::string &name) {
    record(name).trim = TrimState{};
}

std::map<std::string, ExperimentStore::ChannelTable>
ExperimentStore::raw_channels() const {
    std::map<std::string, ChannelTable> view;
    for (const auto &name : order_) { view[name] = to_table(record(name).experiment.channels); }
    return view;
}

std::map<std::string, ExperimentStore::ChannelTable>
ExperimentStore::trimmed_channels() const {
    std::map<std::string, ChannelTable> view;
    for (const auto &name : order_) {
        const auto &trimmed_data = record(name).trim.trimmed;
        if (trimmed_data) { view[name] = to_table(trimmed_data->channels); }
    }
    return view;
}

std::map<std::string, std::optional<TrimRegion>>
ExperimentStore::trim_regions() const {
    std::map<std::string, std::optional<TrimRegion>> view;
    for (const auto &name : order_) { view[name] = record(name).trim.region; }
    return view;
}

} // namespace tpd
