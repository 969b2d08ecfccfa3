#include "tpd/experiment.hpp"
#include <stdexcept>
#include <string>

namespace tpd {

namespace {

// Shared by Experiment and TrimmedExperiment, which hold channels the same way.
const Channel *
temperature_of(const std::vector<Channel> &channels, const std::optional<std::size_t> &index) {
    if (!index.has_value() || *index >= channels.size()) { return nullptr; }
    return &channels[*index];
}

std::vector<const Channel *>
ions_of(const std::vector<Channel> &channels, const std::optional<std::size_t> &index) {
    std::vector<const Channel *> ions;
    for (std::size_t i = 0; i < channels.size(); ++i) {
        if (index.has_value() && *index == i) { continue; }
        ions.push_back(&channels[i]);
    }
    return ions;
}

const Channel *
find_in(const std::vector<Channel> &channels, const std::string &channel_name) {
    for (const auto &channel : channels) {
        if (channel.name == channel_name) { return &channel; }
    }
    return nullptr;
}

} // namespace

// --- Experiment ---

std::size_t
Experiment::row_count() const {
    return channels.empty() ? 0 : channels.front().size();
}

const Channel *
Experiment::temperature_channel() const {
    return temperature_of(channels, temperature_index);
}

std::vector<const Channel *>
Experiment::ion_channels() const {
    return ions_of(channels, temperature_index);
}

const Channel *
Experiment::find_channel(const std::string &channel_name) const {
    return find_in(channels, channel_name);
}

void
Experiment::validate_alignment() const {
    if (temperature_index.has_value() && *temperature_index >= channels.size()) {
        throw std::invalid_argument("Experiment '" + name + "': temperature index " +
                                    std::to_string(*temperature_index) + " is out of range.");
    }
    const std::size_t rows = row_count();
    for (const auto &channel : channels) {
        if (channel.time.size() != channel.value.size()) {
            throw std::invalid_argument("Channel '" + channel.name + "' has " + std::to_string(channel.time.size()) +
                                        " time stamps but " + std::to_string(channel.value.size()) + " values.");
        }
        if (channel.size() != rows) {
            throw std::invalid_argument("Channel '" + channel.name + "' has " + std::to_string(channel.size()) +
                                        " rows, expected " + std::to_string(rows) + ".");
        }
    }
}

// --- TrimmedExperiment ---

bool
TrimmedExperiment::empty() const {
    return row_count() == 0;
}

std::size_t
TrimmedExperiment::row_count() const {
    return channels.empty() ? 0 : channels.front().size();
}

const Channel *
TrimmedExperiment::temperature_channel() const {
    return temperature_of(channels, temperature_index);
}

std::vector<const Channel *>
TrimmedExperiment::ion_channels() const {
    return ions_of(channels, temperature_index);
}

const Channel *
TrimmedExperiment::find_channel(const std::string &channel_name) const {
    return find_in(channels, channel_name);
}

} // namespace tpd
