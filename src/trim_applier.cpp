#include "tpd/trim_applier.hpp"
#include <utility>

namespace tpd {

const Channel *
trim_reference_channel(const Experiment &experiment) {
    if (const Channel *temperature = experiment.temperature_channel()) { return temperature; }
    if (experiment.channels.empty()) { return nullptr; }
    return &experiment.channels.front();
}

std::vector<std::size_t>
select_rows(const Experiment &experiment, const TrimRegion &region) {
    std::vector<std::size_t> rows;
    const Channel *reference = trim_reference_channel(experiment);
    if (reference == nullptr) { return rows; }
    for (std::size_t i = 0; i < reference->size(); ++i) {
        if (region.contains(reference->time[i])) { rows.push_back(i); }
    }
    return rows;
}

TrimmedExperiment
apply_trim(const Experiment &experiment, const TrimRegion &region) {
    experiment.validate_alignment();

    const std::vector<std::size_t> rows = select_rows(experiment, region);

    TrimmedExperiment trimmed;
    trimmed.name = experiment.name;
    trimmed.region = region;
    trimmed.temperature_index = experiment.temperature_index;
    trimmed.channels.reserve(experiment.channels.size());
    for (const auto &channel : experiment.channels) {
        Channel cut;
        cut.name = channel.name;
        cut.role = channel.role;
        cut.time.reserve(rows.size());
        cut.value.reserve(rows.size());
        for (std::size_t row : rows) {
            cut.time.push_back(channel.time[row]);
            cut.value.push_back(channel.value[row]);
        }
        trimmed.channels.push_back(std::move(cut));
    }
    return trimmed;
}

} // namespace tpd
