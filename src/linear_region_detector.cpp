#include "tpd/linear_region_detector.hpp"
#include "tpd/smoother.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace tpd {

std::vector<double>
compute_slopes(const std::vector<double> &time, const std::vector<double> &temperature) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> slopes(temperature.size(), nan);
    for (std::size_t i = 1; i < temperature.size(); ++i) {
        const double dt = time[i] - time[i - 1];
        if (dt == 0.0 || !std::isfinite(dt)) { continue; }
        slopes[i] = (temperature[i] - temperature[i - 1]) / dt;
    }
    return slopes;
}

std::optional<LinearRun>
find_linear_run(const std::vector<double> &time, const std::vector<double> &temperature, const TrimOptions &options) {
    options.validate();

    if (time.size() != temperature.size()) {
        std::cerr << "[LinearRegionDetector] Warning: time (" << time.size() << ") and temperature ("
                  << temperature.size() << ") lengths differ; no linear region." << std::endl;
        return std::nullopt;
    }
    if (temperature.empty()) { return std::nullopt; }

    const std::vector<double> reference =
      options.smoothing_enabled ? smooth(temperature, options.smoothing_window) : temperature;
    const std::vector<double> slopes = compute_slopes(time, reference);

    // NaN slopes compare false and therefore never qualify.
    auto qualifies = [&](std::size_t i) { return std::abs(slopes[i] - options.target_slope) <= options.tolerance; };
    auto long_enough = [&](std::size_t start, std::size_t end) {
        return time[end] - time[start] >= options.min_duration;
    };

    std::optional<std::size_t> run_start;
    for (std::size_t i = 0; i < slopes.size(); ++i) {
        if (qualifies(i)) {
            if (!run_start.has_value()) { run_start = i; }
            continue;
        }
        if (run_start.has_value()) {
            if (long_enough(*run_start, i - 1)) { return LinearRun{ *run_start, i - 1 }; }
            run_start.reset();
        }
    }
    // A run is only closed by a non-qualifying sample; one still open at the end does not count.
    return std::nullopt;
}

std::optional<TrimRegion>
detect_linear_region(const std::vector<double> &time,
                     const std::vector<double> &temperature,
                     const TrimOptions &options) {
    auto run = find_linear_run(time, temperature, options);
    if (!run.has_value()) { return std::nullopt; }
    return TrimRegion{ time[run->start], time[run->end] };
}

std::optional<TrimRegion>
detect_linear_region(const Experiment &experiment, const TrimOptions &options) {
    const Channel *temperature = experiment.temperature_channel();
    if (temperature == nullptr) {
        options.validate();
        std::cerr << "[LinearRegionDetector] Warning: experiment '" << experiment.name
                  << "' has no temperature channel." << std::endl;
        return std::nullopt;
    }

    auto region = detect_linear_region(temperature->time, temperature->value, options);
    if (region.has_value()) {
        std::cout << "[LinearRegionDetector] Linear region for " << experiment.name << ": " << region->start_time
                  << " s to " << region->end_time << " s" << std::endl;
    } else {
        std::cout << "[LinearRegionDetector] No valid linear region found for " << experiment.name << "."
                  << std::endl;
    }
    return region;
}

} // namespace tpd
