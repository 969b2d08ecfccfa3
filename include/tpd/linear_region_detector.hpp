#ifndef TPD_LINEAR_REGION_DETECTOR_HPP
#define TPD_LINEAR_REGION_DETECTOR_HPP

#include "tpd/analysis_options.hpp"
#include "tpd/experiment.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace tpd {

/**
 * @brief Index range [start, end] (inclusive) of a qualifying run of samples.
 */
struct LinearRun {
    std::size_t start = 0;
    std::size_t end = 0;
};

/**
 * @brief Local heating rate slope[i] = (T[i] - T[i-1]) / (t[i] - t[i-1]).
 *
 * slope[0] is NaN, as is any slope whose time step is zero or non-finite.
 * Requires time.size() == temperature.size().
 */
std::vector<double>
compute_slopes(const std::vector<double> &time, const std::vector<double> &temperature);

/**
 * @brief Finds the first run of samples heating at the target rate for long enough.
 *
 * A sample qualifies when |slope - target_slope| <= tolerance. Runs are scanned in time
 * order and the FIRST run whose span time[end] - time[start] reaches options.min_duration
 * is returned, even when a later run is longer. A run is evaluated when the first
 * non-qualifying sample ends it; a run still qualifying at the last sample is never
 * returned.
 *
 * @return The run's indices, or std::nullopt when no run is long enough or the input
 *         is empty or inconsistent.
 * @throws ConfigError if options are invalid.
 */
std::optional<LinearRun>
find_linear_run(const std::vector<double> &time, const std::vector<double> &temperature, const TrimOptions &options);

/**
 * @brief Same search as find_linear_run(), reported as time values so the window can be
 *        applied to channels with a different sampling.
 */
std::optional<TrimRegion>
detect_linear_region(const std::vector<double> &time,
                     const std::vector<double> &temperature,
                     const TrimOptions &options);

/**
 * @brief Runs detect_linear_region() on the experiment's temperature channel.
 * @return std::nullopt (with a warning) when the experiment has no temperature channel.
 */
std::optional<TrimRegion>
detect_linear_region(const Experiment &experiment, const TrimOptions &options);

} // namespace tpd

#endif // TPD_LINEAR_REGION_DETECTOR_HPP
