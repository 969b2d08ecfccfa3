#ifndef TPD_TRIM_APPLIER_HPP
#define TPD_TRIM_APPLIER_HPP

#include "tpd/experiment.hpp"
#include <cstddef>
#include <vector>

namespace tpd {

/**
 * @brief Channel whose time stamps define the rows kept by a trim.
 *
 * The tagged temperature channel, else the first channel, else nullptr.
 */
const Channel *
trim_reference_channel(const Experiment &experiment);

/**
 * @brief Rows whose reference-channel time lies in [region.start_time, region.end_time].
 */
std::vector<std::size_t>
select_rows(const Experiment &experiment, const TrimRegion &region);

/**
 * @brief Restricts every channel of an experiment to the rows inside a trim region.
 *
 * The same row selection is applied to all channels, so the result stays row-aligned.
 * No matching row yields an empty TrimmedExperiment (its channels are present but hold
 * no samples). The input is not modified and the result depends only on the inputs.
 *
 * @throws std::invalid_argument if the experiment's channels are not row-aligned.
 */
TrimmedExperiment
apply_trim(const Experiment &experiment, const TrimRegion &region);

} // namespace tpd

#endif // TPD_TRIM_APPLIER_HPP
