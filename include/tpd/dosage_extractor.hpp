#ifndef TPD_DOSAGE_EXTRACTOR_HPP
#define TPD_DOSAGE_EXTRACTOR_HPP

#include <optional>
#include <string>

namespace tpd {

/**
 * @brief Reads the exposure encoded in an experiment name.
 *
 * Names follow "<prefix>_<dosage>[kK]_<suffix>", e.g. "Xe_12,5k_2" -> 12.5. The prefix
 * (everything up to the first '_') is ignored. The dosage must directly follow a '_' and
 * may use ',' or '.' as decimal separator ("Xe_NoDose5K_3" and "Xe_.5K_1" have none).
 *
 * @return The dosage, or std::nullopt when the name does not follow the convention.
 */
std::optional<double>
extract_dosage(const std::string &experiment_name);

} // namespace tpd

#endif // TPD_DOSAGE_EXTRACTOR_HPP
