#ifndef TPD_INTEGRATION_ENGINE_HPP
#define TPD_INTEGRATION_ENGINE_HPP

#include "tpd/analysis_options.hpp"
#include "tpd/experiment.hpp"
#include "tpd/experiment_store.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tpd {

/**
 * @brief Ratio of two window integrals; std::nullopt means "undefined" (zero right integral).
 */
using RatioValue = std::optional<double>;

/**
 * @brief Channels of one experiment to integrate.
 *
 * Channel names may be given in full ("Xe_5K_1_Mass 131") or as the header token
 * ("Mass 131"). An empty list selects every ion-current channel.
 */
struct ChannelSelection {
    std::string experiment;
    std::vector<std::string> channels;
};

/**
 * @brief Two temperature sub-windows (Kelvin, inclusive) for ratio integration.
 */
struct RatioWindows {
    double left_start = 0.0;
    double left_end = 0.0;
    double right_start = 0.0;
    double right_end = 0.0;

    /// @throws ConfigError if a window is inverted, not finite, or the windows overlap.
    void validate() const;
};

/**
 * @brief Per-experiment record of a full integration.
 */
struct ExperimentIntegral {
    std::string experiment;
    double dosage = 0.0;
    double integral = 0.0;
    std::size_t channel_count = 0;
};

struct FullIntegrationResult {
    std::map<double, double> integrals;          ///< dosage -> summed integral
    std::vector<ExperimentIntegral> experiments; ///< every experiment that contributed
    std::vector<std::string> warnings;           ///< skipped experiments and collisions
};

/**
 * @brief Per-experiment record of a ratio integration.
 */
struct ExperimentRatio {
    std::string experiment;
    double dosage = 0.0;
    double left_integral = 0.0;
    double right_integral = 0.0;
    RatioValue ratio;
};

struct RatioIntegrationResult {
    std::map<double, RatioValue> ratios; ///< dosage -> left / right
    std::vector<ExperimentRatio> experiments;
    std::vector<std::string> warnings;
};

/**
 * @brief Left and right window integrals of one experiment.
 */
struct WindowIntegrals {
    double left = 0.0;
    double right = 0.0;

    /// left / right, or std::nullopt when right is exactly zero.
    RatioValue ratio() const;
};

/**
 * @brief Integral of each ion channel against (smoothed) temperature over the whole
 *        trimmed range, summed across channels.
 * @throws std::invalid_argument if the experiment has no temperature channel.
 * @throws ConfigError if temperature_smoothing_window < 1.
 */
double
integrate_channels(const TrimmedExperiment &trimmed,
                   const std::vector<const Channel *> &ion_channels,
                   int temperature_smoothing_window);

/**
 * @brief Integrals of the ion channels over the left and right temperature windows.
 *
 * Samples are assigned to a window by their smoothed temperature; each subset keeps its
 * sample order and is integrated on its own. Contributions are summed across channels.
 *
 * @throws std::invalid_argument if the experiment has no temperature channel.
 * @throws ConfigError if the windows or the smoothing window are invalid.
 */
WindowIntegrals
integrate_windows(const TrimmedExperiment &trimmed,
                  const std::vector<const Channel *> &ion_channels,
                  const RatioWindows &windows,
                  int temperature_smoothing_window);

/**
 * @brief Dose-response integration over the trimmed experiments of a store.
 *
 * Results are keyed by the dosage read from each experiment's name. Experiments that
 * cannot contribute (unknown, untrimmed, empty after trimming, no temperature channel,
 * no dosage in the name, unknown channel) are skipped with a warning. When two
 * experiments share a dosage the later one in the selection overwrites the earlier.
 */
class IntegrationEngine {
  public:
    /// @throws ConfigError if options are invalid.
    explicit IntegrationEngine(const ExperimentStore &store, IntegrationOptions options = {});

    /// Selection of every ion channel of every experiment in the store.
    std::vector<ChannelSelection> select_all() const;

    FullIntegrationResult integrate_full(const std::vector<ChannelSelection> &selections) const;

    /// @throws ConfigError if the windows are invalid (before any experiment is integrated).
    RatioIntegrationResult integrate_ratio(const std::vector<ChannelSelection> &selections,
                                           const RatioWindows &windows) const;

    const IntegrationOptions &options() const { return options_; }

  private:
    struct PreparedExperiment {
        std::shared_ptr<const TrimmedExperiment> trimmed;
        std::vector<const Channel *> channels;
        double dosage = 0.0;
    };

    // Resolves a selection; on failure appends a warning and returns std::nullopt.
    std::optional<PreparedExperiment> prepare(const ChannelSelection &selection,
                                              std::vector<std::string> &warnings) const;

    const ExperimentStore &store_;
    IntegrationOptions options_;
};

} // namespace tpd

#endif // TPD_INTEGRATION_ENGINE_HPP
