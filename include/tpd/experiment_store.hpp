#ifndef TPD_EXPERIMENT_STORE_HPP
#define TPD_EXPERIMENT_STORE_HPP

#include "tpd/analysis_options.hpp"
#include "tpd/experiment.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tpd {

/**
 * @brief Trim state of one experiment. Always replaced as a whole.
 */
struct TrimState {
    std::optional<TrimRegion> region;
    std::shared_ptr<const TrimmedExperiment> trimmed; ///< nullptr exactly when region is empty.
};

/**
 * @brief Outcome of ExperimentStore::load_files().
 */
struct LoadReport {
    std::vector<std::string> loaded;            ///< Experiment names, in load order.
    std::map<std::string, std::string> failures; ///< File path -> error message.
};

/**
 * @brief Session-wide collection of parsed experiments and their trim state.
 *
 * Experiments keep their insertion order. Each trim operation computes the new region and
 * trimmed data first and then swaps in the complete TrimState, so readers never observe a
 * region paired with trimmed data from another region. Callers holding a
 * shared_ptr<const TrimmedExperiment> keep a consistent snapshot after later trims.
 *
 * Not thread-safe; operations are expected to be issued one at a time.
 */
class ExperimentStore {
  public:
    using ChannelTable = std::map<std::string, Channel>;

    /**
     * @brief Adds an experiment, replacing (and un-trimming) one with the same name.
     * @throws std::invalid_argument if the experiment's channels are not row-aligned.
     */
    void add(Experiment experiment);

    /**
     * @brief Parses each file and adds it. A file that fails to load is reported in the
     *        result and does not affect the others or experiments already in the store.
     * @throws ConfigError if options are invalid (before any file is read).
     */
    LoadReport load_files(const std::vector<std::string> &paths, const ParserOptions &options = {});

    bool contains(const std::string &name) const;
    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    /// Experiment names in insertion order.
    const std::vector<std::string> &names() const { return order_; }

    /// @throws std::out_of_range for an unknown name.
    const Experiment &experiment(const std::string &name) const;

    /// @throws std::out_of_range for an unknown name.
    std::optional<TrimRegion> trim_region(const std::string &name) const;

    /// @return The current trimmed data, or nullptr when the experiment has no trim region.
    /// @throws std::out_of_range for an unknown name.
    std::shared_ptr<const TrimmedExperiment> trimmed(const std::string &name) const;

    /**
     * @brief Detects the linear heating region of one experiment and trims to it.
     *
     * When no region qualifies, the experiment's trim state is cleared.
     *
     * @return The new region, or std::nullopt.
     * @throws ConfigError if options are invalid.
     * @throws std::out_of_range for an unknown name.
     */
    std::optional<TrimRegion> detect_and_trim(const std::string &name, const TrimOptions &options);

    /**
     * @brief detect_and_trim() for every experiment, in insertion order.
     * @throws ConfigError if options are invalid (before any experiment is touched).
     */
    std::map<std::string, std::optional<TrimRegion>> detect_and_trim_all(const TrimOptions &options);

    /**
     * @brief Trims an experiment to externally supplied boundaries (e.g. dragged by a user).
     * @throws std::invalid_argument if end_time < start_time or either is not finite.
     * @throws std::out_of_range for an unknown name.
     */
    std::shared_ptr<const TrimmedExperiment> set_trim_region(const std::string &name,
                                                             double start_time,
                                                             double end_time);

    /// @throws std::out_of_range for an unknown name.
    void clear_trim_region(const std::string &name);

    // --- Views for plotting collaborators ---

    /// {experiment: {channel: Channel}} over the raw data of every experiment.
    std::map<std::string, ChannelTable> raw_channels() const;

    /// Same shape over trimmed data; experiments without a trim region are omitted.
    std::map<std::string, ChannelTable> trimmed_channels() const;

    /// Current trim region of every experiment (std::nullopt when none).
    std::map<std::string, std::optional<TrimRegion>> trim_regions() const;

  private:
    struct Record {
        Experiment experiment;
        TrimState trim;
    };

    const Record &record(const std::string &name) const;
    Record &record(const std::string &name);

    std::map<std::string, Record> records_;
    std::vector<std::string> order_;
};

} // namespace tpd

#endif // TPD_EXPERIMENT_STORE_HPP
