#ifndef TPD_EXPERIMENT_HPP
#define TPD_EXPERIMENT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tpd {

/**
 * @brief Physical meaning of a channel within an experiment.
 */
enum class ChannelRole {
    IonCurrent, ///< Detector current for one species (arbitrary units).
    Temperature ///< Sample temperature in Kelvin; the reference for trimming and integration.
};

/**
 * @brief One named time series of an experiment.
 *
 * time[i] is in seconds, value[i] is the sample at that time. Both vectors always have
 * the same length.
 */
struct Channel {
    std::string name;
    ChannelRole role = ChannelRole::IonCurrent;
    std::vector<double> time;
    std::vector<double> value;

    std::size_t size() const { return time.size(); }
    bool empty() const { return time.empty(); }
    bool is_temperature() const { return role == ChannelRole::Temperature; }
};

/**
 * @brief Time window of the linear part of the heating ramp (inclusive on both ends).
 */
struct TrimRegion {
    double start_time = 0.0;
    double end_time = 0.0;

    double duration() const { return end_time - start_time; }
    bool contains(double t) const { return t >= start_time && t <= end_time; }

    bool operator==(const TrimRegion &other) const {
        return start_time == other.start_time && end_time == other.end_time;
    }
    bool operator!=(const TrimRegion &other) const { return !(*this == other); }
};

/**
 * @brief All channels parsed from one instrument file, row-aligned.
 *
 * Channels keep the order of the file's header. The temperature channel is tagged
 * explicitly (temperature_index) instead of being inferred from its position.
 */
struct Experiment {
    std::string name;
    std::vector<Channel> channels;
    std::optional<std::size_t> temperature_index;

    /// Number of rows shared by all channels (0 for an experiment without channels).
    std::size_t row_count() const;

    /// @return The tagged temperature channel, or nullptr when none is tagged.
    const Channel *temperature_channel() const;

    /// @return Pointers to every channel that is not the temperature channel, in header order.
    std::vector<const Channel *> ion_channels() const;

    /// @return The channel with the given full name (e.g. "Xe_5K_1_Mass 131"), or nullptr.
    const Channel *find_channel(const std::string &channel_name) const;

    /**
     * @brief Checks that every channel has the same number of samples.
     * @throws std::invalid_argument when lengths differ or the temperature index is out of range.
     */
    void validate_alignment() const;
};

/**
 * @brief Channels of an experiment restricted to the rows inside a trim region.
 *
 * Built by apply_trim() and never modified afterwards; a new trim region produces a new object.
 */
struct TrimmedExperiment {
    std::string name;
    TrimRegion region;
    std::vector<Channel> channels;
    std::optional<std::size_t> temperature_index;

    /// True when no row of the reference channel fell inside the region.
    bool empty() const;
    std::size_t row_count() const;
    const Channel *temperature_channel() const;
    std::vector<const Channel *> ion_channels() const;
    const Channel *find_channel(const std::string &channel_name) const;
};

} // namespace tpd

#endif // TPD_EXPERIMENT_HPP
