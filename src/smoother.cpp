#include "tpd/smoother.hpp"
#include "tpd/errors.hpp"
#include <cstddef>
#include <string>

namespace tpd {

namespace {

// Mirrors an out-of-range index about the series edges, repeating the edge sample
// (d c b a | a b c d | d c b a).
std::ptrdiff_t
reflect_index(std::ptrdiff_t j, std::ptrdiff_t n) {
    const std::ptrdiff_t period = 2 * n;
    std::ptrdiff_t m = j % period;
    if (m < 0) { m += period; }
    return m < n ? m : period - 1 - m;
}

} // namespace

std::vector<double>
smooth(const std::vector<double> &values, int window) {
    if (window < 1) { throw ConfigError("Smoothing window must be at least 1, got " + std::to_string(window) + "."); }
    if (window == 1 || values.size() < 2) { return values; }

    const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(values.size());
    const std::ptrdiff_t left_reach = window / 2;
    const std::ptrdiff_t right_reach = window - 1 - left_reach;

    std::vector<double> smoothed(values.size());
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        double sum = 0.0;
        for (std::ptrdiff_t j = i - left_reach; j <= i + right_reach; ++j) { sum += values[reflect_index(j, n)]; }
        smoothed[i] = sum / static_cast<double>(window);
    }
    return smoothed;
}

} // namespace tpd
