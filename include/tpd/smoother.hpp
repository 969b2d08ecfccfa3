#ifndef TPD_SMOOTHER_HPP
#define TPD_SMOOTHER_HPP

#include <vector>

namespace tpd {

/**
 * @brief Moving-average (box) filter shared by trimming and integration.
 *
 * Output sample i is the mean of the window input samples from i - window/2 to
 * i + (window - 1 - window/2). Near the edges the series is extended by reflection with
 * the edge sample repeated (x1 x0 | x0 x1 ... xn-1 | xn-1 xn-2), so every output averages
 * exactly window values. A window of 1 returns the input.
 *
 * @param values Input sequence.
 * @param window Number of samples averaged per output sample.
 * @return Sequence of the same length as values.
 * @throws ConfigError if window < 1.
 */
std::vector<double>
smooth(const std::vector<double> &values, int window);

} // namespace tpd

#endif // TPD_SMOOTHER_HPP
