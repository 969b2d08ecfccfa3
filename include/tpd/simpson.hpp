#ifndef TPD_SIMPSON_HPP
#define TPD_SIMPSON_HPP

#include <vector>

namespace tpd {

/**
 * @brief Composite Simpson's rule for samples at arbitrary (non-uniform) abscissae.
 *
 * Consecutive panel pairs use the non-uniform three-point formula. With an odd number of
 * intervals the last interval is closed with a quadratic end correction, so the rule is
 * exact for quadratics either way. Two samples fall back to the trapezoid, fewer give 0.
 * A pair containing a zero-width panel is integrated with the trapezoid.
 *
 * @param x Abscissae (e.g. temperature), in sample order.
 * @param y Ordinates, same length as x.
 * @throws std::invalid_argument if x and y differ in length.
 */
double
simpson(const std::vector<double> &x, const std::vector<double> &y);

} // namespace tpd

#endif // TPD_SIMPSON_HPP
