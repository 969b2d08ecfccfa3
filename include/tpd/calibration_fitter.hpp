#ifndef TPD_CALIBRATION_FITTER_HPP
#define TPD_CALIBRATION_FITTER_HPP

#include "tpd/analysis_options.hpp"
#include "tpd/integration_engine.hpp"
#include <cstddef>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tpd {

/**
 * @brief (dosage, response) samples in ascending dosage order.
 */
struct CalibrationData {
    std::vector<double> x;
    std::vector<double> y;
};

/// Converts a full-integration result into fit input.
CalibrationData
calibration_points(const std::map<double, double> &integrals);

/// Converts a ratio-integration result into fit input; undefined ratios are dropped.
CalibrationData
calibration_points(const std::map<double, RatioValue> &ratios);

/**
 * @brief Ordinary least-squares line y = slope * x + intercept.
 */
struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
    std::vector<double> x; ///< Samples the fit was computed from.
    std::vector<double> y;

    double evaluate(double at) const { return slope * at + intercept; }
};

/**
 * @brief Monolayer model f(x) = 0 for x < threshold, slope * (x - threshold) otherwise.
 */
struct PiecewiseFit {
    double threshold = 0.0;
    double slope = 0.0;
    double initial_threshold = 0.0;
    double initial_slope = 0.0;
    double cost = 0.0; ///< Half the sum of squared residuals, as reported by Ceres.
    int iterations = 0;
    std::vector<double> x;
    std::vector<double> y;

    double evaluate(double at) const { return at < threshold ? 0.0 : slope * (at - threshold); }
};

/**
 * @brief Fits a straight line to calibration samples.
 * @throws std::invalid_argument if x and y differ in length, fewer than two samples are
 *         given, or all x are equal.
 */
LinearFit
fit_linear(const std::vector<double> &x, const std::vector<double> &y);

/**
 * @brief Fits the zero-then-linear monolayer model by nonlinear least squares.
 *
 * Starts from threshold = median(x) and slope = (max(y) - min(y)) / (max(x) - min(x)).
 *
 * @throws std::invalid_argument for mismatched or insufficient samples or a zero x range.
 * @throws ConfigError if options are invalid.
 * @throws FitConvergenceError if the solver does not report convergence.
 */
PiecewiseFit
fit_piecewise(const std::vector<double> &x, const std::vector<double> &y, const CalibrationOptions &options = {});

/**
 * @brief Evaluates a fitted model at n evenly spaced points across the sampled x range,
 *        for drawing the fitted curve.
 * @throws std::invalid_argument if n < 2 or the fit holds no samples.
 */
template<typename Fit>
std::vector<std::pair<double, double>>
sample_curve(const Fit &fit, std::size_t n = 100) {
    if (n < 2) { throw std::invalid_argument("sample_curve needs at least two points."); }
    if (fit.x.empty()) { throw std::invalid_argument("sample_curve called on a fit without samples."); }
    double lo = fit.x.front();
    double hi = fit.x.front();
    for (double value : fit.x) {
        lo = value < lo ? value : lo;
        hi = value > hi ? value : hi;
    }
    std::vector<std::pair<double, double>> curve;
    curve.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double at = lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
        curve.emplace_back(at, fit.evaluate(at));
    }
    return curve;
}

} // namespace tpd

#endif // TPD_CALIBRATION_FITTER_HPP
