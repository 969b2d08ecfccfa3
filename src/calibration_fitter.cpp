#include "tpd/calibration_fitter.hpp"
#include "tpd/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <boost/math/statistics/univariate_statistics.hpp>
#include <ceres/ceres.h>
#include <cmath>
#include <iostream>
#include <string>

namespace tpd {

namespace {

void
check_samples(const std::vector<double> &x, const std::vector<double> &y, const char *caller) {
    if (x.size() != y.size()) {
        throw std::invalid_argument(std::string(caller) + ": x has " + std::to_string(x.size()) +
                                    " samples but y has " + std::to_string(y.size()) + ".");
    }
    if (x.size() < 2) { throw std::invalid_argument(std::string(caller) + ": at least two samples are required."); }
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            throw std::invalid_argument(std::string(caller) + ": samples must be finite.");
        }
    }
}

// Residual y - f(x) of the zero-then-linear model; params = [threshold, slope].
struct PiecewiseResidual {
    PiecewiseResidual(double x, double y)
      : x_(x)
      , y_(y) {}

    template<typename T>
    bool operator()(const T *const params, T *residual) const {
        const T &threshold = params[0];
        const T &slope = params[1];
        const T x(x_);
        T prediction(0.0);
        if (!(x < threshold)) { prediction = slope * (x - threshold); }
        residual[0] = T(y_) - prediction;
        return true;
    }

  private:
    double x_;
    double y_;
};

} // namespace

CalibrationData
calibration_points(const std::map<double, double> &integrals) {
    CalibrationData data;
    for (const auto &pair : integrals) {
        data.x.push_back(pair.first);
        data.y.push_back(pair.second);
    }
    return data;
}

CalibrationData
calibration_points(const std::map<double, RatioValue> &ratios) {
    CalibrationData data;
    for (const auto &pair : ratios) {
        if (!pair.second.has_value()) { continue; }
        data.x.push_back(pair.first);
        data.y.push_back(*pair.second);
    }
    return data;
}

LinearFit
fit_linear(const std::vector<double> &x, const std::vector<double> &y) {
    check_samples(x, y, "fit_linear");

    const Eigen::Index n = static_cast<Eigen::Index>(x.size());
    Eigen::MatrixXd design(n, 2);
    Eigen::VectorXd response(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        design(i, 0) = x[i];
        design(i, 1) = 1.0;
        response(i) = y[i];
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
    if (qr.rank() < 2) { throw std::invalid_argument("fit_linear: all dosages are equal; slope is undefined."); }
    const Eigen::VectorXd coefficients = qr.solve(response);

    LinearFit fit;
    fit.slope = coefficients(0);
    fit.intercept = coefficients(1);
    fit.x = x;
    fit.y = y;

    const Eigen::VectorXd residuals = response - design * coefficients;
    const double ss_res = residuals.squaredNorm();
    const double ss_tot = (response.array() - response.mean()).matrix().squaredNorm();
    fit.r_squared = ss_tot > 0.0 ? 1.0 - ss_res / ss_tot : 1.0;
    return fit;
}

PiecewiseFit
fit_piecewise(const std::vector<double> &x, const std::vector<double> &y, const CalibrationOptions &options) {
    check_samples(x, y, "fit_piecewise");
    options.validate();

    const auto [x_min, x_max] = std::minmax_element(x.begin(), x.end());
    const auto [y_min, y_max] = std::minmax_element(y.begin(), y.end());
    if (*x_max == *x_min) { throw std::invalid_argument("fit_piecewise: all dosages are equal."); }

    std::vector<double> x_copy = x; // median() reorders its argument
    PiecewiseFit fit;
    fit.initial_threshold = boost::math::statistics::median(x_copy);
    fit.initial_slope = (*y_max - *y_min) / (*x_max - *x_min);
    fit.x = x;
    fit.y = y;

    double params[2] = { fit.initial_threshold, fit.initial_slope };

    ceres::Problem problem;
    for (std::size_t i = 0; i < x.size(); ++i) {
        ceres::CostFunction *cost_function =
          new ceres::AutoDiffCostFunction<PiecewiseResidual, 1, 2>(new PiecewiseResidual(x[i], y[i]));
        problem.AddResidualBlock(cost_function, nullptr, params);
    }

    ceres::Solver::Options solver_options;
    solver_options.linear_solver_type = ceres::DENSE_QR;
    solver_options.max_num_iterations = options.max_num_iterations;
    solver_options.function_tolerance = options.function_tolerance;
    solver_options.gradient_tolerance = options.gradient_tolerance;
    solver_options.parameter_tolerance = options.parameter_tolerance;
    solver_options.minimizer_progress_to_stdout = options.verbose;

    ceres::Solver::Summary summary;
    ceres::Solve(solver_options, &problem, &summary);
    if (options.verbose) { std::cout << "[CalibrationFitter] " << summary.BriefReport() << std::endl; }

    if (summary.termination_type != ceres::CONVERGENCE || !summary.IsSolutionUsable() || !std::isfinite(params[0]) ||
        !std::isfinite(params[1])) {
        std::cerr << "[CalibrationFitter] Piecewise fit did not converge: " << summary.BriefReport() << std::endl;
        throw FitConvergenceError("Piecewise calibration fit did not converge.", summary.BriefReport());
    }

    fit.threshold = params[0];
    fit.slope = params[1];
    fit.cost = summary.final_cost;
    fit.iterations = static_cast<int>(summary.iterations.size());
    return fit;
}

} // namespace tpd
