#include "tpd/simpson.hpp"
#include <stdexcept>
#include <string>

namespace tpd {

namespace {

double
trapezoid(double x0, double x1, double y0, double y1) {
    return 0.5 * (x1 - x0) * (y0 + y1);
}

// Simpson over [x[i], x[i+2]] with unequal panel widths.
double
simpson_pair(const std::vector<double> &x, const std::vector<double> &y, std::size_t i) {
    const double h0 = x[i + 1] - x[i];
    const double h1 = x[i + 2] - x[i + 1];
    if (h0 == 0.0 || h1 == 0.0) {
        return trapezoid(x[i], x[i + 1], y[i], y[i + 1]) + trapezoid(x[i + 1], x[i + 2], y[i + 1], y[i + 2]);
    }
    const double h = h0 + h1;
    return h / 6.0 * ((2.0 - h1 / h0) * y[i] + (h * h / (h0 * h1)) * y[i + 1] + (2.0 - h0 / h1) * y[i + 2]);
}

// Last interval of an odd-interval series, from the parabola through the last three samples.
double
last_interval_correction(const std::vector<double> &x, const std::vector<double> &y) {
    const std::size_t n = x.size();
    const double h0 = x[n - 2] - x[n - 3];
    const double h1 = x[n - 1] - x[n - 2];
    if (h0 == 0.0 || h0 + h1 == 0.0) { return trapezoid(x[n - 2], x[n - 1], y[n - 2], y[n - 1]); }
    const double alpha = (2.0 * h1 * h1 + 3.0 * h0 * h1) / (6.0 * (h0 + h1));
    const double beta = (h1 * h1 + 3.0 * h0 * h1) / (6.0 * h0);
    const double eta = (h1 * h1 * h1) / (6.0 * h0 * (h0 + h1));
    return alpha * y[n - 1] + beta * y[n - 2] - eta * y[n - 3];
}

} // namespace

double
simpson(const std::vector<double> &x, const std::vector<double> &y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("simpson: x has " + std::to_string(x.size()) + " samples but y has " +
                                    std::to_string(y.size()) + ".");
    }
    const std::size_t n = x.size();
    if (n < 2) { return 0.0; }
    if (n == 2) { return trapezoid(x[0], x[1], y[0], y[1]); }

    const std::size_t intervals = n - 1;
    const std::size_t paired_end = (intervals % 2 == 0) ? n - 1 : n - 2;

    double result = 0.0;
    for (std::size_t i = 0; i + 2 <= paired_end; i += 2) { result += simpson_pair(x, y, i); }
    if (intervals % 2 == 1) { result += last_interval_correction(x, y); }
    return result;
}

} // namespace tpd
