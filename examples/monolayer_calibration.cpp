#include "tpd.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Synthetic desorption peak centred at 320 K whose area saturates beyond a monolayer.
tpd::Experiment
synthetic_experiment(const std::string &name, double dosage, double monolayer_dosage) {
    const double area = dosage < monolayer_dosage ? 0.0 : 5.0 * (dosage - monolayer_dosage);
    tpd::Experiment experiment;
    experiment.name = name;

    tpd::Channel ion;
    ion.name = name + "_Mass 131";
    tpd::Channel temperature;
    temperature.name = name + "_Temperature";
    temperature.role = tpd::ChannelRole::Temperature;

    for (int i = 0; i <= 90; ++i) {
        const double t = 0.5 * i;
        const double T = 290.0 + (t < 40.0 ? t : 40.0);
        const double peak = area / (4.0 * std::sqrt(2.0 * std::acos(-1.0))) * std::exp(-0.5 * std::pow((T - 310.0) / 4.0, 2));
        ion.time.push_back(t);
        ion.value.push_back(peak);
        temperature.time.push_back(t);
        temperature.value.push_back(T);
    }
    experiment.channels = { ion, temperature };
    experiment.temperature_index = 1;
    return experiment;
}

} // namespace

int
main() {
    std::cout << "--- Monolayer Calibration Example ---" << '\n';

    // --- 1. Build experiments at increasing dosage ---
    const double true_monolayer = 2.0;
    const std::vector<double> dosages = { 0.5, 1.0, 1.5, 3.0, 4.0, 5.0, 6.5, 8.0 };
    tpd::ExperimentStore store;
    for (std::size_t i = 0; i < dosages.size(); ++i) {
        std::ostringstream name;
        name << "Xe_" << dosages[i] << "K_" << i + 1;
        store.add(synthetic_experiment(name.str(), dosages[i], true_monolayer));
    }

    // --- 2. Trim to the linear heating region ---
    tpd::AnalysisOptions options;
    store.detect_and_trim_all(options.trim);

    // --- 3. Integrate ---
    options.integration.temperature_smoothing_window = 1;
    tpd::IntegrationEngine engine(store, options.integration);
    const tpd::FullIntegrationResult result = engine.integrate_full(engine.select_all());

    std::cout << '\n' << "Dosage\tIntegral" << '\n';
    for (const auto &entry : result.integrals) { std::cout << entry.first << '\t' << entry.second << '\n'; }

    // --- 4. Fit ---
    const tpd::CalibrationData points = tpd::calibration_points(result.integrals);
    try {
        const tpd::PiecewiseFit fit = tpd::fit_piecewise(points.x, points.y, options.calibration);
        std::cout << '\n'
                  << "True monolayer dosage: " << true_monolayer << '\n'
                  << "Fitted threshold:      " << fit.threshold << '\n'
                  << "Fitted slope:          " << fit.slope << '\n';

        std::cout << '\n' << "Fitted curve (every 20th point):" << '\n';
        const auto curve = tpd::sample_curve(fit);
        for (std::size_t i = 0; i < curve.size(); i += 20) {
            std::cout << curve[i].first << '\t' << curve[i].second << '\n';
        }
    } catch (const tpd::FitConvergenceError &e) {
        std::cerr << "Fit failed: " << e.what() << '\n' << e.solver_report() << '\n';
        return 1;
    }
    return 0;
}
