#include "tpd.hpp"
#include <array>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void
print_usage(const char *program) {
    std::cerr << "Usage: " << program << " [--config options.json] [--ratio L0 L1 R0 R1] file..." << '\n'
              << "  --config  JSON file overriding parser, trim, integration and calibration options" << '\n'
              << "  --ratio   left and right temperature windows (K) for ratio integration" << '\n';
}

void
report_fits(const tpd::CalibrationData &points, const tpd::CalibrationOptions &options) {
    if (points.x.size() < 2) {
        std::cout << "Not enough dosages for a calibration fit (" << points.x.size() << ")." << '\n';
        return;
    }
    try {
        const tpd::LinearFit line = tpd::fit_linear(points.x, points.y);
        std::cout << "Linear fit: y = " << line.slope << " * x + " << line.intercept << " (R^2 = " << line.r_squared
                  << ")" << '\n';
    } catch (const std::invalid_argument &e) { std::cerr << "Linear fit failed: " << e.what() << '\n'; }

    try {
        const tpd::PiecewiseFit monolayer = tpd::fit_piecewise(points.x, points.y, options);
        std::cout << "Monolayer fit: threshold = " << monolayer.threshold << ", slope = " << monolayer.slope
                  << " (cost " << monolayer.cost << ", " << monolayer.iterations << " iterations)" << '\n';
    } catch (const tpd::FitConvergenceError &e) {
        std::cerr << "Monolayer fit failed: " << e.what() << '\n' << e.solver_report() << '\n';
    } catch (const std::invalid_argument &e) { std::cerr << "Monolayer fit failed: " << e.what() << '\n'; }
}

} // namespace

int
main(int argc, char **argv) {
    std::string config_path;
    bool use_ratio = false;
    std::array<double, 4> bounds{};
    std::vector<std::string> files;

    // --- 1. Command line ---
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--ratio") == 0 && i + 4 < argc) {
            for (double &bound : bounds) {
                auto value = tpd::parse_decimal(argv[++i]);
                if (!value.has_value()) {
                    std::cerr << "Invalid window boundary '" << argv[i] << "'." << '\n';
                    return 2;
                }
                bound = *value;
            }
            use_ratio = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown or incomplete option '" << argv[i] << "'." << '\n';
            print_usage(argv[0]);
            return 2;
        } else {
            files.emplace_back(argv[i]);
        }
    }
    if (files.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        const tpd::AnalysisOptions options =
          config_path.empty() ? tpd::AnalysisOptions{} : tpd::load_analysis_options(config_path);

        // --- 2. Load and trim ---
        tpd::ExperimentStore store;
        const tpd::LoadReport report = store.load_files(files, options.parser);
        std::cout << "Loaded " << report.loaded.size() << " of " << files.size() << " file(s)." << '\n';
        if (store.empty()) { return 1; }

        const auto regions = store.detect_and_trim_all(options.trim);
        std::cout << '\n' << "Experiment\tStart [s]\tEnd [s]" << '\n';
        for (const auto &name : store.names()) {
            const auto &region = regions.at(name);
            if (region.has_value()) {
                std::cout << name << '\t' << region->start_time << '\t' << region->end_time << '\n';
            } else {
                std::cout << name << "\t-\t-" << '\n';
            }
        }

        // --- 3. Integrate ---
        tpd::IntegrationEngine engine(store, options.integration);
        tpd::CalibrationData points;
        std::cout << '\n';
        if (use_ratio) {
            const tpd::RatioWindows windows{ bounds[0], bounds[1], bounds[2], bounds[3] };
            const tpd::RatioIntegrationResult result = engine.integrate_ratio(engine.select_all(), windows);
            std::cout << "Dosage\tLeft/Right" << '\n';
            for (const auto &entry : result.ratios) {
                std::cout << entry.first << '\t';
                if (entry.second.has_value()) {
                    std::cout << *entry.second << '\n';
                } else {
                    std::cout << "undefined" << '\n';
                }
            }
            points = tpd::calibration_points(result.ratios);
        } else {
            const tpd::FullIntegrationResult result = engine.integrate_full(engine.select_all());
            std::cout << "Dosage\tIntegral" << '\n';
            for (const auto &entry : result.integrals) { std::cout << entry.first << '\t' << entry.second << '\n'; }
            points = tpd::calibration_points(result.integrals);
        }

        // --- 4. Calibration ---
        std::cout << '\n';
        report_fits(points, options.calibration);
    } catch (const tpd::ConfigError &e) {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return 2;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
