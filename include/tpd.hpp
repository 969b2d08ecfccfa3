#ifndef TPD_HPP
#define TPD_HPP

// Umbrella header for the TPD analysis library.

#include "tpd/analysis_options.hpp"
#include "tpd/calibration_fitter.hpp"
#include "tpd/channel_parser.hpp"
#include "tpd/dosage_extractor.hpp"
#include "tpd/errors.hpp"
#include "tpd/experiment.hpp"
#include "tpd/experiment_store.hpp"
#include "tpd/integration_engine.hpp"
#include "tpd/linear_region_detector.hpp"
#include "tpd/simpson.hpp"
#include "tpd/smoother.hpp"
#include "tpd/trim_applier.hpp"

#endif // TPD_HPP
