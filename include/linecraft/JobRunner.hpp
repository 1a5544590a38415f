#pragma once
#include "Settings.hpp"
#include <nlohmann/json.hpp>

namespace linecraft {

/*
 * Run a job description:
 *
 *   { "settings": {...},
 *     "curves":   [ {"name", "points", "reference"?, "visible"?}, ... ],
 *     "steps":    [ {"op", "select"?, "settings"?, "algorithm"?, "reference"?, "position"?}, ... ] }
 *
 * op is one of interpolate, smooth, mean_median, outliers, best_fit,
 * move ("position", default 0), export.  Steps without "select" work on the visible curves.  Step
 * settings apply to that step only.
 *
 * Returns { settings, steps, curves, best_fits, exports }.  Any failing
 * step throws CurveError and the job stops there.
 */
nlohmann::json run_job(const nlohmann::json&   job,
                       const AnalysisSettings& base_settings,
                       unsigned                nthreads = 0,
                       bool                    verbose  = true);

} // namespace linecraft
