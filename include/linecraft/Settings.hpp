#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace linecraft {

enum class OutlierAction { None = 0, Hide = 1, Remove = 2 };

// User options of the processing workflow, defaults as shipped
struct AnalysisSettings {
    // ---------------- import / export ----------------
    int    import_ppo                  = 0;      // 0: keep imported points
    int    export_ppo                  = 96;     // 0: export as is
    int    interpolate_must_contain_hz = 1000;   // pinned grid frequency

    // ---------------- statistics ---------------------
    bool   mean_selected               = false;
    bool   median_selected             = true;

    // ---------------- smoothing ----------------------
    int    smoothing_type              = 0;      // SmoothingKind index
    int    smoothing_resolution_ppo    = 96;
    int    smoothing_bandwidth         = 6;      // 1/N octave

    // ---------------- outliers -----------------------
    double        outlier_fence_iqr    = 10.0;
    OutlierAction outlier_action       = OutlierAction::None;

    // ---------------- interpolation ------------------
    int    processing_interpolation_ppo = 96;

    // ---------------- best fit -----------------------
    int    best_fit_calculation_resolution_ppo = 24;
    int    best_fit_critical_range_start_freq  = 200;
    int    best_fit_critical_range_end_freq    = 5000;
    double best_fit_critical_range_weight      = 1.0;

    // smoothing bandwidth in octaves
    Real smoothing_bandwidth_octaves() const;
};

/* Keys present in `j` override the values already in `s`; unknown keys
 * are ignored.  Bad values are CurveError(InvalidParameter).            */
void apply_settings_json(const nlohmann::json& j, AnalysisSettings& s);
nlohmann::json settings_to_json(const AnalysisSettings& s);

AnalysisSettings load_settings(const std::string& path);

} // namespace linecraft
