#include "linecraft/Settings.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/JsonUtils.hpp"
#include <cmath>
#include <sstream>
#include <type_traits>

namespace linecraft {

namespace {

template <class T>
void read_key(const nlohmann::json& j, const char* key, T& field)
{
    if (!j.contains(key)) return;
    const nlohmann::json& v = j.at(key);
    // get<int>() would truncate 0.5 to 0
    if constexpr (std::is_same_v<T, int>) {
        if (!v.is_number_integer())
            throw CurveError(ErrorKind::InvalidParameter,
                             std::string("apply_settings_json(): \"") + key
                             + "\" must be an integer, got " + v.dump());
    }
    try {
        field = v.get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw CurveError(ErrorKind::InvalidParameter,
                         std::string("apply_settings_json(): bad value for \"") + key
                         + "\": " + e.what());
    }
}

void require_non_negative(int value, const char* key)
{
    if (value < 0) {
        std::ostringstream msg;
        msg << "apply_settings_json(): \"" << key << "\" must be >= 0, got " << value;
        throw CurveError(ErrorKind::InvalidParameter, msg.str());
    }
}

} // anonymous namespace

Real AnalysisSettings::smoothing_bandwidth_octaves() const
{
    if (smoothing_bandwidth <= 0) {
        std::ostringstream msg;
        msg << "smoothing_bandwidth_octaves(): bandwidth denominator must be > 0, got "
            << smoothing_bandwidth;
        throw CurveError(ErrorKind::InvalidParameter, msg.str());
    }
    return 1.0 / static_cast<Real>(smoothing_bandwidth);
}

void apply_settings_json(const nlohmann::json& j, AnalysisSettings& s)
{
    if (!j.is_object())
        throw CurveError(ErrorKind::InvalidParameter,
                         "apply_settings_json(): settings must be a JSON object");

    AnalysisSettings t = s;   // s stays untouched on error

    read_key(j, "import_ppo",                          t.import_ppo);
    read_key(j, "export_ppo",                          t.export_ppo);
    read_key(j, "interpolate_must_contain_hz",         t.interpolate_must_contain_hz);
    read_key(j, "mean_selected",                       t.mean_selected);
    read_key(j, "median_selected",                     t.median_selected);
    read_key(j, "smoothing_type",                      t.smoothing_type);
    read_key(j, "smoothing_resolution_ppo",            t.smoothing_resolution_ppo);
    read_key(j, "smoothing_bandwidth",                 t.smoothing_bandwidth);
    read_key(j, "outlier_fence_iqr",                   t.outlier_fence_iqr);
    read_key(j, "processing_interpolation_ppo",        t.processing_interpolation_ppo);
    read_key(j, "best_fit_calculation_resolution_ppo", t.best_fit_calculation_resolution_ppo);
    read_key(j, "best_fit_critical_range_start_freq",  t.best_fit_critical_range_start_freq);
    read_key(j, "best_fit_critical_range_end_freq",    t.best_fit_critical_range_end_freq);
    read_key(j, "best_fit_critical_range_weight",      t.best_fit_critical_range_weight);

    int action = static_cast<int>(t.outlier_action);
    read_key(j, "outlier_action", action);
    if (action < 0 || action > 2) {
        std::ostringstream msg;
        msg << "apply_settings_json(): outlier_action must be 0 (none), 1 (hide) or 2 (remove), got "
            << action;
        throw CurveError(ErrorKind::InvalidParameter, msg.str());
    }
    t.outlier_action = static_cast<OutlierAction>(action);

    require_non_negative(t.import_ppo, "import_ppo");
    require_non_negative(t.export_ppo, "export_ppo");
    if (!(t.best_fit_critical_range_weight >= 0.0) || !std::isfinite(t.best_fit_critical_range_weight)) {
        std::ostringstream msg;
        msg << "apply_settings_json(): \"best_fit_critical_range_weight\" must be finite and >= 0, got "
            << t.best_fit_critical_range_weight;
        throw CurveError(ErrorKind::InvalidParameter, msg.str());
    }
    if (t.interpolate_must_contain_hz <= 0)
        throw CurveError(ErrorKind::InvalidParameter,
                         "apply_settings_json(): \"interpolate_must_contain_hz\" must be > 0");

    s = t;
}

nlohmann::json settings_to_json(const AnalysisSettings& s)
{
    return {
        {"import_ppo",                          s.import_ppo},
        {"export_ppo",                          s.export_ppo},
        {"interpolate_must_contain_hz",         s.interpolate_must_contain_hz},
        {"mean_selected",                       s.mean_selected},
        {"median_selected",                     s.median_selected},
        {"smoothing_type",                      s.smoothing_type},
        {"smoothing_resolution_ppo",            s.smoothing_resolution_ppo},
        {"smoothing_bandwidth",                 s.smoothing_bandwidth},
        {"outlier_fence_iqr",                   s.outlier_fence_iqr},
        {"outlier_action",                      static_cast<int>(s.outlier_action)},
        {"processing_interpolation_ppo",        s.processing_interpolation_ppo},
        {"best_fit_calculation_resolution_ppo", s.best_fit_calculation_resolution_ppo},
        {"best_fit_critical_range_start_freq",  s.best_fit_critical_range_start_freq},
        {"best_fit_critical_range_end_freq",    s.best_fit_critical_range_end_freq},
        {"best_fit_critical_range_weight",      s.best_fit_critical_range_weight}
    };
}

AnalysisSettings load_settings(const std::string& path)
{
    nlohmann::json j = load_json(path);
    expand_env(j);

    AnalysisSettings s;
    apply_settings_json(j, s);
    return s;
}

} // namespace linecraft
