#pragma once
#include "Curve.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace linecraft {
nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

/* {"name": …, "points": [[f, a], …]}  optionally "base_name", "suffixes".
 * Points go through the validator, non-numeric entries are
 * CurveError(NonNumeric).                                               */
Curve          curve_from_json(const nlohmann::json& j);
nlohmann::json curve_to_json(const Curve& curve);
} // namespace linecraft
