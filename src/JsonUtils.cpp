#include "linecraft/JsonUtils.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/Validator.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <utility>
#include <vector>

namespace linecraft {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw CurveError(ErrorKind::InvalidParameter, "load_json(): cannot open " + path);

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw CurveError(ErrorKind::InvalidParameter,
                         "load_json(): " + path + ": " + e.what());
    }
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

Curve curve_from_json(const nlohmann::json& j)
{
    if (!j.contains("points") || !j["points"].is_array())
        throw CurveError(ErrorKind::InsufficientData,
                         "curve_from_json(): curve has no \"points\" array");

    std::vector<std::pair<Real, Real>> points;
    points.reserve(j["points"].size());
    for (const auto& p : j["points"]) {
        if (!p.is_array() || p.size() != 2)
            throw CurveError(ErrorKind::ShapeMismatch,
                             "curve_from_json(): every point must be a [frequency, amplitude] pair");
        if (!p[0].is_number() || !p[1].is_number())
            throw CurveError(ErrorKind::NonNumeric,
                             "curve_from_json(): point " + p.dump() + " is not numeric");
        points.emplace_back(p[0].get<Real>(), p[1].get<Real>());
    }

    Curve curve = make_curve(points);
    // curve_to_json() output carries the bare base name beside the full one
    curve.set_name_base(j.contains("base_name") ? j["base_name"].get<std::string>()
                                                : j.value("name", std::string{}));
    if (j.contains("suffixes"))
        for (const auto& s : j["suffixes"]) curve.add_name_suffix(s.get<std::string>());
    return curve;
}

nlohmann::json curve_to_json(const Curve& curve)
{
    nlohmann::json points = nlohmann::json::array();
    for (Eigen::Index i = 0; i < curve.size(); ++i)
        points.push_back({curve.frequencies()[i], curve.amplitudes()[i]});

    return {
        {"name",      curve.full_name()},
        {"base_name", curve.name_base()},
        {"suffixes",  curve.name_suffixes()},
        {"points",    points}
    };
}

} // namespace linecraft
