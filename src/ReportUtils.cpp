#include "linecraft/ReportUtils.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/JsonUtils.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace linecraft {

static std::string fmt_swr(const std::optional<Real>& v)
{
    if (!v) return "nan";
    std::ostringstream s;
    s << *v;                       // %g, 6 significant digits
    return s.str();
}

std::string format_best_fit_table(const BestFitReport& report)
{
    const std::string head_name = "Item name";
    const std::string head_swr  = "Swr";

    std::vector<std::pair<std::string, std::string>> rows;
    rows.reserve(report.ranking.size());
    std::size_t w_name = head_name.size();
    std::size_t w_swr  = head_swr.size();
    for (const auto& e : report.ranking) {
        rows.emplace_back(e.label, fmt_swr(e.std_dev));
        w_name = std::max(w_name, rows.back().first.size());
        w_swr  = std::max(w_swr,  rows.back().second.size());
    }

    std::ostringstream out;
    out << "-- Standard deviation of weighted residual error (Swr) --\n"
        << "Reference: " << report.reference_label
        << "    Amount of frequency points: " << report.reference_points << "\n\n";

    out << std::left  << std::setw(static_cast<int>(w_name)) << head_name << "  "
        << std::right << std::setw(static_cast<int>(w_swr))  << head_swr  << '\n'
        << std::string(w_name, '-') << "  " << std::string(w_swr, '-');
    for (const auto& [name, swr] : rows) {
        out << '\n'
            << std::left  << std::setw(static_cast<int>(w_name)) << name << "  "
            << std::right << std::setw(static_cast<int>(w_swr))  << swr;
    }
    return out.str();
}

nlohmann::json best_fit_to_json(const BestFitReport& report)
{
    nlohmann::json ranking = nlohmann::json::array();
    for (const auto& e : report.ranking) {
        ranking.push_back({
            {"id",          e.id},
            {"name",        e.label},
            {"swr",         e.std_dev ? nlohmann::json(*e.std_dev) : nlohmann::json(nullptr)},
            {"points_used", e.points_used}
        });
    }
    return {
        {"reference",         report.reference_label},
        {"frequency_points",  report.reference_points},
        {"weighting_applied", report.weighting_applied},
        {"ranking",           ranking}
    };
}

nlohmann::json registry_to_json(const CurveRegistry& registry)
{
    nlohmann::json curves = nlohmann::json::array();
    for (auto id : registry.ids()) {
        nlohmann::json c = curve_to_json(registry.get(id));
        c["id"]        = id;
        c["visible"]   = registry.is_visible(id);
        c["reference"] = registry.is_reference(id);
        curves.push_back(std::move(c));
    }
    return curves;
}

void write_json(const std::string& path, const nlohmann::json& j)
{
    if (path == "-") {
        std::cout << j.dump(2) << '\n';
        return;
    }
    std::ofstream f(path);
    if (!f.is_open())
        throw CurveError(ErrorKind::InvalidParameter, "write_json(): cannot open " + path);
    f << j.dump(2) << '\n';
}

} // namespace linecraft
