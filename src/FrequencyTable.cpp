#include "linecraft/FrequencyTable.hpp"
#include <algorithm>

namespace linecraft {

FrequencyTable::FrequencyTable(const CurveSet& curves)
{
    ids_.reserve(curves.size());
    for (const auto& [id, curve] : curves) ids_.push_back(id);

    /* ---- present cells only, columns are the union of grids -------- */
    for (const auto& [id, curve] : curves) {
        const Vector& f = curve.frequencies();
        const Vector& a = curve.amplitudes();
        for (Eigen::Index i = 0; i < f.size(); ++i)
            columns_[f[i]].emplace(id, a[i]);
    }
}

std::optional<Real> FrequencyTable::value(Real frequency, CurveId id) const
{
    auto col = columns_.find(frequency);
    if (col == columns_.end()) return std::nullopt;
    auto cell = col->second.find(id);
    if (cell == col->second.end()) return std::nullopt;
    return cell->second;
}

std::vector<Real> FrequencyTable::present_values(const Column& column)
{
    std::vector<Real> out;
    out.reserve(column.size());
    for (const auto& [id, amplitude] : column)
        out.push_back(amplitude);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace linecraft
