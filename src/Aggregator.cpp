#include "linecraft/Aggregator.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/FrequencyTable.hpp"
#include "linecraft/Statistics.hpp"
#include <cmath>
#include <set>
#include <sstream>

namespace linecraft {

namespace {

void require_curves(const CurveSet& curves, std::size_t minimum, const char* caller)
{
    if (curves.size() < minimum) {
        std::ostringstream msg;
        msg << caller << "(): a minimum of " << minimum
            << " curves is needed for this analysis, got " << curves.size();
        throw CurveError(ErrorKind::InsufficientCurves, msg.str());
    }
}

Curve to_curve(const std::vector<Real>& f, const std::vector<Real>& a)
{
    return Curve(Eigen::Map<const Vector>(f.data(), f.size()),
                 Eigen::Map<const Vector>(a.data(), a.size()));
}

} // anonymous namespace

MeanMedianResult mean_and_median(const CurveSet& curves)
{
    require_curves(curves, 2, "mean_and_median");

    const FrequencyTable table(curves);

    std::vector<Real> freq, mean, median;
    freq.reserve(table.column_count());
    mean.reserve(table.column_count());
    median.reserve(table.column_count());

    for (const auto& [f, column] : table.columns()) {
        auto values = FrequencyTable::present_values(column);
        if (values.empty()) continue;

        freq.push_back(f);
        mean.push_back(mean_of(values));
        median.push_back(median_of(std::move(values)));
    }

    return MeanMedianResult{to_curve(freq, mean), to_curve(freq, median), curves.size()};
}

IqrResult iqr_analysis(const CurveSet& curves, Real fence_multiplier)
{
    require_curves(curves, 3, "iqr_analysis");
    if (!(fence_multiplier >= 0.0) || !std::isfinite(fence_multiplier)) {
        std::ostringstream msg;
        msg << "iqr_analysis(): fence multiplier must be finite and >= 0, got "
            << fence_multiplier;
        throw CurveError(ErrorKind::InvalidParameter, msg.str());
    }

    const FrequencyTable table(curves);

    std::vector<Real> freq, lower, median, upper;
    std::set<CurveId> outliers;

    for (const auto& [f, column] : table.columns()) {
        auto values = FrequencyTable::present_values(column);
        if (values.empty()) continue;

        const Quartiles q  = quartiles_of(std::move(values));
        const Real      lo = q.q1 - fence_multiplier * q.iqr();
        const Real      hi = q.q3 + fence_multiplier * q.iqr();

        freq.push_back(f);
        lower.push_back(lo);
        median.push_back(q.median);
        upper.push_back(hi);

        for (const auto& [id, amplitude] : column)
            if (amplitude < lo || amplitude > hi) outliers.insert(id);
    }

    return IqrResult{to_curve(freq, lower),
                     to_curve(freq, median),
                     to_curve(freq, upper),
                     std::vector<CurveId>(outliers.begin(), outliers.end()),
                     curves.size()};
}

} // namespace linecraft
