#include "linecraft/Statistics.hpp"
#include "linecraft/CurveError.hpp"
#include <algorithm>
#include <boost/math/statistics/univariate_statistics.hpp>
#include <cmath>

namespace linecraft {

namespace {

void require_sample(const std::vector<Real>& v, const char* caller)
{
    if (v.empty())
        throw CurveError(ErrorKind::InsufficientData,
                         std::string(caller) + "(): empty sample");
}

/* v must already be sorted */
Real sorted_quantile(const std::vector<Real>& v, Real q)
{
    const Real h  = static_cast<Real>(v.size() - 1) * q;
    const auto lo = static_cast<std::size_t>(std::floor(h));
    if (lo + 1 >= v.size()) return v.back();
    return v[lo] + (h - static_cast<Real>(lo)) * (v[lo + 1] - v[lo]);
}

} // anonymous namespace

Real mean_of(std::vector<Real> values)
{
    require_sample(values, "mean_of");
    std::sort(values.begin(), values.end());
    return boost::math::statistics::mean(values);
}

Real median_of(std::vector<Real> values)
{
    require_sample(values, "median_of");
    return boost::math::statistics::median(values);
}

Real quantile_of(std::vector<Real> values, Real q)
{
    require_sample(values, "quantile_of");
    if (!(q >= 0.0 && q <= 1.0))
        throw CurveError(ErrorKind::InvalidParameter,
                         "quantile_of(): q must lie within [0, 1]");
    std::sort(values.begin(), values.end());
    return sorted_quantile(values, q);
}

Quartiles quartiles_of(std::vector<Real> values)
{
    require_sample(values, "quartiles_of");
    std::sort(values.begin(), values.end());

    Quartiles q;
    q.q1     = sorted_quantile(values, 0.25);
    q.median = sorted_quantile(values, 0.50);
    q.q3     = sorted_quantile(values, 0.75);
    return q;
}

} // namespace linecraft
