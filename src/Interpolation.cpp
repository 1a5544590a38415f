#include "linecraft/Interpolation.hpp"
#include <algorithm>
#include <cmath>

namespace linecraft {

/* -------------------------------------------------------------- *
 *  helper: y(f) for a *monotonic* f_in, linear in log frequency   *
 *  f must lie within [f_in.front, f_in.back]                      *
 * -------------------------------------------------------------- */
static Real interp_inside(const Vector& f_in, const Vector& y_in, Real f)
{
    const Eigen::Index n = f_in.size();
    const auto* first = f_in.data();
    const auto* it    = std::lower_bound(first, first + n, f);
    const Eigen::Index hi = static_cast<Eigen::Index>(it - first);

    if (hi < n && f_in[hi] == f) return y_in[hi];   // exact sample
    if (hi == 0)                 return y_in[0];
    if (hi >= n)                 return y_in[n - 1];

    const Eigen::Index lo = hi - 1;
    const Real x0 = std::log(f_in[lo]);
    const Real x1 = std::log(f_in[hi]);
    const Real t  = (std::log(f) - x0) / (x1 - x0);   // 0 … 1
    return (1.0 - t) * y_in[lo] + t * y_in[hi];
}

Vector interp_log_frequency(const Vector& f_in,
                            const Vector& y_in,
                            const Vector& f_out)
{
    const Eigen::Index n_in = f_in.size();
    Vector out(f_out.size());

    for (Eigen::Index k = 0; k < f_out.size(); ++k) {
        const Real f = f_out[k];
        if (f <= f_in[0])
            out[k] = y_in[0];
        else if (f >= f_in[n_in - 1])
            out[k] = y_in[n_in - 1];
        else
            out[k] = interp_inside(f_in, y_in, f);
    }
    return out;
}

std::vector<std::optional<Real>>
interp_log_frequency_bounded(const Vector& f_in,
                             const Vector& y_in,
                             const Vector& f_out)
{
    const Eigen::Index n_in = f_in.size();
    std::vector<std::optional<Real>> out(f_out.size());

    for (Eigen::Index k = 0; k < f_out.size(); ++k) {
        const Real f = f_out[k];
        if (f < f_in[0] || f > f_in[n_in - 1]) continue;   // absent
        out[k] = interp_inside(f_in, y_in, f);
    }
    return out;
}

} // namespace linecraft
