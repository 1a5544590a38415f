#include "linecraft/LogGrid.hpp"
#include "linecraft/CurveError.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace linecraft {

namespace {
constexpr Real GRID_SLACK = 1e-9;   // in units of grid steps
} // anonymous namespace

Vector build_ppo_grid(Real f_min,
                      Real f_max,
                      int  ppo,
                      Real pinned)
{
    if (ppo <= 0) {
        std::ostringstream msg;
        msg << "build_ppo_grid(): points per octave must be > 0, got " << ppo;
        throw CurveError(ErrorKind::InvalidResolution, msg.str());
    }
    if (!(pinned > 0.0) || !std::isfinite(pinned))
        throw CurveError(ErrorKind::InvalidParameter,
                         "build_ppo_grid(): pinned frequency must be finite and > 0");
    if (!(f_min > 0.0) || !std::isfinite(f_max) || f_max < f_min)
        throw CurveError(ErrorKind::InvalidAxis,
                         "build_ppo_grid(): invalid frequency span");

    /* grid index range, measured in steps away from the pinned point */
    const double k_lo = std::ceil (ppo * std::log2(f_min / pinned) - GRID_SLACK);
    const double k_hi = std::floor(ppo * std::log2(f_max / pinned) + GRID_SLACK);

    if (k_hi < k_lo) {
        std::ostringstream msg;
        msg << "build_ppo_grid(): no " << ppo << " ppo grid point pinned at "
            << pinned << " Hz lies within [" << f_min << ", " << f_max << "]";
        throw CurveError(ErrorKind::InsufficientData, msg.str());
    }

    const auto n = static_cast<Eigen::Index>(k_hi - k_lo) + 1;
    Vector grid(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double k = k_lo + static_cast<double>(i);
        grid[i] = pinned * std::pow(2.0, k / ppo);
    }
    return grid;
}

bool grids_equal(const Vector& a, const Vector& b, Real rel_tol)
{
    if (a.size() != b.size()) return false;
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        const Real scale = std::max(std::abs(a[i]), std::abs(b[i]));
        if (std::abs(a[i] - b[i]) > rel_tol * scale) return false;
    }
    return true;
}

} // namespace linecraft
