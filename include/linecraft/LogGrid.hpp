#pragma once
#include "Types.hpp"

namespace linecraft {

/*
 * Log-spaced frequency grid with `ppo` points per octave:
 *
 *        f_k = pinned · 2^(k / ppo) ,   k integer
 *
 * restricted to f_min <= f_k <= f_max (with a 1e-9 relative slack so that
 * points of an earlier grid survive rounding).  `pinned` itself is always
 * exactly f_0, whether or not it lies inside the span.
 *
 * Throws CurveError(InvalidResolution) for ppo <= 0,
 *        CurveError(InsufficientData)  if no grid point falls in the span.
 */
Vector build_ppo_grid(Real f_min,
                      Real f_max,
                      int  ppo,
                      Real pinned = 1000.0);

/* Same length and every pair within rel_tol of each other. */
bool grids_equal(const Vector& a, const Vector& b, Real rel_tol = 1e-9);

} // namespace linecraft
