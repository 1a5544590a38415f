#pragma once
#include "Types.hpp"
#include "Curve.hpp"

namespace linecraft {

/**
 * Resample `curve` onto the log-spaced grid of build_ppo_grid() spanning
 * [min f, max f] with `points_per_octave` points per octave and
 * `pinned_frequency` on the grid.  Amplitudes are linear in ln(f).
 *
 *  - points_per_octave == 0 : the pair is returned as it is
 *  - the new grid equals the present one : original amplitudes are kept,
 *    so repeated passes do not smooth the data any further
 *  - points_per_octave < 0  : CurveError(InvalidResolution)
 *
 * The result is a fresh, unnamed Curve; the input is never modified.
 */
Curve resample_to_grid(const Curve& curve,
                       int          points_per_octave,
                       Real         pinned_frequency = 1000.0);

} // namespace linecraft
