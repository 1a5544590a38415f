#include "linecraft/Resampler.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/Interpolation.hpp"
#include "linecraft/LogGrid.hpp"
#include <sstream>

namespace linecraft {

Curve resample_to_grid(const Curve& curve,
                       int          points_per_octave,
                       Real         pinned_frequency)
{
    if (points_per_octave < 0) {
        std::ostringstream msg;
        msg << "resample_to_grid(): points per octave must be >= 0, got "
            << points_per_octave;
        throw CurveError(ErrorKind::InvalidResolution, msg.str());
    }
    if (points_per_octave == 0)
        return Curve(curve.frequencies(), curve.amplitudes());

    Vector grid = build_ppo_grid(curve.min_frequency(),
                                 curve.max_frequency(),
                                 points_per_octave,
                                 pinned_frequency);

    if (grids_equal(grid, curve.frequencies()))
        return Curve(curve.frequencies(), curve.amplitudes());

    Vector amps = interp_log_frequency(curve.frequencies(), curve.amplitudes(), grid);
    return Curve(std::move(grid), std::move(amps));
}

} // namespace linecraft
