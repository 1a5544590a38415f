#pragma once
#include "Types.hpp"
#include "Curve.hpp"
#include <string>

namespace linecraft {

enum class SmoothingKind {
    ButterworthOrder8,   // log spaced, zero phase
    ButterworthOrder4,   // log spaced, zero phase
    Rectangular,         // original points, no interpolation
    Gaussian             // log spaced
};

struct SmoothingParams {
    SmoothingKind kind       = SmoothingKind::ButterworthOrder8;
    Real          bandwidth  = 1.0 / 6.0;  // octaves
    int           resolution = 96;         // ppo, unused by Rectangular
    Real          pinned_frequency = 1000.0;
};

/* UI index 0…3 in the order of the enum, and the names of to_string().
 * Anything else is CurveError(UnsupportedAlgorithm).                   */
SmoothingKind smoothing_kind_from_index(int index);
SmoothingKind smoothing_kind_from_string(const std::string& name);
std::string   to_string(SmoothingKind kind);

/*
 * Dispatch on params.kind.  The returned curve holds only the numeric
 * pair, naming it is left to the caller.
 */
Curve smooth_curve(const Curve& curve, const SmoothingParams& params);

/* Resample to `resolution` ppo and run an order-N Butterworth lowpass
 * forward and backward.  `bandwidth` (octaves) is the distance between
 * the −3 dB points, i.e. the cutoff is 1 / (2·bandwidth) cycles/octave.  */
Curve smooth_butterworth(const Curve& curve,
                         Real         bandwidth,
                         int          resolution,
                         int          order,
                         Real         pinned_frequency = 1000.0);

/* Mean of all original points within ±bandwidth/2 octaves of each point. */
Curve smooth_rectangular(const Curve& curve, Real bandwidth);

/* Resample to `resolution` ppo and convolve with a Gaussian of
 * σ = bandwidth/2 octaves, truncated at 5σ and renormalised per point.   */
Curve smooth_gaussian(const Curve& curve,
                      Real         bandwidth,
                      int          resolution,
                      Real         pinned_frequency = 1000.0);

} // namespace linecraft
