#pragma once
#include "Types.hpp"
#include <vector>

namespace linecraft {

// One biquad, a0 normalised to 1, transposed direct form II.
struct SecondOrderSection {
    Real b0 = 1.0, b1 = 0.0, b2 = 0.0;
    Real a1 = 0.0, a2 = 0.0;
};

/**
 * Digital Butterworth lowpass of the given order as cascaded sections
 * (order/2 biquads plus one first-order section for odd orders).
 * Cookbook biquad formulas, one stage per conjugate analog pole pair.
 *
 * Throws CurveError(InvalidParameter)  for order < 1 or sample_rate <= 0,
 *        CurveError(InvalidResolution) unless 0 < cutoff < sample_rate / 2.
 */
std::vector<SecondOrderSection>
design_butterworth_lowpass(int order, Real cutoff, Real sample_rate);

/**
 * Zero-phase filtering: the cascade is run forward, then backward over the
 * result.  The signal is extended at both ends by an odd reflection of
 * 3·(2·sections + 1) samples (fewer for first-order sections, never more
 * than size − 1) and every section starts in its steady state for the
 * first sample, so constant input comes out unchanged.
 */
Vector filtfilt(const std::vector<SecondOrderSection>& sos, const Vector& x);

} // namespace linecraft
