#pragma once
#include "Types.hpp"
#include <optional>
#include <vector>

namespace linecraft {

/**
 * Amplitude at `f_out`, linear in ln(f) between the samples of
 * (f_in, y_in).  Outside the sampled span the edge values are held.
 * f_in must be strictly ascending and non-empty.
 */
Vector interp_log_frequency(const Vector& f_in,
                            const Vector& y_in,
                            const Vector& f_out);

/**
 * As above, but points outside [f_in.front, f_in.back] come back absent
 * instead of being extrapolated.
 */
std::vector<std::optional<Real>>
interp_log_frequency_bounded(const Vector& f_in,
                             const Vector& y_in,
                             const Vector& f_out);

} // namespace linecraft
