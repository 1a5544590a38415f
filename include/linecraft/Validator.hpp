#pragma once
#include "Types.hpp"
#include "Curve.hpp"
#include <string>
#include <utility>
#include <vector>

namespace linecraft {

/*
 * Frequency axis sanity: at least one point, every value finite and > 0,
 * strictly ascending.  Unsorted input is an error, nothing is reordered.
 * Throws CurveError(InvalidAxis | InsufficientData).
 */
void check_frequency_axis(const Vector& frequencies);

/*
 * Full pair check used by the Curve constructor.
 * ShapeMismatch  : lengths differ
 * InsufficientData: no points
 * InvalidAxis    : see check_frequency_axis()
 * NonNumeric     : an amplitude is NaN or infinite
 */
void check_pair(const Vector& frequencies, const Vector& amplitudes);

Curve make_curve(const std::vector<std::pair<Real, Real>>& points);
Curve make_curve(const std::vector<Real>& frequencies,
                 const std::vector<Real>& amplitudes);

/* Text cells as handed over by an importer.  Surrounding blanks are
 * ignored, anything else that is not a finite number is NonNumeric.     */
Real  parse_real(const std::string& token);
Curve make_curve_from_text(const std::vector<std::string>& frequencies,
                           const std::vector<std::string>& amplitudes);

} // namespace linecraft
