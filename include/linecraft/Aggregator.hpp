#pragma once
#include "Types.hpp"
#include "Curve.hpp"
#include <vector>

namespace linecraft {

struct MeanMedianResult {
    Curve       mean;
    Curve       median;
    std::size_t n_curves = 0;
};

struct IqrResult {
    Curve                lower_fence;
    Curve                median;
    Curve                upper_fence;
    std::vector<CurveId> outliers;      // ascending ids
    std::size_t          n_curves = 0;
};

/*
 * Per-frequency mean and median over the union of all frequency grids,
 * each column reduced over the curves that actually have a sample there.
 * Needs at least 2 curves, CurveError(InsufficientCurves) otherwise.
 */
MeanMedianResult mean_and_median(const CurveSet& curves);

/*
 * Tukey fences per frequency:  Q1 − k·IQR  and  Q3 + k·IQR.
 * A curve is an outlier as soon as one of its own samples lies strictly
 * outside the fences of that column.  Needs at least 3 curves.
 */
IqrResult iqr_analysis(const CurveSet& curves, Real fence_multiplier);

} // namespace linecraft
