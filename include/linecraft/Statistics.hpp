#pragma once
#include "Types.hpp"
#include <vector>

namespace linecraft {

struct Quartiles {
    Real q1     = 0.0;
    Real median = 0.0;
    Real q3     = 0.0;

    Real iqr() const { return q3 - q1; }
};

/* All reducers take their sample by value, sort it and therefore do not
 * depend on the order in which values were collected.  An empty sample
 * is CurveError(InsufficientData).                                      */
Real mean_of(std::vector<Real> values);
Real median_of(std::vector<Real> values);

/* q-quantile, linear interpolation between closest ranks:
 *      h = (n − 1)·q ,  Q = x[⌊h⌋] + (h − ⌊h⌋)·(x[⌊h⌋+1] − x[⌊h⌋])      */
Real quantile_of(std::vector<Real> values, Real q);

Quartiles quartiles_of(std::vector<Real> values);

} // namespace linecraft
