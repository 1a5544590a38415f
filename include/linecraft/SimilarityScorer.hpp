#pragma once
#include "Types.hpp"
#include "Curve.hpp"
#include <optional>
#include <string>
#include <vector>

namespace linecraft {

// residuals with start <= f < end get `weight` times the share of the rest
struct CriticalBand {
    Real start_frequency = 200.0;
    Real end_frequency   = 5000.0;
    Real weight          = 1.0;
};

struct BestFitEntry {
    CurveId             id = 0;
    std::string         label;         // full name of the candidate
    std::optional<Real> std_dev;       // absent with fewer than 2 usable points
    std::size_t         points_used = 0;
};

struct BestFitReport {
    std::vector<BestFitEntry> ranking;           // best fit first
    Vector                    frequencies;       // evaluation grid
    std::size_t               reference_points = 0;
    std::string               reference_label;
    bool                      weighting_applied = false;  // false: band was empty
};

/*
 * Rank `candidates` by the standard deviation of their weighted squared
 * residuals against `reference`:
 *
 *   1. reference resampled to `resolution_ppo` (see resample_to_grid)
 *   2. each candidate interpolated in ln f onto that grid; grid points
 *      outside the candidate's own span are left out for that candidate
 *   3. r = (candidate − reference)²
 *   4. n columns, c of them inside the critical band:
 *         normalizer = (n + c·(w − 1)) / n ,  critical = w / normalizer
 *      every r is divided by normalizer, in-band r are then multiplied by
 *      critical.  c == 0 skips the weighting (weighting_applied = false).
 *   5. s = sqrt( Σ r / (m − 1) ) over the m present columns
 *   6. ascending s, candidates without s last; on a tie `reference_id`
 *      (the reference's own entry in `candidates`) goes first, then by id
 */
BestFitReport best_fit(const Curve&           reference,
                       const CurveSet&        candidates,
                       int                    resolution_ppo,
                       const CriticalBand&    band,
                       Real                   pinned_frequency = 1000.0,
                       std::optional<CurveId> reference_id     = std::nullopt);

} // namespace linecraft
