#include "linecraft/SimilarityScorer.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/Interpolation.hpp"
#include "linecraft/Resampler.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace linecraft {

BestFitReport best_fit(const Curve&           reference,
                       const CurveSet&        candidates,
                       int                    resolution_ppo,
                       const CriticalBand&    band,
                       Real                   pinned_frequency,
                       std::optional<CurveId> reference_id)
{
    if (!(band.weight >= 0.0) || !std::isfinite(band.weight)) {
        std::ostringstream msg;
        msg << "best_fit(): critical range weight must be finite and >= 0, got "
            << band.weight;
        throw CurveError(ErrorKind::InvalidParameter, msg.str());
    }

    /* ---- 1. reference on the calculation grid ---------------------- */
    const Curve   ref      = resample_to_grid(reference, resolution_ppo, pinned_frequency);
    const Vector& ref_freq = ref.frequencies();
    const Vector& ref_amp  = ref.amplitudes();
    const Eigen::Index n   = ref_freq.size();

    /* ---- 4. weighting factors -------------------------------------- */
    std::vector<bool> in_band(n, false);
    Eigen::Index c = 0;
    for (Eigen::Index k = 0; k < n; ++k) {
        in_band[k] = ref_freq[k] >= band.start_frequency && ref_freq[k] < band.end_frequency;
        if (in_band[k]) ++c;
    }

    BestFitReport report;
    report.frequencies       = ref_freq;
    report.reference_points  = static_cast<std::size_t>(n);
    report.reference_label   = reference.name_prefix().empty() ? reference.full_name()
                                                               : reference.name_prefix();
    report.weighting_applied = c > 0;

    Real normalizer = 1.0;
    Real critical   = 1.0;
    if (report.weighting_applied) {
        normalizer = (static_cast<Real>(n) + static_cast<Real>(c) * (band.weight - 1.0))
                   / static_cast<Real>(n);
        if (!(normalizer > 0.0))
            throw CurveError(ErrorKind::InvalidParameter,
                             "best_fit(): a zero-weight critical range covers every point");
        critical = band.weight / normalizer;
    }

    /* ---- 2, 3, 5. per candidate ------------------------------------ */
    report.ranking.reserve(candidates.size());
    for (const auto& [id, cand] : candidates) {
        const auto values = interp_log_frequency_bounded(cand.frequencies(),
                                                         cand.amplitudes(),
                                                         ref_freq);
        Real        sum = 0.0;
        std::size_t m   = 0;
        for (Eigen::Index k = 0; k < n; ++k) {
            if (!values[k]) continue;
            const Real d = *values[k] - ref_amp[k];
            Real r = d * d;
            if (report.weighting_applied) {
                r /= normalizer;
                if (in_band[k]) r *= critical;
            }
            sum += r;
            ++m;
        }

        BestFitEntry entry;
        entry.id          = id;
        entry.label       = cand.full_name();
        entry.points_used = m;
        if (m >= 2) entry.std_dev = std::sqrt(sum / static_cast<Real>(m - 1));
        report.ranking.push_back(std::move(entry));
    }

    /* ---- 6. rank ---------------------------------------------------- */
    std::sort(report.ranking.begin(), report.ranking.end(),
              [&reference_id](const BestFitEntry& a, const BestFitEntry& b) {
                  if (a.std_dev.has_value() != b.std_dev.has_value())
                      return a.std_dev.has_value();
                  if (a.std_dev && *a.std_dev != *b.std_dev)
                      return *a.std_dev < *b.std_dev;
                  if (reference_id && (a.id == *reference_id) != (b.id == *reference_id))
                      return a.id == *reference_id;
                  return a.id < b.id;
              });
    return report;
}

} // namespace linecraft
