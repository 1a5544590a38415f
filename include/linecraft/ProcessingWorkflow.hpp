#pragma once
#include "Types.hpp"
#include "Curve.hpp"
#include "CurveRegistry.hpp"
#include "Settings.hpp"
#include "SimilarityScorer.hpp"
#include "ThreadPool.hpp"
#include <string>
#include <vector>

namespace linecraft {

/*
 * Runs the analysis operations on curves held by a CurveRegistry and puts
 * the results back into it, named and positioned the way a curve list
 * shows them:
 *
 *   interpolate / smoothen   result right below each source curve
 *   mean_and_median          results on top
 *   outlier_detection        results on top, outliers hidden or removed
 *
 * Prefixes are renumbered after every change.  A failing operation
 * leaves the registry as it was.
 */
class ProcessingWorkflow {
public:
    struct Config
    {
        unsigned nthreads = 0;      // 0: hardware concurrency
        bool     verbose  = true;
    };

    struct OutlierOutcome
    {
        std::vector<CurveId> inserted;   // median, lower fence, upper fence
        std::vector<CurveId> outliers;
    };

    struct BestFitOutcome
    {
        BestFitReport report;
        std::string   text;
    };

    ProcessingWorkflow(CurveRegistry&          registry,
                       const AnalysisSettings& settings,
                       const Config&           config);

    const AnalysisSettings& settings() const { return settings_; }
    void set_settings(const AnalysisSettings& s) { settings_ = s; }

    CurveId import_curve(Curve curve);
    Curve   export_curve(CurveId id) const;

    std::vector<CurveId> interpolate(const std::vector<CurveId>& ids);
    std::vector<CurveId> smoothen(const std::vector<CurveId>& ids);
    std::vector<CurveId> mean_and_median(const std::vector<CurveId>& ids);
    OutlierOutcome       outlier_detection(const std::vector<CurveId>& ids);

    // every curve of the registry is ranked against `reference_id`
    BestFitOutcome best_fits(CurveId reference_id) const;

private:
    // unique ids in display order, unknown ids throw
    std::vector<CurveId> ordered_selection(const std::vector<CurveId>& ids) const;

    // derived curves, named after their source plus `suffix`, inserted
    // right below the source
    template <class Op>
    std::vector<CurveId> derive_each(const std::vector<CurveId>& ids,
                                     const std::string&          suffix,
                                     Op                          op);

    std::string representative_name_of(const std::vector<CurveId>& ids) const;

    CurveRegistry&   registry_;
    AnalysisSettings settings_;
    Config           config_;
    ThreadPool       pool_;
};

} // namespace linecraft
