#include "linecraft/ProcessingWorkflow.hpp"
#include "linecraft/Aggregator.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/CurveNaming.hpp"
#include "linecraft/ReportUtils.hpp"
#include "linecraft/Resampler.hpp"
#include "linecraft/Smoothing.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace linecraft {

/* ------------------------------------------------------------------------- */
/*  constructor                                                              */
/* ------------------------------------------------------------------------- */
ProcessingWorkflow::ProcessingWorkflow(CurveRegistry&          registry,
                                       const AnalysisSettings& settings,
                                       const Config&           config)
    : registry_(registry)
    , settings_(settings)
    , config_(config)
    , pool_(config.nthreads)
{
}

std::vector<CurveId>
ProcessingWorkflow::ordered_selection(const std::vector<CurveId>& ids) const
{
    std::set<CurveId> unique(ids.begin(), ids.end());
    std::vector<std::pair<std::size_t, CurveId>> by_pos;
    by_pos.reserve(unique.size());
    for (auto id : unique) by_pos.emplace_back(registry_.position_of(id), id);
    std::sort(by_pos.begin(), by_pos.end());

    std::vector<CurveId> out;
    out.reserve(by_pos.size());
    for (const auto& p : by_pos) out.push_back(p.second);
    return out;
}

std::string ProcessingWorkflow::representative_name_of(const std::vector<CurveId>& ids) const
{
    std::vector<std::string> names;
    names.reserve(ids.size());
    for (auto id : ids) names.push_back(registry_.get(id).base_name_and_suffixes());
    return representative_name(names);
}

/* ------------------------------------------------------------------------- */
/*  import / export                                                          */
/* ------------------------------------------------------------------------- */
CurveId ProcessingWorkflow::import_curve(Curve curve)
{
    if (settings_.import_ppo > 0) {
        curve.replace_pair(resample_to_grid(curve, settings_.import_ppo,
                                            settings_.interpolate_must_contain_hz));
    }
    const CurveId id = registry_.add(std::move(curve));
    registry_.reset_prefixes();

    if (config_.verbose)
        std::cout << "[Import] " << registry_.get(id).full_name()
                  << " (" << registry_.get(id).size() << " points)\n";
    return id;
}

Curve ProcessingWorkflow::export_curve(CurveId id) const
{
    const Curve& src = registry_.get(id);
    Curve out = resample_to_grid(src, settings_.export_ppo,
                                 settings_.interpolate_must_contain_hz);
    out.set_name_prefix(src.name_prefix());
    out.copy_name_from(src);
    return out;
}

/* ------------------------------------------------------------------------- */
/*  per-curve operations, one task per curve                                 */
/* ------------------------------------------------------------------------- */
template <class Op>
std::vector<CurveId> ProcessingWorkflow::derive_each(const std::vector<CurveId>& ids,
                                                     const std::string&          suffix,
                                                     Op                          op)
{
    const auto sources = ordered_selection(ids);
    if (sources.empty())
        throw CurveError(ErrorKind::InsufficientCurves,
                         "ProcessingWorkflow: no curve selected");

    const CurveSet inputs = registry_.select(sources);

    std::vector<std::future<Curve>> futures;
    futures.reserve(sources.size());
    for (auto id : sources) {
        const Curve* src = &inputs.at(id);
        futures.push_back(pool_.enqueue([src, &op]() { return op(*src); }));
    }

    // every task has to finish before `inputs` and `op` go out of scope,
    // and a failure must leave the registry alone
    for (auto& f : futures) f.wait();
    std::vector<Curve> results;
    results.reserve(futures.size());
    for (auto& f : futures) results.push_back(f.get());

    std::vector<CurveId> inserted;
    inserted.reserve(results.size());
    for (std::size_t i = 0; i < sources.size(); ++i) {
        Curve& c = results[i];
        c.copy_name_from(inputs.at(sources[i]));
        c.remove_name_suffix(CurveRegistry::REFERENCE_SUFFIX);
        c.add_name_suffix(suffix);
        const std::size_t pos = registry_.position_of(sources[i]) + 1;
        inserted.push_back(registry_.insert(pos, std::move(c)));
    }
    registry_.reset_prefixes();
    return inserted;
}

std::vector<CurveId> ProcessingWorkflow::interpolate(const std::vector<CurveId>& ids)
{
    const int  ppo    = settings_.processing_interpolation_ppo;
    const Real pinned = settings_.interpolate_must_contain_hz;
    if (ppo <= 0) {
        std::ostringstream msg;
        msg << "ProcessingWorkflow::interpolate(): points per octave must be > 0, got " << ppo;
        throw CurveError(ErrorKind::InvalidResolution, msg.str());
    }

    auto out = derive_each(ids, "interpolated to " + std::to_string(ppo) + " ppo",
                           [ppo, pinned](const Curve& c) {
                               return resample_to_grid(c, ppo, pinned);
                           });
    if (config_.verbose)
        std::cout << "[Interpolate] " << out.size() << " curve(s) to " << ppo << " ppo\n";
    return out;
}

std::vector<CurveId> ProcessingWorkflow::smoothen(const std::vector<CurveId>& ids)
{
    SmoothingParams params;
    params.kind             = smoothing_kind_from_index(settings_.smoothing_type);
    params.bandwidth        = settings_.smoothing_bandwidth_octaves();
    params.resolution       = settings_.smoothing_resolution_ppo;
    params.pinned_frequency = settings_.interpolate_must_contain_hz;

    auto out = derive_each(ids, "smoothed 1/" + std::to_string(settings_.smoothing_bandwidth),
                           [params](const Curve& c) { return smooth_curve(c, params); });
    if (config_.verbose)
        std::cout << "[Smoothing] " << out.size() << " curve(s), " << to_string(params.kind)
                  << ", 1/" << settings_.smoothing_bandwidth << " octave\n";
    return out;
}

/* ------------------------------------------------------------------------- */
/*  statistics over the selection                                            */
/* ------------------------------------------------------------------------- */
std::vector<CurveId> ProcessingWorkflow::mean_and_median(const std::vector<CurveId>& ids)
{
    const auto sel = ordered_selection(ids);
    auto res = linecraft::mean_and_median(registry_.select(sel));

    const std::string base = representative_name_of(sel);
    const std::string n    = std::to_string(res.n_curves);
    res.mean.set_name_base(base);
    res.median.set_name_base(base);
    res.mean.add_name_suffix("mean, " + n + " curves");
    res.median.add_name_suffix("median, " + n + " curves");

    std::vector<Curve> to_insert;
    if (settings_.mean_selected)   to_insert.push_back(std::move(res.mean));
    if (settings_.median_selected) to_insert.push_back(std::move(res.median));

    std::vector<CurveId> inserted;
    for (std::size_t i = 0; i < to_insert.size(); ++i)
        inserted.push_back(registry_.insert(i, std::move(to_insert[i])));
    registry_.reset_prefixes();

    if (config_.verbose)
        std::cout << "[Statistics] mean/median of " << res.n_curves << " curves, "
                  << inserted.size() << " result(s)\n";
    return inserted;
}

ProcessingWorkflow::OutlierOutcome
ProcessingWorkflow::outlier_detection(const std::vector<CurveId>& ids)
{
    const Real k = settings_.outlier_fence_iqr;
    const auto sel = ordered_selection(ids);
    auto res = iqr_analysis(registry_.select(sel), k);

    std::ostringstream fence;
    fence << std::fixed << std::setprecision(1) << k << "xIQR, " << res.n_curves << " curves";

    std::vector<Curve> results;
    results.push_back(std::move(res.median));
    results.push_back(std::move(res.lower_fence));
    results.push_back(std::move(res.upper_fence));

    const std::string base = representative_name_of(sel);
    for (auto& c : results) c.set_name_base(base);
    results[0].add_name_suffix("median, " + std::to_string(res.n_curves) + " curves");
    results[1].add_name_suffix("-" + fence.str());
    results[2].add_name_suffix("+" + fence.str());

    if (!res.outliers.empty()) {
        switch (settings_.outlier_action) {
        case OutlierAction::None:
            break;
        case OutlierAction::Hide:
            registry_.set_visible(res.outliers, false);
            for (auto& c : results) c.add_name_suffix("calculated before hiding outliers");
            break;
        case OutlierAction::Remove:
            registry_.remove(res.outliers);
            for (auto& c : results) c.add_name_suffix("calculated before removing outliers");
            break;
        }
    }

    OutlierOutcome out;
    out.outliers = res.outliers;
    for (std::size_t i = 0; i < results.size(); ++i)
        out.inserted.push_back(registry_.insert(i, std::move(results[i])));
    registry_.reset_prefixes();

    if (config_.verbose) {
        std::cout << "[Outliers] " << res.outliers.size() << " of " << res.n_curves
                  << " curves outside " << k << "xIQR\n";
    }
    return out;
}

/* ------------------------------------------------------------------------- */
/*  ranking against a reference                                              */
/* ------------------------------------------------------------------------- */
ProcessingWorkflow::BestFitOutcome ProcessingWorkflow::best_fits(CurveId reference_id) const
{
    CriticalBand band;
    band.start_frequency = settings_.best_fit_critical_range_start_freq;
    band.end_frequency   = settings_.best_fit_critical_range_end_freq;
    band.weight          = settings_.best_fit_critical_range_weight;

    BestFitOutcome out;
    out.report = best_fit(registry_.get(reference_id),
                          registry_.select(registry_.ids()),
                          settings_.best_fit_calculation_resolution_ppo,
                          band,
                          settings_.interpolate_must_contain_hz,
                          reference_id);
    out.text = format_best_fit_table(out.report);

    if (!out.report.weighting_applied)
        std::cerr << "[BestFit] Warning: critical frequency range does not contain any of "
                     "the frequency points used in best fit\n";
    return out;
}

} // namespace linecraft
