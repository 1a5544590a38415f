#include "linecraft/JobRunner.hpp"
#include "linecraft/CurveError.hpp"
#include "linecraft/CurveRegistry.hpp"
#include "linecraft/JsonUtils.hpp"
#include "linecraft/ProcessingWorkflow.hpp"
#include "linecraft/ReportUtils.hpp"
#include "linecraft/Smoothing.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace linecraft {

namespace {

std::vector<CurveId> selection_of(const nlohmann::json& step, const CurveRegistry& reg)
{
    if (!step.contains("select")) return reg.visible_ids();
    try {
        return step["select"].get<std::vector<CurveId>>();
    } catch (const nlohmann::json::exception& e) {
        throw CurveError(ErrorKind::InvalidParameter,
                         std::string("run_job(): \"select\" must list curve ids: ") + e.what());
    }
}

// step-local settings: "settings" object plus the smoothing algorithm by name
AnalysisSettings settings_for(const nlohmann::json& step, const AnalysisSettings& base)
{
    AnalysisSettings s = base;
    if (step.contains("settings")) apply_settings_json(step["settings"], s);
    if (step.contains("algorithm"))
        s.smoothing_type = static_cast<int>(
            smoothing_kind_from_string(step["algorithm"].get<std::string>()));
    return s;
}

}   // anonymous namespace

nlohmann::json run_job(const nlohmann::json&   job,
                       const AnalysisSettings& base_settings,
                       unsigned                nthreads,
                       bool                    verbose)
{
    AnalysisSettings settings = base_settings;
    if (job.contains("settings")) apply_settings_json(job["settings"], settings);

    CurveRegistry registry;
    ProcessingWorkflow::Config wf_cfg;
    wf_cfg.nthreads = nthreads;
    wf_cfg.verbose  = verbose;
    ProcessingWorkflow workflow(registry, settings, wf_cfg);

    /* ---------------- curves ---------------- */
    for (const auto& jc : job.value("curves", nlohmann::json::array())) {
        const CurveId id = workflow.import_curve(curve_from_json(jc));
        if (jc.value("reference", false)) registry.set_reference(id);
        if (!jc.value("visible", true))   registry.set_visible({id}, false);
    }

    /* ---------------- steps ----------------- */
    nlohmann::json steps     = nlohmann::json::array();
    nlohmann::json best_fits = nlohmann::json::array();
    nlohmann::json exports   = nlohmann::json::array();

    for (const auto& step : job.value("steps", nlohmann::json::array())) {
        if (!step.is_object() || !step.contains("op") || !step["op"].is_string())
            throw CurveError(ErrorKind::InvalidParameter,
                             "run_job(): every step needs an \"op\" name");
        const std::string op = step["op"].get<std::string>();
        workflow.set_settings(settings_for(step, settings));

        nlohmann::json record = {{"op", op}};
        if (op == "interpolate") {
            record["inserted"] = workflow.interpolate(selection_of(step, registry));
        } else if (op == "smooth") {
            record["inserted"] = workflow.smoothen(selection_of(step, registry));
        } else if (op == "mean_median") {
            record["inserted"] = workflow.mean_and_median(selection_of(step, registry));
        } else if (op == "outliers") {
            auto res = workflow.outlier_detection(selection_of(step, registry));
            record["inserted"] = res.inserted;
            record["outliers"] = res.outliers;
        } else if (op == "best_fit") {
            CurveId ref_id;
            if (step.contains("reference")) {
                ref_id = step["reference"].get<CurveId>();
                registry.set_reference(ref_id);
            } else if (registry.reference()) {
                ref_id = *registry.reference();
            } else {
                throw CurveError(ErrorKind::InvalidParameter,
                                 "run_job(): best_fit needs a reference curve");
            }
            auto res = workflow.best_fits(ref_id);
            if (verbose) std::cout << '\n' << res.text << "\n\n";
            nlohmann::json jb = best_fit_to_json(res.report);
            jb["text"] = res.text;
            best_fits.push_back(std::move(jb));
        } else if (op == "move") {
            // selected curves, in the given order, from `position` on
            std::size_t position = step.value("position", std::size_t{0});
            for (auto id : selection_of(step, registry)) registry.move(id, position++);
            registry.reset_prefixes();
        } else if (op == "export") {
            for (auto id : selection_of(step, registry)) {
                nlohmann::json c = curve_to_json(workflow.export_curve(id));
                c["id"] = id;
                exports.push_back(std::move(c));
            }
        } else {
            throw CurveError(ErrorKind::InvalidParameter, "run_job(): unknown step \"" + op + "\"");
        }
        steps.push_back(std::move(record));
    }

    return {
        {"settings",  settings_to_json(settings)},
        {"steps",     steps},
        {"curves",    registry_to_json(registry)},
        {"best_fits", best_fits},
        {"exports",   exports}
    };
}

} // namespace linecraft
